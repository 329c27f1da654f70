/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cmath>
#include <limits>
#include <tc/common/test.hpp>
#include <tc/cbor/parser.hpp>
#include <tc/cbor/projector.hpp>

using namespace typed_cbor;
using namespace typed_cbor::cbor;

namespace {
    using std::string_literals::operator""s;
    using failure = std::pair<error_kind, std::string>;

    value from_hex(const std::string_view hex)
    {
        return decode(uint8_vector::from_hex(hex));
    }

    template<typename T>
    T project_hex(const std::string_view hex, const decode_config &cfg={})
    {
        return project<T>(from_hex(hex), cfg);
    }

    template<typename T>
    failure project_failure(const std::string_view hex, const decode_config &cfg={})
    {
        try {
            project_hex<T>(hex, cfg);
        } catch (const decode_error &ex) {
            return { ex.kind(), ex.location() };
        }
        throw error(fmt::format("no decode_error has been thrown for {}", hex));
    }
}

suite cbor_projector_suite = [] {
    "cbor::projector"_test = [] {
        "unsigned"_test = [] {
            test_same(uint8_t { 255 }, project_hex<uint8_t>("18FF"));
            test_same(uint16_t { 1000 }, project_hex<uint16_t>("1903E8"));
            test_same(std::numeric_limits<uint64_t>::max(), project_hex<uint64_t>("1BFFFFFFFFFFFFFFFF"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<uint8_t>("190100"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<uint32_t>("1B0000000100000000"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<uint32_t>("20"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<uint64_t>("3BFFFFFFFFFFFFFFFF"));
        };
        "signed"_test = [] {
            test_same(int8_t { 127 }, project_hex<int8_t>("187F"));
            test_same(int8_t { -1 }, project_hex<int8_t>("20"));
            test_same(int8_t { -128 }, project_hex<int8_t>("387F"));
            test_same(int16_t { -1000 }, project_hex<int16_t>("3903E7"));
            test_same(std::numeric_limits<int64_t>::min(), project_hex<int64_t>("3B7FFFFFFFFFFFFFFF"));
            test_same(std::numeric_limits<int64_t>::max(), project_hex<int64_t>("1B7FFFFFFFFFFFFFFF"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<int8_t>("1880"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<int8_t>("3880"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<int64_t>("1B8000000000000000"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<int64_t>("3B8000000000000000"));
        };
        "integer_mismatch"_test = [] {
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<int32_t>("6131"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<uint32_t>("F93C00"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<uint32_t>("F5"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<uint32_t>("C101"));
        };
        "bool"_test = [] {
            expect(!project_hex<bool>("F4"));
            expect(project_hex<bool>("F5"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<bool>("F6"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<bool>("01"));
        };
        "text_and_bytes"_test = [] {
            test_same("IETF"s, project_hex<std::string>("6449455446"));
            test_same(uint8_vector::from_hex("01020304"), project_hex<uint8_vector>("4401020304"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::string>("4401020304"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<uint8_vector>("6449455446"));
        };
        "floats"_test = [] {
            test_same(1.5, project_hex<double>("F93E00"));
            test_same(1.5F, project_hex<float>("FA3FC00000"));
            test_same(std::numeric_limits<float>::infinity(), project_hex<float>("F97C00"));
            expect(std::isnan(project_hex<float>("F97E00")));
            test_same(100.0F, project_hex<float>("FB4059000000000000"));
            test_same(failure { error_kind::integer_overflow, "$" }, project_failure<float>("FB7E37E43C8800759C"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<double>("6131"));
        };
        "int_to_float"_test = [] {
            test_same(1.0, project_hex<double>("01"));
            test_same(-10.0, project_hex<double>("29"));
            test_same(1000.0F, project_hex<float>("1903E8"));
            decode_config cfg {};
            cfg.int_to_float = false;
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<double>("01", cfg));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<double>("29", cfg));
            test_same(1.5, project_hex<double>("F93E00", cfg));
        };
        "vector"_test = [] {
            test_same(std::vector<uint32_t> { 11, 22, 33 }, project_hex<std::vector<uint32_t>>("830B1618" "21"));
            test_same(std::vector<std::string> {}, project_hex<std::vector<std::string>>("80"));
            test_same(std::vector<std::vector<int>> { { 1 }, { 2, 3 } }, project_hex<std::vector<std::vector<int>>>("828101820203"));
            test_same(failure { error_kind::type_mismatch, "$[2]" }, project_failure<std::vector<int>>("83010261" "61"));
            test_same(failure { error_kind::integer_overflow, "$[1][0]" }, project_failure<std::vector<std::vector<uint8_t>>>("8281018119" "0100"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::vector<int>>("A0"));
        };
        "map"_test = [] {
            const std::map<int8_t, std::string> exp { { -25, "abc" }, { 7, "DEF" } };
            test_same(exp, project_hex<std::map<int8_t, std::string>>("A2381863616263076344" "4546"));
            test_same(failure { error_kind::type_mismatch, "${2}" }, project_failure<std::map<int, std::string>>("A2016161" "0201"));
            test_same(failure { error_kind::type_mismatch, "${#0}.key" }, project_failure<std::map<int, int>>("A1616101"));
            test_same(failure { error_kind::type_mismatch, "${\"a\"}" }, project_failure<std::map<std::string, int>>("A1616161" "62"));
            test_same(failure { error_kind::type_mismatch, "${-1}" }, project_failure<std::map<int, int>>("A120F6"));
            test_same(failure { error_kind::integer_overflow, "${#0}.key" }, project_failure<std::map<uint8_t, int>>("A1190100" "01"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::map<int, int>>("80"));
            test_same(failure { error_kind::type_mismatch, "${#0}" }, project_failure<std::map<std::vector<int>, int>>("A1810060"));
        };
        "map_kinds"_test = [] {
            const auto u = project_hex<std::unordered_map<std::string, uint64_t>>("A2616101616202");
            test_same(size_t { 2 }, u.size());
            test_same(uint64_t { 2 }, u.at("b"));
            const auto f = project_hex<flat_map<uint64_t, bool>>("A202F401F5");
            test_same(uint64_t { 1 }, f.begin()->first);
            expect(f.begin()->second);
            expect(!f.at(2));
            const auto v = project_hex<std::map<uint64_t, value>>("A1018201F6");
            test_same(from_hex("8201F6"), v.at(1));
        };
        "composite_keys"_test = [] {
            // {[1, 2]: "a", {1: h'00'}: 1, 1(2): null}
            const std::string_view hex = "A38201026161A101410001C102F6";
            const auto u = project_hex<std::unordered_map<value, value>>(hex);
            test_same(size_t { 3 }, u.size());
            test_same(from_hex("6161"), u.at(from_hex("820102")));
            test_same(from_hex("01"), u.at(from_hex("A1014100")));
            expect(u.at(from_hex("C102")).is_null());
            expect(!u.contains(from_hex("820201")));
            const auto o = project_hex<std::map<value, value>>(hex);
            test_same(size_t { 3 }, o.size());
            // keys are ordered by their kind first: arrays, then maps, then tags
            test_same(from_hex("820102"), o.begin()->first);
            test_same(from_hex("C102"), o.rbegin()->first);
            decode_config cfg {};
            cfg.duplicate_keys = duplicate_key_policy::reject;
            test_same(failure { error_kind::duplicate_key, "${#1}" }, project_failure<std::unordered_map<value, int>>("A2810101810102", cfg));
            test_same(failure { error_kind::duplicate_key, "${#1}" }, project_failure<std::map<value, int>>("A2810101810102", cfg));
            test_same(size_t { 2 }, project_hex<std::unordered_map<value, int>>("A2810101810202").size());
        };
        "duplicate_keys"_test = [] {
            const std::map<int, int> last { { 1, 11 } };
            test_same(last, project_hex<std::map<int, int>>("A2010A010B"));
            test_same(size_t { 1 }, project_hex<std::unordered_map<int, int>>("A2010A010B").size());
            decode_config cfg {};
            cfg.duplicate_keys = duplicate_key_policy::reject;
            test_same(failure { error_kind::duplicate_key, "${1}" }, project_failure<std::map<int, int>>("A2010A010B", cfg));
            test_same(failure { error_kind::duplicate_key, "${1}" }, project_failure<flat_map<int, int>>("A2010A010B", cfg));
            // keys that differ in the encoding but project to the same target key
            test_same(failure { error_kind::duplicate_key, "${1}" }, project_failure<std::map<double, int>>("A2F93C000A010B", cfg));
            test_same(std::map<int, int> { { 1, 10 }, { 2, 11 } }, project_hex<std::map<int, int>>("A2010A020B", cfg));
        };
        "map_entries"_test = [] {
            const auto e = project_hex<map_entries<int, int>>("A3010A020B010C");
            test_same(size_t { 3 }, e.size());
            test_same(std::pair<int, int> { 2, 11 }, e[1]);
            test_same(std::pair<int, int> { 1, 12 }, e[2]);
            decode_config cfg {};
            cfg.duplicate_keys = duplicate_key_policy::reject;
            test_same(size_t { 3 }, project_hex<map_entries<int, int>>("A3010A020B010C", cfg).size());
            test_same(failure { error_kind::type_mismatch, "${2}" }, project_failure<map_entries<int, int>>("A20101026161"));
        };
        "pair"_test = [] {
            test_same(std::pair<std::string, int> { "a", -1 }, project_hex<std::pair<std::string, int>>("826161" "20"));
            test_same(std::pair<std::string, int> { "a", 5 }, project_hex<std::pair<std::string, int>>("A1616105"));
            test_same(failure { error_kind::type_mismatch, "$[1]" }, project_failure<std::pair<int, int>>("8201F5"));
            test_same(failure { error_kind::type_mismatch, "${#0}.key" }, project_failure<std::pair<int, int>>("A1F501"));
            test_same(failure { error_kind::type_mismatch, "${1}" }, project_failure<std::pair<int, int>>("A101F5"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::pair<int, int>>("83010203"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::pair<int, int>>("A201010202"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::pair<int, int>>("01"));
        };
        "optional"_test = [] {
            expect(!project_hex<std::optional<int>>("F6"));
            expect(!project_hex<std::optional<std::string>>("F7"));
            test_same(std::optional<int> { 5 }, project_hex<std::optional<int>>("05"));
            test_same(std::vector<std::optional<int>> { 1, std::nullopt, 3 }, project_hex<std::vector<std::optional<int>>>("8301F603"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::optional<int>>("F4"));
        };
        "tagged"_test = [] {
            const auto t = project_hex<tagged<std::string>>("C074323031332D30332D32315432303A30343A30305A");
            test_same(uint64_t { 0 }, t.id);
            test_same("2013-03-21T20:04:00Z"s, t.val);
            test_same(tagged<uint8_vector> { 24, uint8_vector::from_hex("6449455446") }, project_hex<tagged<uint8_vector>>("D818456449455446"));
            test_same(failure { error_kind::type_mismatch, "$(1)" }, project_failure<tagged<int>>("C16161"));
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<tagged<int>>("01"));
            // tags are not unwrapped implicitly
            test_same(failure { error_kind::type_mismatch, "$" }, project_failure<std::string>("C06161"));
            test_same(failure { error_kind::type_mismatch, "$[0]" }, project_failure<std::vector<int>>("81C101"));
        };
        "value"_test = [] {
            const auto v = from_hex("A2616181C10161620F");
            test_same(v, project<value>(v));
            const auto items = project_hex<std::vector<value>>("82F5C101");
            test_same(uint8_t { 21 }, items[0].simple());
            test_same(uint64_t { 1 }, items[1].tag().id);
        };
        "depth_limit"_test = [] {
            decode_config cfg {};
            cfg.max_depth = 2;
            const auto v = from_hex("81818100");
            test_same(failure { error_kind::depth_exceeded, "$[0][0]" }, [&] {
                try {
                    project<std::vector<std::vector<std::vector<int>>>>(v, cfg);
                } catch (const decode_error &ex) {
                    return failure { ex.kind(), ex.location() };
                }
                return failure { error_kind::unexpected_eof, "no error" };
            }());
            test_same(size_t { 1 }, project<std::vector<std::vector<value>>>(v, cfg).size());
        };
        "message"_test = [] {
            try {
                project_hex<std::vector<int>>("83010261" "61");
                expect(false);
            } catch (const decode_error &ex) {
                test_same("type_mismatch: expected an integer but got text at $[2]"s, std::string { ex.what() });
            }
        };
    };
};
