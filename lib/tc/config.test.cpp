/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fstream>
#include <tc/common/test.hpp>
#include <tc/config.hpp>

using namespace typed_cbor;

namespace {
    static std::string write_tmp(const std::string_view name, const std::string_view content)
    {
        const auto path = (std::filesystem::temp_directory_path() / name).string();
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        os << content;
        return path;
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "defaults"_test = [] {
            const decode_config cfg {};
            test_same(size_t { 64 }, cfg.max_depth);
            test_same(std::numeric_limits<size_t>::max(), cfg.max_collection_size);
            expect(cfg.int_to_float);
            expect(cfg.duplicate_keys == duplicate_key_policy::last_wins);
        };
        "from_json"_test = [] {
            const auto j = json::parse(std::string_view { R"({"maxDepth":8,"maxCollectionSize":1024,"intToFloat":false,"duplicateKeys":"reject"})" });
            const auto cfg = decode_config::from_json(j.as_object());
            test_same(size_t { 8 }, cfg.max_depth);
            test_same(size_t { 1024 }, cfg.max_collection_size);
            expect(!cfg.int_to_float);
            expect(cfg.duplicate_keys == duplicate_key_policy::reject);
        };
        "from_json_partial"_test = [] {
            const auto j = json::parse(std::string_view { R"({"maxDepth":3})" });
            decode_config exp {};
            exp.max_depth = 3;
            expect(decode_config::from_json(j.as_object()) == exp);
        };
        "from_json_invalid"_test = [] {
            expect(throws<error>([] { decode_config::from_json(json::parse(std::string_view { R"({"duplicateKeys":"first-wins"})" }).as_object()); }));
            expect(throws<error>([] { decode_config::from_json(json::parse(std::string_view { R"({"duplicateKeys":1})" }).as_object()); }));
            expect(throws<error>([] { decode_config::from_json(json::parse(std::string_view { R"({"intToFloat":"yes"})" }).as_object()); }));
            expect(throws<error>([] { decode_config::from_json(json::parse(std::string_view { R"({"maxDepth":-1})" }).as_object()); }));
            expect(throws<error>([] { decode_config::from_json(json::parse(std::string_view { R"({"maxDepth":"64"})" }).as_object()); }));
        };
        "from_file"_test = [] {
            const auto path = write_tmp("typed-cbor-config-test.json", R"({"intToFloat":false})");
            const auto cfg = decode_config::from_file(path);
            expect(!cfg.int_to_float);
            test_same(size_t { 64 }, cfg.max_depth);
            std::filesystem::remove(path);
        };
        "from_file_invalid"_test = [] {
            const auto path = write_tmp("typed-cbor-config-bad.json", "[1, 2");
            expect(throws<error>([&] { decode_config::from_file(path); }));
            std::filesystem::remove(path);
            expect(throws<error>([] { decode_config::from_file("/nonexistent/typed-cbor/config.json"); }));
        };
        "format"_test = [] {
            test_same(std::string { "decode_config(max_depth: 64 max_collection_size: 18446744073709551615 int_to_float: true duplicate_keys: last-wins)" },
                fmt::format("{}", decode_config {}));
        };
    };
};
