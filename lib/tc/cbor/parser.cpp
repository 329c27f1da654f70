/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <utf8cpp/utf8.h>
#include <tc/cbor/parser.hpp>
#include <tc/logger.hpp>

namespace typed_cbor::cbor {
    double decode_half(const uint16_t bits)
    {
        const int exp = (bits >> 10) & 0x1F;
        const int mant = bits & 0x3FF;
        double val;
        if (exp == 0)
            val = std::ldexp(mant, -24);
        else if (exp != 31)
            val = std::ldexp(mant + 1024, exp - 25);
        else
            val = mant == 0 ? std::numeric_limits<double>::infinity() : std::numeric_limits<double>::quiet_NaN();
        return bits & 0x8000 ? -val : val;
    }

    struct parser::nesting_guard {
        nesting_guard(parser &p, const size_t hdr_off): _p { p }
        {
            if (_p._depth >= _p._cfg.max_depth) [[unlikely]]
                throw decode_error(error_kind::depth_exceeded, byte_reader::location(hdr_off),
                    fmt::format("nesting is deeper than the limit of {} levels", _p._cfg.max_depth));
            ++_p._depth;
        }

        nesting_guard(const nesting_guard &) =delete;

        ~nesting_guard()
        {
            --_p._depth;
        }
    private:
        parser &_p;
    };

    value parser::read()
    {
        value val {};
        _read_item(val, false);
        return val;
    }

    uint64_t parser::_read_argument(const uint8_t ai, const size_t hdr_off)
    {
        if (ai < 24) [[likely]]
            return ai;
        switch (ai) {
            case 24: return _reader.read_uint(1);
            case 25: return _reader.read_uint(2);
            case 26: return _reader.read_uint(4);
            case 27: return _reader.read_uint(8);
            default:
                throw decode_error(error_kind::invalid_encoding, byte_reader::location(hdr_off),
                    fmt::format("reserved additional info value {}", ai));
        }
    }

    void parser::_check_collection_size(const uint64_t size, const size_t hdr_off) const
    {
        if (size > _cfg.max_collection_size) [[unlikely]] {
            logger::debug("CBOR item at offset {} has {} elements while the limit is {}", hdr_off, size, _cfg.max_collection_size);
            throw decode_error(error_kind::invalid_encoding, byte_reader::location(hdr_off),
                fmt::format("collection too big: {} is above the limit of {}", size, _cfg.max_collection_size));
        }
    }

    // Returns false when a break code has been consumed instead of a value.
    bool parser::_read_item(value &val, const bool break_allowed)
    {
        const auto hdr_off = _reader.offset();
        const uint8_t hdr = _reader.read_byte();
        const auto type = static_cast<major_type>(hdr >> 5);
        const uint8_t ai = hdr & 0x1F;
        bool indefinite = false;
        uint64_t arg = 0;
        if (ai == static_cast<uint8_t>(special_val::s_break)) {
            switch (type) {
                case major_type::bytes:
                case major_type::text:
                case major_type::array:
                case major_type::map:
                    indefinite = true;
                    break;
                case major_type::simple:
                    if (break_allowed)
                        return false;
                    throw decode_error(error_kind::invalid_encoding, byte_reader::location(hdr_off), "unexpected break code");
                default:
                    throw decode_error(error_kind::invalid_encoding, byte_reader::location(hdr_off),
                        fmt::format("indefinite length is not allowed for {}", type));
            }
        } else {
            arg = _read_argument(ai, hdr_off);
        }

        switch (type) {
            case major_type::uint:
                val = value { arg };
                break;
            case major_type::nint:
                val = value { nint_value { arg } };
                break;
            case major_type::bytes:
                if (indefinite) {
                    val = value { _read_chunks(major_type::bytes, hdr_off) };
                } else {
                    _reader.ensure_items(arg, 1);
                    _check_collection_size(arg, hdr_off);
                    val = value { uint8_vector { _reader.read_bytes(arg) } };
                }
                break;
            case major_type::text:
                val = value { _read_text(arg, indefinite, hdr_off) };
                break;
            case major_type::array:
                val = _read_array(arg, indefinite, hdr_off);
                break;
            case major_type::map:
                val = _read_map(arg, indefinite, hdr_off);
                break;
            case major_type::tag:
                val = _read_tag(arg, hdr_off);
                break;
            case major_type::simple:
                val = _read_simple(ai, arg, hdr_off);
                break;
            default:
                throw error(fmt::format("internal error: reached an impossible state at byte {}", hdr_off));
        }
        return true;
    }

    uint8_vector parser::_read_chunks(const major_type type, const size_t hdr_off)
    {
        nesting_guard guard { *this, hdr_off };
        uint8_vector res {};
        for (;;) {
            const auto chunk_off = _reader.offset();
            const uint8_t hdr = _reader.read_byte();
            if (hdr == 0xFF)
                break;
            const auto chunk_type = static_cast<major_type>(hdr >> 5);
            const uint8_t ai = hdr & 0x1F;
            if (chunk_type != type || ai == static_cast<uint8_t>(special_val::s_break)) [[unlikely]]
                throw decode_error(error_kind::invalid_encoding, byte_reader::location(chunk_off),
                    fmt::format("a chunk of an indefinite {} string must be a definite {} string", type, type));
            const auto chunk_size = _read_argument(ai, chunk_off);
            _reader.ensure_items(chunk_size, 1);
            _check_collection_size(chunk_size, chunk_off);
            const auto chunk = _reader.read_bytes(chunk_size);
            _check_collection_size(res.size() + chunk.size(), hdr_off);
            res << chunk;
        }
        return res;
    }

    std::string parser::_read_text(const uint64_t size, const bool indefinite, const size_t hdr_off)
    {
        std::string text {};
        if (indefinite) {
            text = _read_chunks(major_type::text, hdr_off).str();
        } else {
            _reader.ensure_items(size, 1);
            _check_collection_size(size, hdr_off);
            text = static_cast<std::string_view>(_reader.read_bytes(size));
        }
        if (const auto it = utf8::find_invalid(text.begin(), text.end()); it != text.end()) [[unlikely]]
            throw decode_error(error_kind::invalid_encoding, byte_reader::location(hdr_off),
                fmt::format("invalid UTF-8 sequence at text position {}", std::distance(text.begin(), it)));
        return text;
    }

    value parser::_read_array(const uint64_t size, const bool indefinite, const size_t hdr_off)
    {
        nesting_guard guard { *this, hdr_off };
        value_array items {};
        if (indefinite) {
            for (;;) {
                value item {};
                if (!_read_item(item, true))
                    break;
                _check_collection_size(items.size() + 1, hdr_off);
                items.emplace_back(std::move(item));
            }
        } else {
            // every element takes at least one byte
            _reader.ensure_items(size, 1);
            _check_collection_size(size, hdr_off);
            items.reserve(std::min(static_cast<size_t>(size), _reader.remaining()));
            for (uint64_t i = 0; i < size; ++i) {
                items.emplace_back();
                _read_item(items.back(), false);
            }
        }
        return value { std::move(items) };
    }

    value parser::_read_map(const uint64_t size, const bool indefinite, const size_t hdr_off)
    {
        nesting_guard guard { *this, hdr_off };
        value_map entries {};
        if (indefinite) {
            for (;;) {
                value key {};
                if (!_read_item(key, true))
                    break;
                _check_collection_size(entries.size() + 1, hdr_off);
                value val {};
                // a break in place of a value is reported as invalid_encoding by _read_item
                _read_item(val, false);
                entries.emplace_back(std::move(key), std::move(val));
            }
        } else {
            // every entry takes at least two bytes
            _reader.ensure_items(size, 2);
            _check_collection_size(size, hdr_off);
            entries.reserve(std::min(static_cast<size_t>(size), _reader.remaining() / 2));
            for (uint64_t i = 0; i < size; ++i) {
                auto &entry = entries.emplace_back();
                _read_item(entry.first, false);
                _read_item(entry.second, false);
            }
        }
        return value { std::move(entries) };
    }

    value parser::_read_tag(const uint64_t id, const size_t hdr_off)
    {
        nesting_guard guard { *this, hdr_off };
        value inner {};
        _read_item(inner, false);
        return value { value_tag { id, std::move(inner) } };
    }

    value parser::_read_simple(const uint8_t ai, const uint64_t arg, const size_t hdr_off)
    {
        switch (ai) {
            case static_cast<uint8_t>(special_val::one_byte):
                if (arg < 32) [[unlikely]]
                    throw decode_error(error_kind::invalid_encoding, byte_reader::location(hdr_off),
                        fmt::format("simple value {} must use the one-byte encoding", arg));
                return value { simple_value { static_cast<uint8_t>(arg) } };
            case static_cast<uint8_t>(special_val::two_bytes):
                return value { decode_half(static_cast<uint16_t>(arg)) };
            case static_cast<uint8_t>(special_val::four_bytes): {
                const auto bits = static_cast<uint32_t>(arg);
                float f;
                static_assert(sizeof(f) == sizeof(bits));
                memcpy(&f, &bits, sizeof(f));
                return value { static_cast<double>(f) };
            }
            case static_cast<uint8_t>(special_val::eight_bytes): {
                double d;
                static_assert(sizeof(d) == sizeof(arg));
                memcpy(&d, &arg, sizeof(d));
                return value { d };
            }
            default:
                return value { simple_value { ai } };
        }
    }

    value decode(const buffer bytes, const decode_config &cfg)
    {
        parser p { bytes, cfg };
        auto val = p.read();
        if (!p.eof()) [[unlikely]]
            throw decode_error(error_kind::trailing_bytes, byte_reader::location(p.offset()),
                fmt::format("{} unconsumed bytes after a complete value", bytes.size() - p.offset()));
        return val;
    }
}
