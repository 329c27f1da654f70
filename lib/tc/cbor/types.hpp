/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CBOR_TYPES_HPP
#define TYPED_CBOR_CBOR_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace typed_cbor::cbor {
    enum class major_type: uint8_t {
        uint = 0,
        nint = 1,
        bytes = 2,
        text = 3,
        array = 4,
        map = 5,
        tag = 6,
        simple = 7
    };

    enum class special_val: uint8_t {
        s_false = 20,
        s_true = 21,
        s_null = 22,
        s_undefined = 23,
        one_byte = 24,
        two_bytes = 25,
        four_bytes = 26,
        eight_bytes = 27,
        s_break = 31
    };

    enum class error_kind: uint8_t {
        unexpected_eof,
        invalid_encoding,
        trailing_bytes,
        type_mismatch,
        integer_overflow,
        depth_exceeded,
        duplicate_key
    };
}

namespace fmt {
    template<>
    struct formatter<typed_cbor::cbor::special_val>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using typed_cbor::cbor::special_val;
            switch (v) {
                case special_val::s_false: return fmt::format_to(ctx.out(), "false");
                case special_val::s_true: return fmt::format_to(ctx.out(), "true");
                case special_val::s_null: return fmt::format_to(ctx.out(), "null");
                case special_val::s_undefined: return fmt::format_to(ctx.out(), "undefined");
                case special_val::one_byte: return fmt::format_to(ctx.out(), "one_byte");
                case special_val::two_bytes: return fmt::format_to(ctx.out(), "two_bytes");
                case special_val::four_bytes: return fmt::format_to(ctx.out(), "four_bytes");
                case special_val::eight_bytes: return fmt::format_to(ctx.out(), "eight_bytes");
                case special_val::s_break: return fmt::format_to(ctx.out(), "break");
                default: return fmt::format_to(ctx.out(), "special_value: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<typed_cbor::cbor::major_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using typed_cbor::cbor::major_type;
            switch (v) {
                case major_type::uint: return fmt::format_to(ctx.out(), "uint");
                case major_type::nint: return fmt::format_to(ctx.out(), "nint");
                case major_type::bytes: return fmt::format_to(ctx.out(), "bytes");
                case major_type::text: return fmt::format_to(ctx.out(), "text");
                case major_type::array: return fmt::format_to(ctx.out(), "array");
                case major_type::map: return fmt::format_to(ctx.out(), "map");
                case major_type::tag: return fmt::format_to(ctx.out(), "tag");
                case major_type::simple: return fmt::format_to(ctx.out(), "simple");
                default: return fmt::format_to(ctx.out(), "major_type: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<typed_cbor::cbor::error_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using typed_cbor::cbor::error_kind;
            switch (v) {
                case error_kind::unexpected_eof: return fmt::format_to(ctx.out(), "unexpected_eof");
                case error_kind::invalid_encoding: return fmt::format_to(ctx.out(), "invalid_encoding");
                case error_kind::trailing_bytes: return fmt::format_to(ctx.out(), "trailing_bytes");
                case error_kind::type_mismatch: return fmt::format_to(ctx.out(), "type_mismatch");
                case error_kind::integer_overflow: return fmt::format_to(ctx.out(), "integer_overflow");
                case error_kind::depth_exceeded: return fmt::format_to(ctx.out(), "depth_exceeded");
                case error_kind::duplicate_key: return fmt::format_to(ctx.out(), "duplicate_key");
                default: return fmt::format_to(ctx.out(), "error_kind: {}", static_cast<int>(v));
            }
        }
    };
}

namespace typed_cbor::cbor {
    // Message layout: "<kind>: <detail> at <location>"
    struct decode_error: error {
        decode_error(const error_kind kind, const std::string_view location, const std::string_view detail):
            error { fmt::format("{}: {} at {}", kind, detail, location) },
            _kind { kind }, _location { location }
        {
        }

        error_kind kind() const noexcept
        {
            return _kind;
        }

        const std::string &location() const noexcept
        {
            return _location;
        }
    private:
        error_kind _kind;
        std::string _location;
    };
}

#endif // !TYPED_CBOR_CBOR_TYPES_HPP
