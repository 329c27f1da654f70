/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_COMMON_FORMAT_HPP
#define TYPED_CBOR_COMMON_FORMAT_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef _MSC_VER
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wpragmas"
#   ifndef __clang__
#       pragma GCC diagnostic ignored "-Wdangling-reference"
#       pragma GCC diagnostic ignored "-Warray-bounds"
#       pragma GCC diagnostic ignored "-Wstringop-overflow"
#   endif
#endif
#include <fmt/core.h>
#include <fmt/format.h>
#ifndef _MSC_VER
#   pragma GCC diagnostic pop
#endif

#include "error.hpp"

namespace typed_cbor {
    using fmt::format;

    // Writes key-value ranges as {k1=v1, k2=v2}; shared by the formatters of all map types.
    template<typename OutputIt, typename R>
    OutputIt format_entries(OutputIt out_it, const R &entries)
    {
        out_it = fmt::format_to(out_it, "{{");
        bool first = true;
        for (const auto &[k, v]: entries) {
            out_it = fmt::format_to(out_it, "{}{}={}", first ? "" : ", ", k, v);
            first = false;
        }
        return fmt::format_to(out_it, "}}");
    }
}

namespace fmt {
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::span<const uint8_t> &bytes, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const auto b: bytes)
                out_it = fmt::format_to(out_it, "{:02X}", b);
            return out_it;
        }
    };

    template<typename X, typename Y>
    struct formatter<std::pair<X, Y>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &p, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "({}, {})", p.first, p.second);
        }
    };

    template<typename T, typename A>
    struct formatter<std::vector<T, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &items, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "[{}]", fmt::join(items, ", "));
        }
    };

    template<typename K, typename V, typename C, typename A>
    struct formatter<std::map<K, V, C, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &m, FormatContext &ctx) const -> decltype(ctx.out()) {
            return typed_cbor::format_entries(ctx.out(), m);
        }
    };

    template<typename K, typename V, typename H, typename E, typename A>
    struct formatter<std::unordered_map<K, V, H, E, A>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &m, FormatContext &ctx) const -> decltype(ctx.out()) {
            return typed_cbor::format_entries(ctx.out(), m);
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "nullopt");
        }
    };

    template<>
    struct formatter<std::source_location>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::source_location &loc, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        }
    };
}

#endif // !TYPED_CBOR_COMMON_FORMAT_HPP
