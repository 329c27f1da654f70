/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_COMMON_BYTES_HPP
#define TYPED_CBOR_COMMON_BYTES_HPP

#include <algorithm>
#include <compare>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace typed_cbor {
    // A non-owning view of bytes; the referenced memory must outlive it.
    struct buffer: std::span<const uint8_t> {
        buffer() =default;

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            if (const auto min_sz = std::min(size(), o.size()); min_sz) {
                if (const auto cmp = memcmp(data(), o.data(), min_sz); cmp != 0)
                    return cmp < 0 ? std::strong_ordering::less : std::strong_ordering::greater;
            }
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return size() == o.size() && (empty() || memcmp(data(), o.data(), size()) == 0);
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset > size() || sz > size() - offset) [[unlikely]]
                throw error(fmt::format("a slice at offset {} of {} bytes does not fit into a buffer of {} bytes", offset, sz, size()));
            return buffer { data() + offset, sz };
        }
    };

    inline uint8_t hex_digit(const char k)
    {
        if (k >= '0' && k <= '9')
            return k - '0';
        if (k >= 'a' && k <= 'f')
            return k - 'a' + 10;
        if (k >= 'A' && k <= 'F')
            return k - 'A' + 10;
        throw error(fmt::format("not a hex digit: '{}'", k));
    }

    struct uint8_vector: std::vector<uint8_t> {
        static uint8_vector from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0) [[unlikely]]
                throw error(fmt::format("a hex string must have an even length but has {}: {}", hex.size(), hex));
            uint8_vector res(hex.size() / 2);
            for (size_t i = 0; i < res.size(); ++i)
                res[i] = (hex_digit(hex[2 * i]) << 4) | hex_digit(hex[2 * i + 1]);
            return res;
        }

        uint8_vector() =default;

        explicit uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const std::initializer_list<uint8_t> bytes):
            std::vector<uint8_t> { bytes }
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return static_cast<buffer>(*this);
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> static_cast<buffer>(o);
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) == static_cast<buffer>(o);
        }
    };

    inline uint8_vector &operator<<(uint8_vector &v, const buffer bytes)
    {
        v.insert(v.end(), bytes.begin(), bytes.end());
        return v;
    }
}

namespace fmt {
    template<>
    struct formatter<typed_cbor::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<typed_cbor::uint8_vector>: formatter<typed_cbor::buffer> {
        template<typename FormatContext>
        auto format(const typed_cbor::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<typed_cbor::buffer>::format(static_cast<typed_cbor::buffer>(v), ctx);
        }
    };
}

#endif // !TYPED_CBOR_COMMON_BYTES_HPP
