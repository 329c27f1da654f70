/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CBOR_VALUE_HPP
#define TYPED_CBOR_CBOR_VALUE_HPP

#include <compare>
#include <memory>
#include <source_location>
#include <string>
#include <utility>
#include <variant>
#include <tc/common/bytes.hpp>
#include <tc/container.hpp>
#include <tc/cbor/types.hpp>

namespace typed_cbor::cbor {
    struct value;

    // Stores the encoded magnitude m of a negative integer -1 - m.
    struct nint_value {
        uint64_t raw = 0;

        bool operator==(const nint_value &o) const =default;
    };

    struct simple_value {
        uint8_t code = 0;

        bool operator==(const simple_value &o) const =default;
    };

    using value_array = vector<value>;
    using value_map = vector<std::pair<value, value>>;

    struct value_tag {
        uint64_t id = 0;
        std::unique_ptr<value> val {};

        value_tag() =default;
        value_tag(uint64_t id_, value &&val_);
        value_tag(const value_tag &o);
        value_tag(value_tag &&o) noexcept =default;
        ~value_tag();

        value_tag &operator=(const value_tag &o);
        value_tag &operator=(value_tag &&o) noexcept =default;
        bool operator==(const value_tag &o) const;
    };

    struct value {
        using storage_type = std::variant<uint64_t, nint_value, uint8_vector, std::string,
            value_array, value_map, value_tag, simple_value, double>;

        static const std::string &type_name(major_type type);

        value() =default;
        value(const value &) =default;
        value(value &&) noexcept =default;

        explicit value(const uint64_t u): _storage { u }
        {
        }

        explicit value(const nint_value n): _storage { n }
        {
        }

        explicit value(uint8_vector &&bytes): _storage { std::move(bytes) }
        {
        }

        explicit value(std::string &&text): _storage { std::move(text) }
        {
        }

        explicit value(value_array &&items): _storage { std::move(items) }
        {
        }

        explicit value(value_map &&entries): _storage { std::move(entries) }
        {
        }

        explicit value(value_tag &&t): _storage { std::move(t) }
        {
        }

        explicit value(const simple_value s): _storage { s }
        {
        }

        explicit value(const double f): _storage { f }
        {
        }

        value &operator=(const value &) =default;
        value &operator=(value &&) noexcept =default;
        bool operator==(const value &o) const;
        // Orders by the variant first and then by the content; partial because of NaN floats.
        std::partial_ordering operator<=>(const value &o) const;

        // Consistent with operator==: equal values have equal hashes.
        size_t hash() const noexcept;

        major_type major() const noexcept;
        const std::string &type_name() const;
        // Unlike type_name distinguishes floats from other simple values.
        std::string_view variant_name() const noexcept;
        std::string to_string() const;

        uint64_t uint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint64_t>("uint", loc);
        }

        // The encoded magnitude m of the value -1 - m.
        uint64_t nint(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<nint_value>("nint", loc).raw;
        }

        const uint8_vector &bytes(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<uint8_vector>("bytes", loc);
        }

        const std::string &text(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<std::string>("text", loc);
        }

        const value_array &array(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<value_array>("array", loc);
        }

        const value_map &map(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<value_map>("map", loc);
        }

        const value_tag &tag(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<value_tag>("tag", loc);
        }

        uint8_t simple(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<simple_value>("simple", loc).code;
        }

        double float64(const std::source_location &loc=std::source_location::current()) const
        {
            return _get<double>("float", loc);
        }

        template<typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&_storage);
        }

        bool is_null() const noexcept
        {
            const auto *s = get_if<simple_value>();
            return s && s->code == static_cast<uint8_t>(special_val::s_null);
        }

        bool is_undefined() const noexcept
        {
            const auto *s = get_if<simple_value>();
            return s && s->code == static_cast<uint8_t>(special_val::s_undefined);
        }

        const storage_type &storage() const noexcept
        {
            return _storage;
        }
    private:
        storage_type _storage {};

        template<typename T>
        const T &_get(const std::string_view exp_name, const std::source_location &loc) const
        {
            if (const auto *v = std::get_if<T>(&_storage); v) [[likely]]
                return *v;
            throw decode_error(error_kind::type_mismatch, fmt::format("{}", loc),
                fmt::format("expected a {} value but got {}", exp_name, variant_name()));
        }
    };

    extern std::string format_negative(uint64_t raw);
}

namespace std {
    template<>
    struct hash<typed_cbor::cbor::value> {
        size_t operator()(const auto &v) const noexcept
        {
            return v.hash();
        }
    };
}

namespace fmt {
    template<>
    struct formatter<typed_cbor::cbor::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !TYPED_CBOR_CBOR_VALUE_HPP
