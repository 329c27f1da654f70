/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CONFIG_HPP
#define TYPED_CBOR_CONFIG_HPP

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <tc/json.hpp>

namespace typed_cbor {
    enum class duplicate_key_policy: uint8_t {
        last_wins,
        reject
    };

    extern duplicate_key_policy duplicate_key_policy_from_string(std::string_view name);

    struct decode_config {
        static constexpr size_t default_max_depth = 64;
        // lengths are always bounded by the input size, so the collection limit is opt-in
        static constexpr size_t default_max_collection_size = std::numeric_limits<size_t>::max();

        // JSON keys: maxDepth, maxCollectionSize, intToFloat, duplicateKeys
        static decode_config from_json(const json::object &j);
        static decode_config from_file(const std::string &path);

        size_t max_depth = default_max_depth;
        size_t max_collection_size = default_max_collection_size;
        bool int_to_float = true;
        duplicate_key_policy duplicate_keys = duplicate_key_policy::last_wins;

        bool operator==(const decode_config &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<typed_cbor::duplicate_key_policy>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using typed_cbor::duplicate_key_policy;
            switch (v) {
                case duplicate_key_policy::last_wins: return fmt::format_to(ctx.out(), "last-wins");
                case duplicate_key_policy::reject: return fmt::format_to(ctx.out(), "reject");
                default: throw typed_cbor::error(fmt::format("unsupported duplicate_key_policy: {}", static_cast<int>(v)));
            }
        }
    };

    template<>
    struct formatter<typed_cbor::decode_config>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "decode_config(max_depth: {} max_collection_size: {} int_to_float: {} duplicate_keys: {})",
                v.max_depth, v.max_collection_size, v.int_to_float, v.duplicate_keys);
        }
    };
}

#endif // !TYPED_CBOR_CONFIG_HPP
