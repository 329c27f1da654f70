/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CONTAINER_HPP
#define TYPED_CBOR_CONTAINER_HPP

#include <vector>
#include <boost/container/flat_map.hpp>
#include <tc/common/format.hpp>

namespace typed_cbor {
    template<typename T>
    using vector = std::vector<T>;

    template<typename K, typename V>
    struct flat_map: boost::container::flat_map<K, V> {
        using base_type = boost::container::flat_map<K, V>;
        using base_type::base_type;
    };
}

namespace fmt {
    template<typename K, typename V>
    struct formatter<typed_cbor::flat_map<K, V>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return typed_cbor::format_entries(ctx.out(), v);
        }
    };
}

#endif // !TYPED_CBOR_CONTAINER_HPP
