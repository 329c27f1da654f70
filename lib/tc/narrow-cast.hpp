/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_NARROW_CAST_HPP
#define TYPED_CBOR_NARROW_CAST_HPP

#include <limits>
#include <type_traits>
#include <typeinfo>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace typed_cbor {
    // Returns true when from is representable as TO without a change of value.
    template<typename TO, typename FROM>
    constexpr bool fits(const FROM from) noexcept
    {
        if constexpr (std::numeric_limits<FROM>::is_signed == std::numeric_limits<TO>::is_signed) {
            return from <= std::numeric_limits<TO>::max() && from >= std::numeric_limits<TO>::min();
        } else if constexpr (std::numeric_limits<FROM>::is_signed) {
            if (from < 0)
                return false;
            return static_cast<std::make_unsigned_t<FROM>>(from) <= std::numeric_limits<TO>::max();
        } else {
            return from <= static_cast<std::make_unsigned_t<TO>>(std::numeric_limits<TO>::max());
        }
    }

    template<typename TO, typename FROM>
    constexpr TO narrow_cast(const FROM from)
    {
        if (!fits<TO>(from)) [[unlikely]] {
            if constexpr (std::numeric_limits<FROM>::is_signed) {
                if (from < 0)
                    throw error(fmt::format("can't convert {} {} to {}: the value is too small", typeid(FROM).name(), from, typeid(TO).name()));
            }
            throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
        }
        return static_cast<TO>(from);
    }
}

#endif // !TYPED_CBOR_NARROW_CAST_HPP
