/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_COMMON_TEST_HPP
#define TYPED_CBOR_COMMON_TEST_HPP

#include <iostream>
#include <source_location>
#include <span>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace typed_cbor {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", t);
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    // Compares after converting the actual value to the expected type and prints both on a mismatch.
    template<typename T, typename Y>
    bool test_same(const T &exp, const Y &act, const std::source_location &loc=std::source_location::current())
    {
        const bool same = exp == static_cast<T>(act);
        expect(same, loc) << fmt::format("expected: {} actual: {}", exp, act);
        return same;
    }

    template<typename T, typename Y>
    bool test_same(const std::string_view name, const T &exp, const Y &act, const std::source_location &loc=std::source_location::current())
    {
        const bool same = exp == static_cast<T>(act);
        expect(same, loc) << fmt::format("{}: expected: {} actual: {}", name, exp, act);
        return same;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<typed_cbor::test_printer>> {};

#endif // !TYPED_CBOR_COMMON_TEST_HPP
