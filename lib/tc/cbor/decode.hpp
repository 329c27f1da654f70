/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CBOR_DECODE_HPP
#define TYPED_CBOR_CBOR_DECODE_HPP

#include <tc/cbor/parser.hpp>
#include <tc/cbor/projector.hpp>

namespace typed_cbor::cbor {
    template<typename T>
    T decode_to(const buffer bytes, const decode_config &cfg={})
    {
        const auto val = decode(bytes, cfg);
        return project<T>(val, cfg);
    }
}

#endif // !TYPED_CBOR_CBOR_DECODE_HPP
