/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CBOR_PARSER_HPP
#define TYPED_CBOR_CBOR_PARSER_HPP

#include <tc/config.hpp>
#include <tc/cbor/byte-reader.hpp>
#include <tc/cbor/value.hpp>

namespace typed_cbor::cbor {
    extern double decode_half(uint16_t bits);

    struct parser {
        explicit parser(const buffer bytes, const decode_config &cfg={}):
            _reader { bytes }, _cfg { cfg }
        {
        }

        // Decodes exactly one complete value starting at the current offset.
        value read();

        bool eof() const noexcept
        {
            return _reader.remaining() == 0;
        }

        size_t offset() const noexcept
        {
            return _reader.offset();
        }
    private:
        struct nesting_guard;

        byte_reader _reader;
        const decode_config _cfg;
        size_t _depth = 0;

        bool _read_item(value &val, bool break_allowed);
        uint64_t _read_argument(uint8_t ai, size_t hdr_off);
        void _check_collection_size(uint64_t size, size_t hdr_off) const;
        uint8_vector _read_chunks(major_type type, size_t hdr_off);
        std::string _read_text(uint64_t size, bool indefinite, size_t hdr_off);
        value _read_array(uint64_t size, bool indefinite, size_t hdr_off);
        value _read_map(uint64_t size, bool indefinite, size_t hdr_off);
        value _read_tag(uint64_t id, size_t hdr_off);
        value _read_simple(uint8_t ai, uint64_t arg, size_t hdr_off);
    };

    // Decodes a buffer that must contain exactly one complete value.
    extern value decode(buffer bytes, const decode_config &cfg={});
}

#endif // !TYPED_CBOR_CBOR_PARSER_HPP
