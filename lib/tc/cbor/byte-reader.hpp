/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_CBOR_BYTE_READER_HPP
#define TYPED_CBOR_CBOR_BYTE_READER_HPP

#include <tc/common/bytes.hpp>
#include <tc/cbor/types.hpp>

namespace typed_cbor::cbor {
    // A bounds-checked cursor over a borrowed buffer; the buffer must outlive the reader.
    struct byte_reader {
        explicit byte_reader(const buffer bytes) noexcept:
            _bytes { bytes }
        {
        }

        uint8_t peek_byte() const
        {
            if (_offset >= _bytes.size()) [[unlikely]]
                throw eof_error(1);
            return _bytes[_offset];
        }

        uint8_t read_byte()
        {
            const auto b = peek_byte();
            ++_offset;
            return b;
        }

        uint64_t read_uint(const size_t width)
        {
            switch (width) {
                case 1: case 2: case 4: case 8:
                    break;
                default:
                    throw decode_error(error_kind::invalid_encoding, location(), fmt::format("unsupported integer width {}", width));
            }
            if (remaining() < width) [[unlikely]]
                throw eof_error(width);
            uint64_t x = 0;
            for (size_t i = 0; i < width; ++i)
                x = (x << 8) | _bytes[_offset + i];
            _offset += width;
            return x;
        }

        buffer read_bytes(const uint64_t num_bytes)
        {
            // compared against the remaining count so that a huge num_bytes cannot overflow the offset
            if (num_bytes > remaining()) [[unlikely]]
                throw eof_error(num_bytes);
            const auto res = _bytes.subbuf(_offset, static_cast<size_t>(num_bytes));
            _offset += res.size();
            return res;
        }

        // Fails unless count items taking at least item_size bytes each can still follow.
        void ensure_items(const uint64_t count, const size_t item_size) const
        {
            if (count > remaining() / item_size) [[unlikely]]
                throw decode_error { error_kind::unexpected_eof, location(),
                    fmt::format("{} items of at least {} bytes each do not fit into the remaining {} bytes", count, item_size, remaining()) };
        }

        size_t remaining() const noexcept
        {
            return _bytes.size() - _offset;
        }

        size_t offset() const noexcept
        {
            return _offset;
        }

        std::string location() const
        {
            return location(_offset);
        }

        static std::string location(const size_t off)
        {
            return fmt::format("offset {}", off);
        }
    private:
        const buffer _bytes;
        size_t _offset = 0;

        decode_error eof_error(const uint64_t needed) const
        {
            return decode_error { error_kind::unexpected_eof, location(),
                fmt::format("need {} bytes but only {} remain", needed, remaining()) };
        }
    };
}

#endif // !TYPED_CBOR_CBOR_BYTE_READER_HPP
