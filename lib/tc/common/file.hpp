/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_COMMON_FILE_HPP
#define TYPED_CBOR_COMMON_FILE_HPP

#include <cstdio>
#include <string>
#include "bytes.hpp"
#include "error.hpp"
#include "format.hpp"

namespace typed_cbor::file {
    struct read_stream {
        explicit read_stream(const std::string &path):
            _path { path }, _f { std::fopen(path.c_str(), "rb") }
        {
            if (!_f) [[unlikely]]
                throw error_sys(fmt::format("failed to open a file for reading {}", _path));
        }

        read_stream(const read_stream &) =delete;

        ~read_stream()
        {
            std::fclose(_f);
        }

        size_t size()
        {
            if (std::fseek(_f, 0, SEEK_END) != 0) [[unlikely]]
                throw error_sys(fmt::format("failed to seek to the end of {}", _path));
            const auto sz = std::ftell(_f);
            if (sz < 0) [[unlikely]]
                throw error_sys(fmt::format("failed to tell the size of {}", _path));
            if (std::fseek(_f, 0, SEEK_SET) != 0) [[unlikely]]
                throw error_sys(fmt::format("failed to seek to the start of {}", _path));
            return static_cast<size_t>(sz);
        }

        void read(void *data, const size_t num_bytes)
        {
            if (num_bytes > 0 && std::fread(data, 1, num_bytes, _f) != num_bytes) [[unlikely]]
                throw error_sys(fmt::format("failed to read {} bytes from {}", num_bytes, _path));
        }
    private:
        const std::string _path;
        FILE *_f;
    };

    inline uint8_vector read(const std::string &path)
    {
        read_stream is { path };
        uint8_vector buf(is.size());
        is.read(buf.data(), buf.size());
        return buf;
    }
}

#endif // !TYPED_CBOR_COMMON_FILE_HPP
