/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifdef __APPLE__
#   define _GNU_SOURCE 1
#endif
#include <cerrno>
#include <cstring>
#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <tc/logger.hpp>

namespace typed_cbor {
    // frames of safe_dump_to and of the error constructors
    static constexpr size_t own_frames = 3;

    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        boost::stacktrace::safe_dump_to(own_frames, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        // what() is noexcept, so the trace is rendered into a fixed thread-local buffer
        thread_local std::array<char, 0x2000> text {};
        boost::interprocess::obufferstream os { text.data(), text.size() - 1 };
        os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
        text[os.buffer().second] = 0;
        logger::debug("{} raised at:\n{}", _msg, text.data());
        return _msg.c_str();
    }

    error::error(const std::string_view msg):
        base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &cause):
        error { fmt::format("{} caused by {}: {}", msg, typeid(cause).name(), cause.what()) }
    {
    }

    error_sys::error_sys(const std::string_view msg):
        error { fmt::format("{} errno: {} strerror: {}", msg, errno, std::strerror(errno)) }
    {
    }
}
