/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef TYPED_CBOR_LOGGER_HPP
#define TYPED_CBOR_LOGGER_HPP

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <tc/common/error.hpp>
#include <tc/common/format.hpp>

namespace typed_cbor::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    // Enabled by the TC_DEBUG environment variable; lowers the logger's level to trace.
    extern bool &tracing_enabled();
    extern void log(level lev, const std::string &msg);

    template<typename... Args>
    void log(const level lev, const fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(lev, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::trace, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void debug(const fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::debug, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void info(const fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::info, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void warn(const fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::warn, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void error(const fmt::format_string<Args...> fmt_str, Args&&... a)
    {
        log(level::error, fmt::format(fmt_str, std::forward<Args>(a)...));
    }

    using action = std::function<void()>;
    using optional_action = std::optional<action>;

    // Runs main and then cleanup, which also runs when main throws. Exceptions are logged
    // together with the caller's location and returned to the caller for a later rethrow.
    extern std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current());

    inline void run_log_errors_rethrow(const action &main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current())
    {
        if (const auto ex = run_log_errors(main, cleanup, loc); ex)
            std::rethrow_exception(ex);
    }
}

namespace fmt {
    template<>
    struct formatter<typed_cbor::logger::level>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using typed_cbor::logger::level;
            switch (v) {
                case level::trace: return fmt::format_to(ctx.out(), "trace");
                case level::debug: return fmt::format_to(ctx.out(), "debug");
                case level::info: return fmt::format_to(ctx.out(), "info");
                case level::warn: return fmt::format_to(ctx.out(), "warn");
                case level::error: return fmt::format_to(ctx.out(), "error");
                default: throw typed_cbor::error(fmt::format("unsupported log level: {}", static_cast<int>(v)));
            }
        }
    };
}

#endif // !TYPED_CBOR_LOGGER_HPP
