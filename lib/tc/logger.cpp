/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2024 Alex Sierkov (alex dot sierkov at gmail dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <typeinfo>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <tc/logger.hpp>

namespace typed_cbor::logger {
    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("TC_DEBUG") != nullptr;
        return enabled;
    }

    static spdlog::sink_ptr console_sink()
    {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_level(spdlog::level::info);
        sink->set_pattern("[%^%l%$] %v");
        return sink;
    }

    static spdlog::sink_ptr file_sink(const std::string &path)
    {
        // spdlog reports an unwritable file only on the first write, so test it upfront
        if (!std::ofstream { path, std::ios_base::app }) {
            std::cerr << fmt::format("TC_INIT: cannot write to the log file {}; terminating\n", path);
            std::terminate();
        }
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        sink->set_level(spdlog::level::trace);
        sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        return sink;
    }

    static spdlog::logger create()
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (!std::getenv("TC_LOG_NO_CONSOLE"))
            sinks.emplace_back(console_sink());
        if (const char *path = std::getenv("TC_LOG"); path)
            sinks.emplace_back(file_sink(path));
        spdlog::logger logger { "tc", sinks.begin(), sinks.end() };
        logger.set_level(tracing_enabled() ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create();
        return logger;
    }

    static spdlog::level::level_enum spdlog_level(const level lev)
    {
        switch (lev) {
            case level::trace: return spdlog::level::trace;
            case level::debug: return spdlog::level::debug;
            case level::info: return spdlog::level::info;
            case level::warn: return spdlog::level::warn;
            case level::error: return spdlog::level::err;
            default: throw typed_cbor::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }

    void log(const level lev, const std::string &msg)
    {
        get().log(spdlog_level(lev), msg);
    }

    std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup, const std::source_location &loc)
    {
        std::exception_ptr ex_ptr {};
        try {
            main();
        } catch (const typed_cbor::error &ex) {
            ex_ptr = std::current_exception();
            logger::error("block at {} failed: {}", loc, ex.what());
        } catch (const std::exception &ex) {
            ex_ptr = std::current_exception();
            logger::error("block at {} failed with {}: {}", loc, typeid(ex).name(), ex.what());
        } catch (...) {
            ex_ptr = std::current_exception();
            logger::error("block at {} failed with an unknown exception", loc);
        }
        if (cleanup)
            (*cleanup)();
        return ex_ptr;
    }
}
