#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <string_view>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif
#include "format.hpp"

namespace xproof::logger {
    using level = spdlog::level::level_enum;

    // XPROOF_DEBUG lowers the level to trace
    extern bool &tracing_enabled();
    // XPROOF_LOG or log/xproof.log
    extern std::string log_path();
    // XPROOF_LOG_NO_CONSOLE disables the stderr sink
    extern bool console_enabled();
    // the file the process logs to, fixed at the first use
    extern const std::string &path();
    extern spdlog::logger &get();

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        get().log(lev, fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::err, fmt, std::forward<Args>(a)...);
    }
}
