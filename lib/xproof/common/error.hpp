#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <stdexcept>
#include <string_view>

namespace xproof {
    // The base of every exception thrown by xproof
    struct error: std::runtime_error {
        explicit error(std::string_view msg);
        // the message of the cause is appended
        error(std::string_view msg, const std::exception &cause);
    };

    // appends the current errno and its description
    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}
