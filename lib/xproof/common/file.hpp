#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace xproof::file {
    // relative paths are resolved against the working directory, absolute ones are kept
    extern std::string install_path(std::string_view path);
    extern uint8_vector read(const std::string &path);
    extern void write(const std::string &path, buffer data);

    // removes the file, if any, when going out of scope
    struct tmp {
        explicit tmp(const std::string_view name):
            _path { (std::filesystem::temp_directory_path() / name).string() }
        {
        }

        tmp(const tmp &) =delete;

        ~tmp()
        {
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
        }

        const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
