/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdio>
#include "file.hpp"

namespace xproof::file {
    std::string install_path(const std::string_view path)
    {
        const std::filesystem::path p { path };
        if (p.is_absolute())
            return p.string();
        return (std::filesystem::path { "." } / p).string();
    }

    uint8_vector read(const std::string &path)
    {
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(path, ec);
        if (ec) [[unlikely]]
            throw error(fmt::format("failed to get the size of {}: {}", path, ec.message()));
        uint8_vector buf(sz);
        FILE *f = std::fopen(path.c_str(), "rb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for reading: {}", path));
        const auto num_read = std::fread(buf.data(), 1, buf.size(), f);
        std::fclose(f);
        if (num_read != sz) [[unlikely]]
            throw error_sys(fmt::format("could read only {} bytes from {} while expected {}", num_read, path, sz));
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        FILE *f = std::fopen(path.c_str(), "wb");
        if (f == nullptr) [[unlikely]]
            throw error_sys(fmt::format("failed to open file for writing: {}", path));
        const auto num_written = std::fwrite(data.data(), 1, data.size(), f);
        std::fclose(f);
        if (num_written != data.size()) [[unlikely]]
            throw error_sys(fmt::format("could write only {} bytes to {} while expected {}", num_written, path, data.size()));
    }
}
