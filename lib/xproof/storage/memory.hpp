#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace xproof::storage::memory {
    // Safe for concurrent readers and writers
    struct db_t: storage::db_t {
        explicit db_t();
        ~db_t() override;
        void foreach(const observer_t &) const override;
        value_t get(buffer key) const override;
        void set(buffer key, buffer val) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
