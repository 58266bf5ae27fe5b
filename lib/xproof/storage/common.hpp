#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <memory>
#include <optional>
#include <xproof/common/bytes.hpp>

namespace xproof::storage {
    using value_t = std::optional<uint8_vector>;
    using observer_t = std::function<void(uint8_vector, uint8_vector)>;

    struct err_conflicting_value_t: error {
        using error::error;
    };

    // An append-only key-value store: once a key is set its value can only be set again to the same bytes
    struct db_t {
        virtual ~db_t() = default;
        virtual void foreach(const observer_t &) const = 0;
        [[nodiscard]] virtual value_t get(buffer key) const = 0;
        virtual void set(buffer key, buffer val) = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }

        [[nodiscard]] bool operator==(const db_t &o) const
        {
            if (size() != o.size())
                return false;
            size_t num_mismatches = 0;
            foreach([&](const auto &k, const auto &v) {
                const auto ov = o.get(k);
                if (v != ov)
                    ++num_mismatches;
            });
            return num_mismatches == 0;
        }
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
