/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <mutex>
#include <shared_mutex>
#include "memory.hpp"

namespace xproof::storage::memory {
    struct db_t::impl {
        void foreach(const observer_t &obs) const
        {
            std::shared_lock lk { _mutex };
            for (const auto &[k, v]: _db) {
                obs(k, v);
            }
        }

        value_t get(const buffer k) const
        {
            std::shared_lock lk { _mutex };
            if (const auto it = _db.find(k); it != _db.end())
                return it->second;
            return {};
        }

        void set(const buffer key, const buffer val)
        {
            std::unique_lock lk { _mutex };
            auto [it, created] = _db.try_emplace(key, val);
            if (!created && static_cast<buffer>(it->second) != val) [[unlikely]]
                throw err_conflicting_value_t(fmt::format("an attempt to replace the value of key {} with different bytes", key));
        }

        [[nodiscard]] size_t size() const
        {
            std::shared_lock lk { _mutex };
            return _db.size();
        }
    private:
        mutable std::shared_mutex _mutex {};
        std::map<uint8_vector, uint8_vector> _db {};
    };

    db_t::db_t():
        _impl { std::make_unique<impl>() }
    {
    }

    db_t::~db_t() = default;

    size_t db_t::size() const
    {
        return _impl->size();
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const buffer key) const
    {
        return _impl->get(key);
    }

    void db_t::set(const buffer key, const buffer val)
    {
        _impl->set(key, val);
    }
}
