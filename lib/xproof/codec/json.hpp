#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <limits>
#include <optional>
#include <ostream>
#include <vector>
#include <boost/json.hpp>
#include <xproof/common/bytes.hpp>
#include "serializable.hpp"

namespace xproof::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(T t, boost::json::value jv)
    {
        { T::from_json(jv) };
    };

    extern value parse(const buffer &buf);
    extern value load(const std::string &path);
    extern void save_pretty(std::ostream& os, value const &jv, std::string *indent = nullptr);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    struct decoder: archive_t {
        decoder(const boost::json::value &jv)
        {
            _vals.emplace_back(jv);
        }

        void push(const std::string_view name)
        {
            _vals.emplace_back(_top().as_object().at(name));
        }

        void pop()
        {
            if (_vals.size() == 1) [[unlikely]]
                throw error("cannot pop the top element!");
            _vals.pop_back();
        }

        template<typename T>
        static void decode(const boost::json::value &jv, T &val)
        {
            if constexpr (from_json_c<T>) {
                val = T::from_json(jv);
            } else if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (byte_array_c<T>) {
                decoder dec { jv };
                dec.process_bytes_fixed(val);
            } else if constexpr (optional_c<T>) {
                decoder dec { jv };
                dec.process_optional(val);
            } else if constexpr (std::is_same_v<T, uint8_t>
                    || std::is_same_v<T, uint16_t>
                    || std::is_same_v<T, uint32_t>
                    || std::is_same_v<T, uint64_t>
                    || std::is_same_v<T, int64_t>
                    || std::is_same_v<T, bool>) {
                val = boost::json::value_to<T>(jv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                val = boost::json::value_to<std::string>(jv);
            } else {
                throw error(fmt::format("json serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process_varlen_uint(T &val)
        {
            val = boost::json::value_to<T>(_top());
        }

        void process_string(std::string &val)
        {
            val = boost::json::value_to<std::string>(_top());
        }

        template<typename T>
        void process_uint(T &val)
        {
            process_varlen_uint(val);
        }

        void process(auto &val)
        {
            decode(_top(), val);
        }

        void process(const std::string_view name, auto &val)
        {
            using T = std::decay_t<decltype(val)>;
            const auto &jo = _top().as_object();
            const auto it = jo.find(name);
            if (it != jo.end()) {
                decode(it->value(), val);
            } else {
                if constexpr (optional_c<T>) {
                    val.reset();
                } else {
                    throw error(fmt::format("a required field '{}' is missing in: {}", name, codec::json::serialize_pretty(jo)));
                }
            }
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto &j_arr = _top().as_array();
            if (!(static_cast<int>(j_arr.size() >= min_sz) & static_cast<int>(j_arr.size() <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", j_arr.size(), min_sz, max_sz));
            self.clear();
            self.reserve(j_arr.size());
            for (size_t i = 0; i < j_arr.size(); ++i) {
                typename T::value_type v;
                decode(j_arr[i], v);
                self.emplace_back(std::move(v));
            }
        }

        template<typename T>
        void process_optional(T &val)
        {
            val.reset();
            if (!_top().is_null()) {
                val.emplace();
                decode(_top(), *val);
            }
        }

        void process_bytes_fixed(std::span<uint8_t> bytes)
        {
            const auto hex = boost::json::value_to<std::string_view>(_top());
            if (!hex.starts_with("0x")) [[unlikely]]
                throw error(fmt::format("expected a hex string but got: {}", hex));
            init_from_hex(bytes, hex.substr(2));
        }
    private:
        std::vector<std::reference_wrapper<const boost::json::value>> _vals {};

        const boost::json::value &_top() const
        {
            return _vals.back().get();
        }
    };

    template<typename T>
    T from_json(const value &j)
    {
        if constexpr (from_json_c<T>) {
            return T::from_json(j);
        } else if constexpr (codec::serializable_c<T>) {
            codec::json::decoder j_dec { j };
            return codec::from<T>(j_dec);
        } else {
            throw error(fmt::format("JSON serialization not supported for {}", typeid(T).name()));
        }
    }

    template<typename T>
    T load_obj(const std::string &path)
    {
        return from_json<T>(load(path));
    }
}
