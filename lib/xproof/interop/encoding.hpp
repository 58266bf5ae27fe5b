#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <limits>
#include <xproof/codec/serializable.hpp>
#include <xproof/common/bytes.hpp>
#include <xproof/common/numeric-cast.hpp>

namespace xproof::interop {
    // Canonical binary encoding: big-endian fixed-width integers, u32 element counts, raw fixed-size hashes.
    struct decoder;

    template<typename T>
    concept from_bytes_c = requires(T t, decoder &dec)
    {
        { T::from_bytes(dec) };
    };

    struct encoder;

    template<typename T>
    concept to_bytes_c = requires(T t, encoder &enc)
    {
        { t.to_bytes(enc) };
    };

    struct encoder: codec::archive_t {
        static void uint_fixed(const std::span<uint8_t> &bytes, const size_t num_bytes, const uint64_t val)
        {
            if (!num_bytes) [[unlikely]]
                throw error("interop::encoder: uint_fixed: num_bytes must be greater than 0!");
            if (bytes.size() != num_bytes) [[unlikely]]
                throw error(fmt::format("uint_fixed: expected an output buffer of {} bytes, got {}", num_bytes, bytes.size()));
            auto x = val;
            for (size_t i = num_bytes; i > 0; --i) {
                bytes[i - 1] = static_cast<uint8_t>(x & 0xFF);
                x >>= 8;
            }
            if (x) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded as a sequence of {} bytes", val, num_bytes));
        }

        template<typename ...Args>
        explicit encoder(const Args &... args)
        {
            (process(args), ...);
        }

        void push(const std::string_view)
        {
            // do nothing
        }

        void pop()
        {
            // do nothing
        }

        void uint_fixed(const size_t num_bytes, const uint64_t val)
        {
            for (size_t i = 0; i < num_bytes; ++i) {
                _bytes.emplace_back(0);
            }
            // emplace_back can reallocate, so take the pointer only after that
            uint_fixed(std::span { _bytes.data() + _bytes.size() - num_bytes, num_bytes }, num_bytes, val);
        }

        template<typename T>
        void process_uint(const T &val)
        {
            uint_fixed(sizeof(val), val);
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<uint32_t>::max())
        {
            if (!(static_cast<int>(self.size() >= min_sz) & static_cast<int>(self.size() <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", self.size(), min_sz, max_sz));
            uint_fixed(4, numeric_cast<uint32_t>(self.size()));
            for (const auto &v: self)
                encode(v);
        }

        void process_bytes(const buffer bytes)
        {
            uint_fixed(4, numeric_cast<uint32_t>(bytes.size()));
            _bytes << bytes;
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _bytes << bytes;
        }

        template<typename T>
        void process(const T &val)
        {
            if constexpr (to_bytes_c<T>) {
                val.to_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                // since the encoder methods do not update the value, it's safe to const_cast the value
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (codec::byte_array_c<T>) {
                process_bytes_fixed(val);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                uint_fixed(8, val);
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                uint_fixed(4, val);
            } else if constexpr (std::is_same_v<T, uint16_t>) {
                uint_fixed(2, val);
            } else if constexpr (std::is_same_v<T, uint8_t>) {
                uint_fixed(1, val);
            } else if constexpr (std::is_same_v<T, bool>) {
                uint_fixed(1, static_cast<uint8_t>(val));
            } else {
                throw error(fmt::format("serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, const T &val)
        {
            process(val);
        }

        template<typename T>
        void encode(const T &val)
        {
            process(val);
        }

        uint8_vector &bytes()
        {
            return _bytes;
        }

        const uint8_vector &bytes() const
        {
            return _bytes;
        }
    private:
        uint8_vector _bytes {};
    };

    struct decoder: codec::archive_t {
        explicit decoder(const buffer bytes) noexcept:
            _ptr { bytes.data() },
            _end { bytes.data() + bytes.size() }
        {
        }

        void push(const std::string_view)
        {
            // do nothing
        }

        void pop()
        {
            // do nothing
        }

        template<typename T>
        T uint_fixed(const size_t num_bytes)
        {
            if (num_bytes > 8) [[unlikely]]
                throw error("uint_fixed supports 8-bytes values at most!");
            uint64_t x = 0;
            for (size_t i = 0; i < num_bytes; ++i) {
                x = (x << 8) | next();
            }
            return numeric_cast<T>(x);
        }

        template<typename T>
        void decode(T &val)
        {
            if constexpr (from_bytes_c<T>) {
                val = T::from_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                val.serialize(*this);
            } else if constexpr (codec::byte_array_c<T>) {
                process_bytes_fixed(val);
            } else if constexpr (std::is_same_v<uint64_t, T>) {
                val = uint_fixed<T>(8);
            } else if constexpr (std::is_same_v<uint32_t, T>) {
                val = uint_fixed<T>(4);
            } else if constexpr (std::is_same_v<uint16_t, T>) {
                val = uint_fixed<T>(2);
            } else if constexpr (std::is_same_v<uint8_t, T>) {
                val = uint_fixed<T>(1);
            } else if constexpr (std::is_same_v<bool, T>) {
                const auto b = uint_fixed<uint8_t>(1);
                if (b > 1) [[unlikely]]
                    throw error(fmt::format("an invalid boolean value: {}", b));
                val = b != 0;
            } else {
                throw error(fmt::format("serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process_uint(T &val)
        {
            val = uint_fixed<T>(sizeof(val));
        }

        template<typename T>
        void process(T &val)
        {
            decode(val);
        }

        template<typename T>
        void process(const std::string_view, T &val)
        {
            process(val);
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<uint32_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto sz = uint_fixed<size_t>(4);
            if (!(static_cast<int>(sz >= min_sz) & static_cast<int>(sz <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", sz, min_sz, max_sz));
            // each element takes at least one byte so a larger count cannot be satisfied
            if (sz > size()) [[unlikely]]
                throw error(fmt::format("array size {} exceeds the remaining {} bytes", sz, size()));
            self.clear();
            self.reserve(sz);
            for (size_t i = 0; i < sz; ++i) {
                typename T::value_type v;
                process(v);
                self.emplace_back(std::move(v));
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes)
        {
            const auto sz = uint_fixed<size_t>(4);
            const auto data = next_bytes(sz);
            bytes.resize(sz);
            if (sz)
                memcpy(bytes.data(), data.data(), sz);
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            const auto data = next_bytes(bytes.size());
            if (!bytes.empty())
                memcpy(bytes.data(), data.data(), bytes.size());
        }

        [[nodiscard]] uint8_t next()
        {
            if (_ptr >= _end) [[unlikely]]
                throw error("codec: an attempt to read past the end of the byte stream");
            return *_ptr++;
        }

        [[nodiscard]] buffer next_bytes(const size_t sz)
        {
            if (sz > size()) [[unlikely]]
                throw error("codec: an attempt to read past the end of the byte stream");
            const auto *begin = _ptr;
            _ptr += sz;
            return { begin, sz };
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _ptr >= _end;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return empty() ? size_t { 0 } : numeric_cast<size_t>(_end - _ptr);
        }
    private:
        const uint8_t *_ptr, *_end;
    };

    template<typename T>
    encoder &operator<<(encoder &enc, const T &val)
    {
        enc.encode(val);
        return enc;
    }

    template<typename T>
    uint8_vector to_bytes(const T &val)
    {
        encoder enc { val };
        return std::move(enc.bytes());
    }

    // The whole buffer must be consumed: trailing bytes are an error
    template<typename T>
    T from_bytes(const buffer bytes)
    {
        decoder dec { bytes };
        T res;
        if constexpr (from_bytes_c<T>) {
            res = T::from_bytes(dec);
        } else if constexpr (codec::serializable_c<T>) {
            res = codec::from<T>(dec);
        } else {
            throw error(fmt::format("binary deserialization not supported for type {}", typeid(T).name()));
        }
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} trailing bytes after a {}", dec.size(), typeid(T).name()));
        return res;
    }
}
