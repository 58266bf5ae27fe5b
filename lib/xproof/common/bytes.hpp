#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <array>
#include <cctype>
#include <compare>
#include <cstring>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "error.hpp"
#include "format.hpp"

namespace xproof {
    typedef std::span<uint8_t> write_buffer;

    struct buffer: std::span<const uint8_t> {
        buffer() =default;
        buffer(const buffer &) =default;

        template <typename T, size_t SZ>
        buffer(const std::span<T, SZ> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), SZ * sizeof(T) }
        {
        }

        template <typename T>
        buffer(const std::span<T> bytes):
            buffer { reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size() * sizeof(T) }
        {
        }

        buffer(const uint8_t *data, const size_t sz):
            std::span<const uint8_t> { data, sz }
        {
        }

        buffer(const std::string_view s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer(const std::string &s):
            buffer { reinterpret_cast<const uint8_t *>(s.data()), s.size() }
        {
        }

        buffer &operator=(const buffer &o) =default;

        operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        std::strong_ordering operator<=>(const buffer &o) const noexcept
        {
            const auto min_sz = std::min(size(), o.size());
            const auto cmp = min_sz ? memcmp(data(), o.data(), min_sz) : 0;
            if (cmp < 0)
                return std::strong_ordering::less;
            if (cmp > 0)
                return std::strong_ordering::greater;
            return size() <=> o.size();
        }

        bool operator==(const buffer &o) const noexcept
        {
            return std::strong_ordering::equal == (*this <=> o);
        }

        uint8_t at(const size_t off) const
        {
            if (off < size()) [[likely]]
                return (*this)[off];
            throw error(fmt::format("requested offset: {} that behind the end of buffer: {}!", off, size()));
        }

        buffer subbuf(const size_t offset, const size_t sz) const
        {
            if (offset + sz <= size()) [[likely]]
                return buffer { data() + offset, sz };
            throw error(fmt::format("requested offset: {} and size: {} end over the end of buffer's size: {}!", offset, sz, size()));
        }

        buffer subbuf(const size_t offset) const
        {
            if (offset <= size()) [[likely]]
                return subbuf(offset, size() - offset);
            throw error(fmt::format("a buffer's offset {} is greater than its size {}", offset, size()));
        }
    };

    inline uint8_t uint_from_hex(char k)
    {
        switch (std::tolower(static_cast<unsigned char>(k))) {
            case '0': return 0;
            case '1': return 1;
            case '2': return 2;
            case '3': return 3;
            case '4': return 4;
            case '5': return 5;
            case '6': return 6;
            case '7': return 7;
            case '8': return 8;
            case '9': return 9;
            case 'a': return 10;
            case 'b': return 11;
            case 'c': return 12;
            case 'd': return 13;
            case 'e': return 14;
            case 'f': return 15;
            default: throw error(fmt::format("unexpected character in a hex number: {}!", k));
        }
    }

    inline void init_from_hex(std::span<uint8_t> out, const std::string_view hex)
    {
        if (hex.size() != out.size() * 2)
            throw error(fmt::format("hex string must have {} characters but got {}: {}!", out.size() * 2, hex.size(), hex));
        for (size_t i = 0; i < out.size(); ++i)
            out[i] = uint_from_hex(hex[i * 2]) << 4 | uint_from_hex(hex[i * 2 + 1]);
    }

    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        template<typename C=byte_array<SZ>>
        static C from_hex(const std::string_view hex)
        {
            C data;
            init_from_hex(data, hex);
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("span must be of size {} but got {}", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("a buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("a buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), std::data(s), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        explicit operator std::string_view() const noexcept
        {
            return { reinterpret_cast<const char *>(base_type::data()), base_type::size() };
        }

        std::span<const uint8_t> span() const noexcept
        {
            return { base_type::data(), SZ };
        }
    };

    struct uint8_vector: std::vector<uint8_t> {
        using base_type = std::vector<uint8_t>;
        using base_type::base_type;

        template<typename C=uint8_vector>
        static C from_hex(const std::string_view hex)
        {
            if (hex.size() % 2 != 0)
                throw error(fmt::format("hex string must have an even number of characters but got {}!", hex.size()));
            C data(hex.size() / 2);
            init_from_hex(data, hex);
            return data;
        }

        uint8_vector() noexcept =default;

        uint8_vector(base_type &&o) noexcept:
            base_type { std::move(o) }
        {
        }

        uint8_vector(const size_t sz):
            std::vector<uint8_t>(sz)
        {
        }

        uint8_vector(const buffer bytes):
            std::vector<uint8_t> { bytes.begin(), bytes.end() }
        {
        }

        operator buffer() const noexcept
        {
            return { data(), size() };
        }

        std::string_view str() const noexcept
        {
            return { reinterpret_cast<const char *>(data()), size() };
        }

        uint8_vector &operator=(const buffer bytes)
        {
            resize(bytes.size());
            if (!bytes.empty())
                memcpy(data(), bytes.data(), bytes.size());
            return *this;
        }

        std::strong_ordering operator<=>(const uint8_vector &o) const noexcept
        {
            return static_cast<buffer>(*this) <=> static_cast<buffer>(o);
        }

        bool operator==(const uint8_vector &o) const noexcept
        {
            return std::strong_ordering::equal == (*this <=> o);
        }
    };

    static_assert(std::is_constructible_v<uint8_vector, buffer>);
    static_assert(std::is_convertible_v<uint8_vector, buffer>);

    inline uint8_vector &operator<<(uint8_vector &v, const uint8_t b)
    {
        v.push_back(b);
        return v;
    }

    inline uint8_vector &operator<<(uint8_vector &v, const buffer buf)
    {
        const size_t end_off = v.size();
        v.resize(end_off + buf.size());
        if (!buf.empty())
            memcpy(v.data() + end_off, buf.data(), buf.size());
        return v;
    }
}

namespace fmt {
    template<size_t SZ>
    struct formatter<xproof::byte_array<SZ>>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const xproof::byte_array<SZ> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(v.span(), ctx);
        }
    };

    template<>
    struct formatter<xproof::buffer>: formatter<std::span<const uint8_t>> {
    };

    template<>
    struct formatter<xproof::uint8_vector>: formatter<std::span<const uint8_t>> {
        template<typename FormatContext>
        auto format(const xproof::uint8_vector &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return formatter<std::span<const uint8_t>>::format(std::span<const uint8_t> { v.data(), v.size() }, ctx);
        }
    };
}
