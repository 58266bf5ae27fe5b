#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <source_location>
#include <string_view>
#include <typeinfo>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "file.hpp"
#include "format.hpp"

namespace xproof {
    using namespace boost::ut;

    template<typename X, typename Y>
    bool expect_equal(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    // the action must throw E with a message that mentions the given text
    template<typename E>
    bool expect_throws_with(const std::function<void()> &action, const std::string_view text,
        const std::source_location &loc=std::source_location::current())
    {
        try {
            action();
        } catch (const E &ex) {
            const std::string_view what { ex.what() };
            const auto res = what.find(text) != std::string_view::npos;
            expect(res, loc) << fmt::format("'{}' does not mention '{}'", what, text);
            return res;
        }
        expect(false, loc) << fmt::format("{} was not thrown", typeid(E).name());
        return false;
    }
}
