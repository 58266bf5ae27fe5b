#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <utility>
#include "error.hpp"
#include "format.hpp"

namespace xproof {
    // a static_cast that throws when the value does not fit into TO
    template<typename TO, typename FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        if (!std::in_range<TO>(from)) [[unlikely]]
            throw error(fmt::format("the value {} is outside of the target range [{}, {}]",
                from, std::numeric_limits<TO>::min(), std::numeric_limits<TO>::max()));
        return static_cast<TO>(from);
    }
}
