/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "classifier.hpp"

namespace xproof::interop {
    game_output_t classify(const verdict_t verdict, const direction_t direction) noexcept
    {
        if ((verdict == verdict_t::valid) == (direction == direction_t::asserts_valid))
            return game_output_t::agree;
        return game_output_t::disagree;
    }
}
