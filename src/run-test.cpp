/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#ifndef _WIN32
#   include <sys/resource.h>
#endif
#include <chrono>
#include <iostream>
#include <xproof/common/logger.hpp>
#include <xproof/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace xproof;
    const auto start = std::chrono::steady_clock::now();
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
#   ifndef _WIN32
    {
#       ifdef XPROOF_STACK_SIZE
            static constexpr size_t stack_size = XPROOF_STACK_SIZE;
#       else
            static constexpr size_t stack_size = 32ULL << 20U;
#       endif
        struct rlimit rl;
        if (getrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
            throw error_sys("getrlimit RLIMIT_STACK failed!");
        if (rl.rlim_cur < stack_size) {
            rl.rlim_cur = stack_size;
            if (setrlimit(RLIMIT_STACK, &rl) != 0) [[unlikely]]
                throw error_sys("setrlimit RLIMIT_STACK failed!");
        }
        std::cerr << fmt::format("stack size: {} MB\n", rl.rlim_cur >> 20);
    }
#   endif
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    const auto took = std::chrono::duration<double> { std::chrono::steady_clock::now() - start }.count();
    logger::info("run-test took {:0.3f} sec", took);
    return res ? 1 : 0;
}
