/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <cstdlib>
#include <optional>
#include "test.hpp"
#include "logger.hpp"

namespace {
    using namespace xproof;

    // restores an environment variable when going out of scope
    struct env_var_t {
        explicit env_var_t(const char *name):
            _name { name }
        {
            if (const char *val = std::getenv(name); val)
                _prev.emplace(val);
        }

        ~env_var_t()
        {
            if (_prev)
                ::setenv(_name, _prev->c_str(), 1);
            else
                ::unsetenv(_name);
        }

        void set(const char *val) const
        {
            ::setenv(_name, val, 1);
        }

        void unset() const
        {
            ::unsetenv(_name);
        }
    private:
        const char *_name;
        std::optional<std::string> _prev {};
    };
}

suite xproof_common_logger_suite = [] {
    "xproof::common::logger"_test = [] {
        "log path"_test = [] {
            const env_var_t var { "XPROOF_LOG" };
            var.unset();
            expect_equal(std::string { "./log/xproof.log" }, logger::log_path());
            var.set("consolidation/run.log");
            expect_equal(std::string { "./consolidation/run.log" }, logger::log_path());
            var.set("/tmp/xproof-consolidation.log");
            expect_equal(std::string { "/tmp/xproof-consolidation.log" }, logger::log_path());
        };
        "console sink"_test = [] {
            const env_var_t var { "XPROOF_LOG_NO_CONSOLE" };
            var.unset();
            expect(logger::console_enabled());
            var.set("1");
            expect(!logger::console_enabled());
        };
        "records reach the log file"_test = [] {
            const auto marker = fmt::format("verdict marker {}", std::chrono::steady_clock::now().time_since_epoch().count());
            logger::info("{}", marker);
            logger::get().flush();
            const auto bytes = file::read(logger::path());
            const std::string_view text { reinterpret_cast<const char *>(bytes.data()), bytes.size() };
            expect(text.find(marker) != std::string_view::npos) << logger::path();
        };
        "level"_test = [] {
            const auto exp = logger::tracing_enabled() ? logger::level::trace : logger::level::debug;
            expect(logger::get().level() == exp);
            expect(logger::get().should_log(logger::level::debug));
        };
    };
};
