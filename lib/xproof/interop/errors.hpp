#pragma once
/* This file is part of xproof project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <variant>
#include <xproof/common/error.hpp>

namespace xproof::interop {
    // fatal: a run cannot reach a verdict without the data
    struct err_preimage_unavailable_t: error {
        using error::error;
    };

    struct err_malformed_super_root_t: error {
        using error::error;
    };

    struct err_malformed_preimage_t: error {
        using error::error;
    };

    struct err_unknown_chain_t: error {
        using error::error;
    };

    struct err_invalid_registry_t: error {
        using error::error;
    };

    // classified into a verdict, never escape the state machine
    struct err_dependency_invalid_t: error {
        using error::error;
    };

    struct err_unresolved_dependency_t: error {
        using error::error;
    };

    struct err_aggregate_mismatch_t: error {
        using error::error;
    };

    template<typename BASE_T, typename BASE_V>
    struct err_group_t: BASE_V {
        using base_type = BASE_V;
        using base_type::base_type;

        static void catch_into(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (std::variant_size_v<BASE_V> > 0) {
                catch_into_impl<std::variant_size_v<BASE_V> - 1>(action, on_error);
            }
        }
    private:
        template<size_t I>
        static void catch_into_impl(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (I == 0) {
                try {
                    action();
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            } else {
                try {
                    catch_into_impl<I - 1>(action, on_error);
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            }
        }
    };

    using dependency_err_base_t = std::variant<
        err_dependency_invalid_t,
        err_unresolved_dependency_t
    >;

    struct dependency_err_t: err_group_t<dependency_err_t, dependency_err_base_t> {
        using base_type = err_group_t<dependency_err_t, dependency_err_base_t>;
        using base_type::base_type;

        [[nodiscard]] bool invalid() const noexcept
        {
            return std::holds_alternative<err_dependency_invalid_t>(*this);
        }

        [[nodiscard]] const char *what() const noexcept
        {
            return std::visit([](const auto &e) { return e.what(); }, static_cast<const dependency_err_base_t &>(*this));
        }
    };
}
