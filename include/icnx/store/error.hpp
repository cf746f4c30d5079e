// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace icnx::store {

enum class StoreErrc {
    success = 0,
    not_found,
    open_failed,
    prepare_failed,
    bind_failed,
    step_failed,
    exec_failed,
    io_error,
    parse_error,
};

namespace detail {

struct StoreErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "icnx::store";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::success:        return "Success";
            case StoreErrc::not_found:      return "Database does not exist";
            case StoreErrc::open_failed:    return "Cannot open database";
            case StoreErrc::prepare_failed: return "Cannot prepare statement";
            case StoreErrc::bind_failed:    return "Cannot bind parameter";
            case StoreErrc::step_failed:    return "Statement execution failed";
            case StoreErrc::exec_failed:    return "SQL execution failed";
            case StoreErrc::io_error:       return "Store I/O error";
            case StoreErrc::parse_error:    return "Malformed stored data";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StoreErrcCategory& store_errc_category() noexcept {
    static detail::StoreErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_errc_category()};
}

} // namespace icnx::store

namespace std {

template<>
struct is_error_code_enum<icnx::store::StoreErrc> : true_type {};

} // namespace std
