// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace icnx::cli {

// Terminal rendering of one session's event stream: item lifecycle lines
// plus a single aggregate progress bar
class SessionView {
public:
    explicit SessionView(bool verbose = false, bool quiet = false) noexcept
        : verbose_(verbose), quiet_(quiet) {}

    void on_event(std::string_view name, const nlohmann::json& payload);

    // Finish the progress line
    void finish();

    [[nodiscard]] std::size_t items() const noexcept { return items_.size(); }

    [[nodiscard]] static std::string format_speed(double bps);

private:
    struct ItemState {
        std::uint64_t downloaded{0};
        std::uint64_t total{0};
        double speed{0.0};
        std::string status;
    };

    void on_progress(const nlohmann::json& payload);
    void print_line(const std::string& line);
    void render();
    [[nodiscard]] static std::string render_bar(double percent);

    std::map<std::string, ItemState> items_;
    bool verbose_;
    bool quiet_;
    bool bar_drawn_{false};
    int last_percent_{-1};
};

} // namespace icnx::cli
