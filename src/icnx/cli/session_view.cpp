// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/cli/session_view.hpp>
#include <icnx/core/events.hpp>
#include <icnx/store/history_store.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace icnx::cli {

namespace ev = icnx::core::events;

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

std::uint64_t uint_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<std::uint64_t>();
    }
    return 0;
}

} // namespace

void SessionView::on_event(std::string_view name, const nlohmann::json& payload) {
    if (name == ev::PROGRESS) {
        on_progress(payload);
        return;
    }

    if (name == ev::ITEM_QUEUED) {
        items_[string_field(payload, "url")];
        if (verbose_) print_line("queued    " + string_field(payload, "url"));
    } else if (name == ev::ITEM_COMPLETED) {
        print_line("completed " + string_field(payload, "path") + " ("
                   + store::format_size(uint_field(payload, "size")) + ")");
    } else if (name == ev::ITEM_PARSE_ERROR) {
        print_line("skipped   " + string_field(payload, "error"));
    } else if (name == ev::SESSION_PAUSED) {
        print_line("paused");
    } else if (name == ev::SESSION_RESUMED) {
        print_line("resumed");
    } else if (name == ev::SESSION_CANCELLED) {
        print_line("cancelling...");
    } else if (verbose_) {
        print_line(std::string(name) + " " + payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
}

void SessionView::on_progress(const nlohmann::json& payload) {
    auto url = string_field(payload, "url");
    auto& item = items_[url];
    item.downloaded = uint_field(payload, "downloaded");
    item.total = uint_field(payload, "total");
    item.speed = payload.contains("speed") && payload["speed"].is_number() ? payload["speed"].get<double>() : 0.0;
    item.status = string_field(payload, "status");

    if (item.status == "failed") {
        print_line("failed    " + url + ": " + string_field(payload, "error"));
    }
    render();
}

void SessionView::print_line(const std::string& line) {
    if (quiet_) return;
    if (bar_drawn_) {
        std::cout << "\r" << std::string(100, ' ') << "\r";
        bar_drawn_ = false;
        last_percent_ = -1;
    }
    std::cout << line << std::endl;
}

void SessionView::render() {
    if (quiet_ || items_.empty()) return;

    std::uint64_t downloaded = 0;
    std::uint64_t total = 0;
    double speed = 0.0;
    std::size_t done = 0;
    for (const auto& [url, item] : items_) {
        downloaded += item.downloaded;
        total += item.total;
        if (item.status == "downloading") speed += item.speed;
        if (item.status == "completed" || item.status == "failed" || item.status == "cancelled") ++done;
    }

    double percent = total > 0 ? static_cast<double>(downloaded) * 100.0 / static_cast<double>(total) : 0.0;
    percent = std::clamp(percent, 0.0, 100.0);

    // Redraw on whole-percent changes only
    int scaled = static_cast<int>(percent);
    if (scaled == last_percent_ && done < items_.size()) return;
    last_percent_ = scaled;

    std::string line = "\r" + render_bar(percent);
    line += fmt::format(" {:3d}% {}/{} files, {}", scaled, done, items_.size(), store::format_size(downloaded));
    if (speed > 0.0) {
        line += " @ " + format_speed(speed);
    }
    line += std::string(10, ' ');

    std::cout << line << std::flush;
    bar_drawn_ = true;
}

void SessionView::finish() {
    if (bar_drawn_ && !quiet_) {
        std::cout << std::endl;
    }
    bar_drawn_ = false;
}

std::string SessionView::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(bar_width - filled), ' ');
    bar += "]";
    return bar;
}

std::string SessionView::format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    if (bps >= GB) return fmt::format("{:.1f} GB/s", bps / GB);
    if (bps >= MB) return fmt::format("{:.1f} MB/s", bps / MB);
    if (bps >= KB) return fmt::format("{:.1f} KB/s", bps / KB);
    return fmt::format("{:.0f} B/s", bps);
}

} // namespace icnx::cli
