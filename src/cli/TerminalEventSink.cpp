/**
 * @file TerminalEventSink.cpp
 * @brief Terminal rendering of streamed events
 */

#include "cli/TerminalEventSink.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <format>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto YELLOW = "\033[33m";
constexpr auto MAGENTA = "\033[35m";

auto safety_color(SafetyLevel level) -> const char* {
    switch (level) {
        case SafetyLevel::SAFE: return GREEN;
        case SafetyLevel::CAUTION: return YELLOW;
        case SafetyLevel::EXPERT: return MAGENTA;
        case SafetyLevel::DANGEROUS: return RED;
    }
    return RESET;
}

auto usage_color(double percent) -> const char* {
    if (percent >= 90.0) {
        return RED;
    }
    return percent >= 70.0 ? YELLOW : GREEN;
}

}  // namespace

TerminalEventSink::TerminalEventSink(std::ostream& out, std::ostream& status)
    : out_(out), status_(status) {
    color_enabled_ = is_terminal();
}

auto TerminalEventSink::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void TerminalEventSink::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void TerminalEventSink::emit(const AppEvent& event) {
    std::lock_guard lock{render_mutex_};
    std::visit([this](const auto& payload) { render(payload); }, event);
}

// ============================================================================
// Package stream
// ============================================================================

void TerminalEventSink::render(const PackageChunk& chunk) {
    if (chunk.packages.empty()) {
        return;
    }
    clear_status_line();
    for (const auto& package : chunk.packages) {
        const auto level = std::format("{:<9}", safety_level_name(package.safety_level));
        out_ << colorize(level, safety_color(package.safety_level)) << ' '
             << std::format("{:<50} {}", package.package_name, package.app_name) << '\n';
    }
    out_.flush();
}

void TerminalEventSink::render(const StreamProgress& progress) {
    clear_status_line();
    if (progress.error) {
        status_ << colorize("[FAILED] ", RED) << progress.status << ": " << *progress.error << '\n';
    } else if (progress.is_complete) {
        status_ << colorize("[OK] ", GREEN) << progress.status << '\n';
    } else {
        status_ << progress.status;
        status_line_open_ = true;
        if (!is_terminal()) {
            status_ << '\n';
            status_line_open_ = false;
        }
    }
    status_.flush();
}

void TerminalEventSink::render(const StreamComplete& complete) {
    clear_status_line();
    if (complete.from_cache) {
        status_ << std::format("{} packages served from cache\n", complete.total_packages);
    } else {
        status_ << std::format("{} packages enumerated in {} ms\n", complete.total_packages,
                               complete.duration_ms);
    }
    status_.flush();
}

// ============================================================================
// Health
// ============================================================================

void TerminalEventSink::render(const HealthUpdate& update) {
    if (!update.is_complete) {
        return;
    }
    clear_status_line();
    const auto& health = update.health;

    out_ << colorize(std::format("Device health ({})", health.device_id.empty() ? "unknown" : health.device_id), BOLD)
         << '\n';

    if (health.storage) {
        const auto& s = *health.storage;
        out_ << std::format("  Storage   {} {:5.1f}%  {} / {} MB used\n", generate_bar(s.usage_percent),
                            s.usage_percent, s.used_mb, s.total_mb);
    }
    if (health.memory) {
        const auto& m = *health.memory;
        out_ << std::format("  Memory    {} {:5.1f}%  {} / {} MB used\n", generate_bar(m.usage_percent),
                            m.usage_percent, m.used_mb, m.total_mb);
    }
    if (health.cpu) {
        const auto& c = *health.cpu;
        out_ << std::format("  CPU       {} {:5.1f}%  user {:.1f}% sys {:.1f}%\n",
                            generate_bar(c.usage_percent), c.usage_percent, c.user_percent,
                            c.system_percent);
    }
    if (health.thermal) {
        const auto& t = *health.thermal;
        out_ << "  Thermal   " << t.status;
        if (t.temperature_c) {
            out_ << std::format(" ({:.1f} C)", *t.temperature_c);
        }
        if (t.throttling) {
            out_ << ' ' << colorize("throttling", RED);
        }
        out_ << '\n';
    }
    if (health.services_count) {
        out_ << std::format("  Services  {}\n", *health.services_count);
    }
    if (health.app_counts) {
        const auto& a = *health.app_counts;
        out_ << std::format("  Apps      {} system, {} user, {} total\n", a.system_apps, a.user_apps,
                            a.total_apps);
    }
    if (!health.battery_drainers.empty()) {
        out_ << "  Top battery consumers:\n";
        for (const auto& drainer : health.battery_drainers) {
            out_ << std::format("    {:5.1f}%  {} ({})\n", drainer.usage_percent, drainer.app_name,
                                drainer.package_name);
        }
    }
    out_.flush();
}

// ============================================================================
// Helpers
// ============================================================================

auto TerminalEventSink::generate_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";
    if (color_enabled_) {
        bar += usage_color(percentage);
    }
    for (int i = 0; i < filled; ++i) {
        bar += "█";  // Full block character
    }
    if (color_enabled_) {
        bar += RESET;
    }
    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "░";  // Light shade character
    }
    bar += "]";
    return bar;
}

auto TerminalEventSink::colorize(std::string_view text, const char* color) const -> std::string {
    if (!color_enabled_) {
        return std::string(text);
    }
    return std::format("{}{}{}", color, text, RESET);
}

void TerminalEventSink::clear_status_line() {
    if (status_line_open_) {
        status_ << "\r\033[K";
        status_line_open_ = false;
    }
}

}  // namespace cli
