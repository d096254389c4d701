/**
 * @file TerminalEventSink.hpp
 * @brief Human-readable rendering of package and health events
 */

#pragma once

#include "core/IEventSink.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace cli {

/**
 * @class TerminalEventSink
 * @brief Prints package rows to stdout and a live status line to stderr
 *
 * Health updates are drawn only once a pass is complete. ANSI colors are
 * used when stdout is a terminal.
 */
class TerminalEventSink : public IEventSink {
public:
    TerminalEventSink(std::ostream& out, std::ostream& status);

    void emit(const AppEvent& event) override;

    void set_color_enabled(bool enable);

    [[nodiscard]] static auto is_terminal() -> bool;

    /// `[████░░░░]` bar for a 0..100 value
    [[nodiscard]] auto generate_bar(double percentage) const -> std::string;

private:
    void render(const PackageChunk& chunk);
    void render(const StreamProgress& progress);
    void render(const StreamComplete& complete);
    void render(const HealthUpdate& update);

    [[nodiscard]] auto colorize(std::string_view text, const char* color) const -> std::string;
    void clear_status_line();

    std::ostream& out_;
    std::ostream& status_;
    std::mutex render_mutex_;
    bool color_enabled_ = true;
    bool status_line_open_ = false;

    static constexpr int BAR_WIDTH = 20;
};

}  // namespace cli
