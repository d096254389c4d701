/**
 * @file JsonEventSink.hpp
 * @brief Event sink writing newline-delimited JSON
 */

#pragma once

#include "core/IEventSink.hpp"

#include <mutex>
#include <ostream>

/**
 * @class JsonEventSink
 * @brief Writes each event as one `{"event": ..., "payload": ...}` line
 */
class JsonEventSink : public IEventSink {
public:
    /**
     * @param out Stream that must outlive the sink
     */
    explicit JsonEventSink(std::ostream& out) : out_(out) {}

    void emit(const AppEvent& event) override;

private:
    std::ostream& out_;
    std::mutex write_mutex_;
};
