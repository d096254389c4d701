/**
 * @file IEventSink.hpp
 * @brief Outbound event channel from services to the presentation layer
 */

#pragma once

#include "models/Events.hpp"

/**
 * @class IEventSink
 * @brief Receives fire-and-forget notifications
 *
 * emit() may be called from worker threads. Implementations must not block
 * for long and must not throw; delivery is at most once and unacknowledged.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void emit(const AppEvent& event) = 0;
};

/**
 * @class NullEventSink
 * @brief Discards every event
 */
class NullEventSink : public IEventSink {
public:
    void emit(const AppEvent& /*event*/) override {}
};
