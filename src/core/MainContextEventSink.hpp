/**
 * @file MainContextEventSink.hpp
 * @brief Forwards events onto a GLib main context
 */

#pragma once

#include "core/IEventSink.hpp"

#include <glib.h>

#include <memory>

/**
 * @class MainContextEventSink
 * @brief Marshals events from worker threads to the thread that iterates a GMainContext
 *
 * Events from other threads are queued as idle sources and dispatched in
 * emission order by whichever thread owns the context, so the wrapped sink
 * needs no locking of its own. Events emitted while the calling thread owns
 * the context are delivered immediately.
 */
class MainContextEventSink : public IEventSink {
public:
    /**
     * @param inner Sink invoked on the main context
     * @param context Target context; nullptr selects the global default context
     */
    explicit MainContextEventSink(std::shared_ptr<IEventSink> inner, GMainContext* context = nullptr);
    ~MainContextEventSink() override;

    MainContextEventSink(const MainContextEventSink&) = delete;
    MainContextEventSink& operator=(const MainContextEventSink&) = delete;

    void emit(const AppEvent& event) override;

private:
    std::shared_ptr<IEventSink> inner_;
    GMainContext* context_;
};
