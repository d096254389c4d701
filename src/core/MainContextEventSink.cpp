#include "core/MainContextEventSink.hpp"

#include <utility>

namespace {

struct PendingEvent {
    std::shared_ptr<IEventSink> sink;
    AppEvent event;
};

auto dispatch_pending(gpointer data) -> gboolean {
    auto* item = static_cast<PendingEvent*>(data);
    item->sink->emit(item->event);
    return G_SOURCE_REMOVE;
}

}  // namespace

MainContextEventSink::MainContextEventSink(std::shared_ptr<IEventSink> inner, GMainContext* context)
    : inner_(std::move(inner)),
      context_(g_main_context_ref(context != nullptr ? context : g_main_context_default())) {}

MainContextEventSink::~MainContextEventSink() {
    g_main_context_unref(context_);
}

void MainContextEventSink::emit(const AppEvent& event) {
    if (g_main_context_is_owner(context_)) {
        inner_->emit(event);
        return;
    }

    // Always queue from other threads, even when the context is momentarily
    // free, so sources dispatch in the order they were attached
    auto* pending = new PendingEvent{inner_, event};
    GSource* source = g_idle_source_new();
    g_source_set_priority(source, G_PRIORITY_DEFAULT);
    g_source_set_callback(source, dispatch_pending, pending,
                          [](gpointer data) { delete static_cast<PendingEvent*>(data); });
    g_source_attach(source, context_);
    g_source_unref(source);
}
