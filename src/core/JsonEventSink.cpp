#include "core/JsonEventSink.hpp"

#include "models/JsonSerialization.hpp"

void JsonEventSink::emit(const AppEvent& event) {
    const auto line = to_json_text(event_to_json(event));
    std::lock_guard lock{write_mutex_};
    out_ << line << '\n';
    out_.flush();
}
