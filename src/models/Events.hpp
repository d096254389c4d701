/**
 * @file Events.hpp
 * @brief Events pushed from the service layer to the presentation layer
 */

#pragma once

#include "models/HealthTypes.hpp"
#include "models/PackageTypes.hpp"

#include <string_view>
#include <type_traits>
#include <variant>

using AppEvent = std::variant<PackageChunk, StreamProgress, StreamComplete, HealthUpdate>;

namespace event_names {
inline constexpr std::string_view PACKAGE_CHUNK = "package_chunk";
inline constexpr std::string_view PACKAGE_STREAM_PROGRESS = "package_stream_progress";
inline constexpr std::string_view PACKAGE_STREAM_COMPLETE = "package_stream_complete";
inline constexpr std::string_view SYSTEM_HEALTH_UPDATE = "system_health_update";
}  // namespace event_names

[[nodiscard]] inline auto event_name(const AppEvent& event) -> std::string_view {
    return std::visit(
        [](const auto& payload) -> std::string_view {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, PackageChunk>) {
                return event_names::PACKAGE_CHUNK;
            } else if constexpr (std::is_same_v<T, StreamProgress>) {
                return event_names::PACKAGE_STREAM_PROGRESS;
            } else if constexpr (std::is_same_v<T, StreamComplete>) {
                return event_names::PACKAGE_STREAM_COMPLETE;
            } else {
                return event_names::SYSTEM_HEALTH_UPDATE;
            }
        },
        event);
}
