/**
 * @file PackageTypes.hpp
 * @brief Package records and package-stream event payloads
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @enum SafetyLevel
 * @brief How risky it is to remove a package
 */
enum class SafetyLevel {
    SAFE,       ///< Removable without side effects
    CAUTION,    ///< Removable, some features may stop working
    EXPERT,     ///< Only for users who know the consequences
    DANGEROUS   ///< Removal can break the system
};

[[nodiscard]] constexpr auto safety_level_name(SafetyLevel level) -> std::string_view {
    switch (level) {
        case SafetyLevel::SAFE: return "Safe";
        case SafetyLevel::CAUTION: return "Caution";
        case SafetyLevel::EXPERT: return "Expert";
        case SafetyLevel::DANGEROUS: return "Dangerous";
    }
    return "Safe";
}

[[nodiscard]] inline auto parse_safety_level(std::string_view name) -> std::optional<SafetyLevel> {
    if (name == "Safe") return SafetyLevel::SAFE;
    if (name == "Caution") return SafetyLevel::CAUTION;
    if (name == "Expert") return SafetyLevel::EXPERT;
    if (name == "Dangerous") return SafetyLevel::DANGEROUS;
    return std::nullopt;
}

/**
 * @struct PackageRecord
 * @brief A classified package, immutable once produced by an enumeration pass
 */
struct PackageRecord {
    std::string package_name;  ///< Reverse-domain id, unique key
    std::string app_name;      ///< Display name
    SafetyLevel safety_level = SafetyLevel::SAFE;

    auto operator==(const PackageRecord&) const -> bool = default;
};

/**
 * @struct PackageChunk
 * @brief One bounded batch of an enumeration pass, in discovery order
 */
struct PackageChunk {
    std::vector<PackageRecord> packages;
    size_t chunk_index = 0;   ///< Strictly increasing within a pass
    size_t total_so_far = 0;  ///< Packages emitted including this batch
    bool is_final = false;    ///< Exactly one terminal batch per pass
    bool from_cache = false;
};

/**
 * @struct StreamProgress
 * @brief Status line for the enumeration
 */
struct StreamProgress {
    std::string status;
    size_t packages_loaded = 0;
    bool is_complete = false;
    std::optional<std::string> error;
};

/**
 * @struct StreamComplete
 * @brief Sent once after a successful pass
 */
struct StreamComplete {
    size_t total_packages = 0;
    uint64_t duration_ms = 0;
    bool from_cache = false;
};

/**
 * @struct PackageCacheStatus
 * @brief Snapshot of the package cache for diagnostics
 */
struct PackageCacheStatus {
    bool has_cache = false;
    size_t package_count = 0;
    std::optional<std::string> device_serial;
    std::optional<uint64_t> age_seconds;
    bool is_expired = true;
};
