/**
 * @file PackageDatabase.hpp
 * @brief Built-in knowledge about commonly pre-installed Android packages
 */

#pragma once

#include "models/PackageTypes.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * @struct KnownPackage
 * @brief One curated entry of the removal-safety table
 */
struct KnownPackage {
    std::string_view name;
    std::string_view display_name;
    SafetyLevel safety_level;
    std::string_view reason;
    bool can_reinstall;
};

/**
 * @class PackageDatabase
 * @brief Read-only lookup table plus substring heuristics for unknown packages
 */
class PackageDatabase {
public:
    PackageDatabase() = delete;

    [[nodiscard]] static auto find(std::string_view package) -> std::optional<KnownPackage>;

    /**
     * @brief Table level if known, otherwise vendor/social heuristics, otherwise Safe
     */
    [[nodiscard]] static auto safety_level(std::string_view package) -> SafetyLevel;

    /**
     * @brief Table name if known, otherwise the last dot segment split on '_' and capitalized
     */
    [[nodiscard]] static auto display_name(std::string_view package) -> std::string;

    [[nodiscard]] static auto safety_reason(std::string_view package) -> std::string;

    /// Safe and Caution packages may be removed without expert confirmation
    [[nodiscard]] static auto is_safe_to_remove(std::string_view package) -> bool;

    /// Platform or Google package by prefix; a hint only, pm decides what is really a system app
    [[nodiscard]] static auto is_system_app(std::string_view package) -> bool;

    [[nodiscard]] static auto classify(std::string_view package) -> PackageRecord;

    [[nodiscard]] static auto all() -> std::span<const KnownPackage>;
};
