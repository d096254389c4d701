/**
 * @file BackupTypes.hpp
 * @brief Backup file contents and restore outcome
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @struct BackupData
 * @brief On-disk backup document
 */
struct BackupData {
    std::string version = "1.0";
    std::string timestamp;  ///< RFC 3339, UTC
    std::string device_name;
    std::vector<std::string> packages;
};

/**
 * @struct BackupInfo
 * @brief Listing entry for an existing backup file
 */
struct BackupInfo {
    std::string filename;
    std::string path;
    std::string timestamp;
    std::string device_name;
    size_t package_count = 0;
};

struct RestoreFailure {
    std::string package;
    std::string error;
};

/**
 * @struct RestoreResult
 * @brief Per-package outcome of restoring a backup
 */
struct RestoreResult {
    std::vector<std::string> restored;
    std::vector<RestoreFailure> failed;

    [[nodiscard]] auto all_restored() const -> bool { return failed.empty(); }
};
