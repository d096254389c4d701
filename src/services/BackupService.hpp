/**
 * @file BackupService.hpp
 * @brief JSON backups of removed package lists and their restoration
 */

#pragma once

#include "models/BackupTypes.hpp"
#include "services/IBridgeExecutor.hpp"
#include "services/IDeviceRegistry.hpp"
#include "services/PackageActions.hpp"
#include "util/Result.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/**
 * @class BackupService
 * @brief Stores one `backup_<timestamp>.json` file per backup in a per-user directory
 */
class BackupService {
public:
    BackupService(std::shared_ptr<IBridgeExecutor> executor,
                  std::shared_ptr<IDeviceRegistry> registry,
                  std::shared_ptr<PackageActions> actions,
                  std::filesystem::path directory = default_directory());

    /**
     * @brief Write a backup of the given package names
     * @return Full path of the new file
     */
    auto create(const std::vector<std::string>& packages) -> util::Result<std::filesystem::path>;

    /**
     * @brief Every readable backup, newest first
     *
     * Files that fail to parse are skipped.
     */
    [[nodiscard]] auto list() const -> util::Result<std::vector<BackupInfo>>;

    /**
     * @brief Reinstall every package named in a backup file
     * @param filename Bare file name inside directory()
     */
    auto restore(const std::string& filename) -> util::Result<RestoreResult>;

    /**
     * @brief Delete a backup file
     * @param filename Bare `*.json` name; anything containing a path separator is refused
     */
    auto remove(const std::string& filename) -> util::Result<void>;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }

    /**
     * @brief `<documents>/AndroidDebloater/backups` for the current user
     */
    [[nodiscard]] static auto default_directory() -> std::filesystem::path;

    [[nodiscard]] static auto is_valid_backup_name(std::string_view filename) -> bool;

private:
    auto ensure_directory() const -> util::Result<void>;
    auto device_name() -> std::string;
    [[nodiscard]] auto read_backup(const std::filesystem::path& path) const -> util::Result<BackupData>;

    std::shared_ptr<IBridgeExecutor> executor_;
    std::shared_ptr<IDeviceRegistry> registry_;
    std::shared_ptr<PackageActions> actions_;
    std::filesystem::path directory_;
};
