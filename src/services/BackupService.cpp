#include "services/BackupService.hpp"

#include "models/JsonSerialization.hpp"
#include "util/Logger.hpp"
#include "util/TextUtils.hpp"

#include <glib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace {

constexpr std::string_view BACKUP_EXTENSION = ".json";
constexpr std::string_view UNKNOWN_DEVICE = "Unknown Device";

}  // namespace

BackupService::BackupService(std::shared_ptr<IBridgeExecutor> executor,
                             std::shared_ptr<IDeviceRegistry> registry,
                             std::shared_ptr<PackageActions> actions, std::filesystem::path directory)
    : executor_(std::move(executor)), registry_(std::move(registry)), actions_(std::move(actions)),
      directory_(std::move(directory)) {}

auto BackupService::default_directory() -> std::filesystem::path {
    std::filesystem::path documents;
    if (const char* dir = g_get_user_special_dir(G_USER_DIRECTORY_DOCUMENTS)) {
        documents = dir;
    } else {
        documents = std::filesystem::path(g_get_home_dir()) / "Documents";
    }
    return documents / "AndroidDebloater" / "backups";
}

auto BackupService::is_valid_backup_name(std::string_view filename) -> bool {
    return filename.size() > BACKUP_EXTENSION.size() && filename.ends_with(BACKUP_EXTENSION) &&
           filename.find('/') == std::string_view::npos &&
           filename.find('\\') == std::string_view::npos && filename.find("..") == std::string_view::npos;
}

auto BackupService::ensure_directory() const -> util::Result<void> {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(util::Error(
            util::ErrorKind::IO_ERROR,
            std::format("Failed to create backup directory {}: {}", directory_.string(), ec.message()),
            ec.value()));
    }
    return {};
}

auto BackupService::device_name() -> std::string {
    std::string serial;
    if (auto device = registry_->default_device()) {
        serial = device->serial;
    }
    auto model = executor_->shell(serial, "getprop ro.product.model");
    if (!model) {
        return std::string(UNKNOWN_DEVICE);
    }
    auto name = util::trim(*model);
    return name.empty() ? std::string(UNKNOWN_DEVICE) : std::string(name);
}

// ============================================================================
// Create / list
// ============================================================================

auto BackupService::create(const std::vector<std::string>& packages)
    -> util::Result<std::filesystem::path> {
    if (auto ready = ensure_directory(); !ready) {
        return std::unexpected(ready.error());
    }

    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    BackupData data;
    data.timestamp = std::format("{:%FT%TZ}", now);
    data.device_name = device_name();
    data.packages = packages;

    const auto stem = std::format("backup_{:%Y-%m-%d_%H%M%S}", now);
    auto path = directory_ / (stem + std::string(BACKUP_EXTENSION));
    // Two backups within the same second get a numeric suffix
    for (int suffix = 1; std::filesystem::exists(path); ++suffix) {
        path = directory_ / std::format("{}_{}{}", stem, suffix, BACKUP_EXTENSION);
    }

    std::ofstream out(path);
    if (!out) {
        return std::unexpected(util::Error(util::ErrorKind::IO_ERROR,
                                           std::format("Failed to open {} for writing", path.string())));
    }
    out << to_json_text(nlohmann::json(data), 2) << '\n';
    out.close();
    if (!out) {
        return std::unexpected(util::Error(util::ErrorKind::IO_ERROR,
                                           std::format("Failed to write backup file {}", path.string())));
    }

    LOG_INFO("BackupService", std::format("Backed up {} packages from {} to {}", packages.size(),
                                          data.device_name, path.string()));
    return path;
}

auto BackupService::read_backup(const std::filesystem::path& path) const -> util::Result<BackupData> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(util::Error(util::ErrorKind::IO_ERROR,
                                           std::format("Failed to read backup file {}", path.string())));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        return nlohmann::json::parse(buffer.str()).get<BackupData>();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(util::Error(
            util::ErrorKind::PARSE_ERROR,
            std::format("Invalid backup file {}: {}", path.filename().string(), e.what())));
    }
}

auto BackupService::list() const -> util::Result<std::vector<BackupInfo>> {
    std::vector<BackupInfo> backups;
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        return backups;
    }

    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return std::unexpected(util::Error(
            util::ErrorKind::IO_ERROR,
            std::format("Failed to read backup directory {}: {}", directory_.string(), ec.message()),
            ec.value()));
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension().string() != BACKUP_EXTENSION) {
            continue;
        }
        auto data = read_backup(entry.path());
        if (!data) {
            LOG_WARNING("BackupService", std::format("Skipping {}: {}", entry.path().filename().string(),
                                                     data.error().message));
            continue;
        }
        backups.push_back(BackupInfo{.filename = entry.path().filename().string(),
                                     .path = entry.path().string(),
                                     .timestamp = data->timestamp,
                                     .device_name = data->device_name,
                                     .package_count = data->packages.size()});
    }

    // RFC 3339 UTC timestamps order lexicographically
    std::ranges::sort(backups, std::ranges::greater{}, &BackupInfo::timestamp);
    return backups;
}

// ============================================================================
// Restore / remove
// ============================================================================

auto BackupService::restore(const std::string& filename) -> util::Result<RestoreResult> {
    if (!is_valid_backup_name(filename)) {
        return std::unexpected(
            util::Error(util::ErrorKind::COMMAND_FAILED, std::format("Invalid backup file name: {}", filename)));
    }
    auto data = read_backup(directory_ / filename);
    if (!data) {
        return std::unexpected(data.error());
    }

    LOG_INFO("BackupService", std::format("Restoring {} packages from {}", data->packages.size(), filename));
    RestoreResult result;
    for (const auto& package : data->packages) {
        auto reinstalled = actions_->reinstall(package);
        if (reinstalled) {
            result.restored.push_back(package);
        } else {
            result.failed.push_back(RestoreFailure{.package = package, .error = reinstalled.error().user_message()});
        }
    }

    if (!result.all_restored()) {
        LOG_WARNING("BackupService", std::format("Restore of {} left {} of {} packages missing", filename,
                                                 result.failed.size(), data->packages.size()));
    }
    return result;
}

auto BackupService::remove(const std::string& filename) -> util::Result<void> {
    if (!is_valid_backup_name(filename)) {
        return std::unexpected(
            util::Error(util::ErrorKind::COMMAND_FAILED, std::format("Invalid backup file name: {}", filename)));
    }

    std::error_code ec;
    const auto path = directory_ / filename;
    if (!std::filesystem::remove(path, ec)) {
        const auto reason = ec ? ec.message() : std::string("no such file");
        return std::unexpected(util::Error(util::ErrorKind::IO_ERROR,
                                           std::format("Failed to delete backup {}: {}", filename, reason),
                                           ec.value()));
    }
    LOG_INFO("BackupService", std::format("Deleted backup {}", filename));
    return {};
}
