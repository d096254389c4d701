#include "services/BridgeLocator.hpp"

#include "util/Logger.hpp"

#include <glib.h>

#include <format>
#include <iterator>
#include <utility>

namespace {

constexpr auto BRIDGE_NAME = "adb";

// Well-known install locations, in order of preference
constexpr const char* LINUX_PATHS[] = {"/usr/bin/adb", "/usr/local/bin/adb"};
constexpr const char* MACOS_PATHS[] = {"/usr/local/bin/adb", "/opt/homebrew/bin/adb"};
constexpr const char* WINDOWS_PATHS[] = {"C:\\Android\\platform-tools\\adb.exe",
                                         "C:\\Program Files\\Android\\platform-tools\\adb.exe"};

auto is_executable(const std::string& path) -> bool {
    return g_file_test(path.c_str(), G_FILE_TEST_IS_EXECUTABLE) &&
           !g_file_test(path.c_str(), G_FILE_TEST_IS_DIR);
}

auto glib_env(const std::string& name) -> std::optional<std::string> {
    const gchar* value = g_getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

BridgeLocator::BridgeLocator(std::shared_ptr<IProcessRunner> runner,
                             std::optional<std::string> override_path,
                             std::optional<std::vector<std::string>> candidates)
    : runner_(std::move(runner)), override_path_(std::move(override_path)),
      candidates_(candidates ? std::move(*candidates)
                             : default_candidates(host_platform(), glib_env)) {}

auto BridgeLocator::host_platform() -> HostPlatform {
#if defined(_WIN32)
    return HostPlatform::WINDOWS;
#elif defined(__APPLE__)
    return HostPlatform::MACOS;
#else
    return HostPlatform::LINUX;
#endif
}

auto BridgeLocator::default_candidates(HostPlatform platform, const EnvLookup& env)
    -> std::vector<std::string> {
    std::vector<std::string> paths;

    switch (platform) {
        case HostPlatform::LINUX:
            paths.assign(std::begin(LINUX_PATHS), std::end(LINUX_PATHS));
            if (auto home = env("HOME")) {
                paths.push_back(std::format("{}/Android/Sdk/platform-tools/adb", *home));
            }
            break;
        case HostPlatform::MACOS:
            paths.assign(std::begin(MACOS_PATHS), std::end(MACOS_PATHS));
            if (auto home = env("HOME")) {
                paths.push_back(std::format("{}/Library/Android/sdk/platform-tools/adb", *home));
            }
            break;
        case HostPlatform::WINDOWS:
            paths.assign(std::begin(WINDOWS_PATHS), std::end(WINDOWS_PATHS));
            if (auto local = env("LOCALAPPDATA")) {
                paths.push_back(std::format("{}\\Android\\Sdk\\platform-tools\\adb.exe", *local));
            }
            if (auto profile = env("USERPROFILE")) {
                paths.push_back(
                    std::format("{}\\AppData\\Local\\Android\\Sdk\\platform-tools\\adb.exe", *profile));
            }
            break;
    }

    return paths;
}

auto BridgeLocator::resolve() -> std::expected<BridgeExecutable, util::Error> {
    {
        std::lock_guard lock(mutex_);
        if (resolved_) {
            return *resolved_;
        }
    }

    auto found = probe();
    if (!found) {
        LOG_ERROR("BridgeLocator", "adb not found on PATH or in any known location");
        return std::unexpected(
            util::Error{util::ErrorKind::BRIDGE_NOT_FOUND, "adb executable not found"});
    }

    LOG_INFO("BridgeLocator", std::format("Using adb at {}", found->path));
    std::lock_guard lock(mutex_);
    resolved_ = *found;
    return *found;
}

void BridgeLocator::invalidate() {
    std::lock_guard lock(mutex_);
    resolved_.reset();
}

auto BridgeLocator::probe() -> std::optional<BridgeExecutable> {
    if (override_path_) {
        if (is_executable(*override_path_)) {
            return BridgeExecutable{.path = *override_path_, .from_search_path = false};
        }
        LOG_WARNING("BridgeLocator",
                    std::format("Configured adb path {} is not executable, searching instead",
                                *override_path_));
    }

    if (responds_to_version(BRIDGE_NAME)) {
        return BridgeExecutable{.path = BRIDGE_NAME, .from_search_path = true};
    }

    for (const auto& candidate : candidates_) {
        if (is_executable(candidate)) {
            return BridgeExecutable{.path = candidate, .from_search_path = false};
        }
        LOG_DEBUG("BridgeLocator", std::format("No adb at {}", candidate));
    }

    return std::nullopt;
}

auto BridgeLocator::responds_to_version(const std::string& program) -> bool {
    auto result = runner_->run({program, "version"}, PROBE_TIMEOUT);
    if (!result) {
        LOG_DEBUG("BridgeLocator",
                  std::format("'{} version' failed: {}", program, result.error().message));
        return false;
    }
    return result->success();
}
