#pragma once

#include "services/IBridgeLocator.hpp"
#include "services/IProcessRunner.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @enum HostPlatform
 * @brief Selects the well-known adb install locations to probe
 */
enum class HostPlatform { LINUX, MACOS, WINDOWS };

/// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

class BridgeLocator : public IBridgeLocator {
public:
    /**
     * @param runner Used for the `adb version` search-path probe
     * @param override_path Explicit executable from configuration; probed first when set
     * @param candidates Fallback locations; defaults to default_candidates() for this host
     */
    explicit BridgeLocator(std::shared_ptr<IProcessRunner> runner,
                           std::optional<std::string> override_path = std::nullopt,
                           std::optional<std::vector<std::string>> candidates = std::nullopt);
    ~BridgeLocator() override = default;

    BridgeLocator(const BridgeLocator&) = delete;
    BridgeLocator& operator=(const BridgeLocator&) = delete;

    [[nodiscard]] auto resolve() -> std::expected<BridgeExecutable, util::Error> override;
    void invalidate() override;

    /**
     * @brief Well-known locations followed by environment-derived SDK paths
     */
    [[nodiscard]] static auto default_candidates(HostPlatform platform, const EnvLookup& env)
        -> std::vector<std::string>;

    [[nodiscard]] static auto host_platform() -> HostPlatform;

private:
    [[nodiscard]] auto probe() -> std::optional<BridgeExecutable>;
    [[nodiscard]] auto responds_to_version(const std::string& program) -> bool;

    std::shared_ptr<IProcessRunner> runner_;
    std::optional<std::string> override_path_;
    std::vector<std::string> candidates_;

    std::mutex mutex_;
    std::optional<BridgeExecutable> resolved_;

    static constexpr auto PROBE_TIMEOUT = std::chrono::seconds{5};
};
