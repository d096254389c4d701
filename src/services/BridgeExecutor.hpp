#pragma once

#include "services/IBridgeExecutor.hpp"
#include "services/IBridgeLocator.hpp"
#include "services/IProcessRunner.hpp"

#include <chrono>
#include <memory>
#include <string_view>

class BridgeExecutor : public IBridgeExecutor {
public:
    BridgeExecutor(std::shared_ptr<IBridgeLocator> locator, std::shared_ptr<IProcessRunner> runner,
                   std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
    ~BridgeExecutor() override = default;

    BridgeExecutor(const BridgeExecutor&) = delete;
    BridgeExecutor& operator=(const BridgeExecutor&) = delete;

    [[nodiscard]] auto run(const std::vector<std::string>& args)
        -> std::expected<std::string, util::Error> override;

    [[nodiscard]] auto stream(const std::vector<std::string>& args, const LineCallback& on_line)
        -> std::expected<void, util::Error> override;

    /**
     * @brief Map a failed command's diagnostic text to an error kind
     *
     * Patterns are matched case-insensitively in priority order; the first
     * match wins, so "device unauthorized" is never reported as a generic
     * failure.
     */
    [[nodiscard]] static auto classify_failure(std::string_view diagnostics, int exit_status)
        -> util::Error;

    static constexpr auto DEFAULT_TIMEOUT = std::chrono::milliseconds{30'000};

private:
    [[nodiscard]] auto command_line(const std::vector<std::string>& args)
        -> std::expected<std::vector<std::string>, util::Error>;

    std::shared_ptr<IBridgeLocator> locator_;
    std::shared_ptr<IProcessRunner> runner_;
    std::chrono::milliseconds timeout_;
};
