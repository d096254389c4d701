#include "services/BridgeExecutor.hpp"

#include "util/Logger.hpp"
#include "util/TextUtils.hpp"

#include <array>
#include <format>
#include <string>
#include <utility>

namespace {

struct FailurePattern {
    std::string_view needle;  // lower case
    util::ErrorKind kind;
};

// Priority order matters: earlier patterns win
constexpr std::array FAILURE_PATTERNS{
    FailurePattern{"no devices/emulators found", util::ErrorKind::NO_DEVICE_CONNECTED},
    FailurePattern{          "device not found", util::ErrorKind::NO_DEVICE_CONNECTED},
    FailurePattern{            "device offline",      util::ErrorKind::DEVICE_OFFLINE},
    FailurePattern{       "device unauthorized", util::ErrorKind::DEVICE_UNAUTHORIZED},
    FailurePattern{        "daemon not running",  util::ErrorKind::SERVER_NOT_RUNNING},
    FailurePattern{  "cannot connect to daemon",  util::ErrorKind::SERVER_NOT_RUNNING},
    FailurePattern{         "permission denied",   util::ErrorKind::PERMISSION_DENIED},
    FailurePattern{             "access denied",   util::ErrorKind::PERMISSION_DENIED},
};

auto describe(const std::vector<std::string>& args) -> std::string {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

auto diagnostics_of(const ProcessOutput& output) -> std::string_view {
    auto text = util::trim(output.stderr_text);
    if (text.empty()) {
        text = util::trim(output.stdout_text);
    }
    return text;
}

}  // namespace

BridgeExecutor::BridgeExecutor(std::shared_ptr<IBridgeLocator> locator,
                               std::shared_ptr<IProcessRunner> runner,
                               std::chrono::milliseconds timeout)
    : locator_(std::move(locator)), runner_(std::move(runner)), timeout_(timeout) {}

auto BridgeExecutor::classify_failure(std::string_view diagnostics, int exit_status)
    -> util::Error {
    const auto lower = util::to_lower(diagnostics);
    for (const auto& pattern : FAILURE_PATTERNS) {
        if (lower.contains(pattern.needle)) {
            return util::Error{pattern.kind, std::string(util::trim(diagnostics)), exit_status};
        }
    }

    auto detail = std::string(util::trim(diagnostics));
    if (detail.empty()) {
        detail = std::format("exit status {}", exit_status);
    }
    return util::Error{util::ErrorKind::COMMAND_FAILED, std::move(detail), exit_status};
}

auto BridgeExecutor::command_line(const std::vector<std::string>& args)
    -> std::expected<std::vector<std::string>, util::Error> {
    auto bridge = locator_->resolve();
    if (!bridge) {
        return std::unexpected(bridge.error());
    }

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(bridge->path);
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

auto BridgeExecutor::run(const std::vector<std::string>& args)
    -> std::expected<std::string, util::Error> {
    auto argv = command_line(args);
    if (!argv) {
        return std::unexpected(argv.error());
    }

    LOG_DEBUG("BridgeExecutor", std::format("adb {}", describe(args)));
    auto output = runner_->run(*argv, timeout_);
    if (!output) {
        LOG_WARNING("BridgeExecutor",
                    std::format("adb {} did not complete: {}", describe(args), output.error().message));
        return std::unexpected(output.error());
    }

    if (!output->success()) {
        auto error = classify_failure(diagnostics_of(*output), output->exit_status);
        LOG_WARNING("BridgeExecutor", std::format("adb {} failed ({}): {}", describe(args),
                                                  util::error_kind_name(error.kind), error.message));
        return std::unexpected(std::move(error));
    }

    return std::move(output->stdout_text);
}

auto BridgeExecutor::stream(const std::vector<std::string>& args, const LineCallback& on_line)
    -> std::expected<void, util::Error> {
    auto argv = command_line(args);
    if (!argv) {
        return std::unexpected(argv.error());
    }

    LOG_DEBUG("BridgeExecutor", std::format("adb {} (streaming)", describe(args)));
    auto output = runner_->run_streaming(*argv, on_line);
    if (!output) {
        return std::unexpected(output.error());
    }

    if (!output->success()) {
        auto error = classify_failure(diagnostics_of(*output), output->exit_status);
        LOG_WARNING("BridgeExecutor", std::format("adb {} failed ({}): {}", describe(args),
                                                  util::error_kind_name(error.kind), error.message));
        return std::unexpected(std::move(error));
    }

    return {};
}
