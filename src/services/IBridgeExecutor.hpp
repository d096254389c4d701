/**
 * @file IBridgeExecutor.hpp
 * @brief Interface for running adb subcommands
 *
 * This is the single point where raw process failures are turned into
 * typed errors. Callers above it propagate util::Error unchanged.
 */

#pragma once

#include "services/IProcessRunner.hpp"
#include "util/Result.hpp"

#include <future>
#include <string>
#include <utility>
#include <vector>

/**
 * @class IBridgeExecutor
 * @brief Abstract interface for adb command execution
 */
class IBridgeExecutor {
public:
    virtual ~IBridgeExecutor() = default;

    /**
     * @brief Run `adb <args...>` and wait for it
     * @param args Subcommand and arguments, without the adb path
     * @return stdout on exit status 0, otherwise the classified error
     */
    [[nodiscard]] virtual auto run(const std::vector<std::string>& args)
        -> std::expected<std::string, util::Error> = 0;

    /**
     * @brief Run `adb <args...>`, delivering stdout line by line
     *
     * No timeout applies. Lines already delivered are not retracted when
     * the command later fails.
     */
    [[nodiscard]] virtual auto stream(const std::vector<std::string>& args,
                                      const LineCallback& on_line)
        -> std::expected<void, util::Error> = 0;

    /**
     * @brief Non-blocking form of run(); the command executes on another thread
     */
    [[nodiscard]] auto run_async(std::vector<std::string> args)
        -> std::future<std::expected<std::string, util::Error>> {
        return std::async(std::launch::async,
                          [this, args = std::move(args)] { return run(args); });
    }

    /**
     * @brief Run `adb [-s serial] shell <command>`
     * @param serial Target device; empty targets the only attached device
     */
    [[nodiscard]] auto shell(const std::string& serial, const std::string& command)
        -> std::expected<std::string, util::Error> {
        return run(shell_args(serial, command));
    }

    [[nodiscard]] static auto shell_args(const std::string& serial, const std::string& command)
        -> std::vector<std::string> {
        std::vector<std::string> args;
        if (!serial.empty()) {
            args = {"-s", serial};
        }
        args.emplace_back("shell");
        args.push_back(command);
        return args;
    }
};
