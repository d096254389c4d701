/**
 * @file IProcessRunner.hpp
 * @brief Interface for spawning child processes
 *
 * Separates process plumbing from adb semantics so the bridge layer can be
 * tested against scripted output.
 */

#pragma once

#include "util/Result.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @struct ProcessOutput
 * @brief Captured result of a finished child
 */
struct ProcessOutput {
    int exit_status = 0;       ///< Exit code, or 128 + signal number
    std::string stdout_text;   ///< Empty for streaming runs
    std::string stderr_text;

    [[nodiscard]] auto success() const -> bool { return exit_status == 0; }
};

/// Receives one stdout line at a time, without the trailing newline
using LineCallback = std::function<void(std::string_view line)>;

/**
 * @class IProcessRunner
 * @brief Abstract interface for running external programs
 *
 * argv[0] is either an absolute path or a bare name looked up in PATH.
 * A non-zero exit status is not an error at this level; only failures to
 * spawn, read, or finish in time are.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run to completion, buffering stdout and stderr
     * @param argv Program and arguments
     * @param timeout Kill the child with SIGKILL after this long
     * @return Captured output, or TIMEOUT / COMMAND_FAILED
     */
    [[nodiscard]] virtual auto run(const std::vector<std::string>& argv,
                                   std::chrono::milliseconds timeout)
        -> std::expected<ProcessOutput, util::Error> = 0;

    /**
     * @brief Run to completion, delivering stdout lines as they arrive
     *
     * The callback runs on the calling thread. stderr is still buffered and
     * returned in the result.
     */
    [[nodiscard]] virtual auto run_streaming(const std::vector<std::string>& argv,
                                             const LineCallback& on_line)
        -> std::expected<ProcessOutput, util::Error> = 0;
};
