#pragma once

#include "services/IProcessRunner.hpp"

/**
 * @class ProcessRunner
 * @brief IProcessRunner backed by g_spawn_async_with_pipes and poll(2)
 *
 * Both pipes are drained concurrently so a chatty stderr can never block
 * the child while we wait on stdout.
 */
class ProcessRunner : public IProcessRunner {
public:
    ProcessRunner() = default;
    ~ProcessRunner() override = default;

    [[nodiscard]] auto run(const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout)
        -> std::expected<ProcessOutput, util::Error> override;

    [[nodiscard]] auto run_streaming(const std::vector<std::string>& argv,
                                     const LineCallback& on_line)
        -> std::expected<ProcessOutput, util::Error> override;
};
