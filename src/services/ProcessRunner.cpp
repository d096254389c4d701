#include "services/ProcessRunner.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <utility>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

constexpr size_t READ_BUFFER_SIZE = 4096;

struct SpawnedChild {
    GPid pid = 0;
    util::FileDescriptor out;
    util::FileDescriptor err;
};

using ChunkHandler = std::function<void(std::string_view)>;

auto spawn_child(const std::vector<std::string>& argv) -> std::expected<SpawnedChild, util::Error> {
    if (argv.empty()) {
        return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED, "Empty command line"});
    }

    std::vector<gchar*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<gchar*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    GPid pid = 0;
    gint out_fd = -1;
    gint err_fd = -1;
    GError* error = nullptr;
    const auto flags = static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD |
                                                 G_SPAWN_CLOEXEC_PIPES);

    if (!g_spawn_async_with_pipes(nullptr, c_argv.data(), nullptr, flags, nullptr, nullptr, &pid,
                                  nullptr, &out_fd, &err_fd, &error)) {
        std::string reason = error != nullptr ? error->message : "unknown error";
        if (error != nullptr) {
            g_error_free(error);
        }
        return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED,
                                           std::format("Failed to spawn {}: {}", argv.front(), reason)});
    }

    SpawnedChild child;
    child.pid = pid;
    child.out.reset(out_fd);
    child.err.reset(err_fd);
    return child;
}

auto reap(GPid pid) -> int {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            g_spawn_close_pid(pid);
            return -1;
        }
    }
    g_spawn_close_pid(pid);

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void kill_and_reap(GPid pid) {
    kill(pid, SIGKILL);
    reap(pid);
}

// Read from whichever pipe is ready until both reach EOF or the deadline passes
auto pump(SpawnedChild& child, std::optional<std::chrono::steady_clock::time_point> deadline,
          const ChunkHandler& on_stdout, std::string& stderr_text)
    -> std::expected<void, util::Error> {
    std::array<char, READ_BUFFER_SIZE> buffer{};

    while (child.out || child.err) {
        std::array<pollfd, 2> fds{};
        std::array<util::FileDescriptor*, 2> owners{};
        nfds_t count = 0;
        for (auto* fd : {&child.out, &child.err}) {
            if (*fd) {
                fds[count] = pollfd{.fd = fd->get(), .events = POLLIN, .revents = 0};
                owners[count] = fd;
                ++count;
            }
        }

        int timeout_ms = -1;
        if (deadline) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::unexpected(util::Error{util::ErrorKind::TIMEOUT, "Command timed out"});
            }
            timeout_ms = static_cast<int>(remaining.count());
        }

        const int ready = poll(fds.data(), count, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED,
                                               std::format("poll failed: {}", std::strerror(errno)),
                                               errno});
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            const ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                const std::string_view chunk{buffer.data(), static_cast<size_t>(n)};
                if (owners[i] == &child.out) {
                    on_stdout(chunk);
                } else {
                    stderr_text.append(chunk);
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                owners[i]->reset();
            }
        }
    }

    return {};
}

}  // namespace

auto ProcessRunner::run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
    -> std::expected<ProcessOutput, util::Error> {
    auto child = spawn_child(argv);
    if (!child) {
        return std::unexpected(child.error());
    }

    ProcessOutput output;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto pumped = pump(
        *child, deadline, [&output](std::string_view chunk) { output.stdout_text.append(chunk); },
        output.stderr_text);

    if (!pumped) {
        LOG_WARNING("ProcessRunner",
                    std::format("Killing {} (pid {}): {}", argv.front(), child->pid,
                                pumped.error().message));
        kill_and_reap(child->pid);
        return std::unexpected(pumped.error());
    }

    output.exit_status = reap(child->pid);
    return output;
}

auto ProcessRunner::run_streaming(const std::vector<std::string>& argv,
                                  const LineCallback& on_line)
    -> std::expected<ProcessOutput, util::Error> {
    auto child = spawn_child(argv);
    if (!child) {
        return std::unexpected(child.error());
    }

    ProcessOutput output;
    std::string pending;
    const auto deliver = [&on_line](std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        on_line(line);
    };

    auto pumped = pump(
        *child, std::nullopt,
        [&](std::string_view chunk) {
            pending.append(chunk);
            size_t start = 0;
            for (auto nl = pending.find('\n'); nl != std::string::npos;
                 nl = pending.find('\n', start)) {
                deliver(std::string_view{pending}.substr(start, nl - start));
                start = nl + 1;
            }
            pending.erase(0, start);
        },
        output.stderr_text);

    if (!pumped) {
        kill_and_reap(child->pid);
        return std::unexpected(pumped.error());
    }

    if (!pending.empty()) {
        deliver(pending);
    }

    output.exit_status = reap(child->pid);
    return output;
}
