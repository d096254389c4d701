/**
 * @file CliApplication.hpp
 * @brief Command-line front end for device inspection and package removal
 */

#pragma once

#include "core/IEventSink.hpp"
#include "models/BackupTypes.hpp"
#include "models/DeviceInfo.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ServiceContext;

namespace cli {

/**
 * @enum ServerAction
 * @brief Argument of --server
 */
enum class ServerAction { START, KILL, RESTART };

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool json_output = false;
    bool verbose = false;

    bool list_devices = false;
    bool device_info = false;
    bool list_packages = false;
    bool force_refresh = false;
    bool cache_status = false;
    bool health = false;
    std::optional<std::chrono::milliseconds> monitor_interval;
    std::optional<std::string> uninstall_package;
    std::optional<std::string> reinstall_package;
    std::optional<std::vector<std::string>> backup_packages;
    bool list_backups = false;
    std::optional<std::string> restore_file;
    std::optional<std::string> delete_backup_file;
    std::optional<ServerAction> server_action;
    std::optional<std::string> connect_address;
    std::optional<std::string> disconnect_address;

    std::optional<std::string> adb_path;
    std::optional<std::string> parse_error;  ///< Set when an option value is malformed
};

/**
 * @class CliApplication
 * @brief Runs one command against the default device and exits
 *
 * Package streaming and health monitoring deliver their output through the
 * event channel; the CLI iterates the default GLib main context until the
 * operation reports completion or the user interrupts.
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Exit code (0 = success)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     *
     * Re-entrant: getopt state is reset on every call.
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();
    static void print_version();

private:
    auto dispatch(const CliOptions& options) -> int;

    auto cmd_devices() -> int;
    auto cmd_info() -> int;
    auto cmd_packages(bool force_refresh) -> int;
    auto cmd_cache_status() -> int;
    auto cmd_health() -> int;
    auto cmd_monitor(std::chrono::milliseconds interval) -> int;
    auto cmd_uninstall(const std::string& package) -> int;
    auto cmd_reinstall(const std::string& package) -> int;
    auto cmd_backup(const std::vector<std::string>& packages) -> int;
    auto cmd_list_backups() -> int;
    auto cmd_restore(const std::string& filename) -> int;
    auto cmd_delete_backup(const std::string& filename) -> int;
    auto cmd_server(ServerAction action) -> int;
    auto cmd_connect(const std::string& address, bool disconnect) -> int;

    /**
     * @brief Log and print `Error: <user message>`
     * @return Exit code 1
     */
    auto report_error(const util::Error& error) -> int;

    /**
     * @brief Print a plain status message, or {"success": true, "message": ...} in JSON mode
     */
    void report_success(const std::string& message);

    void print_devices_table(const std::vector<DeviceInfo>& devices);
    void print_backups_table(const std::vector<BackupInfo>& backups);

    /**
     * @brief Iterate the default main context until the stream or pass completes
     */
    void wait_for_completion();

    class CompletionWatcher;

    bool json_output_ = false;
    std::shared_ptr<CompletionWatcher> watcher_;
    std::unique_ptr<ServiceContext> services_;
};

}  // namespace cli
