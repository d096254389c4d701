/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/TerminalEventSink.hpp"
#include "config.h"
#include "core/JsonEventSink.hpp"
#include "core/MainContextEventSink.hpp"
#include "core/ServiceContext.hpp"
#include "models/JsonSerialization.hpp"
#include "util/Logger.hpp"

#include <glib-unix.h>
#include <glib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <string_view>
#include <utility>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "adb-debloater-cli";

// Long-only options
enum LongOption : int {
    OPT_RESTORE = 256,
    OPT_DELETE_BACKUP,
    OPT_SERVER,
    OPT_CONNECT,
    OPT_DISCONNECT,
    OPT_ADB,
};

// Command line options
const struct option long_options[] = {
    {         "help",       no_argument, nullptr,               'h'},
    {      "version",       no_argument, nullptr,               'V'},
    {         "json",       no_argument, nullptr,               'j'},
    {      "verbose",       no_argument, nullptr,               'v'},
    {      "devices",       no_argument, nullptr,               'd'},
    {         "info",       no_argument, nullptr,               'i'},
    {     "packages",       no_argument, nullptr,               'p'},
    {      "refresh",       no_argument, nullptr,               'r'},
    { "cache-status",       no_argument, nullptr,               'c'},
    {       "health",       no_argument, nullptr,               'H'},
    {      "monitor", required_argument, nullptr,               'm'},
    {    "uninstall", required_argument, nullptr,               'u'},
    {    "reinstall", required_argument, nullptr,               'R'},
    {       "backup", required_argument, nullptr,               'b'},
    { "list-backups",       no_argument, nullptr,               'L'},
    {      "restore", required_argument, nullptr,       OPT_RESTORE},
    {"delete-backup", required_argument, nullptr, OPT_DELETE_BACKUP},
    {       "server", required_argument, nullptr,        OPT_SERVER},
    {      "connect", required_argument, nullptr,       OPT_CONNECT},
    {   "disconnect", required_argument, nullptr,    OPT_DISCONNECT},
    {          "adb", required_argument, nullptr,           OPT_ADB},
    {        nullptr,                 0, nullptr,                 0}
};

auto parse_server_action(std::string_view value) -> std::optional<ServerAction> {
    if (value == "start") {
        return ServerAction::START;
    }
    if (value == "kill" || value == "stop") {
        return ServerAction::KILL;
    }
    if (value == "restart") {
        return ServerAction::RESTART;
    }
    return std::nullopt;
}

auto split_packages(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> packages;
    for (auto part : list | std::views::split(',')) {
        std::string_view name(part.begin(), part.end());
        if (!name.empty()) {
            packages.emplace_back(name);
        }
    }
    return packages;
}

}  // namespace

/**
 * Forwards events to the renderer and records when the current operation
 * has finished. Runs on the main context thread only.
 */
class CliApplication::CompletionWatcher : public IEventSink {
public:
    explicit CompletionWatcher(std::shared_ptr<IEventSink> inner) : inner_(std::move(inner)) {}

    void emit(const AppEvent& event) override {
        inner_->emit(event);
        if (const auto* progress = std::get_if<StreamProgress>(&event);
            progress != nullptr && progress->is_complete) {
            failed_ = progress->error.has_value();
            done_ = true;
        } else if (const auto* update = std::get_if<HealthUpdate>(&event);
                   update != nullptr && update->is_complete) {
            done_ = true;
        }
    }

    void reset() {
        done_ = false;
        failed_ = false;
    }
    [[nodiscard]] auto done() const -> bool { return done_.load(); }
    [[nodiscard]] auto failed() const -> bool { return failed_.load(); }

private:
    std::shared_ptr<IEventSink> inner_;
    std::atomic<bool> done_{false};
    std::atomic<bool> failed_{false};
};

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / PROJECT_NAME / "logs";
    auto& logger = util::Logger::instance();
    logger.initialize(log_dir, APP_NAME, options.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO);
    logger.set_console_output(options.verbose);

    if (options.parse_error) {
        std::cerr << "Error: " << *options.parse_error << "\n";
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    json_output_ = options.json_output;

    std::shared_ptr<IEventSink> renderer;
    if (json_output_) {
        renderer = std::make_shared<JsonEventSink>(std::cout);
    } else {
        renderer = std::make_shared<TerminalEventSink>(std::cout, std::cerr);
    }
    watcher_ = std::make_shared<CompletionWatcher>(renderer);

    ServiceConfig config;
    config.bridge_override = options.adb_path;
    services_ = std::make_unique<ServiceContext>(config, std::make_shared<MainContextEventSink>(watcher_));

    const int status = dispatch(options);
    services_.reset();
    // Drop events queued by workers that finished after the last wait
    while (g_main_context_pending(nullptr)) {
        g_main_context_iteration(nullptr, FALSE);
    }
    return status;
}

auto CliApplication::dispatch(const CliOptions& options) -> int {
    if (options.server_action) {
        return cmd_server(*options.server_action);
    }
    if (options.connect_address) {
        return cmd_connect(*options.connect_address, false);
    }
    if (options.disconnect_address) {
        return cmd_connect(*options.disconnect_address, true);
    }
    if (options.list_devices) {
        return cmd_devices();
    }
    if (options.device_info) {
        return cmd_info();
    }
    if (options.list_packages) {
        return cmd_packages(options.force_refresh);
    }
    if (options.cache_status) {
        return cmd_cache_status();
    }
    if (options.health) {
        return cmd_health();
    }
    if (options.monitor_interval) {
        return cmd_monitor(*options.monitor_interval);
    }
    if (options.uninstall_package) {
        return cmd_uninstall(*options.uninstall_package);
    }
    if (options.reinstall_package) {
        return cmd_reinstall(*options.reinstall_package);
    }
    if (options.backup_packages) {
        return cmd_backup(*options.backup_packages);
    }
    if (options.list_backups) {
        return cmd_list_backups();
    }
    if (options.restore_file) {
        return cmd_restore(*options.restore_file);
    }
    if (options.delete_backup_file) {
        return cmd_delete_backup(*options.delete_backup_file);
    }

    // No command specified
    print_help();
    return 1;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "hVjvdiprcHm:u:R:b:L", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'j':
                options.json_output = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'd':
                options.list_devices = true;
                break;
            case 'i':
                options.device_info = true;
                break;
            case 'p':
                options.list_packages = true;
                break;
            case 'r':
                options.force_refresh = true;
                break;
            case 'c':
                options.cache_status = true;
                break;
            case 'H':
                options.health = true;
                break;
            case 'm': {
                const std::string_view value{optarg};
                int64_t millis = 0;
                auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), millis);
                if (ec != std::errc{} || end != value.data() + value.size() || millis <= 0) {
                    options.parse_error = std::format("Invalid monitor interval '{}'", value);
                } else {
                    options.monitor_interval = std::chrono::milliseconds{millis};
                }
                break;
            }
            case 'u':
                options.uninstall_package = optarg;
                break;
            case 'R':
                options.reinstall_package = optarg;
                break;
            case 'b':
                options.backup_packages = split_packages(optarg);
                break;
            case 'L':
                options.list_backups = true;
                break;
            case OPT_RESTORE:
                options.restore_file = optarg;
                break;
            case OPT_DELETE_BACKUP:
                options.delete_backup_file = optarg;
                break;
            case OPT_SERVER:
                options.server_action = parse_server_action(optarg);
                if (!options.server_action) {
                    options.parse_error =
                        std::format("Unknown server action '{}' (expected start, kill or restart)", optarg);
                }
                break;
            case OPT_CONNECT:
                options.connect_address = optarg;
                break;
            case OPT_DISCONNECT:
                options.disconnect_address = optarg;
                break;
            case OPT_ADB:
                options.adb_path = optarg;
                break;
            default:
                options.show_help = true;
                break;
        }
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Inspect an Android device over adb and remove preinstalled packages\n\n"
              << "Commands:\n"
              << "  -d, --devices               List ready devices\n"
              << "  -i, --info                  Show details of the default device\n"
              << "  -p, --packages              Stream installed packages with safety levels\n"
              << "  -c, --cache-status          Show the package cache status\n"
              << "  -H, --health                Collect device health once\n"
              << "  -m, --monitor <ms>          Collect device health every <ms> until Ctrl+C\n"
              << "  -u, --uninstall <package>   Remove a package for the current user\n"
              << "  -R, --reinstall <package>   Restore a removed package\n"
              << "  -b, --backup <p1,p2,...>    Save a list of packages to a backup file\n"
              << "  -L, --list-backups          List backup files\n"
              << "      --restore <file>        Reinstall every package in a backup\n"
              << "      --delete-backup <file>  Delete a backup file\n"
              << "      --server <action>       start, kill or restart the adb server\n"
              << "      --connect <host:port>   Connect to a device over TCP\n"
              << "      --disconnect <host:port>\n\n"
              << "Options:\n"
              << "  -r, --refresh               Ignore cached packages (with --packages)\n"
              << "      --adb <path>            Use this adb executable\n"
              << "  -j, --json                  Output in JSON format\n"
              << "  -v, --verbose               Debug logging, echoed to stderr\n"
              << "  -h, --help                  Show this help message\n"
              << "  -V, --version               Show version information\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --devices\n"
              << "  " << APP_NAME << " --packages --json\n"
              << "  " << APP_NAME << " --uninstall com.facebook.katana\n"
              << "  " << APP_NAME << " --monitor 2000\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of " << PROJECT_NAME << " - Android package debloater\n";
}

// ============================================================================
// Output helpers
// ============================================================================

auto CliApplication::report_error(const util::Error& error) -> int {
    LOG_ERROR("CLI", std::format("{} ({})", error.message, util::error_kind_name(error.kind)));
    if (json_output_) {
        const nlohmann::json payload{
            {"success", false},
            {   "kind", std::string(util::error_kind_name(error.kind))},
            {  "error", error.user_message()},
        };
        std::cout << to_json_text(payload, 2) << "\n";
    }
    std::cerr << "Error: " << error.user_message() << "\n";
    return 1;
}

void CliApplication::report_success(const std::string& message) {
    if (json_output_) {
        std::cout << to_json_text(nlohmann::json{{"success", true}, {"message", message}}, 2) << "\n";
    } else {
        std::cout << message << "\n";
    }
}

void CliApplication::wait_for_completion() {
    auto* main_context = g_main_context_default();
    while (!watcher_->done()) {
        g_main_context_iteration(main_context, TRUE);
    }
}

// ============================================================================
// Devices
// ============================================================================

auto CliApplication::cmd_devices() -> int {
    auto devices = services_->devices()->list_devices(true);
    if (!devices) {
        return report_error(devices.error());
    }

    if (json_output_) {
        std::cout << to_json_text(nlohmann::json(*devices), 2) << "\n";
    } else if (devices->empty()) {
        std::cout << "No devices found.\n";
    } else {
        print_devices_table(*devices);
    }
    return 0;
}

auto CliApplication::cmd_info() -> int {
    auto details = services_->devices()->device_details();
    if (!details) {
        return report_error(details.error());
    }

    if (json_output_) {
        std::cout << to_json_text(nlohmann::json(*details), 2) << "\n";
        return 0;
    }
    std::cout << "Serial:            " << details->name << "\n"
              << "Model:             " << details->model << "\n"
              << "Android version:   " << details->android_version << "\n"
              << "Battery:           "
              << (details->battery_percent ? std::format("{}%", *details->battery_percent) : "unknown")
              << "\n"
              << "Storage available: " << details->storage_available << "\n";
    return 0;
}

auto CliApplication::cmd_server(ServerAction action) -> int {
    auto& devices = *services_->devices();
    util::Result<void> result;
    std::string done;
    switch (action) {
        case ServerAction::START:
            result = devices.start_server();
            done = "ADB server started";
            break;
        case ServerAction::KILL:
            result = devices.kill_server();
            done = "ADB server stopped";
            break;
        case ServerAction::RESTART:
            result = devices.restart_server();
            done = "ADB server restarted";
            break;
    }
    if (!result) {
        return report_error(result.error());
    }
    report_success(done);
    return 0;
}

auto CliApplication::cmd_connect(const std::string& address, bool disconnect) -> int {
    auto& devices = *services_->devices();
    auto result = disconnect ? devices.disconnect(address) : devices.connect(address);
    if (!result) {
        return report_error(result.error());
    }
    report_success(*result);
    return 0;
}

void CliApplication::print_devices_table(const std::vector<DeviceInfo>& devices) {
    // Column widths for table formatting
    constexpr int COL_SERIAL = 24;
    constexpr int COL_STATE = 10;
    constexpr int COL_MODEL = 24;

    std::cout << std::left << std::setw(COL_SERIAL) << "SERIAL" << std::setw(COL_STATE) << "STATE"
              << std::setw(COL_MODEL) << "MODEL" << "PRODUCT\n";
    std::cout << std::string(COL_SERIAL + COL_STATE + COL_MODEL + 12, '-') << "\n";

    for (const auto& device : devices) {
        std::cout << std::left << std::setw(COL_SERIAL) << device.serial << std::setw(COL_STATE)
                  << device.state << std::setw(COL_MODEL) << device.model.value_or("-")
                  << device.product.value_or("-") << "\n";
    }
}

// ============================================================================
// Packages
// ============================================================================

auto CliApplication::cmd_packages(bool force_refresh) -> int {
    watcher_->reset();
    auto started = services_->packages()->start_stream(force_refresh);
    if (!started) {
        return report_error(started.error());
    }

    wait_for_completion();
    services_->packages()->wait_for_idle();
    return watcher_->failed() ? 1 : 0;
}

auto CliApplication::cmd_cache_status() -> int {
    const auto status = services_->packages()->cache_status();
    if (json_output_) {
        std::cout << to_json_text(nlohmann::json(status), 2) << "\n";
        return 0;
    }
    if (!status.has_cache) {
        std::cout << "No cached package list.\n";
        return 0;
    }
    std::cout << std::format("{} packages cached for {}, {} s old{}\n", status.package_count,
                             status.device_serial.value_or("unknown"), status.age_seconds.value_or(0),
                             status.is_expired ? " (expired)" : "");
    return 0;
}

auto CliApplication::cmd_uninstall(const std::string& package) -> int {
    auto result = services_->actions()->uninstall(package);
    if (!result) {
        return report_error(result.error());
    }
    report_success(*result);
    return 0;
}

auto CliApplication::cmd_reinstall(const std::string& package) -> int {
    auto result = services_->actions()->reinstall(package);
    if (!result) {
        return report_error(result.error());
    }
    report_success(*result);
    return 0;
}

// ============================================================================
// Health
// ============================================================================

auto CliApplication::cmd_health() -> int {
    watcher_->reset();
    services_->health()->collect();
    wait_for_completion();
    return 0;
}

auto CliApplication::cmd_monitor(std::chrono::milliseconds interval) -> int {
    bool interrupted = false;
    const auto on_signal = [](gpointer data) -> gboolean {
        *static_cast<bool*>(data) = true;
        return G_SOURCE_REMOVE;
    };
    const guint sigint_id = g_unix_signal_add(SIGINT, on_signal, &interrupted);
    const guint sigterm_id = g_unix_signal_add(SIGTERM, on_signal, &interrupted);

    if (!json_output_) {
        std::cerr << std::format("Monitoring device health every {} ms, press Ctrl+C to stop\n",
                                 std::max(interval, HealthMonitor::MIN_INTERVAL).count());
    }
    services_->health()->start_monitor(interval);

    auto* main_context = g_main_context_default();
    while (!interrupted) {
        g_main_context_iteration(main_context, TRUE);
    }

    services_->health()->stop_monitor();
    // Whichever handler did not fire is still attached
    for (const guint id : {sigint_id, sigterm_id}) {
        if (GSource* source = g_main_context_find_source_by_id(main_context, id)) {
            g_source_destroy(source);
        }
    }
    return 0;
}

// ============================================================================
// Backups
// ============================================================================

auto CliApplication::cmd_backup(const std::vector<std::string>& packages) -> int {
    if (packages.empty()) {
        return report_error(util::Error(util::ErrorKind::COMMAND_FAILED, "No packages given for backup"));
    }
    auto path = services_->backups()->create(packages);
    if (!path) {
        return report_error(path.error());
    }
    if (json_output_) {
        std::cout << to_json_text(nlohmann::json{{"success", true}, {"backupFile", path->string()}}, 2) << "\n";
    } else {
        std::cout << std::format("Backed up {} packages to {}\n", packages.size(), path->string());
    }
    return 0;
}

auto CliApplication::cmd_list_backups() -> int {
    auto backups = services_->backups()->list();
    if (!backups) {
        return report_error(backups.error());
    }

    if (json_output_) {
        std::cout << to_json_text(nlohmann::json(*backups), 2) << "\n";
    } else if (backups->empty()) {
        std::cout << "No backups in " << services_->backups()->directory().string() << "\n";
    } else {
        print_backups_table(*backups);
    }
    return 0;
}

auto CliApplication::cmd_restore(const std::string& filename) -> int {
    auto result = services_->backups()->restore(filename);
    if (!result) {
        return report_error(result.error());
    }

    if (json_output_) {
        std::cout << to_json_text(nlohmann::json(*result), 2) << "\n";
    } else {
        std::cout << std::format("Restored {} packages\n", result->restored.size());
        for (const auto& failure : result->failed) {
            std::cerr << std::format("  {}: {}\n", failure.package, failure.error);
        }
    }
    return result->all_restored() ? 0 : 1;
}

auto CliApplication::cmd_delete_backup(const std::string& filename) -> int {
    auto result = services_->backups()->remove(filename);
    if (!result) {
        return report_error(result.error());
    }
    report_success(std::format("Deleted {}", filename));
    return 0;
}

void CliApplication::print_backups_table(const std::vector<BackupInfo>& backups) {
    constexpr int COL_FILE = 34;
    constexpr int COL_DATE = 24;
    constexpr int COL_COUNT = 10;

    std::cout << std::left << std::setw(COL_FILE) << "FILE" << std::setw(COL_DATE) << "CREATED"
              << std::setw(COL_COUNT) << "PACKAGES" << "DEVICE\n";
    std::cout << std::string(COL_FILE + COL_DATE + COL_COUNT + 16, '-') << "\n";

    for (const auto& backup : backups) {
        std::cout << std::left << std::setw(COL_FILE) << backup.filename << std::setw(COL_DATE)
                  << backup.timestamp << std::setw(COL_COUNT) << backup.package_count
                  << backup.device_name << "\n";
    }
}

}  // namespace cli
