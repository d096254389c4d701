#include "services/HealthMonitor.hpp"

#include "services/HealthParsers.hpp"
#include "util/Logger.hpp"
#include "util/TextUtils.hpp"

#include <algorithm>
#include <format>
#include <utility>

HealthMonitor::HealthMonitor(std::shared_ptr<IBridgeExecutor> executor,
                             std::shared_ptr<IEventSink> sink, util::Clock clock)
    : executor_(std::move(executor)), sink_(std::move(sink)), clock_(std::move(clock)) {}

HealthMonitor::~HealthMonitor() {
    stop_monitor();
}

// ============================================================================
// Collection
// ============================================================================

template<typename T, typename Fetch>
auto HealthMonitor::refresh(CachedResult<T>& slot, std::string_view name,
                            const std::string& serial, Fetch&& fetch, HealthSnapshot& snapshot,
                            std::vector<std::string>& updated) -> std::optional<T> {
    bool stale = false;
    {
        std::lock_guard lock{cache_mutex_};
        stale = !slot.is_valid_for(serial, clock_());
    }

    if (stale) {
        auto fetched = fetch();
        if (fetched) {
            std::lock_guard lock{cache_mutex_};
            slot.store(std::move(*fetched), clock_(), serial);
            updated.emplace_back(name);
        } else {
            // Previous value, if any, stays in place
            LOG_WARNING("HealthMonitor",
                        std::format("Failed to fetch {}: {}", name, fetched.error().message));
        }
    }

    std::lock_guard lock{cache_mutex_};
    if (!slot.has_value() || slot.owner() != serial) {
        return std::nullopt;
    }
    snapshot.freshness[std::string(name)] = slot.age(clock_()).count();
    return slot.value();
}

auto HealthMonitor::collect() -> HealthSnapshot {
    HealthSnapshot snapshot;
    snapshot.timestamp = util::epoch_millis();
    snapshot.device_id = read_device_id();
    const auto& serial = snapshot.device_id;

    {
        std::lock_guard lock{cache_mutex_};
        if (serial != owner_) {
            if (!owner_.empty()) {
                LOG_INFO("HealthMonitor",
                         std::format("Device changed from {} to {}, dropping cached metrics",
                                     owner_, serial));
            }
            reset_slots();
            owner_ = serial;
        }
    }

    std::vector<std::string> updated;
    size_t remaining = metric::ALL.size();
    const auto publish = [&] {
        --remaining;
        sink_->emit(HealthUpdate{.health = snapshot,
                                 .metrics_updated = updated,
                                 .is_complete = remaining == 0});
    };

    snapshot.storage = refresh(storage_, metric::STORAGE, serial,
                               [&] { return fetch_storage(serial); }, snapshot, updated);
    publish();
    snapshot.memory = refresh(memory_, metric::MEMORY, serial,
                              [&] { return fetch_memory(serial); }, snapshot, updated);
    publish();
    snapshot.cpu = refresh(cpu_, metric::CPU, serial,
                           [&] { return fetch_cpu(serial); }, snapshot, updated);
    publish();
    snapshot.services_count = refresh(services_, metric::SERVICES, serial,
                                      [&] { return fetch_services(serial); }, snapshot, updated);
    publish();
    snapshot.app_counts = refresh(app_counts_, metric::APP_COUNTS, serial,
                                  [&] { return fetch_app_counts(serial); }, snapshot, updated);
    publish();
    snapshot.thermal = refresh(thermal_, metric::THERMAL, serial,
                               [&] { return fetch_thermal(serial); }, snapshot, updated);
    publish();
    snapshot.battery_drainers = refresh(battery_, metric::BATTERY, serial,
                                        [&] { return fetch_battery(serial); }, snapshot, updated)
                                    .value_or(std::vector<BatteryDrainer>{});
    publish();

    LOG_DEBUG("HealthMonitor", std::format("Health pass on '{}' refreshed {} of {} metrics",
                                           serial, updated.size(), metric::ALL.size()));
    return snapshot;
}

void HealthMonitor::clear_cache() {
    std::lock_guard lock{cache_mutex_};
    reset_slots();
    owner_.clear();
}

void HealthMonitor::reset_slots() {
    storage_.reset();
    memory_.reset();
    cpu_.reset();
    services_.reset();
    app_counts_.reset();
    thermal_.reset();
    battery_.reset();
}

auto HealthMonitor::read_device_id() -> std::string {
    auto output = executor_->run({"get-serialno"});
    if (!output) {
        LOG_DEBUG("HealthMonitor",
                  std::format("get-serialno failed: {}", output.error().message));
        return {};
    }
    return std::string(util::trim(*output));
}

auto HealthMonitor::device_ready() -> bool {
    auto state = executor_->run({"get-state"});
    return state && util::trim(*state) == "device";
}

// ============================================================================
// Fetchers
// ============================================================================

auto HealthMonitor::fetch_storage(const std::string& serial) -> util::Result<StorageInfo> {
    auto output = executor_->shell(serial, "df /data");
    if (output) {
        if (auto parsed = health_parsers::parse_storage(*output)) {
            return parsed;
        }
    }

    // Some toolboxes only print human-readable sizes
    auto human = executor_->shell(serial, "df -h /data");
    if (!human) {
        return std::unexpected(human.error());
    }
    return health_parsers::parse_storage_human(*human);
}

auto HealthMonitor::fetch_memory(const std::string& serial) -> util::Result<MemoryInfo> {
    auto output = executor_->shell(serial, "cat /proc/meminfo");
    if (!output) {
        return std::unexpected(output.error());
    }
    return health_parsers::parse_meminfo(*output);
}

auto HealthMonitor::fetch_cpu(const std::string& serial) -> util::Result<CpuInfo> {
    auto output = executor_->shell(serial, "top -n 1 -b");
    if (output) {
        if (auto parsed = health_parsers::parse_top_cpu(*output)) {
            return parsed;
        }
    }

    auto stat = executor_->shell(serial, "cat /proc/stat");
    if (!stat) {
        return std::unexpected(stat.error());
    }
    return health_parsers::parse_proc_stat(*stat);
}

auto HealthMonitor::fetch_services(const std::string& serial) -> util::Result<uint32_t> {
    auto output = executor_->shell(serial, "service list");
    if (!output) {
        return std::unexpected(output.error());
    }
    return health_parsers::parse_service_count(*output);
}

auto HealthMonitor::fetch_app_counts(const std::string& serial) -> util::Result<AppCounts> {
    auto system = executor_->shell(serial, "pm list packages -s");
    if (!system) {
        return std::unexpected(system.error());
    }
    auto user = executor_->shell(serial, "pm list packages -3");
    if (!user) {
        return std::unexpected(user.error());
    }

    AppCounts counts;
    counts.system_apps = health_parsers::count_packages(*system);
    counts.user_apps = health_parsers::count_packages(*user);
    counts.total_apps = counts.system_apps + counts.user_apps;
    return counts;
}

auto HealthMonitor::fetch_thermal(const std::string& serial) -> util::Result<ThermalInfo> {
    auto output = executor_->shell(serial, "dumpsys thermalservice");
    if (!output) {
        return std::unexpected(output.error());
    }
    return health_parsers::parse_thermal(*output);
}

auto HealthMonitor::fetch_battery(const std::string& serial)
    -> util::Result<std::vector<BatteryDrainer>> {
    auto output = executor_->shell(serial, "dumpsys batterystats");
    if (!output) {
        return std::unexpected(output.error());
    }
    return health_parsers::parse_battery_drainers(*output);
}

// ============================================================================
// Background monitor
// ============================================================================

void HealthMonitor::start_monitor(std::chrono::milliseconds interval) {
    interval = std::max(interval, MIN_INTERVAL);
    stop_monitor();

    std::lock_guard control{control_mutex_};
    {
        std::lock_guard lock{monitor_mutex_};
        stop_requested_ = false;
    }
    monitoring_ = true;
    LOG_INFO("HealthMonitor", std::format("Health monitor started, interval {} ms", interval.count()));

    monitor_thread_ = std::thread([this, interval]() {
        std::unique_lock lock{monitor_mutex_};
        while (!stop_requested_) {
            lock.unlock();
            if (device_ready()) {
                collect();
            } else {
                LOG_DEBUG("HealthMonitor", "No ready device, skipping health pass");
            }
            lock.lock();
            monitor_cv_.wait_for(lock, interval, [this] { return stop_requested_; });
        }
    });
}

void HealthMonitor::stop_monitor() {
    std::lock_guard control{control_mutex_};
    if (!monitor_thread_.joinable()) {
        return;
    }
    {
        std::lock_guard lock{monitor_mutex_};
        stop_requested_ = true;
    }
    monitor_cv_.notify_all();
    monitor_thread_.join();
    monitoring_ = false;
    LOG_INFO("HealthMonitor", "Health monitor stopped");
}
