#include "services/PackageStreamService.hpp"

#include "services/PackageDatabase.hpp"
#include "util/Logger.hpp"
#include "util/TextUtils.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <optional>
#include <utility>

namespace {

constexpr std::string_view PACKAGE_PREFIX = "package:";

auto elapsed_ms(util::TimePoint from, util::TimePoint to) -> uint64_t {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

}  // namespace

PackageStreamService::PackageStreamService(std::shared_ptr<IBridgeExecutor> executor,
                                           std::shared_ptr<IDeviceRegistry> registry,
                                           std::shared_ptr<IEventSink> sink, util::Clock clock)
    : executor_(std::move(executor)), registry_(std::move(registry)), sink_(std::move(sink)),
      clock_(std::move(clock)) {}

PackageStreamService::~PackageStreamService() {
    wait_for_idle();
}

auto PackageStreamService::start_stream(bool force_refresh) -> std::expected<void, util::Error> {
    auto device = registry_->default_device();
    if (!device) {
        LOG_ERROR("PackageStream",
                  std::format("Cannot start package scan: {}", device.error().user_message()));
        return std::unexpected(device.error());
    }
    const auto serial = device->serial;

    if (!force_refresh) {
        std::optional<std::vector<PackageRecord>> cached;
        {
            std::lock_guard lock{cache_mutex_};
            // A cache owned by another serial is treated as absent
            if (cache_.is_valid_for(serial, clock_())) {
                cached = cache_.value();
            }
        }
        if (cached) {
            LOG_INFO("PackageStream",
                     std::format("Replaying {} cached packages for {}", cached->size(), serial));
            replay_cached(*cached);
            return {};
        }
    }

    reap_finished_workers();

    LOG_INFO("PackageStream", std::format("Starting package scan on {}", serial));
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lock{workers_mutex_};
    workers_.push_back(Worker{.thread = std::thread([this, serial, done]() {
                                  run_live_pass(serial);
                                  done->store(true);
                              }),
                              .done = done});
    return {};
}

void PackageStreamService::replay_cached(const std::vector<PackageRecord>& packages) {
    const auto total = packages.size();
    sink_->emit(StreamProgress{.status = "Loading from cache...",
                               .packages_loaded = 0,
                               .is_complete = false,
                               .error = std::nullopt});

    // Full batches first, then one final batch holding the remainder, which
    // is empty when the total is a multiple of the batch size, as in a live pass
    const auto slice = [&packages](size_t from, size_t to) {
        return std::vector<PackageRecord>(packages.begin() + static_cast<std::ptrdiff_t>(from),
                                          packages.begin() + static_cast<std::ptrdiff_t>(to));
    };
    const size_t full_chunks = total / CHUNK_SIZE;
    for (size_t index = 0; index < full_chunks; ++index) {
        const auto end = (index + 1) * CHUNK_SIZE;
        sink_->emit(PackageChunk{.packages = slice(index * CHUNK_SIZE, end),
                                 .chunk_index = index,
                                 .total_so_far = end,
                                 .is_final = false,
                                 .from_cache = true});
    }
    sink_->emit(PackageChunk{.packages = slice(full_chunks * CHUNK_SIZE, total),
                             .chunk_index = full_chunks,
                             .total_so_far = total,
                             .is_final = true,
                             .from_cache = true});

    sink_->emit(StreamComplete{.total_packages = total, .duration_ms = 0, .from_cache = true});
    sink_->emit(StreamProgress{.status = std::format("Loaded {} packages (cached)", total),
                               .packages_loaded = total,
                               .is_complete = true,
                               .error = std::nullopt});
}

void PackageStreamService::run_live_pass(const std::string& serial) {
    const auto started = clock_();
    sink_->emit(StreamProgress{.status = "Starting package scan...",
                               .packages_loaded = 0,
                               .is_complete = false,
                               .error = std::nullopt});

    std::vector<PackageRecord> all;
    std::vector<PackageRecord> batch;
    batch.reserve(CHUNK_SIZE);
    size_t chunk_index = 0;

    auto streamed = executor_->stream(
        {"-s", serial, "shell", "pm", "list", "packages", "-a"}, [&](std::string_view line) {
            line = util::trim(line);
            if (!line.starts_with(PACKAGE_PREFIX)) {
                return;
            }
            const auto name = util::trim(line.substr(PACKAGE_PREFIX.size()));
            if (name.empty()) {
                return;
            }

            auto record = PackageDatabase::classify(name);
            all.push_back(record);
            batch.push_back(std::move(record));

            if (batch.size() == CHUNK_SIZE) {
                sink_->emit(PackageChunk{.packages = std::move(batch),
                                         .chunk_index = chunk_index++,
                                         .total_so_far = all.size(),
                                         .is_final = false,
                                         .from_cache = false});
                batch.clear();
                sink_->emit(StreamProgress{
                    .status = std::format("Loading packages... ({})", all.size()),
                    .packages_loaded = all.size(),
                    .is_complete = false,
                    .error = std::nullopt});
                std::this_thread::yield();
            }
        });

    if (!streamed) {
        // Batches already delivered stay delivered; the cache is left untouched
        LOG_ERROR("PackageStream", std::format("Package scan on {} failed after {} packages: {}",
                                               serial, all.size(), streamed.error().message));
        sink_->emit(StreamProgress{.status = "Error loading packages",
                                   .packages_loaded = all.size(),
                                   .is_complete = true,
                                   .error = streamed.error().user_message()});
        return;
    }

    sink_->emit(PackageChunk{.packages = std::move(batch),
                             .chunk_index = chunk_index,
                             .total_so_far = all.size(),
                             .is_final = true,
                             .from_cache = false});

    std::ranges::sort(all, {}, &PackageRecord::package_name);
    const auto total = all.size();
    {
        std::lock_guard lock{cache_mutex_};
        cache_.store(std::move(all), clock_(), serial);
    }

    const auto duration = elapsed_ms(started, clock_());
    LOG_INFO("PackageStream",
             std::format("Loaded {} packages from {} in {} ms", total, serial, duration));
    sink_->emit(StreamComplete{.total_packages = total, .duration_ms = duration, .from_cache = false});
    sink_->emit(StreamProgress{.status = std::format("Loaded {} packages", total),
                               .packages_loaded = total,
                               .is_complete = true,
                               .error = std::nullopt});
}

auto PackageStreamService::cached_packages() const -> std::vector<PackageRecord> {
    std::lock_guard lock{cache_mutex_};
    if (!cache_.has_value()) {
        return {};
    }
    return cache_.value();
}

auto PackageStreamService::cache_status() const -> PackageCacheStatus {
    std::lock_guard lock{cache_mutex_};
    PackageCacheStatus status;
    if (!cache_.has_value()) {
        return status;
    }

    const auto now = clock_();
    status.has_cache = true;
    status.package_count = cache_.value().size();
    status.device_serial = cache_.owner();
    status.age_seconds = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now - cache_.captured_at()).count());
    status.is_expired = !cache_.is_fresh(now);
    return status;
}

void PackageStreamService::clear_cache() {
    std::lock_guard lock{cache_mutex_};
    cache_.reset();
    LOG_DEBUG("PackageStream", "Package cache cleared");
}

void PackageStreamService::reap_finished_workers() {
    std::vector<Worker> finished;
    {
        std::lock_guard lock{workers_mutex_};
        auto split = std::ranges::partition(workers_, [](const Worker& w) { return !w.done->load(); });
        finished.assign(std::make_move_iterator(split.begin()), std::make_move_iterator(split.end()));
        workers_.erase(split.begin(), split.end());
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

void PackageStreamService::wait_for_idle() {
    while (true) {
        std::vector<Worker> pending;
        {
            std::lock_guard lock{workers_mutex_};
            if (workers_.empty()) {
                return;
            }
            pending.swap(workers_);
        }
        for (auto& worker : pending) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }
}
