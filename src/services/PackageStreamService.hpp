/**
 * @file PackageStreamService.hpp
 * @brief Incremental enumeration of installed packages with a per-device cache
 */

#pragma once

#include "core/IEventSink.hpp"
#include "models/CachedResult.hpp"
#include "models/PackageTypes.hpp"
#include "services/IBridgeExecutor.hpp"
#include "services/IDeviceRegistry.hpp"
#include "util/Clock.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @class PackageStreamService
 * @brief Streams `pm list packages -a` to an event sink in fixed-size batches
 *
 * A live pass runs on its own worker thread and emits package_chunk events
 * in discovery order, followed by the sorted result being cached for the
 * device. A cache hit is replayed synchronously with the same event shape.
 * Passes are never cancelled; overlapping passes both finish and the last
 * one to complete owns the cache.
 */
class PackageStreamService {
public:
    PackageStreamService(std::shared_ptr<IBridgeExecutor> executor,
                         std::shared_ptr<IDeviceRegistry> registry,
                         std::shared_ptr<IEventSink> sink,
                         util::Clock clock = util::steady_clock());
    ~PackageStreamService();

    PackageStreamService(const PackageStreamService&) = delete;
    PackageStreamService& operator=(const PackageStreamService&) = delete;
    PackageStreamService(PackageStreamService&&) = delete;
    PackageStreamService& operator=(PackageStreamService&&) = delete;

    /**
     * @brief Begin an enumeration for the default device
     * @param force_refresh Ignore a fresh cache entry
     * @return Error only if no device could be resolved; later failures arrive as events
     */
    auto start_stream(bool force_refresh) -> std::expected<void, util::Error>;

    /**
     * @brief Sorted packages from the last completed pass, empty if none
     */
    [[nodiscard]] auto cached_packages() const -> std::vector<PackageRecord>;

    [[nodiscard]] auto cache_status() const -> PackageCacheStatus;

    void clear_cache();

    /**
     * @brief Block until every live pass started so far has finished
     */
    void wait_for_idle();

    static constexpr size_t CHUNK_SIZE = 30;
    static constexpr auto CACHE_TTL = std::chrono::seconds{300};

private:
    void replay_cached(const std::vector<PackageRecord>& packages);
    void run_live_pass(const std::string& serial);
    void reap_finished_workers();

    std::shared_ptr<IBridgeExecutor> executor_;
    std::shared_ptr<IDeviceRegistry> registry_;
    std::shared_ptr<IEventSink> sink_;
    util::Clock clock_;

    mutable std::mutex cache_mutex_;
    CachedResult<std::vector<PackageRecord>> cache_{CACHE_TTL};

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};
