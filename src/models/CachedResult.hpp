/**
 * @file CachedResult.hpp
 * @brief Timestamped, device-owned cache slot with a fixed TTL
 */

#pragma once

#include "util/Clock.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>

/**
 * @class CachedResult
 * @brief Holds the last fetched value of T together with when and for whom it was fetched
 *
 * A payload is only served while it is younger than the TTL and owned by
 * the serial the caller is asking for. The class itself is not synchronized;
 * owners guard it with their own mutex and hold that lock only for
 * is_valid_for()/store()/reset().
 */
template<typename T>
class CachedResult {
public:
    explicit CachedResult(std::chrono::milliseconds ttl) : ttl_(ttl) {}

    [[nodiscard]] auto ttl() const -> std::chrono::milliseconds { return ttl_; }
    [[nodiscard]] auto has_value() const -> bool { return value_.has_value(); }
    [[nodiscard]] auto value() const -> const T& { return *value_; }
    [[nodiscard]] auto owner() const -> const std::string& { return owner_; }
    [[nodiscard]] auto captured_at() const -> util::TimePoint { return captured_at_; }

    [[nodiscard]] auto age(util::TimePoint now) const -> std::chrono::milliseconds {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - captured_at_);
    }

    [[nodiscard]] auto is_fresh(util::TimePoint now) const -> bool {
        return value_.has_value() && (now - captured_at_) < ttl_;
    }

    [[nodiscard]] auto is_valid_for(const std::string& serial, util::TimePoint now) const -> bool {
        return is_fresh(now) && owner_ == serial;
    }

    void store(T value, util::TimePoint now, std::string owner = {}) {
        value_ = std::move(value);
        captured_at_ = now;
        owner_ = std::move(owner);
    }

    void reset() {
        value_.reset();
        captured_at_ = {};
        owner_.clear();
    }

private:
    std::chrono::milliseconds ttl_;
    std::optional<T> value_;
    util::TimePoint captured_at_{};
    std::string owner_;
};
