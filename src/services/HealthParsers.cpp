#include "services/HealthParsers.hpp"

#include "util/TextUtils.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <format>
#include <map>
#include <numeric>

namespace health_parsers {

namespace {

constexpr size_t THERMAL_SCAN_LINES = 30;
constexpr size_t POWER_SECTION_LINES = 50;
constexpr size_t MAX_DRAINERS = 5;
constexpr double MIN_DRAIN_MAH = 0.1;
constexpr double MAX_PLAUSIBLE_TEMPERATURE = 150.0;

auto parse_number(std::string_view text) -> std::optional<double> {
    text = util::trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parse_unsigned(std::string_view text) -> std::optional<uint64_t> {
    text = util::trim(text);
    uint64_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto last_non_empty_line(std::string_view output) -> std::string_view {
    const auto lines = util::split_lines(output);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!util::trim(*it).empty()) {
            return util::trim(*it);
        }
    }
    return {};
}

auto parse_error(std::string message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::PARSE_ERROR, std::move(message)});
}

// Strip trailing unit decorations such as "C", "°C" or ","
auto strip_temperature_suffix(std::string_view token) -> std::string_view {
    while (!token.empty()) {
        const auto last = static_cast<unsigned char>(token.back());
        if (last == 'C' || last == 'c' || last == ',' || last == 0xB0 || last == 0xC2) {
            token.remove_suffix(1);
        } else {
            break;
        }
    }
    return token;
}

auto temperature_from_line(std::string_view line) -> std::optional<double> {
    // Temperature{mValue=36.5, mType=0, mName=battery, mStatus=0}
    if (const auto pos = line.find("mValue="); pos != std::string_view::npos) {
        auto rest = line.substr(pos + 7);
        const auto end = rest.find_first_of(",} ");
        if (auto value = parse_number(rest.substr(0, end));
            value && *value > 0.0 && *value < MAX_PLAUSIBLE_TEMPERATURE) {
            return value;
        }
    }

    for (auto token : util::split_whitespace(line)) {
        if (auto value = parse_number(strip_temperature_suffix(token));
            value && *value > 0.0 && *value < MAX_PLAUSIBLE_TEMPERATURE) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

auto parse_storage(std::string_view df_output) -> util::Result<StorageInfo> {
    const auto line = last_non_empty_line(df_output);
    const auto tokens = util::split_whitespace(line);
    if (tokens.size() < 4) {
        return parse_error(std::format("unexpected df line '{}'", line));
    }

    const auto total_kb = parse_unsigned(tokens[1]);
    const auto used_kb = parse_unsigned(tokens[2]);
    const auto free_kb = parse_unsigned(tokens[3]);
    if (!total_kb || !used_kb || !free_kb) {
        return parse_error(std::format("non-numeric df columns in '{}'", line));
    }

    StorageInfo info;
    info.total_mb = *total_kb / 1024;
    info.used_mb = *used_kb / 1024;
    info.free_mb = *free_kb / 1024;
    info.usage_percent =
        percentage(static_cast<double>(info.used_mb), static_cast<double>(info.total_mb));
    return info;
}

auto parse_size_to_mb(std::string_view size) -> std::optional<double> {
    size = util::trim(size);
    if (size.empty()) {
        return std::nullopt;
    }

    const auto unit = static_cast<char>(std::toupper(static_cast<unsigned char>(size.back())));
    if (std::isdigit(static_cast<unsigned char>(unit))) {
        return parse_number(size);
    }

    auto number = parse_number(size.substr(0, size.size() - 1));
    if (!number) {
        return std::nullopt;
    }
    switch (unit) {
        case 'K':
            return *number / 1024.0;
        case 'M':
            return *number;
        case 'G':
            return *number * 1024.0;
        case 'T':
            return *number * 1024.0 * 1024.0;
        default:
            return std::nullopt;
    }
}

auto parse_storage_human(std::string_view df_output) -> util::Result<StorageInfo> {
    const auto line = last_non_empty_line(df_output);
    const auto tokens = util::split_whitespace(line);
    if (tokens.size() < 4) {
        return parse_error(std::format("unexpected df -h line '{}'", line));
    }

    const auto total = parse_size_to_mb(tokens[1]);
    const auto used = parse_size_to_mb(tokens[2]);
    const auto free = parse_size_to_mb(tokens[3]);
    if (!total || !used || !free) {
        return parse_error(std::format("unrecognized sizes in '{}'", line));
    }

    StorageInfo info;
    info.total_mb = static_cast<uint64_t>(*total);
    info.used_mb = static_cast<uint64_t>(*used);
    info.free_mb = static_cast<uint64_t>(*free);
    info.usage_percent =
        percentage(static_cast<double>(info.used_mb), static_cast<double>(info.total_mb));
    return info;
}

auto parse_available_storage(std::string_view df_output) -> std::optional<std::string> {
    const auto tokens = util::split_whitespace(last_non_empty_line(df_output));
    if (tokens.size() < 4 || tokens[3] == "Available" || tokens[3] == "Avail") {
        return std::nullopt;
    }
    return std::string(tokens[3]);
}

auto parse_meminfo(std::string_view meminfo) -> util::Result<MemoryInfo> {
    std::map<std::string, uint64_t, std::less<>> fields;

    for (auto line : util::split_lines(meminfo)) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        auto value = util::trim(line.substr(colon + 1));
        if (value.ends_with("kB")) {
            value.remove_suffix(2);
        }
        if (auto number = parse_unsigned(value)) {
            fields.emplace(std::string(util::trim(line.substr(0, colon))), *number);
        }
    }

    const auto field = [&fields](std::string_view name) -> uint64_t {
        auto it = fields.find(name);
        return it != fields.end() ? it->second : 0;
    };

    if (!fields.contains("MemTotal")) {
        return parse_error("MemTotal missing from /proc/meminfo");
    }

    MemoryInfo info;
    info.total_mb = field("MemTotal") / 1024;
    info.available_mb = field("MemAvailable") / 1024;
    info.used_mb = info.total_mb > info.available_mb ? info.total_mb - info.available_mb : 0;
    info.usage_percent =
        percentage(static_cast<double>(info.used_mb), static_cast<double>(info.total_mb));
    info.buffers_mb = field("Buffers") / 1024;
    info.cached_mb = field("Cached") / 1024;
    return info;
}

auto parse_top_cpu(std::string_view top_output) -> util::Result<CpuInfo> {
    for (auto line : util::split_lines(top_output)) {
        const auto lower = util::to_lower(line);
        if (!lower.contains("cpu") || !(lower.contains("user") || lower.contains("usr"))) {
            continue;
        }

        const auto tokens = util::split_whitespace(lower);
        double capacity = 0.0;
        CpuInfo info;
        bool have_idle = false;

        for (size_t i = 0; i < tokens.size(); ++i) {
            std::optional<double> value;
            std::string_view label;

            // toybox: "12%user"; procps: "12.0% user" / "12.0 us,"
            if (const auto pct = tokens[i].find('%'); pct != std::string_view::npos) {
                value = parse_number(tokens[i].substr(0, pct));
                label = tokens[i].substr(pct + 1);
            } else {
                value = parse_number(tokens[i]);
            }
            if (!value) {
                continue;
            }
            if (label.empty() && i + 1 < tokens.size()) {
                label = tokens[i + 1];
            }

            if (label.starts_with("cpu")) {
                capacity = *value;
            } else if (label.contains("user") || label.contains("usr")) {
                info.user_percent = *value;
            } else if (label.contains("sys")) {
                info.system_percent = *value;
            } else if (label.contains("idle") || label.contains("idl")) {
                info.idle_percent = *value;
                have_idle = true;
            }
        }

        // Multi-core toybox top reports against N*100%
        if (capacity > 100.0) {
            const double scale = 100.0 / capacity;
            info.user_percent *= scale;
            info.system_percent *= scale;
            info.idle_percent *= scale;
        }

        if (!have_idle) {
            return parse_error(std::format("no idle figure in '{}'", line));
        }
        info.usage_percent = std::max(0.0, 100.0 - info.idle_percent);
        return info;
    }

    return parse_error("no CPU summary line in top output");
}

auto parse_proc_stat(std::string_view stat_output) -> util::Result<CpuInfo> {
    for (auto line : util::split_lines(stat_output)) {
        const auto tokens = util::split_whitespace(line);
        if (tokens.size() < 5 || tokens[0] != "cpu") {
            continue;
        }

        const double user = parse_number(tokens[1]).value_or(0.0);
        const double nice = parse_number(tokens[2]).value_or(0.0);
        const double system = parse_number(tokens[3]).value_or(0.0);
        const double idle = parse_number(tokens[4]).value_or(0.0);
        const double total = user + nice + system + idle;
        if (total <= 0.0) {
            break;
        }

        CpuInfo info;
        info.usage_percent = percentage(total - idle, total);
        info.user_percent = percentage(user + nice, total);
        info.system_percent = percentage(system, total);
        info.idle_percent = percentage(idle, total);
        return info;
    }

    return parse_error("no aggregate cpu line in /proc/stat");
}

auto parse_service_count(std::string_view output) -> uint32_t {
    uint32_t count = 0;
    for (auto line : util::split_lines(output)) {
        line = util::trim(line);
        if (!line.empty() && !line.starts_with("Found")) {
            ++count;
        }
    }
    return count;
}

auto count_packages(std::string_view output) -> uint32_t {
    return static_cast<uint32_t>(std::ranges::count_if(
        util::split_lines(output),
        [](std::string_view line) { return util::trim(line).starts_with("package:"); }));
}

auto parse_thermal(std::string_view dumpsys_output) -> ThermalInfo {
    auto lines = util::split_lines(dumpsys_output);
    if (lines.size() > THERMAL_SCAN_LINES) {
        lines.resize(THERMAL_SCAN_LINES);
    }

    std::string lower;
    for (auto line : lines) {
        lower += util::to_lower(line);
        lower += '\n';
    }

    ThermalInfo info;
    if (lower.contains("critical") || lower.contains("emergency")) {
        info.status = "critical";
        info.throttling = true;
    } else if (lower.contains("severe") || lower.contains("shutdown")) {
        info.status = "severe";
        info.throttling = true;
    } else if (lower.contains("moderate") || lower.contains("throttling")) {
        info.status = "moderate";
        info.throttling = true;
    } else if (lower.contains("light") || lower.contains("normal") || lower.contains("none")) {
        info.status = "normal";
        info.throttling = false;
    }

    // Later sensors overwrite earlier ones; the last plausible reading wins
    for (auto line : lines) {
        if (util::contains_lower(line, "temperature")) {
            if (auto temperature = temperature_from_line(line)) {
                info.temperature_c = temperature;
            }
        }
    }

    return info;
}

auto parse_battery_drainers(std::string_view batterystats) -> std::vector<BatteryDrainer> {
    const auto lines = util::split_lines(batterystats);
    auto section = std::ranges::find_if(
        lines, [](std::string_view line) { return line.contains("Estimated power use"); });
    if (section == lines.end()) {
        return {};
    }

    std::vector<BatteryDrainer> drainers;
    const auto last = std::min<size_t>(lines.size(),
                                       static_cast<size_t>(section - lines.begin()) + POWER_SECTION_LINES + 1);

    for (auto it = section; it != lines.begin() + static_cast<std::ptrdiff_t>(last); ++it) {
        const auto line = util::trim(*it);
        // Uid u0a123 (com.example.app): 12.5 mAh
        const auto mah_pos = line.find("mAh");
        if (!line.starts_with("Uid") || mah_pos == std::string_view::npos) {
            continue;
        }

        const auto before_mah = util::trim(line.substr(0, mah_pos));
        const auto colon = before_mah.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        const auto uid_part = util::trim(before_mah.substr(0, colon));
        const auto amount_tokens = util::split_whitespace(before_mah.substr(colon + 1));
        const double mah = amount_tokens.empty() ? 0.0 : parse_number(amount_tokens.front()).value_or(0.0);
        if (mah <= MIN_DRAIN_MAH) {
            continue;
        }

        std::string package;
        const auto open = uid_part.find('(');
        const auto close = uid_part.find(')', open == std::string_view::npos ? 0 : open);
        if (open != std::string_view::npos && close != std::string_view::npos) {
            package = std::string(util::trim(uid_part.substr(open + 1, close - open - 1)));
        } else {
            package = std::string(util::trim(uid_part.substr(3)));
        }

        const auto dot = package.rfind('.');
        BatteryDrainer drainer;
        drainer.app_name = dot == std::string::npos ? package : package.substr(dot + 1);
        drainer.package_name = std::move(package);
        drainer.usage_percent = mah;
        drainers.push_back(std::move(drainer));
    }

    std::ranges::stable_sort(drainers, std::ranges::greater{}, &BatteryDrainer::usage_percent);
    if (drainers.size() > MAX_DRAINERS) {
        drainers.resize(MAX_DRAINERS);
    }

    const double total = std::accumulate(
        drainers.begin(), drainers.end(), 0.0,
        [](double sum, const BatteryDrainer& d) { return sum + d.usage_percent; });
    if (total > 0.0) {
        for (auto& drainer : drainers) {
            drainer.usage_percent = drainer.usage_percent / total * 100.0;
        }
    }

    return drainers;
}

auto parse_battery_level(std::string_view dumpsys_battery) -> std::optional<int> {
    for (auto line : util::split_lines(dumpsys_battery)) {
        line = util::trim(line);
        if (line.starts_with("level:")) {
            if (auto level = parse_unsigned(line.substr(6))) {
                return static_cast<int>(*level);
            }
        }
    }
    return std::nullopt;
}

}  // namespace health_parsers
