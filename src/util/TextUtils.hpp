/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the bridge output parsers
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace util {

[[nodiscard]] inline auto trim(std::string_view text) -> std::string_view {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!text.empty() && is_space(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] inline auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Case-insensitive substring test; @p needle must already be lower case
[[nodiscard]] inline auto contains_lower(std::string_view haystack, std::string_view needle)
    -> bool {
    return to_lower(haystack).contains(needle);
}

/// Split on whitespace runs, dropping empty tokens
[[nodiscard]] inline auto split_whitespace(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

/// Split into lines, stripping trailing '\r'; keeps empty lines
[[nodiscard]] inline auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (end < text.size() || !line.empty()) {
            lines.push_back(line);
        }
        start = end + 1;
    }
    return lines;
}

}  // namespace util
