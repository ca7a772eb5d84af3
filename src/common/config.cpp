/**
 * @file config.cpp
 * @brief Runtime option parsing
 */

#include "common/config.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace csvcols {
namespace config {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view strip(std::string_view text) {
    const auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

constexpr std::array<std::string_view, 5> kTrueWords = {"yes", "true", "t", "y", "1"};
constexpr std::array<std::string_view, 5> kFalseWords = {"no", "false", "f", "n", "0"};

}  // namespace

Status parse_bool(std::string_view text, bool* value) {
    const std::string lowered = to_lower(text);
    if (std::find(kTrueWords.begin(), kTrueWords.end(), lowered) != kTrueWords.end()) {
        *value = true;
        return Status::Ok();
    }
    if (std::find(kFalseWords.begin(), kFalseWords.end(), lowered) != kFalseWords.end()) {
        *value = false;
        return Status::Ok();
    }
    return Status::InvalidArgument("boolean value expected, got '" +
                                   std::string(text) + "'");
}

Status parse_delimiter(std::string_view text, char* delimiter) {
    if (text.size() == 1) {
        *delimiter = text.front();
        return Status::Ok();
    }
    if (text == "\\t" || to_lower(text) == "tab") {
        *delimiter = '\t';
        return Status::Ok();
    }
    return Status::InvalidArgument("delimiter must be a single character, got '" +
                                   std::string(text) + "'");
}

Status parse_int(std::string_view text, int* value) {
    int parsed = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (!text.empty() && text.front() == '+') {
        ++first;
    }
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return Status::InvalidArgument("integer expected, got '" +
                                       std::string(text) + "'");
    }
    *value = parsed;
    return Status::Ok();
}

std::vector<std::string> split_column_list(std::string_view text) {
    std::vector<std::string> names;
    text = strip(text);
    if (text.empty()) {
        return names;
    }

    size_t start = 0;
    while (true) {
        const size_t pos = text.find(kColumnListSeparator, start);
        if (pos == std::string_view::npos) {
            names.emplace_back(text.substr(start));
            break;
        }
        names.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return names;
}

}  // namespace config
}  // namespace csvcols
