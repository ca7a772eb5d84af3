/**
 * @file rounding.cpp
 * @brief Numeric rounding implementation
 */

#include "execution/rounding.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

#include "common/config.hpp"

namespace csvcols {

namespace {

/// Beyond this many digits rounding cannot change a double
constexpr int kMaxRoundingDigits = 340;

/// Fixed notation is used for decimal exponents in [kMinFixedExponent, kMaxFixedExponent)
constexpr int kMinFixedExponent = -4;
constexpr int kMaxFixedExponent = 16;

std::string_view strip_spaces(std::string_view text) noexcept {
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

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

}  // namespace

bool is_integer_literal(std::string_view text) noexcept {
    text = strip_spaces(text);
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        text.remove_prefix(1);
    }
    if (text.empty() || !is_digit(text.front()) || !is_digit(text.back())) {
        return false;
    }

    bool prev_underscore = false;
    for (char c : text) {
        if (c == '_') {
            if (prev_underscore) {
                return false;
            }
            prev_underscore = true;
        } else if (is_digit(c)) {
            prev_underscore = false;
        } else {
            return false;
        }
    }
    return true;
}

std::optional<double> parse_float_literal(std::string_view text) {
    text = strip_spaces(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ptr != last) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        // from_chars leaves value untouched; strtod yields +-HUGE_VAL or the underflow result
        const std::string copy(text);
        return std::strtod(copy.c_str(), nullptr);
    }
    if (ec != std::errc()) {
        return std::nullopt;
    }
    return value;
}

double round_to_digits(double value, int digits) {
    if (!std::isfinite(value) || digits > kMaxRoundingDigits) {
        return value;
    }

    // Worst case: 309 integer digits, the point and kMaxRoundingDigits decimals
    std::array<char, 1024> buffer{};
    const auto written = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                                       value, std::chars_format::fixed, digits);
    if (written.ec != std::errc()) {
        return value;
    }

    double rounded = value;
    const auto parsed = std::from_chars(buffer.data(), written.ptr, rounded);
    if (parsed.ec != std::errc()) {
        return value;
    }
    return rounded;
}

std::string format_double(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    std::array<char, 64> buffer{};
    char* const first = buffer.data();
    char* const last = buffer.data() + buffer.size();

    // The shortest scientific form tells us the decimal exponent
    const auto sci = std::to_chars(first, last, value, std::chars_format::scientific);
    const std::string_view sci_text(first, static_cast<size_t>(sci.ptr - first));
    const size_t exp_pos = sci_text.find('e');
    const int exponent = std::atoi(std::string(sci_text.substr(exp_pos + 1)).c_str());

    if (exponent < kMinFixedExponent || exponent >= kMaxFixedExponent) {
        return std::string(sci_text);
    }

    const auto fixed = std::to_chars(first, last, value, std::chars_format::fixed);
    std::string out(first, fixed.ptr);
    if (out.find('.') == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string round_cell(const std::string& cell, int precision) {
    if (precision <= config::kNoRounding || is_integer_literal(cell)) {
        return cell;
    }

    const auto value = parse_float_literal(cell);
    if (!value) {
        return cell;
    }
    return format_double(round_to_digits(*value, precision));
}

void round_row(Row* row, int precision) {
    if (precision <= config::kNoRounding) {
        return;
    }
    for (auto& cell : *row) {
        cell = round_cell(cell, precision);
    }
}

}  // namespace csvcols
