#include "tablekit/value_codec.hpp"
#include "tablekit/errors.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace tablekit::codec {

namespace {

std::string lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::optional<int64_t> parse_int(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return v;
}

std::optional<double> parse_double(const std::string& s) {
    double v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty() || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<int64_t> integral(double d) {
    // 2^63 is exactly representable; anything at or above it overflows int64.
    if (!std::isfinite(d) || std::trunc(d) != d) return std::nullopt;
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return std::nullopt;
    return static_cast<int64_t>(d);
}

std::string format_double(double d) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc()) return std::to_string(d);
    return std::string(buf, ptr);
}

// Reads exactly `count` digits at pos.
bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

[[noreturn]] void reject(const column_descriptor& column, const field_value_t& value) {
    throw validation_error("Value '" + to_display_string(value) + "' is not a valid " +
                           to_string(column.type) + " for column " + column.name, column.name);
}

} // namespace

timestamp_t now() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::string format_timestamp(timestamp_t ts) {
    auto day = std::chrono::floor<std::chrono::days>(ts);
    std::chrono::year_month_day ymd{day};
    std::chrono::hh_mm_ss<std::chrono::seconds> hms{ts - day};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return buf;
}

std::optional<timestamp_t> parse_timestamp(const std::string& text) {
    size_t pos = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_digits(text, pos, 4, y)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!read_digits(text, pos, 2, mo)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!read_digits(text, pos, 2, d)) return std::nullopt;

    if (pos < text.size() && (text[pos] == ' ' || text[pos] == 'T')) {
        ++pos;
        if (!read_digits(text, pos, 2, h)) return std::nullopt;
        if (pos >= text.size() || text[pos++] != ':') return std::nullopt;
        if (!read_digits(text, pos, 2, mi)) return std::nullopt;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!read_digits(text, pos, 2, s)) return std::nullopt;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                size_t start = pos;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
                if (pos == start) return std::nullopt;
            }
        }
        if (pos < text.size() && text[pos] == 'Z') ++pos;
    }
    if (pos != text.size()) return std::nullopt;

    std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
                                    std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59) return std::nullopt;

    return timestamp_t{std::chrono::sys_days{ymd}} + std::chrono::hours{h} +
           std::chrono::minutes{mi} + std::chrono::seconds{s};
}

std::string to_display_string(const field_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return format_timestamp(v);
        }
    }, value);
}

field_value_t coerce(const field_value_t& value, const column_descriptor& column) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        if (!column.nullable) {
            throw validation_error("Column " + column.name + " does not accept null", column.name);
        }
        return nullptr;
    }

    switch (column.type) {
        case semantic_type::integer:
        case semantic_type::foreign_key: {
            if (auto i = std::get_if<int64_t>(&value)) return *i;
            if (auto d = std::get_if<double>(&value)) {
                if (auto i = integral(*d)) return *i;
            }
            if (auto s = std::get_if<std::string>(&value)) {
                if (auto i = parse_int(*s)) return *i;
                if (auto d = parse_double(*s)) {
                    if (auto i = integral(*d)) return *i;
                }
            }
            reject(column, value);
        }
        case semantic_type::real: {
            if (auto d = std::get_if<double>(&value)) {
                if (!std::isfinite(*d)) reject(column, value);
                return *d;
            }
            if (auto i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
            if (auto s = std::get_if<std::string>(&value)) {
                if (auto d = parse_double(*s)) return *d;
            }
            reject(column, value);
        }
        case semantic_type::boolean: {
            if (auto b = std::get_if<bool>(&value)) return *b;
            if (auto i = std::get_if<int64_t>(&value)) {
                if (*i == 0 || *i == 1) return *i == 1;
            }
            if (auto d = std::get_if<double>(&value)) {
                if (*d == 0.0 || *d == 1.0) return *d == 1.0;
            }
            if (auto s = std::get_if<std::string>(&value)) {
                auto l = lower(*s);
                if (l == "true" || l == "1") return true;
                if (l == "false" || l == "0") return false;
            }
            reject(column, value);
        }
        case semantic_type::timestamp: {
            if (auto t = std::get_if<timestamp_t>(&value)) return *t;
            if (auto s = std::get_if<std::string>(&value)) {
                if (auto t = parse_timestamp(*s)) return *t;
            }
            if (auto i = std::get_if<int64_t>(&value)) {
                return timestamp_t{std::chrono::seconds{*i}};
            }
            if (auto d = std::get_if<double>(&value)) {
                if (std::isfinite(*d)) {
                    if (auto i = integral(std::floor(*d))) return timestamp_t{std::chrono::seconds{*i}};
                }
            }
            reject(column, value);
        }
        case semantic_type::text: {
            if (std::holds_alternative<std::string>(value)) return value;
            return to_display_string(value);
        }
        case semantic_type::unsupported:
            break;
    }
    throw validation_error("Column " + column.name + " has unsupported type " + column.physical_type +
                           " and cannot be written", column.name);
}

column_value_t to_physical(const field_value_t& value) {
    return std::visit([](auto&& v) -> column_value_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool>) {
            return static_cast<int64_t>(v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return format_timestamp(v);
        }
    }, value);
}

field_value_t from_physical(const column_value_t& value, semantic_type type) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return nullptr;
    }

    switch (type) {
        case semantic_type::boolean:
            if (auto i = std::get_if<int64_t>(&value)) return *i != 0;
            if (auto d = std::get_if<double>(&value)) return *d != 0.0;
            if (auto s = std::get_if<std::string>(&value)) {
                auto l = lower(*s);
                if (l == "1" || l == "true") return true;
                if (l == "0" || l == "false") return false;
                return *s;
            }
            break;
        case semantic_type::integer:
        case semantic_type::foreign_key:
            if (auto i = std::get_if<int64_t>(&value)) return *i;
            if (auto d = std::get_if<double>(&value)) {
                if (auto i = integral(*d)) return *i;
                return *d;
            }
            if (auto s = std::get_if<std::string>(&value)) {
                if (auto i = parse_int(*s)) return *i;
                return *s;
            }
            break;
        case semantic_type::real:
            if (auto d = std::get_if<double>(&value)) return *d;
            if (auto i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
            if (auto s = std::get_if<std::string>(&value)) {
                if (auto d = parse_double(*s)) return *d;
                return *s;
            }
            break;
        case semantic_type::timestamp:
            if (auto s = std::get_if<std::string>(&value)) {
                if (auto t = parse_timestamp(*s)) return *t;
                return *s;
            }
            if (auto i = std::get_if<int64_t>(&value)) return timestamp_t{std::chrono::seconds{*i}};
            if (auto d = std::get_if<double>(&value)) return *d;
            break;
        case semantic_type::text:
            if (auto s = std::get_if<std::string>(&value)) return *s;
            if (auto i = std::get_if<int64_t>(&value)) return std::to_string(*i);
            if (auto d = std::get_if<double>(&value)) return format_double(*d);
            break;
        case semantic_type::unsupported:
            break;
    }

    // Unsupported columns (and anything unexpected) pass through as read.
    return std::visit([](auto&& v) -> field_value_t { return v; }, value);
}

} // namespace tablekit::codec
