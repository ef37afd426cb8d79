#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace wolfcache::utils {

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Millisecond-resolution wall-clock instant
 *
 * All sync bookkeeping is done at this granularity so that a timestamp
 * survives a format/parse round trip unchanged.
 */
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

inline Timestamp to_timestamp(std::chrono::system_clock::time_point tp) {
    return std::chrono::floor<std::chrono::milliseconds>(tp);
}

/**
 * @brief Format as ISO-8601 in local time with millis and a +HH:MM offset
 * e.g. 2026-10-19T14:03:22.517+02:00
 */
inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        // Pre-epoch instants: to_time_t truncates toward zero
        ms += std::chrono::milliseconds(1000);
        --time;
    }

    std::tm tm_buf;
    ::localtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    // strftime gives +HHMM; ISO-8601 extended format wants +HH:MM
    char tz_buf[8];
    std::strftime(tz_buf, sizeof(tz_buf), "%z", &tm_buf);
    const std::string_view tz(tz_buf);
    if (tz.size() != 5) {
        return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
    }

    return std::format("{}.{:03d}{}:{}", time_buf, static_cast<int>(ms.count()),
                       tz.substr(0, 3), tz.substr(3, 2));
}

namespace detail {

template<typename T>
bool read_fixed(std::string_view s, size_t pos, size_t len, T& out) {
    if (pos + len > s.size()) return false;
    const char* first = s.data() + pos;
    const char* last = first + len;
    for (const char* p = first; p != last; ++p) {
        if (*p < '0' || *p > '9') return false;
    }
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

} // namespace detail

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts YYYY-MM-DD[T| ]HH:MM:SS[.fraction][Z|+HH:MM|+HHMM|+HH].
 * A missing offset is read as UTC. Fractions beyond milliseconds are truncated.
 *
 * @return nullopt on any malformed input
 */
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(std::string_view s) {
    int y = 0;
    unsigned mo = 0, d = 0;
    int hh = 0, mm = 0, ss = 0;

    if (!detail::read_fixed(s, 0, 4, y) || s.size() < 19 ||
        s[4] != '-' || !detail::read_fixed(s, 5, 2, mo) ||
        s[7] != '-' || !detail::read_fixed(s, 8, 2, d) ||
        (s[10] != 'T' && s[10] != 't' && s[10] != ' ') ||
        !detail::read_fixed(s, 11, 2, hh) || s[13] != ':' ||
        !detail::read_fixed(s, 14, 2, mm) || s[16] != ':' ||
        !detail::read_fixed(s, 17, 2, ss)) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{mo}, std::chrono::day{d}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 60) return std::nullopt;

    size_t pos = 19;
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) millis = millis * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    std::chrono::minutes offset{0};
    if (pos < s.size()) {
        const char sign = s[pos];
        if ((sign == 'Z' || sign == 'z') && pos + 1 == s.size()) {
            pos = s.size();
        } else if (sign == '+' || sign == '-') {
            int oh = 0, om = 0;
            if (!detail::read_fixed(s, pos + 1, 2, oh)) return std::nullopt;
            size_t rest = pos + 3;
            if (rest < s.size()) {
                if (s[rest] == ':') ++rest;
                if (!detail::read_fixed(s, rest, 2, om) || rest + 2 != s.size()) {
                    return std::nullopt;
                }
            }
            if (oh > 23 || om > 59) return std::nullopt;
            offset = std::chrono::hours(oh) + std::chrono::minutes(om);
            if (sign == '-') offset = -offset;
            pos = s.size();
        } else {
            return std::nullopt;
        }
    }

    const auto local = std::chrono::sys_days{ymd} + std::chrono::hours(hh) +
                       std::chrono::minutes(mm) + std::chrono::seconds(ss) +
                       std::chrono::milliseconds(millis);
    return Timestamp{local - offset};
}

// ============================================================================
// Boolean Formatting
// ============================================================================

inline constexpr const char* booltostr(bool x) { return x ? "true" : "false"; }

// ============================================================================
// Type-Safe Range Check (eliminates impossible comparisons at compile time)
// ============================================================================

template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    using Common = std::common_type_t<T, decltype(Lo), decltype(Hi)>;
    bool below = false;
    bool above = false;
    if constexpr (static_cast<Common>(std::numeric_limits<T>::min()) >= static_cast<Common>(Lo)) {
        (void)value; // T can never be below Lo
    } else {
        below = static_cast<Common>(value) < static_cast<Common>(Lo);
    }
    if constexpr (static_cast<Common>(std::numeric_limits<T>::max()) <= static_cast<Common>(Hi)) {
        (void)value; // T can never exceed Hi
    } else {
        above = static_cast<Common>(value) > static_cast<Common>(Hi);
    }
    return !below && !above;
}

// ============================================================================
// Numeric Parsing (std::from_chars, locale-independent)
// ============================================================================

// Parse integer, returns std::nullopt on failure (for cases where 0 is ambiguous)
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

/**
 * @brief Strict UTF-8 check (RFC 3629)
 *
 * Rejects stray continuation bytes, truncated sequences, overlong forms,
 * UTF-16 surrogates and code points above U+10FFFF.
 */
[[nodiscard]] inline bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;   // bounds for the second byte
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else return false;

        if (i + len > s.size()) return false;
        const auto second = static_cast<unsigned char>(s[i + 1]);
        if (second < lo || second > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(s[i + k]);
            if (cont < 0x80 || cont > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < threshold().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level get_level() {
    return detail::threshold().load(std::memory_order_relaxed);
}

/// Map a config string ("debug", "info", "warn", "error") to a Level
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace wolfcache::utils
