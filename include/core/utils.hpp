#pragma once

#include <atomic>
#include <cctype>
#include <cmath>
#include <chrono>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ormaudit::utils {

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = std::tolower(static_cast<unsigned char>(c));
    }
    return result;
}

inline bool ends_with(std::string_view str, std::string_view suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Collapse every whitespace run to a single space and trim the ends.
 */
[[nodiscard]] inline std::string collapse_whitespace(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result += ' ';
            pending_space = false;
        }
        result += c;
    }
    return result;
}

/**
 * @brief Double every single quote so the text can sit inside a SQL string literal.
 */
[[nodiscard]] inline std::string escape_sql_string(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 2);
    for (const char c : s) {
        if (c == '\'') result += '\'';
        result += c;
    }
    return result;
}

/**
 * @brief Render a number the way it reads in source: 10, 2.5, 1e+21
 */
[[nodiscard]] inline std::string format_number(double value) {
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15) {
        return std::format("{}", static_cast<long long>(value));
    }
    return std::format("{}", value);
}

/**
 * @brief Read a whole file, std::nullopt when it cannot be opened.
 */
[[nodiscard]] inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    return buffer;
}

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
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
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline std::optional<Level> parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
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

} // namespace ormaudit::utils
