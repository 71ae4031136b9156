#pragma once

#include <fmt/core.h>
#include <fmt/color.h>
#include <mutex>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <filesystem>

// ====== CONFIGURATION: Compile-time flags ======
// Define these in CMake or via compiler flags (-DLOG_DISABLE_INFO, etc.)

// Disable specific levels
#ifndef LOG_DISABLE_INFO
// #define LOG_DISABLE_INFO
#endif
#ifndef LOG_DISABLE_WARN
// #define LOG_DISABLE_WARN
#endif
#ifndef LOG_DISABLE_ERROR
// #define LOG_DISABLE_ERROR
#endif

// Disable colors (for environments that don't support ANSI)
#ifndef LOG_DISABLE_COLORS
// #define LOG_DISABLE_COLORS
#endif

// Disable timestamp in logs
#ifndef LOG_DISABLE_TIMESTAMP
// #define LOG_DISABLE_TIMESTAMP
#endif

#ifndef LOG_DEFAULT_STREAM
    #define LOG_DEFAULT_STREAM stdout
#endif

#ifndef LOG_ERROR_STREAM
    #define LOG_ERROR_STREAM stderr
#endif

// ===============================================

// Defined in src/log.cc
extern std::mutex g_output_mutex;
extern std::ofstream g_log_file;
extern std::atomic<bool> g_console_enabled;

#define LOG_LOCK() std::lock_guard<std::mutex> lock(g_output_mutex)

// Helper to format timestamp: YYYY-MM-DD HH:MM:SS.mmm
inline std::string now_str() {
#ifdef LOG_DISABLE_TIMESTAMP
    return "YYYY-MM-DD HH:MM:SS.000";
#else
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
#endif
}

#ifdef LOG_DISABLE_COLORS
    #define COLOR_INFO fmt::text_style{}
    #define COLOR_WARN fmt::text_style{}
    #define COLOR_ERROR fmt::text_style{}
    #define COLOR_SUCCESS fmt::text_style{}
    #define COLOR_CMD fmt::text_style{}
    #define COLOR_PROMPT fmt::text_style{}
#else
    #define COLOR_INFO fmt::fg(fmt::color::dodger_blue) | fmt::emphasis::bold
    #define COLOR_WARN fmt::fg(fmt::color::orange) | fmt::emphasis::bold
    #define COLOR_ERROR fmt::fg(fmt::color::crimson) | fmt::emphasis::bold
    #define COLOR_SUCCESS fmt::fg(fmt::color::lime_green) | fmt::emphasis::bold
    #define COLOR_CMD fmt::fg(fmt::color::cyan)
    #define COLOR_PROMPT fmt::fg(fmt::color::dodger_blue) | fmt::emphasis::bold
#endif

namespace out {

    // Opens (appending) the file sink. Returns false if the file can't be opened;
    // logging then stays console-only.
    bool init_log_file(const std::filesystem::path& path);
    void close_log_file();

    // The interactive browser owns the terminal while it runs, so console output
    // is muted for that time. The file sink is unaffected.
    inline void set_console(const bool enabled) {
        g_console_enabled.store(enabled);
    }

    inline bool console_enabled() {
        return g_console_enabled.load();
    }

    inline void write_file_line(const std::string& time_str, const char* level, const std::string& msg) {
        if (g_log_file.is_open()) {
            g_log_file << "[" << time_str << "] [" << level << "] " << msg << "\n";
            g_log_file.flush();
        }
    }

    template<typename... T>
    void log_impl(const fmt::text_style style, FILE* stream, const char* level, fmt::format_string<T...> fmt, T&&... args) {
        LOG_LOCK();
        const std::string time_str = now_str();
        const auto msg = fmt::format(fmt, std::forward<T>(args)...);

        if (g_console_enabled.load()) {
#ifdef LOG_DISABLE_COLORS
            fmt::print(stream, "[{}] [{}] {}", time_str, level, msg);
#else
            fmt::print(stream, style, "[{}] [{}] ", time_str, level);
            fmt::print(stream, "{}", msg);
#endif
            fmt::print(stream, "\n");
        }

        write_file_line(time_str, level, msg);
    }

    // File only. Used for failures the user shouldn't be bothered with.
    template<typename... T>
    void debug(fmt::format_string<T...> fmt, T&&... args) {
        LOG_LOCK();
        write_file_line(now_str(), "DEBUG", fmt::format(fmt, std::forward<T>(args)...));
    }

    template<typename... T>
    void info(fmt::format_string<T...> fmt, T&&... args) {
#ifndef LOG_DISABLE_INFO
        log_impl(COLOR_INFO, LOG_DEFAULT_STREAM, "INFO", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void warn(fmt::format_string<T...> fmt, T&&... args) {
#ifndef LOG_DISABLE_WARN
        log_impl(COLOR_WARN, LOG_ERROR_STREAM, "WARNING", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void error(fmt::format_string<T...> fmt, T&&... args) {
#ifndef LOG_DISABLE_ERROR
        log_impl(COLOR_ERROR, LOG_ERROR_STREAM, "ERROR", fmt, std::forward<T>(args)...);
#endif
    }

    template<typename... T>
    void success(fmt::format_string<T...> fmt, T&&... args) {
#ifndef LOG_DISABLE_INFO
        log_impl(COLOR_SUCCESS, LOG_DEFAULT_STREAM, "OK", fmt, std::forward<T>(args)...);
#endif
    }

} // namespace out
