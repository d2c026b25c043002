#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <mutex>

namespace tunebox::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open for the whole run
static std::string log_path = "/tmp/tunebox.log";
static std::atomic<Logger::Level> min_level{Logger::Level::Info};

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    min_level.store(level, std::memory_order_relaxed);
}

Logger::Level Logger::level() {
    return min_level.load(std::memory_order_relaxed);
}

Logger::Level Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return Level::Info;
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load(std::memory_order_relaxed)) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Not initialized yet (tests, early startup): append instead of truncating
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace tunebox::util
