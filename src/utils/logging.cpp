#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "utils/common.hpp"

namespace codebox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level = static_cast<int>(config.min_level);
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace codebox::utils
