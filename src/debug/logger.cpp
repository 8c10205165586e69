#include "cgraph/debug/logger.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <mutex>

namespace cgraph::debug {

namespace {
    std::mutex& WriteMutex() {
        static std::mutex mutex;
        return mutex;
    }

    constexpr std::string_view LevelName(const LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off: return "OFF";
        }
        return "UNKNOWN";
    }
}

void Logger::SetLevel(const LogLevel level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() noexcept {
    return level_.load(std::memory_order_relaxed);
}

uint64_t Logger::WarningCount() noexcept {
    return warning_count_.load(std::memory_order_relaxed);
}

void Logger::Write(const LogLevel level, const std::string_view component, const std::string_view message) {
    std::lock_guard lock(WriteMutex());
    fmt::print(stderr, "[CGRAPH-E2EE] {} [{}] {}\n", LevelName(level), component, message);
    std::fflush(stderr);
}

std::string ToHexPrefix(const std::span<const uint8_t> data, const size_t max_bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t count = std::min(data.size(), max_bytes);
    std::string result;
    result.reserve(count * 2 + 16);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (count < data.size()) {
        result += fmt::format("...({} bytes)", data.size());
    }
    return result;
}

}
