#pragma once

/**
 * @file logger.hpp
 * @brief Leveled diagnostics for the E2EE subsystem.
 *
 * Lines go to stderr as `[CGRAPH-E2EE] <LEVEL> [<component>] <message>`.
 * Plaintext, private keys and derived secrets are never passed to these macros.
 *
 * Key-material tracing (CGRAPH_LOG_KEY) is compiled in only with
 * -DCGRAPH_DEBUG_KEYS=ON and must never ship in release builds.
 */

#include "cgraph/core/format.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace cgraph::debug {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

class Logger {
public:
    static void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel GetLevel() noexcept;
    [[nodiscard]] static bool IsEnabled(LogLevel level) noexcept {
        return level >= GetLevel() && level != LogLevel::Off;
    }
    static void Write(LogLevel level, std::string_view component, std::string_view message);

    /// Number of warnings written since start-up. Used by tests to observe security events.
    [[nodiscard]] static uint64_t WarningCount() noexcept;
    static void NoteWarning() noexcept {
        warning_count_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    static inline std::atomic<LogLevel> level_{LogLevel::Warning};
    static inline std::atomic<uint64_t> warning_count_{0};

    Logger() = delete;
};

[[nodiscard]] std::string ToHexPrefix(std::span<const uint8_t> data, size_t max_bytes = 4);

}

#define CGRAPH_LOG(level, component, ...) \
    do { \
        if ((level) == ::cgraph::debug::LogLevel::Warning) { \
            ::cgraph::debug::Logger::NoteWarning(); \
        } \
        if (::cgraph::debug::Logger::IsEnabled(level)) { \
            ::cgraph::debug::Logger::Write(level, component, ::cgraph::compat::format(__VA_ARGS__)); \
        } \
    } while (0)

#define CGRAPH_LOG_DEBUG(component, ...) CGRAPH_LOG(::cgraph::debug::LogLevel::Debug, component, __VA_ARGS__)
#define CGRAPH_LOG_INFO(component, ...) CGRAPH_LOG(::cgraph::debug::LogLevel::Info, component, __VA_ARGS__)
#define CGRAPH_LOG_WARN(component, ...) CGRAPH_LOG(::cgraph::debug::LogLevel::Warning, component, __VA_ARGS__)
#define CGRAPH_LOG_ERROR(component, ...) CGRAPH_LOG(::cgraph::debug::LogLevel::Error, component, __VA_ARGS__)

#ifdef CGRAPH_DEBUG_KEYS

#define CGRAPH_LOG_KEY(component, key_name, data) \
    do { \
        fmt::print(stderr, "[CGRAPH-E2EE-KEYS] [{}] {}: {}\n", \
            component, key_name, ::cgraph::debug::ToHexPrefix(data, 64)); \
        std::fflush(stderr); \
    } while (0)

#else

#define CGRAPH_LOG_KEY(component, key_name, data) do { (void)(data); } while (0)

#endif
