#ifndef HGREASON_DEBUG_LOG_HPP
#define HGREASON_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <thread>

namespace hgreason {
namespace debug {

// Subsystem a log message comes from
enum class LogCategory : std::uint32_t {
    STORE    = 1u << 0,  // edge insertion, removal, compaction
    LAYERS   = 1u << 1,  // layer toggles
    RULES    = 1u << 2,  // rule selection
    VALIDATE = 1u << 3,  // per-edge verdicts
    REASON   = 1u << 4   // traversal frontiers and limits
};

constexpr std::uint32_t ALL_CATEGORIES = 0x1f;

inline constexpr std::uint32_t category_bit(LogCategory category) {
    return static_cast<std::uint32_t>(category);
}

inline const char* to_string(LogCategory category) {
    switch (category) {
        case LogCategory::STORE: return "store";
        case LogCategory::LAYERS: return "layers";
        case LogCategory::RULES: return "rules";
        case LogCategory::VALIDATE: return "validate";
        case LogCategory::REASON: return "reason";
    }
    return "unknown";
}

// Callback function type for log output routing
// The callback receives the category and a formatted string (no newline at end)
using LogCallback = void (*)(LogCategory category, const char* message);

// Global log callback - set by the embedding application
// When null, HGREASON_LOG uses printf
inline std::atomic<LogCallback> g_log_callback{nullptr};

// Categories that produce output; everything is on by default
inline std::atomic<std::uint32_t> g_log_categories{ALL_CATEGORIES};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

// Restrict output to the categories in mask, e.g.
//   set_log_categories(category_bit(LogCategory::VALIDATE) | category_bit(LogCategory::RULES));
inline void set_log_categories(std::uint32_t mask) {
    g_log_categories.store(mask & ALL_CATEGORIES, std::memory_order_release);
}

inline bool is_enabled(LogCategory category) {
    return (g_log_categories.load(std::memory_order_acquire) & category_bit(category)) != 0;
}

// Internal: filter, format and output a log message
inline void log_output(LogCategory category, const char* fmt, ...) {
    if (!is_enabled(category)) return;

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[hgreason][%s][T%s] %s",
             to_string(category), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(category, full_message);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace hgreason

// Log macro - category is a LogCategory enumerator name, e.g.
//   HGREASON_LOG(STORE, "added %s", text);
#ifdef HGREASON_ENABLE_DEBUG_OUTPUT
    #define HGREASON_LOG(category, fmt, ...) \
        ::hgreason::debug::log_output(::hgreason::debug::LogCategory::category, fmt, ##__VA_ARGS__)
#else
    #define HGREASON_LOG(category, fmt, ...) ((void)0)
#endif

#endif // HGREASON_DEBUG_LOG_HPP
