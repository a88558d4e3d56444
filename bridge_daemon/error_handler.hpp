#ifndef ERROR_HANDLER_HPP
#define ERROR_HANDLER_HPP

#include <string>
#include <cstdint>
#include <unordered_map>

/**
 * Error severity levels
 */
enum class ErrorLevel {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * ErrorHandler - Diagnostic channel for non-fatal bridge failures
 *
 * Features:
 * - Rate-limited output through the Logger
 * - Per-level counters
 * - Once-per-occurrence reporting keyed by source, so a failure that
 *   repeats every tick is surfaced once until it clears
 */
class ErrorHandler {
public:
    ErrorHandler();

    /**
     * Report an error. Always counted, output may be rate limited.
     * Returns true if the line was logged.
     */
    bool report(ErrorLevel level, const std::string &message);

    /**
     * Report unless the same message is already active for this key.
     * The key only becomes active once the line was actually logged, so a
     * report dropped by the rate limit is retried on the next occurrence.
     * Returns true if the message was surfaced.
     */
    bool reportOnce(const std::string &key, ErrorLevel level, const std::string &message);

    /**
     * Mark the condition behind a key as cleared.
     * Returns true if a condition was active.
     */
    bool clear(const std::string &key);

    /**
     * True while a reportOnce() condition is active for the key.
     */
    bool isActive(const std::string &key) const;

    /**
     * Get error count by level.
     */
    uint32_t getCount(ErrorLevel level) const;

    /**
     * Clear error counts.
     */
    void clearCounts();

    /**
     * Set callback for critical errors (e.g., request shutdown).
     */
    using CriticalCallback = void (*)(const std::string &message);
    void setCriticalCallback(CriticalCallback callback);

private:
    uint32_t m_info_count = 0;
    uint32_t m_warning_count = 0;
    uint32_t m_error_count = 0;
    uint32_t m_critical_count = 0;

    uint64_t m_last_log_time_ms = 0;
    uint32_t m_suppressed_count = 0;

    std::unordered_map<std::string, std::string> m_active;

    CriticalCallback m_critical_callback = nullptr;
};

#endif // ERROR_HANDLER_HPP
