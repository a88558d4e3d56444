/**
 * ErrorHandler Implementation
 */

#include "error_handler.hpp"
#include "logger.h"

#include <chrono>

#define LOG_RATE_LIMIT_MS 100  // Minimum time between logs

static uint64_t now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

ErrorHandler::ErrorHandler() {
    // First report is never rate limited
    m_last_log_time_ms = now_ms() - LOG_RATE_LIMIT_MS;
}

bool ErrorHandler::report(ErrorLevel level, const std::string &message) {
    switch (level) {
        case ErrorLevel::INFO:
            m_info_count++;
            break;
        case ErrorLevel::WARNING:
            m_warning_count++;
            break;
        case ErrorLevel::ERROR:
            m_error_count++;
            break;
        case ErrorLevel::CRITICAL:
            m_critical_count++;
            break;
    }

    uint64_t now = now_ms();
    // Critical errors always get through
    if (now - m_last_log_time_ms < LOG_RATE_LIMIT_MS && level != ErrorLevel::CRITICAL) {
        m_suppressed_count++;
        return false;
    }
    m_last_log_time_ms = now;

    std::string line = message;
    if (m_suppressed_count > 0) {
        line += " (+" + std::to_string(m_suppressed_count) + " suppressed)";
        m_suppressed_count = 0;
    }

    switch (level) {
        case ErrorLevel::INFO:
            LOG_INFO("Diag", "%s", line.c_str());
            break;
        case ErrorLevel::WARNING:
            LOG_WARN("Diag", "%s", line.c_str());
            break;
        case ErrorLevel::ERROR:
            LOG_ERROR("Diag", "%s", line.c_str());
            break;
        case ErrorLevel::CRITICAL:
            LOG_ERROR("Diag", "CRITICAL: %s", line.c_str());
            break;
    }

    if (level == ErrorLevel::CRITICAL && m_critical_callback) {
        m_critical_callback(message);
    }
    return true;
}

bool ErrorHandler::reportOnce(const std::string &key, ErrorLevel level,
                              const std::string &message) {
    auto it = m_active.find(key);
    if (it != m_active.end() && it->second == message) {
        return false;
    }
    if (!report(level, key + ": " + message)) {
        return false;
    }
    m_active[key] = message;
    return true;
}

bool ErrorHandler::clear(const std::string &key) {
    return m_active.erase(key) > 0;
}

bool ErrorHandler::isActive(const std::string &key) const {
    return m_active.find(key) != m_active.end();
}

uint32_t ErrorHandler::getCount(ErrorLevel level) const {
    switch (level) {
        case ErrorLevel::INFO:     return m_info_count;
        case ErrorLevel::WARNING:  return m_warning_count;
        case ErrorLevel::ERROR:    return m_error_count;
        case ErrorLevel::CRITICAL: return m_critical_count;
    }
    return 0;
}

void ErrorHandler::clearCounts() {
    m_info_count = 0;
    m_warning_count = 0;
    m_error_count = 0;
    m_critical_count = 0;
}

void ErrorHandler::setCriticalCallback(CriticalCallback callback) {
    m_critical_callback = callback;
}
