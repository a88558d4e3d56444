/**
 * LoopStats Implementation
 */

#include "loop_stats.hpp"

LoopStats::LoopStats(uint64_t start_ms) {
    m_start_time_ms = start_ms;
    m_last_hz_calc_ms = start_ms;
}

void LoopStats::tick(uint64_t now_ms) {
    m_tick_count++;
    m_total_ticks++;

    if (now_ms < m_last_hz_calc_ms) {
        m_last_hz_calc_ms = now_ms;
        m_tick_count = 0;
        return;
    }
    uint64_t elapsed = now_ms - m_last_hz_calc_ms;

    // Calculate loop Hz every second
    if (elapsed >= 1000) {
        m_loop_hz = (float)m_tick_count * 1000.0f / (float)elapsed;
        m_tick_count = 0;
        m_last_hz_calc_ms = now_ms;
    }
}

uint32_t LoopStats::getUptimeSeconds(uint64_t now_ms) const {
    if (now_ms < m_start_time_ms) return 0;
    return (uint32_t)((now_ms - m_start_time_ms) / 1000);
}
