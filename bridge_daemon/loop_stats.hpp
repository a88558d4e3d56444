#ifndef LOOP_STATS_HPP
#define LOOP_STATS_HPP

#include <cstdint>

/**
 * LoopStats - tick rate and bridge counters for periodic status lines
 */
class LoopStats {
public:
    explicit LoopStats(uint64_t start_ms);

    /**
     * Called once per tick.
     */
    void tick(uint64_t now_ms);

    uint32_t getUptimeSeconds(uint64_t now_ms) const;

    uint64_t getTickCount() const { return m_total_ticks; }

    /**
     * Tick frequency (Hz), recomputed every second.
     */
    float getLoopHz() const { return m_loop_hz; }

    void incrementEncodeFailures() { m_encode_failures++; }
    uint32_t getEncodeFailures() const { return m_encode_failures; }

private:
    uint64_t m_start_time_ms = 0;
    uint64_t m_total_ticks = 0;
    uint32_t m_encode_failures = 0;

    uint32_t m_tick_count = 0;
    uint64_t m_last_hz_calc_ms = 0;
    float m_loop_hz = 0.0f;
};

#endif // LOOP_STATS_HPP
