// =============================================================================
// VOXSTREAM - TICK MANAGER
// Fixed-rate server ticks driven by an accumulator of elapsed wall time
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>

namespace voxstream::server {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::nanoseconds;

struct TickConfig {
    std::uint32_t target_tps = 20;
    // Ticks run at most per advance(); time beyond that is dropped
    std::uint32_t max_ticks_per_update = 10;

    [[nodiscard]] constexpr std::uint32_t rate() const noexcept { return target_tps > 0 ? target_tps : 1; }
    [[nodiscard]] constexpr Duration tick_duration() const noexcept {
        return std::chrono::duration_cast<Duration>(std::chrono::seconds(1)) / rate();
    }
    [[nodiscard]] constexpr double delta_time() const noexcept { return 1.0 / static_cast<double>(rate()); }
};

struct TickStats {
    std::uint64_t total_ticks = 0;
    bool is_lagging = false;    // the last advance() dropped time
};

class TickManager {
public:
    TickManager() = default;
    explicit TickManager(TickConfig config) : m_config(config) {}

    void start() noexcept {
        m_running = true;
        m_last = Clock::now();
        m_pending = Duration::zero();
        m_stats = TickStats{};
    }

    void stop() noexcept { m_running = false; }
    [[nodiscard]] bool is_running() const noexcept { return m_running; }

    template<typename OnTick>
    std::uint32_t update(OnTick&& on_tick) {
        return advance(Clock::now(), on_tick);
    }

    // Calls on_tick(delta_time, tick_index) once per whole tick elapsed up to
    // `now`. Returns the number of ticks run.
    template<typename OnTick>
    std::uint32_t advance(TimePoint now, OnTick&& on_tick) {
        if (!m_running) {
            return 0;
        }

        const Duration step = m_config.tick_duration();
        const Duration budget = step * m_config.max_ticks_per_update;

        Duration elapsed = now - m_last;
        m_last = now;
        m_stats.is_lagging = elapsed > budget;
        m_pending += m_stats.is_lagging ? budget : elapsed;

        std::uint32_t ran = 0;
        while (m_pending >= step && ran < m_config.max_ticks_per_update) {
            on_tick(m_config.delta_time(), m_stats.total_ticks);
            m_pending -= step;
            ++m_stats.total_ticks;
            ++ran;
        }
        return ran;
    }

    [[nodiscard]] const TickConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const TickStats& stats() const noexcept { return m_stats; }

    [[nodiscard]] Duration time_until_next_tick() const noexcept {
        const Duration remaining = m_config.tick_duration() - m_pending;
        return remaining > Duration::zero() ? remaining : Duration::zero();
    }

private:
    TickConfig m_config{};
    TickStats m_stats{};
    bool m_running = false;
    Duration m_pending = Duration::zero();
    TimePoint m_last{};
};

} // namespace voxstream::server
