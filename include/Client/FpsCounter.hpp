// =============================================================================
// VOXSTREAM - FPS COUNTER
// Frames presented during a sliding two-second window
// =============================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace voxstream::client {

class FpsCounter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds WINDOW{2};

    void add_frame() { add_frame(Clock::now()); }

    void add_frame(Clock::time_point now) {
        while (!m_frames.empty() && now - m_frames.front() >= WINDOW) {
            m_frames.pop_front();
        }
        m_frames.push_back(now);
    }

    [[nodiscard]] std::size_t fps() const noexcept {
        return m_frames.size() / static_cast<std::size_t>(WINDOW.count());
    }

private:
    std::deque<Clock::time_point> m_frames; // oldest first
};

} // namespace voxstream::client
