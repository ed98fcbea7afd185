#pragma once
#include "core/Core.h"
#include <chrono>

namespace CardioMorph
{
    /**
     * @brief Wall-clock stopwatch for the render timings written to the log.
     */
    class Timer
    {
    public:
        using Clock = std::chrono::steady_clock;

        Timer()
            : m_start( Clock::now() )
        {
        }

        float64_t ElapsedMillis() const { return std::chrono::duration<float64_t, std::milli>( Clock::now() - m_start ).count(); }

        // Milliseconds since the previous lap (or construction); starts the next lap
        float64_t Lap()
        {
            Clock::time_point now     = Clock::now();
            float64_t         elapsed = std::chrono::duration<float64_t, std::milli>( now - m_start ).count();
            m_start                   = now;
            return elapsed;
        }

    private:
        Clock::time_point m_start;
    };
} // namespace CardioMorph
