#pragma once
#include "core/Core.h"
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace CardioMorph
{
    /**
     * @brief Maps the 1-8 day axis onto the nominal animation timeline and derives the beat
     * pulse from it. The whole 7-day span covers TIMELINE_SECONDS, which keeps beat phase
     * continuous across any sampled sub-range.
     */
    class Timeline
    {
    public:
        static constexpr float64_t TIMELINE_SECONDS = 60.0;
        static constexpr float64_t DAY_SPAN         = 7.0;

        /**
         * @brief Returns the timeline position (seconds) of a day.
         */
        static float64_t TimePointForDay( float64_t day ) { return ( day - 1.0 ) * ( TIMELINE_SECONDS / DAY_SPAN ); }

        /**
         * @brief Inverse of TimePointForDay, used for the day label.
         */
        static float64_t DayForTimePoint( float64_t timePoint ) { return 1.0 + ( timePoint / TIMELINE_SECONDS ) * DAY_SPAN; }

        /**
         * @brief Position within the current beat cycle, in [0, 1).
         * Beat frequency grows with beating strength: 1 + strength beats per second.
         */
        static float64_t BeatPhase( float64_t timePoint, float64_t beatingStrength )
        {
            float64_t frequency = 1.0 + beatingStrength;
            float64_t phase     = std::fmod( timePoint * frequency, 1.0 );
            return phase < 0.0 ? phase + 1.0 : phase;
        }

        /**
         * @brief Half-sine pulse in [0, 1] over one beat cycle.
         */
        static float64_t BeatPulse( float64_t timePoint, float64_t beatingStrength )
        {
            return std::sin( BeatPhase( timePoint, beatingStrength ) * glm::pi<float64_t>() );
        }

        // Nearest half day, the preview cache granularity
        static float64_t RoundToHalfDay( float64_t day ) { return std::round( day * 2.0 ) / 2.0; }
    };
} // namespace CardioMorph
