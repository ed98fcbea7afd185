#pragma once
#include "CardioMorphTypes.h"
#include "renderer/Canvas.hpp"

namespace CardioMorph
{
    class Random;

    /**
     * @brief Scatters small particles over the whole frame. Count follows debrisLevel; colour is a
     * two-bucket damage signal (neutral gray below 0.5, reddish-brown from 0.5 up).
     */
    class DebrisRenderer
    {
    public:
        static constexpr float64_t PARTICLES_PER_LEVEL = 80.0;
        static constexpr float64_t DAMAGE_THRESHOLD    = 0.5;

        // round(debrisLevel * 80)
        static uint32_t  DebrisCount( const CharacteristicRecord& record );
        static ColorRGBA DebrisColor( const CharacteristicRecord& record );

        /**
         * @return Number of particles drawn.
         */
        static uint32_t Render( Canvas& canvas, const CharacteristicRecord& record, Random& rng );
    };
} // namespace CardioMorph
