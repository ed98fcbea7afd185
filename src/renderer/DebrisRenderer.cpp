#include "renderer/DebrisRenderer.hpp"

#include "core/Random.hpp"
#include <algorithm>
#include <cmath>

namespace CardioMorph
{
    uint32_t DebrisRenderer::DebrisCount( const CharacteristicRecord& record )
    {
        long count = std::lround( record.debrisLevel * PARTICLES_PER_LEVEL );
        return static_cast<uint32_t>( std::max( 0L, count ) );
    }

    ColorRGBA DebrisRenderer::DebrisColor( const CharacteristicRecord& record )
    {
        if( record.debrisLevel < DAMAGE_THRESHOLD )
            return { 180, 180, 180, 80 };

        return { 160, 100, 100, 100 };
    }

    uint32_t DebrisRenderer::Render( Canvas& canvas, const CharacteristicRecord& record, Random& rng )
    {
        uint32_t  count = DebrisCount( record );
        ColorRGBA color = DebrisColor( record );

        float64_t width  = static_cast<float64_t>( canvas.GetWidth() );
        float64_t height = static_cast<float64_t>( canvas.GetHeight() );

        for( uint32_t i = 0; i < count; ++i )
        {
            float32_t x    = static_cast<float32_t>( rng.Float() * width );
            float32_t y    = static_cast<float32_t>( rng.Float() * height );
            float32_t size = static_cast<float32_t>( 1.0 + rng.Float() * 3.0 );

            canvas.FillEllipse( { x, y }, { x + size, y + size }, color );
        }

        return count;
    }
} // namespace CardioMorph
