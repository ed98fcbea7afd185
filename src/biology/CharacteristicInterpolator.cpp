#include "biology/CharacteristicInterpolator.hpp"

#include "biology/Characteristics.hpp"
#include "core/Log.h"
#include <algorithm>
#include <cmath>

namespace CardioMorph
{
    namespace
    {
        float64_t Lerp( float64_t a, float64_t b, float64_t t )
        {
            return a + t * ( b - a );
        }

        // Truncates like the colour channels do
        uint8_t LerpChannel( uint8_t a, uint8_t b, float64_t t )
        {
            return static_cast<uint8_t>( Lerp( a, b, t ) );
        }
    } // namespace

    CharacteristicRecord CharacteristicInterpolator::Blend( const CharacteristicRecord& lower, const CharacteristicRecord& upper, float64_t t )
    {
        CharacteristicRecord result;

        // Categorical fields never blend
        result.title = lower.title;
        result.shape = lower.shape;

        result.elongation            = Lerp( lower.elongation, upper.elongation, t );
        result.alignment             = Lerp( lower.alignment, upper.alignment, t );
        result.connection            = Lerp( lower.connection, upper.connection, t );
        result.sarcomereOrganization = Lerp( lower.sarcomereOrganization, upper.sarcomereOrganization, t );
        result.beatingStrength       = Lerp( lower.beatingStrength, upper.beatingStrength, t );
        result.beatingSync           = Lerp( lower.beatingSync, upper.beatingSync, t );
        result.nucleusSize           = Lerp( lower.nucleusSize, upper.nucleusSize, t );
        result.debrisLevel           = Lerp( lower.debrisLevel, upper.debrisLevel, t );
        result.cellClustering        = Lerp( lower.cellClustering, upper.cellClustering, t );

        result.colorBase.r = LerpChannel( lower.colorBase.r, upper.colorBase.r, t );
        result.colorBase.g = LerpChannel( lower.colorBase.g, upper.colorBase.g, t );
        result.colorBase.b = LerpChannel( lower.colorBase.b, upper.colorBase.b, t );

        // Stays real valued, the renderer rounds its reduced count
        result.cellCount = Lerp( lower.cellCount, upper.cellCount, t );

        return result;
    }

    Result CharacteristicInterpolator::Interpolate( float64_t day, CharacteristicRecord& out )
    {
        if( !std::isfinite( day ) || day < static_cast<float64_t>( FIRST_DAY ) )
        {
            CM_ERROR( "[Interpolator] Day {} is outside the supported domain [{}, {}].", day, FIRST_DAY, LAST_DAY );
            return Result::INVALID_ARGS;
        }

        auto it = m_cache.find( day );
        if( it != m_cache.end() )
        {
            out = it->second;
            return Result::SUCCESS;
        }

        CharacteristicRecord result;
        if( day >= static_cast<float64_t>( LAST_DAY ) )
        {
            // No extrapolation past the last anchor
            result = GetAnchor( LAST_DAY );
        }
        else
        {
            uint32_t  lowerDay = static_cast<uint32_t>( std::trunc( day ) );
            uint32_t  upperDay = std::min( LAST_DAY, lowerDay + 1 );
            float64_t fraction = day - static_cast<float64_t>( lowerDay );

            result = Blend( GetAnchor( lowerDay ), GetAnchor( upperDay ), fraction );
        }

        CM_TRACE( "[Interpolator] Day {:.3f} -> '{}' ({})", day, result.title, ToString( result.shape ) );

        m_cache.emplace( day, result );
        out = std::move( result );
        return Result::SUCCESS;
    }
} // namespace CardioMorph
