#include "animation/AnimationAssembler.hpp"

#include "biology/CharacteristicInterpolator.hpp"
#include "biology/Characteristics.hpp"
#include "core/Log.h"
#include "core/Timer.hpp"
#include "renderer/FrameComposer.hpp"
#include "simulation/Timeline.hpp"
#include <algorithm>
#include <cmath>

namespace CardioMorph
{
    AnimationAssembler::AnimationAssembler( CharacteristicInterpolator& interpolator, FrameComposer& composer, Random& rng,
                                            const AnimationAssemblerConfig& config )
        : m_interpolator( interpolator )
        , m_composer( composer )
        , m_rng( rng )
        , m_config( config )
    {
    }

    Result AnimationAssembler::Assemble( DayRange range, AnimationSpeed speed, Ref<const AnimationArtifact>& out,
                                         const ProgressCallback& progress )
    {
        Result res = ValidateRange( range );
        if( res != Result::SUCCESS )
            return res;

        uint32_t count = KeyframeCount( range );
        CM_INFO( "[AnimationAssembler] Days {:.2f}-{:.2f}, {} keyframes, speed {}", range.min, range.max, count, ToString( speed ) );

        return Build( SampleDays( range, count ), speed, range, out, progress );
    }

    Result AnimationAssembler::AssembleDays( const HeapArray<float64_t>& days, AnimationSpeed speed, Ref<const AnimationArtifact>& out,
                                             const ProgressCallback& progress )
    {
        if( days.empty() )
        {
            CM_ERROR( "[AnimationAssembler] No keyframe days to assemble." );
            return Result::INVALID_ARGS;
        }

        DayRange range = { *std::min_element( days.begin(), days.end() ), *std::max_element( days.begin(), days.end() ) };
        return Build( days, speed, range, out, progress );
    }

    Result AnimationAssembler::Build( const HeapArray<float64_t>& days, AnimationSpeed speed, const DayRange& range,
                                      Ref<const AnimationArtifact>& out, const ProgressCallback& progress )
    {
        if( m_config.frameWidth == 0 || m_config.frameHeight == 0 )
        {
            CM_ERROR( "[AnimationAssembler] Invalid frame size {}x{}", m_config.frameWidth, m_config.frameHeight );
            return Result::INVALID_ARGS;
        }

        Timer timer;
        Timer frameTimer;

        auto artifact             = CreateRef<AnimationArtifact>();
        artifact->frameDurationMs = FrameDurationMs( speed );
        artifact->loop            = m_config.loop;
        artifact->speed           = speed;
        artifact->range           = range;
        artifact->frames.reserve( days.size() );

        const uint32_t total = static_cast<uint32_t>( days.size() );
        for( uint32_t i = 0; i < total; ++i )
        {
            CharacteristicRecord record;
            Result               res = m_interpolator.Interpolate( days[ i ], record );
            if( res != Result::SUCCESS )
            {
                CM_ERROR( "[AnimationAssembler] Keyframe {} (day {}) rejected: {}", i, days[ i ], toString( res ) );
                return res;
            }

            Ref<const RasterFrame> frame;
            res = m_composer.Compose( record, Timeline::TimePointForDay( days[ i ] ), m_config.frameWidth, m_config.frameHeight, m_rng,
                                      frame );
            if( res != Result::SUCCESS )
            {
                CM_ERROR( "[AnimationAssembler] Keyframe {} failed to compose: {}", i, toString( res ) );
                return res;
            }

            artifact->frames.push_back( frame );
            CM_TRACE( "[AnimationAssembler] Keyframe {}/{} (day {:.2f}) in {:.2f} ms", i + 1, total, days[ i ], frameTimer.Lap() );

            if( progress )
                progress( i + 1, total );
        }

        CM_INFO( "[AnimationAssembler] Assembled {} frames in {:.1f} ms", total, timer.ElapsedMillis() );
        out = artifact;
        return Result::SUCCESS;
    }

    uint32_t AnimationAssembler::KeyframeCount( const DayRange& range )
    {
        const float64_t span = range.Span();
        if( span <= SHORT_RANGE_SPAN )
            return SHORT_RANGE_KEYFRAMES;

        const float64_t fullSpan = static_cast<float64_t>( LAST_DAY - FIRST_DAY );
        return static_cast<uint32_t>( std::lround( FULL_RANGE_KEYFRAMES * span / fullSpan ) );
    }

    HeapArray<float64_t> AnimationAssembler::SampleDays( const DayRange& range, uint32_t count )
    {
        HeapArray<float64_t> days;
        if( count == 0 )
            return days;

        days.reserve( count );
        if( count == 1 )
        {
            days.push_back( range.min );
            return days;
        }

        const float64_t step = range.Span() / static_cast<float64_t>( count - 1 );
        for( uint32_t i = 0; i < count - 1; ++i )
            days.push_back( range.min + step * i );
        days.push_back( range.max ); // exact endpoint

        return days;
    }

    uint32_t AnimationAssembler::FrameDurationMs( AnimationSpeed speed )
    {
        switch( speed )
        {
            case AnimationSpeed::SLOW:
                return 500;
            case AnimationSpeed::FAST:
                return 125;
            case AnimationSpeed::MEDIUM:
            default:
                return 250;
        }
    }

    DayRange AnimationAssembler::PresetRange( DayRangePreset preset )
    {
        switch( preset )
        {
            case DayRangePreset::EARLY:
                return { 1.0, 3.0 };
            case DayRangePreset::MIDDLE:
                return { 3.0, 6.0 };
            case DayRangePreset::LATE:
                return { 6.0, 8.0 };
            case DayRangePreset::ALL_DAYS:
            default:
                return { 1.0, 8.0 };
        }
    }

    const char* AnimationAssembler::ToString( AnimationSpeed speed )
    {
        switch( speed )
        {
            case AnimationSpeed::SLOW:
                return "SLOW";
            case AnimationSpeed::MEDIUM:
                return "MEDIUM";
            case AnimationSpeed::FAST:
                return "FAST";
            default:
                return "UNKNOWN";
        }
    }

    Result AnimationAssembler::ValidateRange( DayRange& range )
    {
        if( !std::isfinite( range.min ) || !std::isfinite( range.max ) )
        {
            CM_ERROR( "[AnimationAssembler] Day range bounds must be finite." );
            return Result::INVALID_ARGS;
        }

        const float64_t lastDay = static_cast<float64_t>( LAST_DAY );
        if( range.max > lastDay )
        {
            CM_WARN( "[AnimationAssembler] Range max {:.2f} clamped to day {}", range.max, LAST_DAY );
            range.max = lastDay;
        }

        if( range.min < static_cast<float64_t>( FIRST_DAY ) || range.min >= range.max )
        {
            CM_ERROR( "[AnimationAssembler] Invalid day range {:.2f}-{:.2f}", range.min, range.max );
            return Result::INVALID_ARGS;
        }

        return Result::SUCCESS;
    }
} // namespace CardioMorph
