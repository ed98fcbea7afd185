#include "simulation/Timeline.hpp"
#include <gtest/gtest.h>

using namespace CardioMorph;

TEST( TimelineTest, DayAxisSpansSixtySeconds )
{
    EXPECT_DOUBLE_EQ( Timeline::TimePointForDay( 1.0 ), 0.0 );
    EXPECT_DOUBLE_EQ( Timeline::TimePointForDay( 8.0 ), 60.0 );
    EXPECT_NEAR( Timeline::TimePointForDay( 4.5 ), 30.0, 1e-9 );
}

TEST( TimelineTest, DayForTimePointInvertsMapping )
{
    for( float64_t day = 1.0; day <= 8.0; day += 0.25 )
        EXPECT_NEAR( Timeline::DayForTimePoint( Timeline::TimePointForDay( day ) ), day, 1e-9 );
}

TEST( TimelineTest, BeatPhaseIsNormalized )
{
    for( float64_t t = -5.0; t < 65.0; t += 0.37 )
    {
        for( float64_t strength: { 0.0, 0.3, 1.0 } )
        {
            float64_t phase = Timeline::BeatPhase( t, strength );
            EXPECT_GE( phase, 0.0 );
            EXPECT_LT( phase, 1.0 );

            float64_t pulse = Timeline::BeatPulse( t, strength );
            EXPECT_GE( pulse, -1e-12 );
            EXPECT_LE( pulse, 1.0 );
        }
    }
}

TEST( TimelineTest, StrongerBeatingBeatsFaster )
{
    // 1 + strength beats per second
    EXPECT_NEAR( Timeline::BeatPhase( 0.25, 0.0 ), 0.25, 1e-12 );
    EXPECT_NEAR( Timeline::BeatPhase( 0.25, 1.0 ), 0.5, 1e-12 );
    EXPECT_NEAR( Timeline::BeatPulse( 0.25, 1.0 ), 1.0, 1e-12 );
    EXPECT_NEAR( Timeline::BeatPulse( 0.0, 0.5 ), 0.0, 1e-12 );
}

TEST( TimelineTest, RoundToHalfDay )
{
    EXPECT_DOUBLE_EQ( Timeline::RoundToHalfDay( 1.0 ), 1.0 );
    EXPECT_DOUBLE_EQ( Timeline::RoundToHalfDay( 2.24 ), 2.0 );
    EXPECT_DOUBLE_EQ( Timeline::RoundToHalfDay( 2.26 ), 2.5 );
    EXPECT_DOUBLE_EQ( Timeline::RoundToHalfDay( 7.8 ), 8.0 );
}
