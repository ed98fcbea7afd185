#include "core/Base.hpp"
#include "core/Random.hpp"
#include <gtest/gtest.h>

using namespace CardioMorph;

namespace
{
    Result Step( Result result, uint32_t& reached )
    {
        reached++;
        return result;
    }

    Result TwoSteps( Result first, Result second, uint32_t& reached )
    {
        CM_RETURN_IF_FAILED( Step( first, reached ) );
        CM_RETURN_IF_FAILED( Step( second, reached ) );
        return Result::SUCCESS;
    }
} // namespace

TEST( CoreTest, ReturnIfFailedStopsAtFirstError )
{
    uint32_t reached = 0;
    EXPECT_EQ( TwoSteps( Result::INVALID_ARGS, Result::SUCCESS, reached ), Result::INVALID_ARGS );
    EXPECT_EQ( reached, 1u );

    reached = 0;
    EXPECT_EQ( TwoSteps( Result::SUCCESS, Result::FAIL, reached ), Result::FAIL );
    EXPECT_EQ( reached, 2u );

    reached = 0;
    EXPECT_EQ( TwoSteps( Result::SUCCESS, Result::SUCCESS, reached ), Result::SUCCESS );
    EXPECT_EQ( reached, 2u );
}

TEST( CoreTest, ResultNames )
{
    EXPECT_EQ( toString( Result::SUCCESS ), "SUCCESS" );
    EXPECT_EQ( toString( Result::INVALID_ARGS ), "INVALID_ARGS" );
    EXPECT_EQ( toString( Result::OUT_OF_MEMORY ), "OUT_OF_MEMORY" );
}

TEST( RandomTest, SeededSequencesRepeat )
{
    Random a( 1234 );
    Random b( 1234 );
    EXPECT_EQ( a.GetSeed(), 1234u );

    for( int i = 0; i < 32; ++i )
    {
        EXPECT_EQ( a.Float(), b.Float() );
        EXPECT_EQ( a.Index( 7 ), b.Index( 7 ) );
    }
}

TEST( RandomTest, ChanceBoundsAreExact )
{
    Random rng( 9 );
    for( int i = 0; i < 256; ++i )
    {
        double value = rng.Float();
        EXPECT_GE( value, 0.0 );
        EXPECT_LT( value, 1.0 );

        EXPECT_FALSE( rng.Chance( 0.0 ) );
        EXPECT_TRUE( rng.Chance( 1.0 ) );
        EXPECT_LT( rng.Index( 3 ), 3u );
    }
}
