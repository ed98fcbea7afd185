#include "renderer/Canvas.hpp"
#include "renderer/Font.hpp"
#include <gtest/gtest.h>

using namespace CardioMorph;

namespace
{
    const ColorRGB WHITE = { 255, 255, 255 };
    const ColorRGB BLACK = { 0, 0, 0 };

    uint32_t CountNot( const Canvas& canvas, ColorRGB color )
    {
        uint32_t count = 0;
        for( uint32_t y = 0; y < canvas.GetHeight(); ++y )
            for( uint32_t x = 0; x < canvas.GetWidth(); ++x )
                if( canvas.GetPixel( x, y ) != color )
                    count++;
        return count;
    }
} // namespace

class CanvasTest : public ::testing::Test
{
protected:
    Canvas m_canvas{ 64, 48 };
};

TEST_F( CanvasTest, StartsCleared )
{
    EXPECT_EQ( m_canvas.GetPixel( 0, 0 ), WHITE );
    EXPECT_EQ( m_canvas.GetPixel( 63, 47 ), WHITE );
    EXPECT_EQ( CountNot( m_canvas, WHITE ), 0u );
}

TEST_F( CanvasTest, OpaqueBlendReplaces )
{
    m_canvas.BlendPixel( 5, 5, { 10, 20, 30, 255 } );
    EXPECT_EQ( m_canvas.GetPixel( 5, 5 ), ( ColorRGB{ 10, 20, 30 } ) );
}

TEST_F( CanvasTest, TranslucentBlendMixes )
{
    m_canvas.Clear( BLACK );
    m_canvas.BlendPixel( 1, 1, { 255, 255, 255, 128 } );

    ColorRGB mixed = m_canvas.GetPixel( 1, 1 );
    EXPECT_NEAR( mixed.r, 128, 1 );

    // A second layer moves further towards the source
    m_canvas.BlendPixel( 1, 1, { 255, 255, 255, 128 } );
    EXPECT_GT( m_canvas.GetPixel( 1, 1 ).r, mixed.r );
}

TEST_F( CanvasTest, OutOfBoundsIsClipped )
{
    m_canvas.BlendPixel( -1, 0, { 0, 0, 0, 255 } );
    m_canvas.BlendPixel( 64, 0, { 0, 0, 0, 255 } );
    m_canvas.FillEllipse( { -20.0f, -20.0f }, { 10.0f, 10.0f }, { 0, 0, 0, 255 } );
    m_canvas.DrawLine( { -30.0f, 5.0f }, { 100.0f, 5.0f }, { 0, 0, 0, 255 }, 3 );

    EXPECT_EQ( m_canvas.GetPixel( 63, 0 ), WHITE );
    EXPECT_EQ( m_canvas.GetPixel( 0, 5 ), BLACK );
    EXPECT_EQ( m_canvas.GetPixel( 63, 5 ), BLACK );
}

TEST_F( CanvasTest, EllipseStaysInsideBox )
{
    m_canvas.FillEllipse( { 10.0f, 10.0f }, { 30.0f, 20.0f }, { 0, 0, 0, 255 } );

    EXPECT_EQ( m_canvas.GetPixel( 20, 15 ), BLACK );
    EXPECT_EQ( m_canvas.GetPixel( 10, 10 ), WHITE ); // corner is outside the ellipse
    EXPECT_EQ( m_canvas.GetPixel( 35, 15 ), WHITE );

    uint32_t filled = CountNot( m_canvas, WHITE );
    EXPECT_GT( filled, 100u );
    EXPECT_LE( filled, 20u * 10u );
}

TEST_F( CanvasTest, TinyEllipseMarksOnePixel )
{
    m_canvas.FillEllipse( { 4.2f, 4.2f }, { 4.6f, 4.6f }, { 0, 0, 0, 255 } );
    EXPECT_EQ( CountNot( m_canvas, WHITE ), 1u );
    EXPECT_EQ( m_canvas.GetPixel( 4, 4 ), BLACK );
}

TEST_F( CanvasTest, RectIsInclusive )
{
    m_canvas.FillRect( { 2, 3 }, { 5, 4 }, { 0, 0, 0, 255 } );
    EXPECT_EQ( CountNot( m_canvas, WHITE ), 8u );
    EXPECT_EQ( m_canvas.GetPixel( 5, 4 ), BLACK );
}

TEST_F( CanvasTest, BresenhamLineHitsEndpoints )
{
    m_canvas.DrawLine( { 3.0f, 7.0f }, { 40.0f, 20.0f }, { 0, 0, 0, 255 } );

    EXPECT_EQ( m_canvas.GetPixel( 3, 7 ), BLACK );
    EXPECT_EQ( m_canvas.GetPixel( 40, 20 ), BLACK );
    // One pixel per step along the major axis
    EXPECT_EQ( CountNot( m_canvas, WHITE ), 38u );
}

TEST_F( CanvasTest, WideLineCoversEachPixelOnce )
{
    m_canvas.Clear( BLACK );
    m_canvas.DrawLine( { 10.0f, 10.0f }, { 50.0f, 10.0f }, { 255, 255, 255, 100 }, 2 );

    // A doubled blend would be brighter than a single one
    ColorRGB single = m_canvas.GetPixel( 30, 10 );
    EXPECT_NEAR( single.r, 100, 1 );
    EXPECT_EQ( m_canvas.GetPixel( 30, 20 ), BLACK );
}

TEST_F( CanvasTest, TextAdvancesPerGlyph )
{
    int32_t advance = m_canvas.DrawText( { 2, 2 }, "DAY 1.5", { 0, 0, 0, 255 } );
    EXPECT_EQ( advance, 7 * ( int32_t )Font::ADVANCE );
    EXPECT_GT( CountNot( m_canvas, WHITE ), 0u );

    // Nothing below the glyph cell
    for( uint32_t x = 0; x < m_canvas.GetWidth(); ++x )
        EXPECT_EQ( m_canvas.GetPixel( x, 2 + Font::GLYPH_HEIGHT ), WHITE );
}

TEST_F( CanvasTest, FinishFreezesPixels )
{
    m_canvas.BlendPixel( 1, 2, { 0, 0, 0, 255 } );

    Ref<const RasterFrame> frame = m_canvas.Finish( 2.5, "Initial Beating" );
    ASSERT_NE( frame, nullptr );
    EXPECT_EQ( frame->GetWidth(), 64u );
    EXPECT_EQ( frame->GetHeight(), 48u );
    EXPECT_EQ( frame->GetPixels().size(), 64u * 48u * 3u );
    EXPECT_EQ( frame->GetPixel( 1, 2 ), BLACK );
    EXPECT_EQ( frame->GetPixel( 0, 0 ), WHITE );
    EXPECT_DOUBLE_EQ( frame->GetDay(), 2.5 );
    EXPECT_EQ( frame->GetTitle(), "Initial Beating" );

    EXPECT_EQ( m_canvas.GetWidth(), 0u );
}

TEST( FontTest, SupportedCharacters )
{
    EXPECT_TRUE( Font::IsSupported( 'A' ) );
    EXPECT_TRUE( Font::IsSupported( 'z' ) );
    EXPECT_TRUE( Font::IsSupported( '7' ) );
    EXPECT_TRUE( Font::IsSupported( '&' ) );
    EXPECT_FALSE( Font::IsSupported( '#' ) );

    EXPECT_EQ( Font::GetGlyph( 'q' ), Font::GetGlyph( 'Q' ) );

    const Glyph& space = Font::GetGlyph( ' ' );
    for( uint32_t row = 0; row < Font::GLYPH_HEIGHT; ++row )
        for( uint32_t col = 0; col < Font::GLYPH_WIDTH; ++col )
            EXPECT_FALSE( Font::IsSet( space, col, row ) );
}
