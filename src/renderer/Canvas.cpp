#include "renderer/Canvas.hpp"

#include "renderer/Font.hpp"
#include <algorithm>
#include <cmath>

namespace CardioMorph
{
    namespace
    {
        inline uint8_t BlendChannel( uint8_t dst, uint8_t src, uint8_t alpha )
        {
            uint32_t value = ( uint32_t )src * alpha + ( uint32_t )dst * ( 255u - alpha ) + 127u;
            return ( uint8_t )( value / 255u );
        }

        // Squared distance from p to segment ab
        inline float DistanceSquared( glm::vec2 p, glm::vec2 a, glm::vec2 b )
        {
            glm::vec2 ab     = b - a;
            float     lenSqr = glm::dot( ab, ab );
            float     t      = lenSqr > 0.0f ? glm::clamp( glm::dot( p - a, ab ) / lenSqr, 0.0f, 1.0f ) : 0.0f;
            glm::vec2 d      = p - ( a + ab * t );
            return glm::dot( d, d );
        }
    } // namespace

    Canvas::Canvas( uint32_t width, uint32_t height, ColorRGB clearColor )
        : m_width( width )
        , m_height( height )
        , m_pixels( ( size_t )width * height * 3 )
    {
        Clear( clearColor );
    }

    void Canvas::Clear( ColorRGB color )
    {
        for( size_t i = 0; i < m_pixels.size(); i += 3 )
        {
            m_pixels[ i ]     = color.r;
            m_pixels[ i + 1 ] = color.g;
            m_pixels[ i + 2 ] = color.b;
        }
    }

    void Canvas::BlendPixel( int32_t x, int32_t y, ColorRGBA color )
    {
        if( !InBounds( x, y ) )
            return;

        size_t   offset = ( ( size_t )y * m_width + ( size_t )x ) * 3;
        uint8_t* px     = &m_pixels[ offset ];
        px[ 0 ]         = BlendChannel( px[ 0 ], color.r, color.a );
        px[ 1 ]         = BlendChannel( px[ 1 ], color.g, color.a );
        px[ 2 ]         = BlendChannel( px[ 2 ], color.b, color.a );
    }

    void Canvas::FillEllipse( glm::vec2 min, glm::vec2 max, ColorRGBA color )
    {
        glm::vec2 lo     = glm::min( min, max );
        glm::vec2 hi     = glm::max( min, max );
        glm::vec2 center = ( lo + hi ) * 0.5f;
        glm::vec2 radius = ( hi - lo ) * 0.5f;

        if( radius.x < 0.5f || radius.y < 0.5f )
        {
            BlendPixel( ( int32_t )std::floor( center.x ), ( int32_t )std::floor( center.y ), color );
            return;
        }

        int32_t x0 = std::max( 0, ( int32_t )std::floor( lo.x ) );
        int32_t y0 = std::max( 0, ( int32_t )std::floor( lo.y ) );
        int32_t x1 = std::min( ( int32_t )m_width - 1, ( int32_t )std::ceil( hi.x ) );
        int32_t y1 = std::min( ( int32_t )m_height - 1, ( int32_t )std::ceil( hi.y ) );

        for( int32_t y = y0; y <= y1; ++y )
        {
            float dy = ( ( float )y + 0.5f - center.y ) / radius.y;
            for( int32_t x = x0; x <= x1; ++x )
            {
                float dx = ( ( float )x + 0.5f - center.x ) / radius.x;
                if( dx * dx + dy * dy <= 1.0f )
                    BlendPixel( x, y, color );
            }
        }
    }

    void Canvas::FillRect( glm::ivec2 min, glm::ivec2 max, ColorRGBA color )
    {
        int32_t x0 = std::max( 0, std::min( min.x, max.x ) );
        int32_t y0 = std::max( 0, std::min( min.y, max.y ) );
        int32_t x1 = std::min( ( int32_t )m_width - 1, std::max( min.x, max.x ) );
        int32_t y1 = std::min( ( int32_t )m_height - 1, std::max( min.y, max.y ) );

        for( int32_t y = y0; y <= y1; ++y )
            for( int32_t x = x0; x <= x1; ++x )
                BlendPixel( x, y, color );
    }

    void Canvas::DrawLine( glm::vec2 from, glm::vec2 to, ColorRGBA color, uint32_t width )
    {
        if( width <= 1 )
        {
            // Bresenham's line algorithm
            int32_t x0  = ( int32_t )std::lround( from.x );
            int32_t y0  = ( int32_t )std::lround( from.y );
            int32_t x1  = ( int32_t )std::lround( to.x );
            int32_t y1  = ( int32_t )std::lround( to.y );
            int32_t dx  = std::abs( x1 - x0 );
            int32_t dy  = std::abs( y1 - y0 );
            int32_t sx  = x0 < x1 ? 1 : -1;
            int32_t sy  = y0 < y1 ? 1 : -1;
            int32_t err = dx - dy;

            while( true )
            {
                BlendPixel( x0, y0, color );
                if( x0 == x1 && y0 == y1 )
                    break;

                int32_t e2 = 2 * err;
                if( e2 > -dy )
                {
                    err -= dy;
                    x0 += sx;
                }
                if( e2 < dx )
                {
                    err += dx;
                    y0 += sy;
                }
            }
            return;
        }

        float     halfWidth = ( float )width * 0.5f;
        glm::vec2 lo        = glm::min( from, to ) - halfWidth;
        glm::vec2 hi        = glm::max( from, to ) + halfWidth;

        int32_t x0 = std::max( 0, ( int32_t )std::floor( lo.x ) );
        int32_t y0 = std::max( 0, ( int32_t )std::floor( lo.y ) );
        int32_t x1 = std::min( ( int32_t )m_width - 1, ( int32_t )std::ceil( hi.x ) );
        int32_t y1 = std::min( ( int32_t )m_height - 1, ( int32_t )std::ceil( hi.y ) );

        float limit = halfWidth * halfWidth;
        for( int32_t y = y0; y <= y1; ++y )
        {
            for( int32_t x = x0; x <= x1; ++x )
            {
                glm::vec2 p( ( float )x + 0.5f, ( float )y + 0.5f );
                if( DistanceSquared( p, from, to ) <= limit )
                    BlendPixel( x, y, color );
            }
        }
    }

    int32_t Canvas::DrawText( glm::ivec2 origin, std::string_view text, ColorRGBA color, uint32_t scale )
    {
        int32_t cursor = origin.x;
        int32_t step   = ( int32_t )std::max( 1u, scale );

        for( char c: text )
        {
            const Glyph& glyph = Font::GetGlyph( c );
            for( uint32_t row = 0; row < Font::GLYPH_HEIGHT; ++row )
            {
                for( uint32_t col = 0; col < Font::GLYPH_WIDTH; ++col )
                {
                    if( !Font::IsSet( glyph, col, row ) )
                        continue;

                    glm::ivec2 cell( cursor + ( int32_t )col * step, origin.y + ( int32_t )row * step );
                    FillRect( cell, cell + glm::ivec2( step - 1 ), color );
                }
            }
            cursor += ( int32_t )Font::ADVANCE * step;
        }

        return cursor - origin.x;
    }

    ColorRGB Canvas::GetPixel( uint32_t x, uint32_t y ) const
    {
        if( x >= m_width || y >= m_height )
            return {};

        size_t offset = ( ( size_t )y * m_width + x ) * 3;
        return { m_pixels[ offset ], m_pixels[ offset + 1 ], m_pixels[ offset + 2 ] };
    }

    Ref<const RasterFrame> Canvas::Finish( float64_t day, const std::string& title )
    {
        auto frame = CreateRef<const RasterFrame>( m_width, m_height, std::move( m_pixels ), day, title );
        m_pixels.clear();
        m_width  = 0;
        m_height = 0;
        return frame;
    }
} // namespace CardioMorph
