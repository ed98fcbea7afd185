#include "CardioMorphTypes.h"

#include <utility>

namespace CardioMorph
{
    RasterFrame::RasterFrame( uint32_t width, uint32_t height, HeapArray<uint8_t> pixels, float64_t day, std::string title )
        : m_width( width )
        , m_height( height )
        , m_pixels( std::move( pixels ) )
        , m_day( day )
        , m_title( std::move( title ) )
    {
    }

    ColorRGB RasterFrame::GetPixel( uint32_t x, uint32_t y ) const
    {
        if( x >= m_width || y >= m_height )
            return {};

        size_t offset = ( ( size_t )y * m_width + x ) * 3;
        return { m_pixels[ offset ], m_pixels[ offset + 1 ], m_pixels[ offset + 2 ] };
    }
} // namespace CardioMorph
