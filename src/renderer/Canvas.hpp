#pragma once
#include "CardioMorphTypes.h"
#include <glm/glm.hpp>
#include <string_view>

namespace CardioMorph
{
    struct ColorRGBA
    {
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;
        uint8_t a = 255;

        static ColorRGBA From( const ColorRGB& rgb, uint8_t alpha ) { return { rgb.r, rgb.g, rgb.b, alpha }; }
    };

    /**
     * @brief Mutable RGB8 drawing surface used while a frame is being composed.
     * Every primitive alpha-blends onto the existing pixels ("source over"), so overlapping
     * translucent shapes stay distinguishable. Coordinates are in pixels, origin top-left;
     * anything outside the canvas is clipped.
     */
    class Canvas
    {
    public:
        Canvas( uint32_t width, uint32_t height, ColorRGB clearColor = { 255, 255, 255 } );

        void Clear( ColorRGB color );

        void BlendPixel( int32_t x, int32_t y, ColorRGBA color );

        /**
         * @brief Fills the ellipse inscribed in the bounding box [min, max].
         * Boxes smaller than a pixel still mark the pixel under their centre.
         */
        void FillEllipse( glm::vec2 min, glm::vec2 max, ColorRGBA color );

        /**
         * @brief Fills the axis aligned rectangle [min, max], both corners inclusive.
         */
        void FillRect( glm::ivec2 min, glm::ivec2 max, ColorRGBA color );

        /**
         * @brief Draws a straight segment. Width 1 uses Bresenham; wider lines cover every pixel
         * whose centre lies within width/2 of the segment, each pixel blended once.
         */
        void DrawLine( glm::vec2 from, glm::vec2 to, ColorRGBA color, uint32_t width = 1 );

        /**
         * @brief Renders text with the built-in bitmap font, top-left anchored.
         * @return Horizontal advance in pixels.
         */
        int32_t DrawText( glm::ivec2 origin, std::string_view text, ColorRGBA color, uint32_t scale = 1 );

        ColorRGB GetPixel( uint32_t x, uint32_t y ) const;

        uint32_t GetWidth() const { return m_width; }
        uint32_t GetHeight() const { return m_height; }

        /**
         * @brief Freezes the canvas into an immutable frame. The canvas is left empty.
         */
        Ref<const RasterFrame> Finish( float64_t day, const std::string& title );

    private:
        bool InBounds( int32_t x, int32_t y ) const { return x >= 0 && y >= 0 && x < ( int32_t )m_width && y < ( int32_t )m_height; }

    private:
        uint32_t           m_width;
        uint32_t           m_height;
        HeapArray<uint8_t> m_pixels;
    };
} // namespace CardioMorph
