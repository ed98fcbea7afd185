#pragma once
#include <array>
#include <cstdint>

namespace CardioMorph
{
    // One row per entry, 3 bits wide, bit 2 = leftmost column
    using Glyph = std::array<uint8_t, 5>;

    /**
     * @brief Tiny 3x5 bitmap font for the frame label overlay.
     * Covers A-Z (lowercase maps to uppercase), 0-9, '.', '&', '-' and space.
     * Anything else renders as a filled block.
     */
    class Font
    {
    public:
        static constexpr uint32_t GLYPH_WIDTH  = 3;
        static constexpr uint32_t GLYPH_HEIGHT = 5;
        static constexpr uint32_t ADVANCE      = GLYPH_WIDTH + 1;

        static const Glyph& GetGlyph( char c );
        static bool         IsSet( const Glyph& glyph, uint32_t col, uint32_t row );
        static bool         IsSupported( char c );
    };
} // namespace CardioMorph
