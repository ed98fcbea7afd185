#include "renderer/Font.hpp"

namespace CardioMorph
{
    namespace
    {
        // clang-format off
        constexpr Glyph LETTERS[ 26 ] = {
            { 0b010, 0b101, 0b111, 0b101, 0b101 }, // A
            { 0b110, 0b101, 0b110, 0b101, 0b110 }, // B
            { 0b011, 0b100, 0b100, 0b100, 0b011 }, // C
            { 0b110, 0b101, 0b101, 0b101, 0b110 }, // D
            { 0b111, 0b100, 0b110, 0b100, 0b111 }, // E
            { 0b111, 0b100, 0b110, 0b100, 0b100 }, // F
            { 0b011, 0b100, 0b101, 0b101, 0b011 }, // G
            { 0b101, 0b101, 0b111, 0b101, 0b101 }, // H
            { 0b111, 0b010, 0b010, 0b010, 0b111 }, // I
            { 0b001, 0b001, 0b001, 0b101, 0b010 }, // J
            { 0b101, 0b101, 0b110, 0b101, 0b101 }, // K
            { 0b100, 0b100, 0b100, 0b100, 0b111 }, // L
            { 0b101, 0b111, 0b111, 0b101, 0b101 }, // M
            { 0b110, 0b101, 0b101, 0b101, 0b101 }, // N
            { 0b010, 0b101, 0b101, 0b101, 0b010 }, // O
            { 0b110, 0b101, 0b110, 0b100, 0b100 }, // P
            { 0b010, 0b101, 0b101, 0b110, 0b011 }, // Q
            { 0b110, 0b101, 0b110, 0b101, 0b101 }, // R
            { 0b011, 0b100, 0b010, 0b001, 0b110 }, // S
            { 0b111, 0b010, 0b010, 0b010, 0b010 }, // T
            { 0b101, 0b101, 0b101, 0b101, 0b111 }, // U
            { 0b101, 0b101, 0b101, 0b101, 0b010 }, // V
            { 0b101, 0b101, 0b111, 0b111, 0b101 }, // W
            { 0b101, 0b101, 0b010, 0b101, 0b101 }, // X
            { 0b101, 0b101, 0b010, 0b010, 0b010 }, // Y
            { 0b111, 0b001, 0b010, 0b100, 0b111 }, // Z
        };

        constexpr Glyph DIGITS[ 10 ] = {
            { 0b111, 0b101, 0b101, 0b101, 0b111 }, // 0
            { 0b010, 0b110, 0b010, 0b010, 0b111 }, // 1
            { 0b110, 0b001, 0b010, 0b100, 0b111 }, // 2
            { 0b110, 0b001, 0b010, 0b001, 0b110 }, // 3
            { 0b101, 0b101, 0b111, 0b001, 0b001 }, // 4
            { 0b111, 0b100, 0b110, 0b001, 0b110 }, // 5
            { 0b011, 0b100, 0b111, 0b101, 0b111 }, // 6
            { 0b111, 0b001, 0b010, 0b010, 0b010 }, // 7
            { 0b111, 0b101, 0b111, 0b101, 0b111 }, // 8
            { 0b111, 0b101, 0b111, 0b001, 0b110 }, // 9
        };

        constexpr Glyph PERIOD    = { 0b000, 0b000, 0b000, 0b000, 0b010 };
        constexpr Glyph AMPERSAND = { 0b010, 0b101, 0b010, 0b101, 0b011 };
        constexpr Glyph DASH      = { 0b000, 0b000, 0b111, 0b000, 0b000 };
        constexpr Glyph SPACE     = { 0b000, 0b000, 0b000, 0b000, 0b000 };
        constexpr Glyph BLOCK     = { 0b111, 0b111, 0b111, 0b111, 0b111 };
        // clang-format on
    } // namespace

    const Glyph& Font::GetGlyph( char c )
    {
        if( c >= 'a' && c <= 'z' )
            c = static_cast<char>( c - 'a' + 'A' );

        if( c >= 'A' && c <= 'Z' )
            return LETTERS[ c - 'A' ];
        if( c >= '0' && c <= '9' )
            return DIGITS[ c - '0' ];

        switch( c )
        {
            case '.':
                return PERIOD;
            case '&':
                return AMPERSAND;
            case '-':
                return DASH;
            case ' ':
                return SPACE;
            default:
                return BLOCK;
        }
    }

    bool Font::IsSet( const Glyph& glyph, uint32_t col, uint32_t row )
    {
        if( col >= GLYPH_WIDTH || row >= GLYPH_HEIGHT )
            return false;
        return ( glyph[ row ] >> ( GLYPH_WIDTH - 1 - col ) ) & 1u;
    }

    bool Font::IsSupported( char c )
    {
        return &GetGlyph( c ) != &BLOCK;
    }
} // namespace CardioMorph
