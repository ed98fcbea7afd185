#pragma once
#include "CardioMorphTypes.h"
#include <array>
#include <string_view>

namespace CardioMorph
{
    constexpr uint32_t FIRST_DAY    = 1;
    constexpr uint32_t LAST_DAY     = 8;
    constexpr uint32_t ANCHOR_COUNT = LAST_DAY - FIRST_DAY + 1;

    using AnchorTable = std::array<CharacteristicRecord, ANCHOR_COUNT>;

    /**
     * @brief Hand-authored anchor records, index 0 = day 1.
     * Built once on first access and never mutated.
     */
    const AnchorTable& GetAnchors();

    /**
     * @brief Anchor for an integer day in [FIRST_DAY, LAST_DAY]. Out of range days are clamped.
     */
    const CharacteristicRecord& GetAnchor( uint32_t day );

    std::string_view ToString( CellShape shape );

    // slightly_elongated .. fully_elongated
    bool IsElongatedFamily( CellShape shape );

    // fragmenting, fragmented
    bool IsFragmentFamily( CellShape shape );
} // namespace CardioMorph
