#include "biology/Characteristics.hpp"

#include <algorithm>

namespace CardioMorph
{
    namespace
    {
        CharacteristicRecord MakeAnchor( const char* title, CellShape shape, float64_t elongation, float64_t alignment, float64_t connection,
                                         float64_t sarcomere, float64_t beatingStrength, float64_t beatingSync, ColorRGB color,
                                         float64_t nucleusSize, float64_t debrisLevel, uint32_t cellCount, float64_t clustering )
        {
            CharacteristicRecord record;
            record.title                 = title;
            record.shape                 = shape;
            record.elongation            = elongation;
            record.alignment             = alignment;
            record.connection            = connection;
            record.sarcomereOrganization = sarcomere;
            record.beatingStrength       = beatingStrength;
            record.beatingSync           = beatingSync;
            record.colorBase             = color;
            record.nucleusSize           = nucleusSize;
            record.debrisLevel           = debrisLevel;
            record.cellCount             = cellCount;
            record.cellClustering        = clustering;
            return record;
        }

        AnchorTable BuildAnchors()
        {
            // clang-format off
            return { {
                //          title                             shape                          elong align conn  sarc  beat  sync  color             nucl  debris cells clust
                MakeAnchor( "Immature Stage",                CellShape::ROUND,              1.0,  0.1,  0.1,  0.1,  0.1,  0.1,  { 255, 214, 204 }, 0.7,  0.1,   8,    0.1 ),
                MakeAnchor( "Initial Beating",               CellShape::SLIGHTLY_ELONGATED, 1.2,  0.2,  0.2,  0.2,  0.3,  0.2,  { 255, 204, 204 }, 0.65, 0.1,   12,   0.3 ),
                MakeAnchor( "Mean Beating Begins",           CellShape::ELONGATED,          1.5,  0.4,  0.3,  0.4,  0.5,  0.4,  { 255, 194, 194 }, 0.5,  0.2,   16,   0.5 ),
                MakeAnchor( "Stronger Contractions",         CellShape::WELL_ELONGATED,     1.8,  0.6,  0.5,  0.6,  0.7,  0.6,  { 255, 153, 153 }, 0.45, 0.2,   20,   0.7 ),
                MakeAnchor( "Moderate Synchronization",      CellShape::FULLY_ELONGATED,    2.0,  0.8,  0.7,  0.8,  0.85, 0.8,  { 255, 102, 102 }, 0.4,  0.3,   24,   0.8 ),
                MakeAnchor( "Peak Contraction Activity",     CellShape::FULLY_ELONGATED,    2.2,  0.9,  0.9,  0.9,  1.0,  0.9,  { 255, 51, 51 },   0.4,  0.4,   28,   0.9 ),
                MakeAnchor( "Damage & Fragmentation Begins", CellShape::FRAGMENTING,        1.6,  0.5,  0.6,  0.5,  0.6,  0.5,  { 204, 51, 51 },   0.3,  0.7,   20,   0.6 ),
                MakeAnchor( "Significant Cell Damage",       CellShape::FRAGMENTED,         1.2,  0.2,  0.2,  0.1,  0.2,  0.1,  { 153, 51, 51 },   0.25, 0.9,   12,   0.2 ),
            } };
            // clang-format on
        }
    } // namespace

    const AnchorTable& GetAnchors()
    {
        static const AnchorTable s_anchors = BuildAnchors();
        return s_anchors;
    }

    const CharacteristicRecord& GetAnchor( uint32_t day )
    {
        uint32_t clamped = std::clamp( day, FIRST_DAY, LAST_DAY );
        return GetAnchors()[ clamped - FIRST_DAY ];
    }

    std::string_view ToString( CellShape shape )
    {
        switch( shape )
        {
            case CellShape::ROUND:
                return "round";
            case CellShape::SLIGHTLY_ELONGATED:
                return "slightly_elongated";
            case CellShape::ELONGATED:
                return "elongated";
            case CellShape::WELL_ELONGATED:
                return "well_elongated";
            case CellShape::FULLY_ELONGATED:
                return "fully_elongated";
            case CellShape::FRAGMENTING:
                return "fragmenting";
            case CellShape::FRAGMENTED:
                return "fragmented";
            default:
                return "unknown";
        }
    }

    bool IsElongatedFamily( CellShape shape )
    {
        return shape == CellShape::SLIGHTLY_ELONGATED || shape == CellShape::ELONGATED || shape == CellShape::WELL_ELONGATED ||
               shape == CellShape::FULLY_ELONGATED;
    }

    bool IsFragmentFamily( CellShape shape )
    {
        return shape == CellShape::FRAGMENTING || shape == CellShape::FRAGMENTED;
    }
} // namespace CardioMorph
