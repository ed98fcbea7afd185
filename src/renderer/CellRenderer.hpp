#pragma once
#include "CardioMorphTypes.h"
#include <glm/glm.hpp>

namespace CardioMorph
{
    class Canvas;
    class Random;
    struct ClusterLayout;

    /**
     * @brief What a cell pass actually drew. Used for diagnostics and structural tests.
     */
    struct CellPassStats
    {
        uint32_t cellsPlaced     = 0; // bodies + fragmented cells
        uint32_t bodies          = 0;
        uint32_t fragmentedCells = 0;
        uint32_t fragments       = 0;
        uint32_t nuclei          = 0;
        uint32_t sarcomereLines  = 0; // continuous + broken
        uint32_t brokenLines     = 0;
        uint32_t batches         = 0;

        HeapArray<glm::vec2> bodySizes;        // width and height of each body, in draw order
        float32_t            maxOffset = 0.0f; // furthest cell from its cluster centre
    };

    /**
     * @brief Draws the cell population of one frame: bodies (or their fragments), sarcomere
     * striations and nuclei, spread around the cluster centres of a layout.
     */
    class CellRenderer
    {
    public:
        static constexpr uint32_t  MAX_CELLS_PER_FRAME   = 15;
        static constexpr float64_t CELL_COUNT_SCALE      = 0.8;
        static constexpr uint32_t  BATCH_SIZE            = 5;
        static constexpr float64_t BASE_CELL_SIZE        = 15.0;
        static constexpr float64_t BEAT_AMPLITUDE        = 0.3;
        static constexpr float64_t FRAGMENT_PROBABILITY  = 0.6;
        static constexpr float64_t FRAGMENT_DEBRIS_LEVEL = 0.5;
        static constexpr uint32_t  FRAGMENTS_PER_CELL    = 3;
        static constexpr float64_t FRAGMENT_SHRINK       = 0.8;
        static constexpr float64_t SARCOMERE_VISIBLE     = 0.3;
        static constexpr float64_t SARCOMERE_ORGANIZED   = 0.5;
        static constexpr uint32_t  SARCOMERE_LINES       = 3;
        static constexpr float64_t NUCLEUS_PROBABILITY   = 0.8;

        static constexpr uint8_t CELL_ALPHA      = 180;
        static constexpr uint8_t FRAGMENT_ALPHA  = 150;
        static constexpr uint8_t SARCOMERE_ALPHA = 150;
        static constexpr uint8_t NUCLEUS_ALPHA   = 180;

        /**
         * @brief Cells drawn per frame: min(round(cellCount * 0.8), 15).
         */
        static uint32_t ReducedCellCount( const CharacteristicRecord& record );

        /**
         * @brief Size multiplier from the beat: 1 + pulse * beatingStrength * 0.3.
         */
        static float64_t BeatEffect( const CharacteristicRecord& record, float64_t beatPulse );

        // Maximum distance of a cell from its cluster centre
        static float64_t ClusterRadius( const CharacteristicRecord& record );

        /**
         * @brief Renders every cell of the frame onto the canvas.
         * A record whose reduced count is zero draws nothing and returns immediately.
         */
        static CellPassStats Render( Canvas& canvas, const CharacteristicRecord& record, const ClusterLayout& layout, float64_t beatPulse,
                                     Random& rng );

    private:
        static void DrawCell( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, float64_t beatEffect, Random& rng,
                              CellPassStats& stats );
        static void DrawFragments( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, Random& rng, CellPassStats& stats );
        static void DrawSarcomeres( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, glm::vec2 size, Random& rng,
                                    CellPassStats& stats );
        static void DrawNucleus( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, glm::vec2 size, Random& rng,
                                 CellPassStats& stats );
    };
} // namespace CardioMorph
