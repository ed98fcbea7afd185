#pragma once
#include "CardioMorphTypes.h"
#include "renderer/CellRenderer.hpp"

namespace CardioMorph
{
    class Canvas;
    class Random;
    struct ClusterLayout;

    struct FrameComposerConfig
    {
        bool_t drawLabels = true;
    };

    /**
     * @brief Per-frame breakdown of the last composition.
     */
    struct FrameStats
    {
        uint32_t      clusters    = 0;
        uint32_t      connections = 0;
        uint32_t      debris      = 0;
        float64_t     beatPulse   = 0.0;
        CellPassStats cells;
    };

    /**
     * @brief Builds one finished frame for a (record, time point) pair.
     *
     * Pass order: white canvas, cluster layout, inter-cluster connections, cells, debris,
     * then the label overlay box (with day and title text when labels are enabled).
     */
    class FrameComposer
    {
    public:
        static constexpr uint8_t  CONNECTION_ALPHA = 120;
        static constexpr uint32_t CONNECTION_WIDTH = 2;

        FrameComposer() = default;
        explicit FrameComposer( const FrameComposerConfig& config );

        /**
         * @brief Composes a frame.
         * @param timePoint Seconds on the 60 s timeline; drives the beat pulse and the day label.
         * @return INVALID_ARGS for a zero-sized canvas, SUCCESS otherwise.
         */
        Result Compose( const CharacteristicRecord& record, float64_t timePoint, uint32_t width, uint32_t height, Random& rng,
                        Ref<const RasterFrame>& outFrame );

        const FrameStats& GetLastStats() const { return m_lastStats; }

    private:
        void DrawConnections( Canvas& canvas, const CharacteristicRecord& record, const ClusterLayout& layout );
        void DrawOverlay( Canvas& canvas, const CharacteristicRecord& record, float64_t day );

    private:
        FrameComposerConfig m_config;
        FrameStats          m_lastStats;
    };
} // namespace CardioMorph
