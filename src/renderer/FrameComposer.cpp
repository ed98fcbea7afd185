#include "renderer/FrameComposer.hpp"

#include "core/Log.h"
#include "core/Random.hpp"
#include "renderer/Canvas.hpp"
#include "renderer/DebrisRenderer.hpp"
#include "simulation/ClusterLayout.hpp"
#include "simulation/Timeline.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/fmt/fmt.h>

namespace CardioMorph
{
    namespace
    {
        const ColorRGB   BACKGROUND = { 255, 255, 255 };
        const ColorRGBA  LABEL_BOX  = { 240, 240, 240, 180 };
        const ColorRGBA  LABEL_TEXT = { 60, 60, 60, 255 };
        const glm::ivec2 LABEL_MIN  = { 10, 10 };
        const glm::ivec2 LABEL_MAX  = { 160, 30 };
    } // namespace

    FrameComposer::FrameComposer( const FrameComposerConfig& config )
        : m_config( config )
    {
    }

    Result FrameComposer::Compose( const CharacteristicRecord& record, float64_t timePoint, uint32_t width, uint32_t height, Random& rng,
                                   Ref<const RasterFrame>& outFrame )
    {
        if( width == 0 || height == 0 )
        {
            CM_ERROR( "[FrameComposer] Invalid canvas size {}x{}", width, height );
            return Result::INVALID_ARGS;
        }

        FrameStats stats;
        stats.beatPulse = Timeline::BeatPulse( timePoint, record.beatingStrength );

        // 1. Blank canvas
        Canvas canvas( width, height, BACKGROUND );

        // 2. Clusters & connections
        ClusterLayout layout = ClusterLayoutGenerator::Generate( record, width, height, rng );
        stats.clusters       = static_cast<uint32_t>( layout.centers.size() );
        stats.connections    = static_cast<uint32_t>( layout.connections.size() );
        DrawConnections( canvas, record, layout );

        // 3. Cells
        stats.cells = CellRenderer::Render( canvas, record, layout, stats.beatPulse, rng );

        // 4. Debris
        stats.debris = DebrisRenderer::Render( canvas, record, rng );

        // 5. Overlay
        float64_t day = Timeline::DayForTimePoint( timePoint );
        DrawOverlay( canvas, record, day );

        m_lastStats = stats;
        outFrame    = canvas.Finish( day, record.title );

        CM_TRACE( "[FrameComposer] Day {:.2f}: {} clusters, {} links, {} cells, {} debris", day, stats.clusters, stats.connections,
                  stats.cells.cellsPlaced, stats.debris );
        return Result::SUCCESS;
    }

    void FrameComposer::DrawConnections( Canvas& canvas, const CharacteristicRecord& record, const ClusterLayout& layout )
    {
        ColorRGBA color = ColorRGBA::From( record.colorBase, CONNECTION_ALPHA );
        for( const auto& [ i, j ]: layout.connections )
        {
            canvas.DrawLine( layout.centers[ i ], layout.centers[ j ], color, CONNECTION_WIDTH );
        }
    }

    void FrameComposer::DrawOverlay( Canvas& canvas, const CharacteristicRecord& record, float64_t day )
    {
        canvas.FillRect( LABEL_MIN, LABEL_MAX, LABEL_BOX );

        if( !m_config.drawLabels )
            return;

        std::string title = record.title;
        std::transform( title.begin(), title.end(), title.begin(), []( unsigned char c ) { return static_cast<char>( std::toupper( c ) ); } );

        canvas.DrawText( LABEL_MIN + glm::ivec2( 3, 3 ), fmt::format( "DAY {:.1f}", day ), LABEL_TEXT );
        canvas.DrawText( LABEL_MIN + glm::ivec2( 3, 11 ), title, LABEL_TEXT );
    }
} // namespace CardioMorph
