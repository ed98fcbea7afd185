#include "renderer/CellRenderer.hpp"

#include "biology/Characteristics.hpp"
#include "core/Log.h"
#include "core/Random.hpp"
#include "renderer/Canvas.hpp"
#include "simulation/ClusterLayout.hpp"
#include <algorithm>
#include <cmath>
#include <glm/gtc/constants.hpp>

namespace CardioMorph
{
    namespace
    {
        const ColorRGBA NUCLEUS_COLOR = { 102, 102, 204, CellRenderer::NUCLEUS_ALPHA };

        uint8_t Darken( uint8_t channel, uint8_t amount )
        {
            return channel > amount ? static_cast<uint8_t>( channel - amount ) : 0;
        }
    } // namespace

    uint32_t CellRenderer::ReducedCellCount( const CharacteristicRecord& record )
    {
        long scaled = std::lround( record.cellCount * CELL_COUNT_SCALE );
        return static_cast<uint32_t>( std::clamp<long>( scaled, 0, MAX_CELLS_PER_FRAME ) );
    }

    float64_t CellRenderer::BeatEffect( const CharacteristicRecord& record, float64_t beatPulse )
    {
        return 1.0 + beatPulse * record.beatingStrength * BEAT_AMPLITUDE;
    }

    float64_t CellRenderer::ClusterRadius( const CharacteristicRecord& record )
    {
        return 20.0 + 15.0 * record.cellClustering;
    }

    CellPassStats CellRenderer::Render( Canvas& canvas, const CharacteristicRecord& record, const ClusterLayout& layout, float64_t beatPulse,
                                       Random& rng )
    {
        CellPassStats stats;

        uint32_t target = ReducedCellCount( record );
        if( target == 0 )
            return stats;

        if( layout.centers.empty() )
        {
            CM_WARN( "[CellRenderer] Layout has no clusters, skipping {} cells.", target );
            return stats;
        }

        float64_t beatEffect   = BeatEffect( record, beatPulse );
        float64_t radius       = ClusterRadius( record );
        size_t    clustersUsed = 0;

        while( stats.cellsPlaced < target )
        {
            // Visit every cluster once, then spread the remainder randomly
            glm::vec2 center;
            if( clustersUsed < layout.centers.size() )
                center = layout.centers[ clustersUsed++ ];
            else
                center = layout.centers[ rng.Index( static_cast<uint32_t>( layout.centers.size() ) ) ];

            uint32_t batch = std::min( BATCH_SIZE, target - stats.cellsPlaced );
            stats.batches++;

            for( uint32_t i = 0; i < batch; ++i )
            {
                float64_t angle    = rng.Float() * 2.0 * glm::pi<float64_t>();
                float64_t distance = rng.Float() * radius;

                glm::vec2 position( center.x + static_cast<float32_t>( std::cos( angle ) * distance ),
                                    center.y + static_cast<float32_t>( std::sin( angle ) * distance ) );

                stats.maxOffset = std::max( stats.maxOffset, glm::length( position - center ) );

                DrawCell( canvas, record, position, beatEffect, rng, stats );
                stats.cellsPlaced++;
            }
        }

        return stats;
    }

    void CellRenderer::DrawCell( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, float64_t beatEffect, Random& rng,
                                 CellPassStats& stats )
    {
        float64_t width  = BASE_CELL_SIZE * beatEffect;
        float64_t height = width;

        if( IsElongatedFamily( record.shape ) )
        {
            height = BASE_CELL_SIZE * record.elongation * beatEffect;

            // Imperfect alignment: some cells lie across the main axis
            if( rng.Chance( record.alignment ) )
                std::swap( width, height );
        }
        else if( IsFragmentFamily( record.shape ) )
        {
            if( rng.Chance( FRAGMENT_PROBABILITY ) && record.debrisLevel > FRAGMENT_DEBRIS_LEVEL )
            {
                DrawFragments( canvas, record, position, rng, stats );
                return;
            }

            width  = BASE_CELL_SIZE * beatEffect * FRAGMENT_SHRINK;
            height = BASE_CELL_SIZE * record.elongation * beatEffect * FRAGMENT_SHRINK;
        }

        glm::vec2 size( static_cast<float32_t>( width ), static_cast<float32_t>( height ) );

        canvas.FillEllipse( position, position + size, ColorRGBA::From( record.colorBase, CELL_ALPHA ) );
        stats.bodies++;
        stats.bodySizes.push_back( size );

        if( record.sarcomereOrganization > SARCOMERE_VISIBLE )
            DrawSarcomeres( canvas, record, position, size, rng, stats );

        DrawNucleus( canvas, record, position, size, rng, stats );
    }

    void CellRenderer::DrawFragments( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, Random& rng, CellPassStats& stats )
    {
        ColorRGBA color = ColorRGBA::From( record.colorBase, FRAGMENT_ALPHA );

        for( uint32_t i = 0; i < FRAGMENTS_PER_CELL; ++i )
        {
            float32_t x    = position.x + static_cast<float32_t>( rng.Float() * 15.0 - 7.0 );
            float32_t y    = position.y + static_cast<float32_t>( rng.Float() * 15.0 - 7.0 );
            float32_t size = static_cast<float32_t>( 4.0 + rng.Float() * 4.0 );

            canvas.FillEllipse( { x, y }, { x + size, y + size }, color );
            stats.fragments++;
        }

        stats.fragmentedCells++;
    }

    void CellRenderer::DrawSarcomeres( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, glm::vec2 size, Random& rng,
                                       CellPassStats& stats )
    {
        ColorRGBA color = { Darken( record.colorBase.r, 50 ), Darken( record.colorBase.g, 50 ), Darken( record.colorBase.b, 50 ), SARCOMERE_ALPHA };

        float32_t length = size.x * 0.8f;
        float32_t start  = position.x + ( size.x - length ) * 0.5f;
        float32_t end    = start + length;

        for( uint32_t i = 0; i < SARCOMERE_LINES; ++i )
        {
            float32_t y = position.y + size.y * static_cast<float32_t>( i + 1 ) / static_cast<float32_t>( SARCOMERE_LINES + 1 );

            // Disorganized striations break up at random
            if( record.sarcomereOrganization < SARCOMERE_ORGANIZED && rng.Float() > 0.5 )
            {
                const uint32_t segments = 2;
                for( uint32_t s = 0; s < segments; ++s )
                {
                    if( rng.Chance( 0.7 ) )
                    {
                        float32_t segStart = start + length * static_cast<float32_t>( s ) / segments;
                        float32_t segEnd   = start + length * static_cast<float32_t>( s + 1 ) / segments;
                        canvas.DrawLine( { segStart, y }, { segEnd, y }, color );
                    }
                }
                stats.brokenLines++;
            }
            else
            {
                canvas.DrawLine( { start, y }, { end, y }, color );
            }
            stats.sarcomereLines++;
        }
    }

    void CellRenderer::DrawNucleus( Canvas& canvas, const CharacteristicRecord& record, glm::vec2 position, glm::vec2 size, Random& rng,
                                    CellPassStats& stats )
    {
        // Not every nucleus lies in the imaged plane
        if( !rng.Chance( NUCLEUS_PROBABILITY ) )
            return;

        glm::vec2 nucleusSize = size * static_cast<float32_t>( record.nucleusSize );
        glm::vec2 origin      = position + ( size - nucleusSize ) * 0.5f;

        canvas.FillEllipse( origin, origin + nucleusSize, NUCLEUS_COLOR );
        stats.nuclei++;
    }
} // namespace CardioMorph
