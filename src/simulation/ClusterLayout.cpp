#include "simulation/ClusterLayout.hpp"

#include "core/Log.h"
#include "core/Random.hpp"
#include <algorithm>
#include <cmath>

namespace CardioMorph
{
    uint32_t ClusterLayoutGenerator::ClusterCount( const CharacteristicRecord& record )
    {
        long count = std::lround( record.cellClustering * 3.0 );
        return static_cast<uint32_t>( std::clamp<long>( count, MIN_CLUSTERS, MAX_CLUSTERS ) );
    }

    float32_t ClusterLayoutGenerator::SampleAxis( uint32_t extent, Random& rng )
    {
        float32_t size = static_cast<float32_t>( extent );

        // Small canvases collapse the inset to the centre line
        if( size <= 2.0f * CLUSTER_MARGIN )
            return size * 0.5f;

        return CLUSTER_MARGIN + static_cast<float32_t>( rng.Float() ) * ( size - 2.0f * CLUSTER_MARGIN );
    }

    ClusterLayout ClusterLayoutGenerator::Generate( const CharacteristicRecord& record, uint32_t width, uint32_t height, Random& rng )
    {
        ClusterLayout layout;

        uint32_t clusterCount = ClusterCount( record );
        layout.centers.reserve( clusterCount );
        for( uint32_t i = 0; i < clusterCount; ++i )
        {
            float32_t x = SampleAxis( width, rng );
            float32_t y = SampleAxis( height, rng );
            layout.centers.emplace_back( x, y );
        }

        // Step function: below the threshold no edge is even attempted
        if( record.connection > CONNECTION_THRESHOLD )
        {
            for( uint32_t i = 0; i < clusterCount; ++i )
            {
                for( uint32_t j = i + 1; j < clusterCount; ++j )
                {
                    if( rng.Chance( record.connection ) )
                        layout.connections.emplace_back( i, j );
                }
            }
        }

        CM_TRACE( "[ClusterLayout] {} clusters, {} connections", layout.centers.size(), layout.connections.size() );
        return layout;
    }
} // namespace CardioMorph
