#pragma once
#include "CardioMorphTypes.h"
#include <glm/glm.hpp>
#include <utility>

namespace CardioMorph
{
    class Random;

    /**
     * @brief Spatial grouping of the population: cluster centres plus the inter-cluster
     * connection graph. Edges are unordered index pairs stored as (i, j) with i < j.
     */
    struct ClusterLayout
    {
        HeapArray<glm::vec2>                     centers;
        HeapArray<std::pair<uint32_t, uint32_t>> connections;
    };

    class ClusterLayoutGenerator
    {
    public:
        static constexpr uint32_t  MIN_CLUSTERS         = 2;
        static constexpr uint32_t  MAX_CLUSTERS         = 3;
        static constexpr float32_t CLUSTER_MARGIN       = 100.0f;
        static constexpr float64_t CONNECTION_THRESHOLD = 0.4;

        /**
         * @brief Number of clusters for a record: round(clustering * 3) clamped to [2, 3].
         */
        static uint32_t ClusterCount( const CharacteristicRecord& record );

        /**
         * @brief Places cluster centres inside the inset canvas rectangle and draws the
         * connection graph. No edges are attempted when connection <= CONNECTION_THRESHOLD.
         */
        static ClusterLayout Generate( const CharacteristicRecord& record, uint32_t width, uint32_t height, Random& rng );

    private:
        static float32_t SampleAxis( uint32_t extent, Random& rng );
    };
} // namespace CardioMorph
