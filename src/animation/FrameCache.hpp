#pragma once
#include "CardioMorphTypes.h"
#include <map>
#include <tuple>

namespace CardioMorph
{
    /**
     * @brief Session-scoped store for rendered previews and assembled artifacts.
     *
     * Previews are keyed by the half-day index round( day * 2 ) and frame size, artifacts by
     * (range, speed, frame size). Nothing is evicted; entries live until Clear() or destruction.
     */
    class FrameCache
    {
    public:
        static int64_t PreviewKey( float64_t day );

        Ref<const RasterFrame> GetPreview( float64_t day, uint32_t width, uint32_t height ) const;
        void                   StorePreview( float64_t day, uint32_t width, uint32_t height, Ref<const RasterFrame> frame );

        Ref<const AnimationArtifact> GetArtifact( const DayRange& range, AnimationSpeed speed, uint32_t width, uint32_t height ) const;
        void StoreArtifact( const DayRange& range, AnimationSpeed speed, uint32_t width, uint32_t height,
                            Ref<const AnimationArtifact> artifact );

        size_t GetPreviewCount() const { return m_previews.size(); }
        size_t GetArtifactCount() const { return m_artifacts.size(); }

        void Clear();

    private:
        using PreviewKeyType  = std::tuple<int64_t, uint32_t, uint32_t>;
        using ArtifactKeyType = std::tuple<float64_t, float64_t, AnimationSpeed, uint32_t, uint32_t>;

        std::map<PreviewKeyType, Ref<const RasterFrame>>        m_previews;
        std::map<ArtifactKeyType, Ref<const AnimationArtifact>> m_artifacts;
    };
} // namespace CardioMorph
