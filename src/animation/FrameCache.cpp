#include "animation/FrameCache.hpp"

#include "core/Log.h"
#include <cmath>

namespace CardioMorph
{
    int64_t FrameCache::PreviewKey( float64_t day ) { return static_cast<int64_t>( std::llround( day * 2.0 ) ); }

    Ref<const RasterFrame> FrameCache::GetPreview( float64_t day, uint32_t width, uint32_t height ) const
    {
        auto it = m_previews.find( PreviewKeyType( PreviewKey( day ), width, height ) );
        if( it == m_previews.end() )
            return nullptr;

        return it->second;
    }

    void FrameCache::StorePreview( float64_t day, uint32_t width, uint32_t height, Ref<const RasterFrame> frame )
    {
        if( !frame )
            return;

        m_previews[ PreviewKeyType( PreviewKey( day ), width, height ) ] = std::move( frame );
    }

    Ref<const AnimationArtifact> FrameCache::GetArtifact( const DayRange& range, AnimationSpeed speed, uint32_t width, uint32_t height ) const
    {
        auto it = m_artifacts.find( ArtifactKeyType( range.min, range.max, speed, width, height ) );
        if( it == m_artifacts.end() )
            return nullptr;

        return it->second;
    }

    void FrameCache::StoreArtifact( const DayRange& range, AnimationSpeed speed, uint32_t width, uint32_t height,
                                    Ref<const AnimationArtifact> artifact )
    {
        if( !artifact )
            return;

        m_artifacts[ ArtifactKeyType( range.min, range.max, speed, width, height ) ] = std::move( artifact );
    }

    void FrameCache::Clear()
    {
        CM_TRACE( "[FrameCache] Dropping {} previews and {} artifacts", m_previews.size(), m_artifacts.size() );
        m_previews.clear();
        m_artifacts.clear();
    }
} // namespace CardioMorph
