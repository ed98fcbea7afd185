#pragma once
#include "CardioMorphTypes.h"

namespace CardioMorph
{
    /**
     * @brief Destination for a finished animation. The container format is up to the implementation.
     */
    class IAnimationSink
    {
    public:
        virtual ~IAnimationSink() = default;

        /**
         * @brief Writes every frame in order, each displayed for artifact.frameDurationMs.
         * @return INVALID_ARGS for an empty or inconsistent artifact, FAIL on I/O errors.
         */
        virtual Result Write( const AnimationArtifact& artifact ) = 0;
    };
} // namespace CardioMorph
