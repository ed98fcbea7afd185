#pragma once
#include "CardioMorphTypes.h"

namespace CardioMorph
{
    /**
     * @brief Serializes frames to PNG and Animated PNG (APNG).
     *
     * Pixel data is written as 8-bit truecolour, filter type 0 on every scanline, deflated with
     * zlib. Animations carry one acTL chunk (frame count, play count 0 = infinite loop) and one
     * fcTL per frame whose delay is frameDurationMs / 1000 s. Frame 0 is stored in IDAT so plain
     * PNG decoders still show the first keyframe.
     */
    class PngEncoder
    {
    public:
        static constexpr uint8_t SIGNATURE[ 8 ] = { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' };

        static Result EncodeFrame( const RasterFrame& frame, HeapArray<uint8_t>& outData );

        /**
         * @brief Encodes an artifact as APNG.
         * @return INVALID_ARGS for an empty artifact, null frames, frames whose size differs from
         * the first one, or a duration that does not fit the 16-bit delay numerator.
         */
        static Result EncodeAnimation( const AnimationArtifact& artifact, HeapArray<uint8_t>& outData );

    private:
        static Result Deflate( const RasterFrame& frame, HeapArray<uint8_t>& outData );
    };
} // namespace CardioMorph
