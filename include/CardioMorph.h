#pragma once
#include "CardioMorphTypes.h"

#include "core/Core.h"
#include <string>

namespace CardioMorph
{

    /**
     * @brief Session facade: owns the interpolator, composer, assembler, frame cache and output
     * file system, and exposes the preview / animation / export operations.
     */
    class CM_API CardioMorph
    {
    public:
        CardioMorph();
        ~CardioMorph();

        Result Initialize( const CardioMorphConfig& config );
        void   Shutdown();

        /**
         * @brief Interpolated characteristics for a fractional day.
         * @return INVALID_ARGS for day < 1 or a non-finite day.
         */
        Result GetCharacteristics( float64_t day, CharacteristicRecord& outRecord );

        /**
         * @brief Renders the still preview for a day, rounded to the nearest half day.
         * Repeated requests for the same half day return the cached frame when caching is enabled.
         */
        Result RenderPreview( float64_t day, Ref<const RasterFrame>& outFrame );

        /**
         * @brief Builds the looping animation for a day range.
         * @param range max > 8 is clamped; min < 1 or min >= max is INVALID_ARGS.
         */
        Result GenerateAnimation( const DayRange& range, AnimationSpeed speed, Ref<const AnimationArtifact>& outArtifact,
                                  const ProgressCallback& progress = nullptr );

        // Paths are relative to the configured output directory unless absolute
        Result ExportAnimation( const AnimationArtifact& artifact, const std::string& path );
        Result ExportFrame( const RasterFrame& frame, const std::string& path );

        bool IsInitialized() const;

        static DayRange GetPresetRange( DayRangePreset preset );

    public:
        FileSystem*              GetFileSystem() const;
        const CardioMorphConfig& GetConfig() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace CardioMorph
