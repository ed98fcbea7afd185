#pragma once
#include "CardioMorphTypes.h"

namespace CardioMorph
{
    class CharacteristicInterpolator;
    class FrameComposer;
    class Random;

    struct AnimationAssemblerConfig
    {
        uint32_t frameWidth  = 400;
        uint32_t frameHeight = 300;
        bool_t   loop        = true;
    };

    /**
     * @brief Samples the day axis, renders one keyframe per sample and packs them into an artifact.
     *
     * The assembler does not own its collaborators; the facade keeps them alive for the session.
     */
    class AnimationAssembler
    {
    public:
        static constexpr float64_t SHORT_RANGE_SPAN      = 2.0;
        static constexpr uint32_t  SHORT_RANGE_KEYFRAMES = 12;
        static constexpr uint32_t  FULL_RANGE_KEYFRAMES  = 16;

        AnimationAssembler( CharacteristicInterpolator& interpolator, FrameComposer& composer, Random& rng,
                            const AnimationAssemblerConfig& config = AnimationAssemblerConfig() );

        /**
         * @brief Builds the looping animation for a day range.
         * @param range Clamped to max 8, then validated (see ValidateRange).
         * @param out Assigned only when every keyframe rendered successfully.
         * @param progress Optional, called after each keyframe with (completed, total).
         */
        Result Assemble( DayRange range, AnimationSpeed speed, Ref<const AnimationArtifact>& out,
                         const ProgressCallback& progress = nullptr );

        /**
         * @brief Renders an explicit list of days in the given order.
         * @return INVALID_ARGS for an empty list, or the first per-frame error.
         */
        Result AssembleDays( const HeapArray<float64_t>& days, AnimationSpeed speed, Ref<const AnimationArtifact>& out,
                             const ProgressCallback& progress = nullptr );

        /**
         * @brief 12 keyframes for spans up to 2 days, otherwise 16 per 7 days of span, rounded.
         */
        static uint32_t KeyframeCount( const DayRange& range );

        // count evenly spaced days over [min, max], both ends included
        static HeapArray<float64_t> SampleDays( const DayRange& range, uint32_t count );

        static uint32_t    FrameDurationMs( AnimationSpeed speed );
        static DayRange    PresetRange( DayRangePreset preset );
        static const char* ToString( AnimationSpeed speed );

        /**
         * @brief Clamps max to the last anchor day and rejects min < 1, non-finite bounds and min >= max.
         */
        static Result ValidateRange( DayRange& range );

    private:
        Result Build( const HeapArray<float64_t>& days, AnimationSpeed speed, const DayRange& range, Ref<const AnimationArtifact>& out,
                      const ProgressCallback& progress );

    private:
        CharacteristicInterpolator& m_interpolator;
        FrameComposer&              m_composer;
        Random&                     m_rng;
        AnimationAssemblerConfig    m_config;
    };
} // namespace CardioMorph
