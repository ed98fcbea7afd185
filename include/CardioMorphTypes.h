#pragma once

#include "core/Core.h"
#include <functional>
#include <string>

namespace CardioMorph
{
    class Log;
    class FileSystem;

    struct ColorRGB
    {
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;

        bool operator==( const ColorRGB& other ) const { return r == other.r && g == other.g && b == other.b; }
        bool operator!=( const ColorRGB& other ) const { return !( *this == other ); }
    };

    /**
     * @brief Morphology stage of the cell population. Categorical, never blended between days.
     */
    enum class CellShape
    {
        ROUND,
        SLIGHTLY_ELONGATED,
        ELONGATED,
        WELL_ELONGATED,
        FULLY_ELONGATED,
        FRAGMENTING,
        FRAGMENTED,
    };

    /**
     * @brief Full parameter set describing the population's appearance and behaviour at one moment.
     * Continuous fields are in [0, 1] except elongation (>= 1).
     */
    struct CharacteristicRecord
    {
        std::string title;
        CellShape   shape = CellShape::ROUND;

        float64_t elongation            = 1.0;
        float64_t alignment             = 0.0;
        float64_t connection            = 0.0;
        float64_t sarcomereOrganization = 0.0;
        float64_t beatingStrength       = 0.0;
        float64_t beatingSync           = 0.0;
        float64_t nucleusSize           = 0.0;
        float64_t debrisLevel           = 0.0;
        float64_t cellClustering        = 0.0;

        ColorRGB  colorBase;
        float64_t cellCount = 0.0;
    };

    enum class AnimationSpeed
    {
        SLOW,
        MEDIUM,
        FAST,
    };

    /**
     * @brief Day ranges offered by the original control panel.
     */
    enum class DayRangePreset
    {
        ALL_DAYS,
        EARLY,
        MIDDLE,
        LATE,
    };

    struct DayRange
    {
        float64_t min = 1.0;
        float64_t max = 8.0;

        float64_t Span() const { return max - min; }
    };

    /**
     * @brief Completed RGB8 raster. Immutable once constructed.
     */
    class CM_API RasterFrame
    {
    public:
        RasterFrame( uint32_t width, uint32_t height, HeapArray<uint8_t> pixels, float64_t day, std::string title );

        uint32_t                  GetWidth() const { return m_width; }
        uint32_t                  GetHeight() const { return m_height; }
        const HeapArray<uint8_t>& GetPixels() const { return m_pixels; }
        float64_t                 GetDay() const { return m_day; }
        const std::string&        GetTitle() const { return m_title; }

        // Returns black for out-of-range coordinates
        ColorRGB GetPixel( uint32_t x, uint32_t y ) const;

    private:
        uint32_t           m_width;
        uint32_t           m_height;
        HeapArray<uint8_t> m_pixels; // Row-major RGB8, width * height * 3 bytes
        float64_t          m_day;
        std::string        m_title;
    };

    /**
     * @brief Ordered keyframes with one uniform display duration and a loop flag.
     */
    struct AnimationArtifact
    {
        HeapArray<Ref<const RasterFrame>> frames;
        uint32_t                          frameDurationMs = 0;
        bool_t                            loop            = true;
        DayRange                          range;
        AnimationSpeed                    speed = AnimationSpeed::MEDIUM;
    };

    /**
     * @brief Invoked after each keyframe completes: (completed, total).
     */
    using ProgressCallback = std::function<void( uint32_t, uint32_t )>;

    struct CardioMorphConfig
    {
        uint32_t    frameWidth      = 400;
        uint32_t    frameHeight     = 300;
        uint64_t    seed            = 0; // 0 = non-deterministic
        bool_t      enableCache     = true;
        bool_t      drawLabels      = true;
        const char* outputDirectory = nullptr; // nullptr = current directory
        bool_t      debugMode       = false;
    };

} // namespace CardioMorph
