#pragma once
#include "CardioMorphTypes.h"
#include <unordered_map>

namespace CardioMorph
{
    /**
     * @brief Derives the characteristic record for any fractional day by linear interpolation
     * between the bracketing anchors.
     *
     * Continuous fields and colour channels blend; title and shape are taken from the lower
     * anchor, so they change in a single step at integer days. Results are memoized per exact
     * day value for the lifetime of the interpolator.
     */
    class CharacteristicInterpolator
    {
    public:
        /**
         * @brief Computes the record for a day.
         * @param day Day in [1, 8]. Values above 8 return the day-8 anchor verbatim.
         * @param out Receives the record on success, untouched otherwise.
         * @return INVALID_ARGS for day < 1 or a non-finite day.
         */
        Result Interpolate( float64_t day, CharacteristicRecord& out );

        size_t GetCacheSize() const { return m_cache.size(); }
        void   ClearCache() { m_cache.clear(); }

        /**
         * @brief Stateless blend of two records, without validation or caching.
         * @param t Fraction in [0, 1] from lower towards upper.
         */
        static CharacteristicRecord Blend( const CharacteristicRecord& lower, const CharacteristicRecord& upper, float64_t t );

    private:
        std::unordered_map<float64_t, CharacteristicRecord> m_cache;
    };
} // namespace CardioMorph
