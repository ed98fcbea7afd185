#pragma once
#include <cstdint>
#include <random>

namespace CardioMorph
{
    /**
     * @brief Explicit random source for every stochastic drawing decision.
     * Seeded instances replay the same sequence of draws, so tests can pin structure
     * (counts, bounds, branch selection) without relying on exact pixels.
     */
    class Random
    {
    public:
        // Non-deterministic seed
        Random()
            : m_seed( std::random_device{}() )
            , m_engine( m_seed )
        {
        }

        explicit Random( uint64_t seed )
            : m_seed( seed )
            , m_engine( seed )
        {
        }

        /**
         * @brief Uniform value in [0, 1).
         */
        double Float() { return std::uniform_real_distribution<double>( 0.0, 1.0 )( m_engine ); }

        /**
         * @brief Bernoulli trial, true with the given probability.
         * Probabilities <= 0 never succeed, >= 1 always succeed.
         */
        bool Chance( double probability ) { return Float() < probability; }

        /**
         * @brief Uniform index in [0, count). count must be > 0.
         */
        uint32_t Index( uint32_t count ) { return std::uniform_int_distribution<uint32_t>( 0, count - 1 )( m_engine ); }

        uint64_t GetSeed() const { return m_seed; }

    private:
        uint64_t        m_seed;
        std::mt19937_64 m_engine;
    };
} // namespace CardioMorph
