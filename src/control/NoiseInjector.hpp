#pragma once
#include "TankTwinTypes.h"
#include <random>

namespace TankTwin
{
    /**
     * @brief Multiplicative Gaussian measurement noise applied to reported values.
     * reported = true * ( 1 + level * N(0,1) ), clamped to the physical bounds.
     */
    class NoiseInjector
    {
    public:
        NoiseInjector( const PlantParameters& params, uint64_t seed );

        void Configure( bool_t enabled, float64_t level );

        /**
         * @brief Returns a perturbed copy; the input is never modified.
         * Perturbs every level and the process-tank concentrations.
         */
        PlantState Apply( const PlantState& trueState );

    private:
        float64_t Perturb( float64_t value, float64_t upperBound );

        PlantParameters                  m_params;
        bool_t                           m_enabled = false;
        float64_t                        m_level   = 0.0;
        std::mt19937_64                  m_engine;
        std::normal_distribution<double> m_normal{ 0.0, 1.0 };
    };
} // namespace TankTwin
