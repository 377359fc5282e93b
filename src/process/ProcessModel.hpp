#pragma once
#include "TankTwinTypes.h"

namespace TankTwin
{
    /**
     * @brief Mass-balance model of the five-tank mixing plant.
     * Stateless: every call maps (state, controls) to the time derivative of the state.
     */
    class ProcessModel
    {
    public:
        explicit ProcessModel( const PlantParameters& params );

        /**
         * @brief Rates of change of every level and process concentration.
         * Utility concentrations have a zero rate. The result is not checked for
         * finiteness; callers treat a non-finite rate as divergence.
         */
        PlantRates ComputeRates( const PlantState& state, const ControlValues& controls ) const;

        // --- Geometry helpers (exposed for tests and validation) ---
        float64_t ConeRadius( TankId id, float64_t level ) const;
        float64_t CrossSection( TankId id, float64_t level ) const;
        float64_t Volume( TankId id, float64_t level ) const;
        float64_t OutletFlow( TankId id, float64_t level, float64_t opening ) const;

        const PlantParameters& GetParameters() const { return m_params; }

    private:
        PlantParameters m_params;
    };
} // namespace TankTwin
