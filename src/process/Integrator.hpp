#pragma once
#include "process/ProcessModel.hpp"

namespace TankTwin
{
    /**
     * @brief Number of values pulled back into their physical range.
     */
    struct ClampStats
    {
        uint64_t levelClamps         = 0;
        uint64_t concentrationClamps = 0;
    };

    /**
     * @brief Advances a plant state by one fixed simulated increment.
     * The result is always finite and within bounds, or the call fails with
     * Result::DIVERGED and leaves the state untouched.
     */
    class Integrator
    {
    public:
        explicit Integrator( const ProcessModel& model );
        virtual ~Integrator() = default;

        Result Step( PlantState& state, const ControlValues& controls, float64_t dt );

        virtual IntegrationMethod GetMethod() const = 0;

        const ClampStats& GetClampStats() const { return m_clampStats; }
        void              ResetClampStats() { m_clampStats = {}; }

    protected:
        /**
         * @brief Computes the provisional (unclamped) next state.
         * @return false if any intermediate rate is non-finite.
         */
        virtual bool Advance( const PlantState& state, const ControlValues& controls, float64_t dt, PlantState& next ) const = 0;

        const ProcessModel& m_model;

    private:
        void Clamp( PlantState& state );

        ClampStats m_clampStats;
    };

    class EulerIntegrator : public Integrator
    {
    public:
        using Integrator::Integrator;

        IntegrationMethod GetMethod() const override { return IntegrationMethod::EULER; }

    protected:
        bool Advance( const PlantState& state, const ControlValues& controls, float64_t dt, PlantState& next ) const override;
    };

    class RK4Integrator : public Integrator
    {
    public:
        using Integrator::Integrator;

        IntegrationMethod GetMethod() const override { return IntegrationMethod::RK4; }

    protected:
        bool Advance( const PlantState& state, const ControlValues& controls, float64_t dt, PlantState& next ) const override;
    };

    Scope<Integrator> CreateIntegrator( IntegrationMethod method, const ProcessModel& model );

} // namespace TankTwin
