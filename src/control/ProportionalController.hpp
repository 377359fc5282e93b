#pragma once
#include "control/Controller.hpp"

namespace TankTwin
{
    /**
     * @brief control = clamp( base + Kp * ( target - measured ), 0, 1 ) on every channel.
     *
     * Loop pairing:
     *  - supply valve A/B   -> level of A/B
     *  - water pump X       -> level of X
     *  - brine pump X       -> concentration of X
     *  - outlet valve X     -> level of X
     */
    class ProportionalController : public Controller
    {
    public:
        ProportionalController( const EquilibriumPoint& equilibrium, const ControllerGains& gains );

        void Update( const PlantState& state, const SetpointTable& setpoints, ControlValues& out ) override;

        // Variable regulated by a channel
        static VariableKind RegulatedVariable( ControlChannel channel );

    private:
        EquilibriumPoint m_equilibrium;
        ControllerGains  m_gains;
    };
} // namespace TankTwin
