#include "control/ProportionalController.hpp"

#include <algorithm>

namespace TankTwin
{
    ProportionalController::ProportionalController( const EquilibriumPoint& equilibrium, const ControllerGains& gains )
        : m_equilibrium( equilibrium )
        , m_gains( gains )
    {
    }

    VariableKind ProportionalController::RegulatedVariable( ControlChannel channel )
    {
        return ActuatorOf( channel ) == ActuatorKind::BRINE_PUMP ? VariableKind::CONCENTRATION : VariableKind::LEVEL;
    }

    void ProportionalController::Update( const PlantState& state, const SetpointTable& setpoints, ControlValues& out )
    {
        for( uint32_t i = 0; i < CONTROL_CHANNEL_COUNT; ++i )
        {
            ControlChannel channel  = static_cast<ControlChannel>( i );
            TankId         tank     = TankOf( channel );
            VariableKind   variable = RegulatedVariable( channel );

            float64_t measured = variable == VariableKind::LEVEL ? state[ tank ].level : state[ tank ].concentration;

            float64_t target = variable == VariableKind::LEVEL ? m_equilibrium.state[ tank ].level : m_equilibrium.state[ tank ].concentration;
            if( auto setpoint = setpoints.Find( tank, variable ) )
                target = setpoint->value;

            float64_t base = m_equilibrium.controls[ channel ];
            out[ channel ] = std::clamp( base + m_gains[ channel ] * ( target - measured ), 0.0, 1.0 );
        }
    }
} // namespace TankTwin
