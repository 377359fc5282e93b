#pragma once
#include "TankTwinTypes.h"
#include <optional>

namespace TankTwin
{
    class SetpointTable;

    /**
     * @brief Control law interface.
     * A session owns exactly one controller and calls Update once per tick with the
     * true (noise-free) plant state.
     */
    class Controller
    {
    public:
        virtual ~Controller() = default;

        /**
         * @brief Computes every actuator value, each in [0, 1].
         * @param state True plant state.
         * @param setpoints Active operator targets; missing targets fall back to the equilibrium.
         * @param out Receives the new control values.
         */
        virtual void Update( const PlantState& state, const SetpointTable& setpoints, ControlValues& out ) = 0;

        /**
         * @brief Drops any internal memory (called on session reset).
         */
        virtual void Reset() {}
    };

    /**
     * @brief Active targets, at most one per (tank, variable).
     */
    class SetpointTable
    {
    public:
        // Replaces any previous target for the same (tank, variable)
        void Set( const Setpoint& setpoint ) { m_entries[ Slot( setpoint.tank, setpoint.variable ) ] = setpoint; }

        std::optional<Setpoint> Find( TankId tank, VariableKind variable ) const { return m_entries[ Slot( tank, variable ) ]; }

        void Clear()
        {
            for( auto& entry: m_entries )
                entry.reset();
        }

        // Ordered by tank, level before concentration
        std::vector<Setpoint> GetActive() const
        {
            std::vector<Setpoint> active;
            for( const auto& entry: m_entries )
            {
                if( entry )
                    active.push_back( *entry );
            }
            return active;
        }

    private:
        static uint32_t Slot( TankId tank, VariableKind variable ) { return ToIndex( tank ) * 2 + static_cast<uint32_t>( variable ); }

        std::array<std::optional<Setpoint>, TANK_COUNT * 2> m_entries{};
    };
} // namespace TankTwin
