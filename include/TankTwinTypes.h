#pragma once

#include "core/Core.h"
#include "core/Handle.h"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace TankTwin
{
    DEFINE_HANDLE( SessionHandle );

    // A and B are the cylindrical utility reservoirs (water, brine).
    // C, D and E are the frusto-conical process tanks.
    enum class TankId : uint8_t
    {
        A = 0,
        B,
        C,
        D,
        E,
        COUNT
    };

    constexpr uint32_t TANK_COUNT         = static_cast<uint32_t>( TankId::COUNT );
    constexpr uint32_t PROCESS_TANK_COUNT = 3;

    enum class VariableKind : uint8_t
    {
        LEVEL,
        CONCENTRATION
    };

    enum class ActuatorKind : uint8_t
    {
        SUPPLY_VALVE,
        WATER_PUMP,
        BRINE_PUMP,
        OUTLET_VALVE
    };

    enum class ControlChannel : uint8_t
    {
        SUPPLY_VALVE_A = 0,
        SUPPLY_VALVE_B,
        WATER_PUMP_C,
        BRINE_PUMP_C,
        OUTLET_VALVE_C,
        WATER_PUMP_D,
        BRINE_PUMP_D,
        OUTLET_VALVE_D,
        WATER_PUMP_E,
        BRINE_PUMP_E,
        OUTLET_VALVE_E,
        COUNT
    };

    constexpr uint32_t CONTROL_CHANNEL_COUNT = static_cast<uint32_t>( ControlChannel::COUNT );

    enum class SessionStatus : uint8_t
    {
        INITIALIZED,
        RUNNING,
        PAUSED,
        CLOSED
    };

    enum class IntegrationMethod : uint8_t
    {
        EULER,
        RK4
    };

    // --- Identity helpers ---

    constexpr uint32_t ToIndex( TankId id ) { return static_cast<uint32_t>( id ); }
    constexpr uint32_t ToIndex( ControlChannel channel ) { return static_cast<uint32_t>( channel ); }

    constexpr bool IsProcessTank( TankId id ) { return id == TankId::C || id == TankId::D || id == TankId::E; }

    // Index of a process tank inside per-process-tank arrays (C -> 0, D -> 1, E -> 2).
    constexpr uint32_t ProcessIndex( TankId id ) { return ToIndex( id ) - ToIndex( TankId::C ); }

    constexpr TankId TankOf( ControlChannel channel )
    {
        if( channel == ControlChannel::SUPPLY_VALVE_A )
            return TankId::A;
        if( channel == ControlChannel::SUPPLY_VALVE_B )
            return TankId::B;
        return static_cast<TankId>( ToIndex( TankId::C ) + ( ToIndex( channel ) - ToIndex( ControlChannel::WATER_PUMP_C ) ) / 3 );
    }

    constexpr ActuatorKind ActuatorOf( ControlChannel channel )
    {
        if( channel == ControlChannel::SUPPLY_VALVE_A || channel == ControlChannel::SUPPLY_VALVE_B )
            return ActuatorKind::SUPPLY_VALVE;
        switch( ( ToIndex( channel ) - ToIndex( ControlChannel::WATER_PUMP_C ) ) % 3 )
        {
            case 0:
                return ActuatorKind::WATER_PUMP;
            case 1:
                return ActuatorKind::BRINE_PUMP;
            default:
                return ActuatorKind::OUTLET_VALVE;
        }
    }

    /**
     * @brief Channel driving a given actuator of a tank.
     * Utility tanks only own a SUPPLY_VALVE; process tanks own the three others.
     */
    constexpr ControlChannel ChannelFor( TankId tank, ActuatorKind kind )
    {
        if( tank == TankId::A )
            return ControlChannel::SUPPLY_VALVE_A;
        if( tank == TankId::B )
            return ControlChannel::SUPPLY_VALVE_B;

        uint32_t offset = 0;
        if( kind == ActuatorKind::BRINE_PUMP )
            offset = 1;
        else if( kind == ActuatorKind::OUTLET_VALVE )
            offset = 2;
        return static_cast<ControlChannel>( ToIndex( ControlChannel::WATER_PUMP_C ) + ProcessIndex( tank ) * 3 + offset );
    }

    inline std::string_view toString( TankId id )
    {
        switch( id )
        {
            case TankId::A:
                return "A";
            case TankId::B:
                return "B";
            case TankId::C:
                return "C";
            case TankId::D:
                return "D";
            case TankId::E:
                return "E";
            default:
                return "?";
        }
    }

    inline std::string_view toString( VariableKind kind )
    {
        return kind == VariableKind::LEVEL ? "level" : "concentration";
    }

    inline std::string_view toString( ControlChannel channel )
    {
        switch( channel )
        {
            case ControlChannel::SUPPLY_VALVE_A:
                return "tank_a_supply_valve";
            case ControlChannel::SUPPLY_VALVE_B:
                return "tank_b_supply_valve";
            case ControlChannel::WATER_PUMP_C:
                return "tank_c_water_pump";
            case ControlChannel::BRINE_PUMP_C:
                return "tank_c_brine_pump";
            case ControlChannel::OUTLET_VALVE_C:
                return "tank_c_outlet_valve";
            case ControlChannel::WATER_PUMP_D:
                return "tank_d_water_pump";
            case ControlChannel::BRINE_PUMP_D:
                return "tank_d_brine_pump";
            case ControlChannel::OUTLET_VALVE_D:
                return "tank_d_outlet_valve";
            case ControlChannel::WATER_PUMP_E:
                return "tank_e_water_pump";
            case ControlChannel::BRINE_PUMP_E:
                return "tank_e_brine_pump";
            case ControlChannel::OUTLET_VALVE_E:
                return "tank_e_outlet_valve";
            default:
                return "unknown_channel";
        }
    }

    inline std::string_view toString( SessionStatus status )
    {
        switch( status )
        {
            case SessionStatus::INITIALIZED:
                return "INITIALIZED";
            case SessionStatus::RUNNING:
                return "RUNNING";
            case SessionStatus::PAUSED:
                return "PAUSED";
            case SessionStatus::CLOSED:
                return "CLOSED";
            default:
                return "UNKNOWN";
        }
    }

    inline std::string_view toString( IntegrationMethod method )
    {
        return method == IntegrationMethod::EULER ? "euler" : "rk4";
    }

    // --- State records ---

    struct TankState
    {
        float64_t level         = 0.0; // m
        float64_t concentration = 0.0; // kg/m^3, evolves only for C, D, E
    };

    struct PlantState
    {
        std::array<TankState, TANK_COUNT> tanks{};

        TankState&       operator[]( TankId id ) { return tanks[ ToIndex( id ) ]; }
        const TankState& operator[]( TankId id ) const { return tanks[ ToIndex( id ) ]; }
    };

    // Same layout as PlantState, holding d(level)/dt and d(concentration)/dt.
    using PlantRates = PlantState;

    struct ControlValues
    {
        std::array<float64_t, CONTROL_CHANNEL_COUNT> channels{};

        float64_t&       operator[]( ControlChannel channel ) { return channels[ ToIndex( channel ) ]; }
        const float64_t& operator[]( ControlChannel channel ) const { return channels[ ToIndex( channel ) ]; }
    };

    /**
     * @brief Consistent steady-state snapshot used as initial condition and default control target.
     * Concentrations of A and B are ignored: A always holds water, B always holds brine.
     */
    struct EquilibriumPoint
    {
        PlantState    state;
        ControlValues controls;
    };

    /**
     * @brief Operating point of the reference plant: every level at 1.5 m, process
     * concentrations at 180 kg/m^3, supply valves 0.306, pumps 0.6125, outlets half open.
     */
    inline EquilibriumPoint NominalEquilibrium()
    {
        EquilibriumPoint eq;
        for( auto& tank: eq.state.tanks )
            tank.level = 1.5;

        eq.state[ TankId::B ].concentration = 360.0;
        eq.state[ TankId::C ].concentration = 180.0;
        eq.state[ TankId::D ].concentration = 180.0;
        eq.state[ TankId::E ].concentration = 180.0;

        for( uint32_t i = 0; i < CONTROL_CHANNEL_COUNT; ++i )
        {
            ControlChannel channel = static_cast<ControlChannel>( i );
            switch( ActuatorOf( channel ) )
            {
                case ActuatorKind::SUPPLY_VALVE:
                    eq.controls[ channel ] = 0.306;
                    break;
                case ActuatorKind::WATER_PUMP:
                case ActuatorKind::BRINE_PUMP:
                    eq.controls[ channel ] = 0.6125;
                    break;
                case ActuatorKind::OUTLET_VALVE:
                    eq.controls[ channel ] = 0.5;
                    break;
            }
        }
        return eq;
    }

    struct Setpoint
    {
        TankId       tank      = TankId::C;
        VariableKind variable  = VariableKind::LEVEL;
        float64_t    value     = 0.0;
        float64_t    issueTime = 0.0; // simulated time at which the command was applied
    };

    // --- Commands ---

    enum class CommandType : uint8_t
    {
        SET_SETPOINT,
        PAUSE,
        RESUME,
        RESET,
        SET_NOISE
    };

    inline std::string_view toString( CommandType type )
    {
        switch( type )
        {
            case CommandType::SET_SETPOINT:
                return "SET_SETPOINT";
            case CommandType::PAUSE:
                return "PAUSE";
            case CommandType::RESUME:
                return "RESUME";
            case CommandType::RESET:
                return "RESET";
            case CommandType::SET_NOISE:
                return "SET_NOISE";
            default:
                return "UNKNOWN";
        }
    }

    struct Command
    {
        CommandType type = CommandType::PAUSE;

        // SET_SETPOINT
        TankId       tank     = TankId::C;
        VariableKind variable = VariableKind::LEVEL;
        float64_t    value    = 0.0;

        // SET_NOISE
        bool_t    noiseEnabled = false;
        float64_t noiseLevel   = 0.0;

        static Command SetSetpoint( TankId tank, VariableKind variable, float64_t value )
        {
            Command cmd;
            cmd.type     = CommandType::SET_SETPOINT;
            cmd.tank     = tank;
            cmd.variable = variable;
            cmd.value    = value;
            return cmd;
        }

        static Command Pause() { return Make( CommandType::PAUSE ); }
        static Command Resume() { return Make( CommandType::RESUME ); }
        static Command Reset() { return Make( CommandType::RESET ); }

        static Command SetNoise( bool_t enabled, float64_t level )
        {
            Command cmd      = Make( CommandType::SET_NOISE );
            cmd.noiseEnabled = enabled;
            cmd.noiseLevel   = level;
            return cmd;
        }

    private:
        static Command Make( CommandType type )
        {
            Command cmd;
            cmd.type = type;
            return cmd;
        }
    };

    // --- Emission ---

    struct StateSnapshot
    {
        uint64_t              sequence      = 0; // strictly increasing per session
        float64_t             simulatedTime = 0.0;
        SessionStatus         status        = SessionStatus::INITIALIZED;
        PlantState            plant;
        ControlValues         controls;
        std::vector<Setpoint> activeSetpoints;
    };

    enum class StreamEventType : uint8_t
    {
        SNAPSHOT,
        CLOSED, // terminal: session closed normally
        FAILED  // terminal: session terminated by an error (see StreamEvent::error)
    };

    struct StreamEvent
    {
        StreamEventType type = StreamEventType::SNAPSHOT;
        StateSnapshot   snapshot;
        Result          error = Result::SUCCESS;
        std::string     message;

        bool IsTerminal() const { return type != StreamEventType::SNAPSHOT; }
    };

    // --- Configuration ---

    // Upper bound on integrator sub-steps in one tick (samplingInterval * timeScale / integrationStep)
    constexpr uint64_t MAX_SUBSTEPS_PER_TICK = 1000000;

    struct CylindricalTankParams
    {
        float64_t radius     = 1.75;  // m
        float64_t maxLevel   = 3.0;   // m
        float64_t supplyGain = 0.048; // m^3/s at full valve opening
    };

    struct ConicalTankParams
    {
        float64_t baseRadius           = 0.75;                 // m, at level 0
        float64_t topRadius            = 1.25;                 // m, at maxLevel
        float64_t maxLevel             = 3.0;                  // m
        float64_t dischargeCoefficient = 0.003612189127885847; // m^2, kv / sqrt(2g) with kv = 0.016
        float64_t waterPumpGain        = 0.008;                // m^3/s at full speed
        float64_t brinePumpGain        = 0.008;                // m^3/s at full speed
    };

    struct PlantParameters
    {
        std::array<CylindricalTankParams, 2>                  utility{};
        std::array<ConicalTankParams, PROCESS_TANK_COUNT>     process{};
        float64_t                                             gravity            = 9.81;  // m/s^2
        float64_t                                             brineConcentration = 360.0; // kg/m^3 held in tank B
        float64_t                                             maxConcentration   = 360.0; // kg/m^3
        float64_t                                             levelEpsilon       = 1e-6;  // m

        const CylindricalTankParams& Utility( TankId id ) const { return utility[ ToIndex( id ) ]; }
        CylindricalTankParams&       Utility( TankId id ) { return utility[ ToIndex( id ) ]; }
        const ConicalTankParams&     Process( TankId id ) const { return process[ ProcessIndex( id ) ]; }
        ConicalTankParams&           Process( TankId id ) { return process[ ProcessIndex( id ) ]; }

        float64_t MaxLevel( TankId id ) const { return IsProcessTank( id ) ? Process( id ).maxLevel : Utility( id ).maxLevel; }
    };

    /**
     * @brief Proportional gains per control channel, in channel units per unit of error.
     * Negative gains close an actuator when the measurement is below target (outlet valves).
     */
    struct ControllerGains
    {
        std::array<float64_t, CONTROL_CHANNEL_COUNT> kp{};

        float64_t&       operator[]( ControlChannel channel ) { return kp[ ToIndex( channel ) ]; }
        const float64_t& operator[]( ControlChannel channel ) const { return kp[ ToIndex( channel ) ]; }

        static ControllerGains Default()
        {
            ControllerGains gains;
            for( uint32_t i = 0; i < CONTROL_CHANNEL_COUNT; ++i )
            {
                ControlChannel channel = static_cast<ControlChannel>( i );
                switch( ActuatorOf( channel ) )
                {
                    case ActuatorKind::SUPPLY_VALVE:
                        gains[ channel ] = 0.5;
                        break;
                    case ActuatorKind::WATER_PUMP:
                        gains[ channel ] = 2.0;
                        break;
                    case ActuatorKind::BRINE_PUMP:
                        gains[ channel ] = 0.005;
                        break;
                    case ActuatorKind::OUTLET_VALVE:
                        gains[ channel ] = -1.0;
                        break;
                }
            }
            return gains;
        }
    };

    /**
     * @brief Per-session parameters supplied by the caller of CreateSession.
     */
    struct SessionDesc
    {
        EquilibriumPoint equilibrium      = NominalEquilibrium();
        float64_t        samplingInterval = 1.0;  // s of wall clock between snapshots
        bool_t           noiseEnabled     = false;
        float64_t        noiseLevel       = 0.01; // relative standard deviation
    };

    /**
     * @brief Engine-wide defaults applied to every session.
     */
    struct TankTwinConfig
    {
        float64_t         integrationStep   = 0.1; // s of simulated time per integrator sub-step
        IntegrationMethod integrationMethod = IntegrationMethod::RK4;
        float64_t         timeScale         = 1.0; // simulated seconds per wall-clock second
        uint32_t          streamCapacity    = 64;  // buffered events per subscriber
        uint64_t          noiseSeed         = 0x5EED;
        PlantParameters   plant;
        ControllerGains   gains = ControllerGains::Default();
    };

} // namespace TankTwin
