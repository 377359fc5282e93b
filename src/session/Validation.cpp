#include "session/Validation.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace TankTwin
{
    namespace
    {
        bool InRange( float64_t value, float64_t lo, float64_t hi ) { return std::isfinite( value ) && value >= lo && value <= hi; }

        bool NonNegative( float64_t value ) { return std::isfinite( value ) && value >= 0.0; }

        bool Positive( float64_t value ) { return std::isfinite( value ) && value > 0.0; }

        Result Reject( std::string& reason, std::string message )
        {
            reason = std::move( message );
            return Result::INVALID_ARGS;
        }
    } // namespace

    Result ValidateConfig( const TankTwinConfig& config, std::string& reason )
    {
        if( !Positive( config.integrationStep ) )
            return Reject( reason, fmt::format( "integration step must be positive, got {}", config.integrationStep ) );
        if( !Positive( config.timeScale ) )
            return Reject( reason, fmt::format( "time scale must be positive, got {}", config.timeScale ) );
        if( config.streamCapacity == 0 )
            return Reject( reason, "stream capacity must be at least 1" );
        if( config.integrationMethod != IntegrationMethod::EULER && config.integrationMethod != IntegrationMethod::RK4 )
            return Reject( reason, "unknown integration method" );

        const PlantParameters& plant = config.plant;
        for( TankId id: { TankId::A, TankId::B } )
        {
            const CylindricalTankParams& p = plant.Utility( id );
            if( !NonNegative( p.radius ) || !Positive( p.maxLevel ) || !NonNegative( p.supplyGain ) )
                return Reject( reason, fmt::format( "invalid geometry for tank {}", toString( id ) ) );
        }
        for( TankId id: { TankId::C, TankId::D, TankId::E } )
        {
            const ConicalTankParams& p = plant.Process( id );
            if( !NonNegative( p.baseRadius ) || !NonNegative( p.topRadius ) || !Positive( p.maxLevel ) || !NonNegative( p.dischargeCoefficient ) ||
                !NonNegative( p.waterPumpGain ) || !NonNegative( p.brinePumpGain ) )
                return Reject( reason, fmt::format( "invalid geometry for tank {}", toString( id ) ) );
        }
        if( !Positive( plant.gravity ) || !NonNegative( plant.levelEpsilon ) || !Positive( plant.maxConcentration ) ||
            !InRange( plant.brineConcentration, 0.0, plant.maxConcentration ) )
            return Reject( reason, "invalid plant constants" );

        for( float64_t kp: config.gains.kp )
        {
            if( !std::isfinite( kp ) )
                return Reject( reason, "controller gains must be finite" );
        }
        return Result::SUCCESS;
    }

    Result ValidateSessionDesc( const SessionDesc& desc, const TankTwinConfig& config, std::string& reason )
    {
        const PlantParameters& plant = config.plant;

        if( !Positive( desc.samplingInterval ) )
            return Reject( reason, fmt::format( "sampling interval must be positive, got {}", desc.samplingInterval ) );

        float64_t substeps = desc.samplingInterval * config.timeScale / config.integrationStep;
        if( !std::isfinite( substeps ) || substeps > static_cast<float64_t>( MAX_SUBSTEPS_PER_TICK ) )
            return Reject( reason, fmt::format( "sampling interval {}s needs {} integration steps per tick (limit {})", desc.samplingInterval, substeps,
                                                MAX_SUBSTEPS_PER_TICK ) );
        if( !NonNegative( desc.noiseLevel ) )
            return Reject( reason, fmt::format( "noise level must be non-negative, got {}", desc.noiseLevel ) );

        const PlantState& state = desc.equilibrium.state;
        for( uint32_t i = 0; i < TANK_COUNT; ++i )
        {
            TankId id = static_cast<TankId>( i );
            if( !InRange( state[ id ].level, 0.0, plant.MaxLevel( id ) ) )
                return Reject( reason, fmt::format( "equilibrium level of tank {} out of range: {}", toString( id ), state[ id ].level ) );
            if( IsProcessTank( id ) && !InRange( state[ id ].concentration, 0.0, plant.maxConcentration ) )
                return Reject( reason,
                               fmt::format( "equilibrium concentration of tank {} out of range: {}", toString( id ), state[ id ].concentration ) );
        }

        for( uint32_t i = 0; i < CONTROL_CHANNEL_COUNT; ++i )
        {
            ControlChannel channel = static_cast<ControlChannel>( i );
            if( !InRange( desc.equilibrium.controls[ channel ], 0.0, 1.0 ) )
                return Reject( reason, fmt::format( "equilibrium control {} out of [0, 1]: {}", toString( channel ),
                                                    desc.equilibrium.controls[ channel ] ) );
        }
        return Result::SUCCESS;
    }

    Result ValidateCommand( const Command& command, const PlantParameters& plant, std::string& reason )
    {
        switch( command.type )
        {
            case CommandType::SET_SETPOINT:
            {
                if( ToIndex( command.tank ) >= TANK_COUNT )
                    return Reject( reason, "setpoint names an unknown tank" );
                if( command.variable == VariableKind::LEVEL )
                {
                    if( !InRange( command.value, 0.0, plant.MaxLevel( command.tank ) ) )
                        return Reject( reason, fmt::format( "level setpoint for tank {} out of range: {}", toString( command.tank ), command.value ) );
                }
                else if( command.variable == VariableKind::CONCENTRATION )
                {
                    if( !IsProcessTank( command.tank ) )
                        return Reject( reason, fmt::format( "concentration of tank {} is not controllable", toString( command.tank ) ) );
                    if( !InRange( command.value, 0.0, plant.maxConcentration ) )
                        return Reject( reason,
                                       fmt::format( "concentration setpoint for tank {} out of range: {}", toString( command.tank ), command.value ) );
                }
                else
                {
                    return Reject( reason, "setpoint names an unknown variable" );
                }
                return Result::SUCCESS;
            }
            case CommandType::SET_NOISE:
                if( !NonNegative( command.noiseLevel ) )
                    return Reject( reason, fmt::format( "noise level must be non-negative, got {}", command.noiseLevel ) );
                return Result::SUCCESS;
            case CommandType::PAUSE:
            case CommandType::RESUME:
            case CommandType::RESET:
                return Result::SUCCESS;
            default:
                reason = fmt::format( "unknown command type {}", static_cast<int>( command.type ) );
                return Result::UNKNOWN_COMMAND;
        }
    }
} // namespace TankTwin
