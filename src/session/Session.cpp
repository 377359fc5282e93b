#include "session/Session.hpp"

#include "control/ProportionalController.hpp"
#include "core/Log.h"
#include "session/Validation.hpp"
#include <algorithm>
#include <cmath>

namespace TankTwin
{
    Session::Session( SessionHandle handle, const TankTwinConfig& config, const SessionDesc& desc, Scope<Controller> controller )
        : m_handle( handle )
        , m_config( config )
        , m_desc( desc )
        , m_model( config.plant )
        , m_controller( std::move( controller ) )
        , m_noise( config.plant, config.noiseSeed )
    {
        m_integrator = CreateIntegrator( config.integrationMethod, m_model );
        if( !m_controller )
            m_controller = CreateScope<ProportionalController>( desc.equilibrium, config.gains );

        m_clock.SetTimeScale( config.timeScale );
        m_noise.Configure( desc.noiseEnabled, desc.noiseLevel );

        RestoreEquilibrium();
    }

    Session::~Session()
    {
        Close();
    }

    void Session::Start()
    {
        SessionStatus expected = SessionStatus::INITIALIZED;
        if( m_status.compare_exchange_strong( expected, SessionStatus::RUNNING ) )
        {
            TT_INFO( "[Session {}] Running (interval {}s, {} step {}s).", m_handle.ToString(), m_desc.samplingInterval,
                     toString( m_integrator->GetMethod() ), m_config.integrationStep );
        }
    }

    Result Session::Submit( const Command& command )
    {
        if( m_status.load() == SessionStatus::CLOSED )
            return Result::SESSION_CLOSED;

        std::string reason;
        Result      res = ValidateCommand( command, m_model.GetParameters(), reason );
        if( res != Result::SUCCESS )
        {
            TT_WARN( "[Session {}] Rejected command: {} ({}).", m_handle.ToString(), reason, toString( res ) );
            return res;
        }

        return m_commands.Push( command );
    }

    Result Session::Subscribe( const Ref<SnapshotStream>& stream )
    {
        if( !stream )
            return Result::INVALID_ARGS;

        std::lock_guard<std::mutex> lock( m_subscriberMutex );
        if( m_status.load() == SessionStatus::CLOSED )
            return Result::SESSION_CLOSED;

        m_subscribers.push_back( stream );
        return Result::SUCCESS;
    }

    void Session::Close( Result reason, const std::string& message )
    {
        std::vector<Ref<SnapshotStream>> subscribers;
        {
            std::lock_guard<std::mutex> lock( m_subscriberMutex );
            if( m_status.exchange( SessionStatus::CLOSED ) == SessionStatus::CLOSED )
                return;
            subscribers.swap( m_subscribers );
        }

        m_commands.Close();

        StreamEvent terminal;
        terminal.type            = reason == Result::SUCCESS ? StreamEventType::CLOSED : StreamEventType::FAILED;
        terminal.error           = reason;
        terminal.message         = message;
        terminal.snapshot.status = SessionStatus::CLOSED;
        for( auto& stream: subscribers )
            stream->Push( terminal );

        if( reason == Result::SUCCESS )
            TT_INFO( "[Session {}] Closed.", m_handle.ToString() );
        else
            TT_ERROR( "[Session {}] Terminated with {}: {}", m_handle.ToString(), toString( reason ), message );
    }

    void Session::RestoreEquilibrium()
    {
        m_plant                               = m_desc.equilibrium.state;
        m_plant[ TankId::A ].concentration    = 0.0;
        m_plant[ TankId::B ].concentration    = m_config.plant.brineConcentration;
        m_controls                            = m_desc.equilibrium.controls;

        m_setpoints.Clear();
        m_controller->Reset();
        m_clock.Reset();
    }

    void Session::ApplyCommand( const Command& command, bool& resetRequested )
    {
        switch( command.type )
        {
            case CommandType::SET_SETPOINT:
            {
                Setpoint setpoint;
                setpoint.tank      = command.tank;
                setpoint.variable  = command.variable;
                setpoint.value     = command.value;
                setpoint.issueTime = m_clock.GetSimTime();
                m_setpoints.Set( setpoint );
                TT_INFO( "[Session {}] Setpoint {} of tank {} = {} at t={}s.", m_handle.ToString(), toString( command.variable ),
                         toString( command.tank ), command.value, setpoint.issueTime );
                break;
            }
            case CommandType::PAUSE:
            {
                SessionStatus expected = SessionStatus::RUNNING;
                if( m_status.compare_exchange_strong( expected, SessionStatus::PAUSED ) )
                    TT_INFO( "[Session {}] Paused at t={}s.", m_handle.ToString(), m_clock.GetSimTime() );
                break;
            }
            case CommandType::RESUME:
            {
                SessionStatus expected = SessionStatus::PAUSED;
                if( m_status.compare_exchange_strong( expected, SessionStatus::RUNNING ) )
                    TT_INFO( "[Session {}] Resumed at t={}s.", m_handle.ToString(), m_clock.GetSimTime() );
                break;
            }
            case CommandType::RESET:
            {
                RestoreEquilibrium();
                SessionStatus expected = SessionStatus::PAUSED;
                m_status.compare_exchange_strong( expected, SessionStatus::RUNNING );
                resetRequested = true;
                TT_INFO( "[Session {}] Reset to equilibrium.", m_handle.ToString() );
                break;
            }
            case CommandType::SET_NOISE:
                m_noise.Configure( command.noiseEnabled, command.noiseLevel );
                TT_INFO( "[Session {}] Noise {} (level {}).", m_handle.ToString(), command.noiseEnabled ? "enabled" : "disabled",
                         command.noiseLevel );
                break;
            default:
                TT_WARN( "[Session {}] Ignoring unknown command type {}.", m_handle.ToString(), static_cast<int>( command.type ) );
                break;
        }
    }

    bool Session::ApplyCommands()
    {
        m_commands.Drain( m_batch );

        bool resetRequested = false;
        for( const Command& command: m_batch )
            ApplyCommand( command, resetRequested );

        m_batch.clear();
        return resetRequested;
    }

    Result Session::Tick()
    {
        SessionStatus status = m_status.load();
        if( status == SessionStatus::CLOSED )
            return Result::SESSION_CLOSED;
        if( status == SessionStatus::INITIALIZED )
            return Result::SUCCESS;

        bool reset = ApplyCommands();

        if( m_status.load() == SessionStatus::PAUSED )
            return Result::SUCCESS;

        if( reset )
        {
            Publish( m_noise.Apply( m_plant ) );
            return Result::SUCCESS;
        }

        // Zero-order hold: one control update per tick
        m_controller->Update( m_plant, m_setpoints, m_controls );

        const float64_t span     = m_clock.GetSimDeltaTime( m_desc.samplingInterval );
        const float64_t step     = m_config.integrationStep;
        const float64_t required = std::ceil( span / step - 1e-9 );
        if( !( required <= static_cast<float64_t>( MAX_SUBSTEPS_PER_TICK ) ) )
        {
            Close( Result::INVALID_ARGS, "Tick span of " + std::to_string( span ) + "s exceeds the integration step budget" );
            return Result::INVALID_ARGS;
        }
        const uint64_t steps = std::max<uint64_t>( 1, static_cast<uint64_t>( required ) );

        for( uint64_t i = 0; i < steps; ++i )
        {
            // The last sub-step absorbs the remainder of the span
            float64_t dt  = ( i + 1 < steps ) ? step : span - step * static_cast<float64_t>( steps - 1 );
            Result    res = m_integrator->Step( m_plant, m_controls, dt );
            if( res != Result::SUCCESS )
            {
                Close( res, "Integration produced a non-finite state at t=" + std::to_string( m_clock.GetSimTime() ) + "s" );
                return res;
            }
        }

        m_clock.Advance( span );
        Publish( m_noise.Apply( m_plant ) );
        return Result::SUCCESS;
    }

    void Session::Publish( const PlantState& reported )
    {
        StreamEvent event;
        event.type                     = StreamEventType::SNAPSHOT;
        event.snapshot.sequence        = ++m_sequence;
        event.snapshot.simulatedTime   = m_clock.GetSimTime();
        event.snapshot.status          = m_status.load();
        event.snapshot.plant           = reported;
        event.snapshot.controls        = m_controls;
        event.snapshot.activeSetpoints = m_setpoints.GetActive();

        std::lock_guard<std::mutex> lock( m_subscriberMutex );
        for( auto& stream: m_subscribers )
            stream->Push( event );
    }
} // namespace TankTwin
