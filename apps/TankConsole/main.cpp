#include <TankTwin.h>
#include <chrono>
#include <core/Log.h>
#include <cstdlib>
#include <string>

int main( int argc, char** argv )
{
    uint32_t snapshotCount = 60;
    if( argc > 1 )
        snapshotCount = static_cast<uint32_t>( std::strtoul( argv[ 1 ], nullptr, 10 ) );

    TankTwin::TankTwin       twin;
    TankTwin::TankTwinConfig config;
    config.timeScale = 10.0; // 10 simulated seconds per wall-clock second

    if( twin.Initialize( config ) != TankTwin::Result::SUCCESS )
        return 1;

    TankTwin::SessionDesc desc;
    desc.samplingInterval = 0.2;
    desc.noiseEnabled     = true;
    desc.noiseLevel       = 0.005;

    TankTwin::SessionHandle session;
    if( twin.CreateSession( desc, &session ) != TankTwin::Result::SUCCESS )
        return 1;

    TankTwin::Ref<TankTwin::SnapshotStream> stream;
    if( twin.Subscribe( session, &stream ) != TankTwin::Result::SUCCESS )
        return 1;

    TT_INFO( "Session {} running, printing {} snapshots.", session.ToString(), snapshotCount );

    uint32_t received = 0;
    while( received < snapshotCount )
    {
        TankTwin::StreamEvent event;
        TankTwin::Result      res = stream->Pop( event, std::chrono::milliseconds( 2000 ) );
        if( res == TankTwin::Result::TIMEOUT )
            continue;
        if( res != TankTwin::Result::SUCCESS || event.IsTerminal() )
        {
            TT_ERROR( "Stream ended: {} {}", TankTwin::toString( event.error ), event.message );
            break;
        }

        const auto& snap = event.snapshot;
        TT_INFO( "#{:<4} t={:7.1f}s  C: {:.3f} m {:6.1f} kg/m3  D: {:.3f} m  E: {:.3f} m  pumpC={:.3f} outletC={:.3f}", snap.sequence,
                 snap.simulatedTime, snap.plant[ TankTwin::TankId::C ].level, snap.plant[ TankTwin::TankId::C ].concentration,
                 snap.plant[ TankTwin::TankId::D ].level, snap.plant[ TankTwin::TankId::E ].level,
                 snap.controls[ TankTwin::ControlChannel::WATER_PUMP_C ], snap.controls[ TankTwin::ControlChannel::OUTLET_VALVE_C ] );

        // Level step on tank C after a few snapshots
        if( ++received == 5 )
        {
            for( const auto& command: { TankTwin::Command::SetSetpoint( TankTwin::TankId::C, TankTwin::VariableKind::LEVEL, 2.0 ),
                                        TankTwin::Command::SetSetpoint( TankTwin::TankId::D, TankTwin::VariableKind::CONCENTRATION, 220.0 ) } )
            {
                TankTwin::Result submitted = twin.SubmitCommand( session, command );
                if( submitted != TankTwin::Result::SUCCESS )
                    TT_WARN( "Command rejected: {}", TankTwin::toString( submitted ) );
            }
        }
    }

    TT_INFO( "Console closing..." );
    twin.CloseSession( session );
    twin.Shutdown();

    return 0;
}
