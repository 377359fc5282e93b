#include "TankTwin.h"
#include <chrono>
#include <gtest/gtest.h>
#include <limits>
#include <thread>

using namespace TankTwin;
using namespace std::chrono_literals;

// =================================================================================================
// Facade tests: real session loops on their own threads
// =================================================================================================

class TankTwinTest : public ::testing::Test
{
protected:
    TankTwinConfig       config;
    SessionDesc          desc;
    Scope<::TankTwin::TankTwin> twin;

    void SetUp() override
    {
        desc.samplingInterval = 0.02; // fast ticks keep the suite short
        twin                  = CreateScope<::TankTwin::TankTwin>();
    }

    void TearDown() override { twin->Shutdown(); }

    // Pops events until a snapshot arrives (or the stream ends)
    static Result NextSnapshot( const Ref<SnapshotStream>& stream, StreamEvent& out )
    {
        Result res = stream->Pop( out, 2000ms );
        if( res == Result::SUCCESS && out.IsTerminal() )
            return Result::SESSION_CLOSED;
        return res;
    }

    static Result WaitForTerminal( const Ref<SnapshotStream>& stream, StreamEvent& out )
    {
        for( int i = 0; i < 1000; ++i )
        {
            Result res = stream->Pop( out, 2000ms );
            if( res != Result::SUCCESS )
                return res;
            if( out.IsTerminal() )
                return Result::SUCCESS;
        }
        return Result::TIMEOUT;
    }

    template<typename Predicate>
    static bool WaitUntil( Predicate predicate, std::chrono::milliseconds timeout = 2000ms )
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while( std::chrono::steady_clock::now() < deadline )
        {
            if( predicate() )
                return true;
            std::this_thread::sleep_for( 2ms );
        }
        return predicate();
    }
};

// 1. Configuration is validated up front
TEST_F( TankTwinTest, InitializeRejectsInvalidConfig )
{
    config.integrationStep = 0.0;
    EXPECT_EQ( twin->Initialize( config ), Result::INVALID_ARGS );
    EXPECT_FALSE( twin->IsInitialized() );

    config.integrationStep = 0.1;
    config.plant.Process( TankId::D ).baseRadius = -1.0;
    EXPECT_EQ( twin->Initialize( config ), Result::INVALID_ARGS );

    config.plant.Process( TankId::D ).baseRadius = 0.75;
    EXPECT_EQ( twin->Initialize( config ), Result::SUCCESS );
    EXPECT_TRUE( twin->IsInitialized() );
}

// 2. Calls before Initialize fail cleanly
TEST_F( TankTwinTest, RequiresInitialize )
{
    SessionHandle handle;
    EXPECT_EQ( twin->CreateSession( desc, &handle ), Result::FAIL );
    EXPECT_EQ( twin->SubmitCommand( handle, Command::Pause() ), Result::SESSION_CLOSED );
    EXPECT_EQ( twin->GetSessionCount(), 0u );
}

// 3. Invalid session descriptions never start a loop
TEST_F( TankTwinTest, CreateSessionValidatesDescription )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );
    SessionHandle handle;

    SessionDesc bad = desc;
    bad.samplingInterval = 0.0;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    bad = desc;
    bad.noiseLevel = -0.1;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    bad = desc;
    bad.equilibrium.state[ TankId::E ].level = 3.5;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    bad = desc;
    bad.equilibrium.state[ TankId::C ].concentration = -1.0;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    bad = desc;
    bad.equilibrium.controls[ ControlChannel::BRINE_PUMP_D ] = 1.5;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    EXPECT_EQ( twin->CreateSession( desc, nullptr ), Result::INVALID_ARGS );
    EXPECT_EQ( twin->GetSessionCount(), 0u );
}

// 3b. A tick must fit in the integration step budget
TEST_F( TankTwinTest, CreateSessionRejectsOversizedTick )
{
    config.timeScale = 1000.0;
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );
    SessionHandle handle;

    // 1e18 s of wall clock per tick
    SessionDesc bad = desc;
    bad.samplingInterval = 1e18;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    // 200 s * 1000 / 0.1 s = 2e6 sub-steps
    bad.samplingInterval = 200.0;
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );

    bad.samplingInterval = std::numeric_limits<float64_t>::infinity();
    EXPECT_EQ( twin->CreateSession( bad, &handle ), Result::INVALID_ARGS );
    EXPECT_EQ( twin->GetSessionCount(), 0u );

    // 50 s * 1000 / 0.1 s = 5e5 sub-steps fits
    SessionDesc ok = desc;
    ok.samplingInterval = 50.0;
    ASSERT_EQ( twin->CreateSession( ok, &handle ), Result::SUCCESS );
    EXPECT_EQ( twin->GetSessionStatus( handle ), SessionStatus::RUNNING );
    EXPECT_EQ( twin->CloseSession( handle ), Result::SUCCESS );
}

// 4. A running session streams ordered snapshots and closes cleanly
TEST_F( TankTwinTest, StreamsOrderedSnapshots )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    SessionHandle handle;
    ASSERT_EQ( twin->CreateSession( desc, &handle ), Result::SUCCESS );
    EXPECT_TRUE( handle.IsValid() );
    EXPECT_EQ( twin->GetSessionCount(), 1u );

    Ref<SnapshotStream> stream;
    ASSERT_EQ( twin->Subscribe( handle, &stream ), Result::SUCCESS );
    EXPECT_EQ( stream->GetCapacity(), config.streamCapacity );

    StreamEvent previous;
    ASSERT_EQ( NextSnapshot( stream, previous ), Result::SUCCESS );
    for( int i = 0; i < 5; ++i )
    {
        StreamEvent event;
        ASSERT_EQ( NextSnapshot( stream, event ), Result::SUCCESS );
        EXPECT_GT( event.snapshot.sequence, previous.snapshot.sequence );
        EXPECT_GE( event.snapshot.simulatedTime, previous.snapshot.simulatedTime );
        EXPECT_EQ( event.snapshot.status, SessionStatus::RUNNING );
        previous = event;
    }

    EXPECT_EQ( twin->CloseSession( handle ), Result::SUCCESS );
    EXPECT_EQ( twin->CloseSession( handle ), Result::SUCCESS );
    EXPECT_EQ( twin->GetSessionStatus( handle ), SessionStatus::CLOSED );
    EXPECT_EQ( twin->GetSessionCount(), 0u );

    StreamEvent terminal;
    ASSERT_EQ( WaitForTerminal( stream, terminal ), Result::SUCCESS );
    EXPECT_EQ( terminal.type, StreamEventType::CLOSED );
}

// 5. Commands submitted from another thread show up in later snapshots
TEST_F( TankTwinTest, CommandsReachTheLoop )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    SessionHandle handle;
    ASSERT_EQ( twin->CreateSession( desc, &handle ), Result::SUCCESS );
    Ref<SnapshotStream> stream;
    ASSERT_EQ( twin->Subscribe( handle, &stream ), Result::SUCCESS );

    std::thread producer( [ this, handle ]() {
        EXPECT_EQ( twin->SubmitCommand( handle, Command::SetSetpoint( TankId::E, VariableKind::LEVEL, 1.9 ) ), Result::SUCCESS );
    } );
    producer.join();

    bool seen = false;
    for( int i = 0; i < 100 && !seen; ++i )
    {
        StreamEvent event;
        ASSERT_EQ( NextSnapshot( stream, event ), Result::SUCCESS );
        for( const Setpoint& sp: event.snapshot.activeSetpoints )
            seen |= sp.tank == TankId::E && sp.variable == VariableKind::LEVEL && sp.value == 1.9;
    }
    EXPECT_TRUE( seen );

    EXPECT_EQ( twin->SubmitCommand( handle, Command::SetSetpoint( TankId::E, VariableKind::LEVEL, 9.0 ) ), Result::INVALID_ARGS );
}

// 6. A paused session stops emitting; resume brings the stream back
TEST_F( TankTwinTest, PauseSuppressesSnapshots )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    SessionHandle handle;
    ASSERT_EQ( twin->CreateSession( desc, &handle ), Result::SUCCESS );
    Ref<SnapshotStream> stream;
    ASSERT_EQ( twin->Subscribe( handle, &stream ), Result::SUCCESS );

    ASSERT_EQ( twin->SubmitCommand( handle, Command::Pause() ), Result::SUCCESS );
    ASSERT_TRUE( WaitUntil( [ & ]() { return twin->GetSessionStatus( handle ) == SessionStatus::PAUSED; } ) );

    StreamEvent event;
    while( stream->TryPop( event ) == Result::SUCCESS )
    {
    }
    float64_t pausedAt = event.snapshot.simulatedTime;

    std::this_thread::sleep_for( 150ms );
    EXPECT_EQ( stream->GetPendingCount(), 0u );

    ASSERT_EQ( twin->SubmitCommand( handle, Command::Resume() ), Result::SUCCESS );
    ASSERT_EQ( NextSnapshot( stream, event ), Result::SUCCESS );
    EXPECT_EQ( event.snapshot.status, SessionStatus::RUNNING );
    EXPECT_GE( event.snapshot.simulatedTime, pausedAt );
}

// 7. Divergence terminates the session with a FAILED event
TEST_F( TankTwinTest, DivergenceFailsSession )
{
    config.plant.Process( TankId::C ).baseRadius = 0.0;
    config.plant.Process( TankId::C ).topRadius  = 0.0;
    desc.samplingInterval                        = 0.2;
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    SessionHandle handle;
    ASSERT_EQ( twin->CreateSession( desc, &handle ), Result::SUCCESS );

    Ref<SnapshotStream> stream;
    Result              subscribed = twin->Subscribe( handle, &stream );
    if( subscribed == Result::SUCCESS )
    {
        StreamEvent terminal;
        ASSERT_EQ( WaitForTerminal( stream, terminal ), Result::SUCCESS );
        EXPECT_EQ( terminal.type, StreamEventType::FAILED );
        EXPECT_EQ( terminal.error, Result::DIVERGED );
    }
    else
    {
        // The first tick diverged before the subscription landed
        EXPECT_EQ( subscribed, Result::SESSION_CLOSED );
    }

    ASSERT_TRUE( WaitUntil( [ & ]() { return twin->GetSessionStatus( handle ) == SessionStatus::CLOSED; } ) );
    EXPECT_EQ( twin->SubmitCommand( handle, Command::Resume() ), Result::SESSION_CLOSED );

    // The failed session stays registered until it is closed
    EXPECT_EQ( twin->GetSessionCount(), 1u );
    EXPECT_EQ( twin->CloseSession( handle ), Result::SUCCESS );
    EXPECT_EQ( twin->GetSessionCount(), 0u );
}

// 8. Transport loss closes the session; its handle goes stale
TEST_F( TankTwinTest, TransportLossInvalidatesHandle )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    SessionHandle first;
    ASSERT_EQ( twin->CreateSession( desc, &first ), Result::SUCCESS );
    Ref<SnapshotStream> stream;
    ASSERT_EQ( twin->Subscribe( first, &stream ), Result::SUCCESS );

    EXPECT_EQ( twin->OnTransportLost( first ), Result::SUCCESS );
    StreamEvent terminal;
    ASSERT_EQ( WaitForTerminal( stream, terminal ), Result::SUCCESS );
    EXPECT_EQ( terminal.type, StreamEventType::CLOSED );

    // The slot is reused with a new generation
    SessionHandle second;
    ASSERT_EQ( twin->CreateSession( desc, &second ), Result::SUCCESS );
    EXPECT_EQ( second.GetIndex(), first.GetIndex() );
    EXPECT_NE( second.GetGeneration(), first.GetGeneration() );

    EXPECT_EQ( twin->SubmitCommand( first, Command::Pause() ), Result::SESSION_CLOSED );
    EXPECT_EQ( twin->GetSessionStatus( first ), SessionStatus::CLOSED );
    EXPECT_EQ( twin->GetSessionStatus( second ), SessionStatus::RUNNING );

    Ref<SnapshotStream> staleStream;
    EXPECT_EQ( twin->Subscribe( first, &staleStream ), Result::SESSION_CLOSED );
    EXPECT_EQ( staleStream, nullptr );
}

// 9. Sessions do not share state
TEST_F( TankTwinTest, SessionsAreIsolated )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    SessionHandle a, b;
    ASSERT_EQ( twin->CreateSession( desc, &a ), Result::SUCCESS );
    ASSERT_EQ( twin->CreateSession( desc, &b ), Result::SUCCESS );
    EXPECT_NE( a, b );
    EXPECT_EQ( twin->GetSessionCount(), 2u );

    Ref<SnapshotStream> streamB;
    ASSERT_EQ( twin->Subscribe( b, &streamB ), Result::SUCCESS );
    ASSERT_EQ( twin->SubmitCommand( a, Command::SetSetpoint( TankId::C, VariableKind::LEVEL, 2.2 ) ), Result::SUCCESS );
    ASSERT_EQ( twin->SubmitCommand( a, Command::Pause() ), Result::SUCCESS );

    ASSERT_TRUE( WaitUntil( [ & ]() { return twin->GetSessionStatus( a ) == SessionStatus::PAUSED; } ) );
    EXPECT_EQ( twin->GetSessionStatus( b ), SessionStatus::RUNNING );

    for( int i = 0; i < 5; ++i )
    {
        StreamEvent event;
        ASSERT_EQ( NextSnapshot( streamB, event ), Result::SUCCESS );
        EXPECT_TRUE( event.snapshot.activeSetpoints.empty() );
    }
}

// 10. Shutdown closes every session and ends every stream
TEST_F( TankTwinTest, ShutdownClosesEverything )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    std::vector<Ref<SnapshotStream>> streams;
    for( int i = 0; i < 3; ++i )
    {
        SessionHandle handle;
        ASSERT_EQ( twin->CreateSession( desc, &handle ), Result::SUCCESS );
        Ref<SnapshotStream> stream;
        ASSERT_EQ( twin->Subscribe( handle, &stream ), Result::SUCCESS );
        streams.push_back( stream );
    }
    EXPECT_EQ( twin->GetSessionCount(), 3u );

    twin->Shutdown();
    EXPECT_FALSE( twin->IsInitialized() );
    EXPECT_EQ( twin->GetSessionCount(), 0u );

    for( auto& stream: streams )
    {
        StreamEvent terminal;
        ASSERT_EQ( WaitForTerminal( stream, terminal ), Result::SUCCESS );
        EXPECT_EQ( terminal.type, StreamEventType::CLOSED );
    }
}

// 11. Unknown handles read as closed
TEST_F( TankTwinTest, UnknownHandleIsClosed )
{
    ASSERT_EQ( twin->Initialize( config ), Result::SUCCESS );

    EXPECT_EQ( twin->GetSessionStatus( SessionHandle::Invalid ), SessionStatus::CLOSED );
    EXPECT_EQ( twin->GetSessionStatus( SessionHandle( 7, 3 ) ), SessionStatus::CLOSED );
    EXPECT_EQ( twin->CloseSession( SessionHandle( 7, 3 ) ), Result::SUCCESS );
}
