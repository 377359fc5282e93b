#include "control/ProportionalController.hpp"
#include "session/SessionLoop.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace TankTwin;
using namespace std::chrono_literals;

namespace
{
    // Control law that takes longer than the sampling interval
    class SlowController : public ProportionalController
    {
    public:
        SlowController( const EquilibriumPoint& equilibrium, std::chrono::milliseconds delay )
            : ProportionalController( equilibrium, ControllerGains::Default() )
            , m_delay( delay )
        {
        }

        void Update( const PlantState& state, const SetpointTable& setpoints, ControlValues& out ) override
        {
            std::this_thread::sleep_for( m_delay );
            ProportionalController::Update( state, setpoints, out );
        }

    private:
        std::chrono::milliseconds m_delay;
    };
} // namespace

class SessionLoopTest : public ::testing::Test
{
protected:
    TankTwinConfig config;
    SessionDesc    desc;

    void SetUp() override { desc.samplingInterval = 0.02; }
};

// 1. Start runs the session, Stop joins and leaves it open
TEST_F( SessionLoopTest, StartAndStop )
{
    auto        session = CreateRef<Session>( SessionHandle( 0, 1 ), config, desc );
    SessionLoop loop( session );
    EXPECT_FALSE( loop.IsRunning() );

    ASSERT_EQ( loop.Start(), Result::SUCCESS );
    EXPECT_TRUE( loop.IsRunning() );
    EXPECT_EQ( session->GetStatus(), SessionStatus::RUNNING );

    loop.Stop();
    loop.Stop();
    EXPECT_FALSE( loop.IsRunning() );
    EXPECT_EQ( session->GetStatus(), SessionStatus::RUNNING );

    session->Close();
    SessionLoop closedLoop( session );
    EXPECT_EQ( closedLoop.Start(), Result::SESSION_CLOSED );
}

// 2. Overruns skip missed ticks; each emitted snapshot still covers exactly one interval
TEST_F( SessionLoopTest, OverrunSkipsMissedTicks )
{
    auto session = CreateRef<Session>( SessionHandle( 0, 1 ), config, desc, CreateScope<SlowController>( desc.equilibrium, 60ms ) );
    auto stream  = CreateRef<SnapshotStream>( 256 );
    ASSERT_EQ( session->Subscribe( stream ), Result::SUCCESS );

    SessionLoop loop( session );
    ASSERT_EQ( loop.Start(), Result::SUCCESS );

    std::vector<StateSnapshot> snapshots;
    while( snapshots.size() < 4 )
    {
        StreamEvent event;
        ASSERT_EQ( stream->Pop( event, 2000ms ), Result::SUCCESS );
        ASSERT_FALSE( event.IsTerminal() );
        snapshots.push_back( event.snapshot );
    }

    EXPECT_TRUE( loop.IsRunning() );
    loop.Stop();
    EXPECT_FALSE( loop.IsRunning() );

    // Each 60 ms tick spans three 20 ms deadlines
    EXPECT_GT( loop.GetSkippedTicks(), 0u );

    for( size_t i = 1; i < snapshots.size(); ++i )
    {
        EXPECT_EQ( snapshots[ i ].sequence, snapshots[ i - 1 ].sequence + 1 );
        EXPECT_NEAR( snapshots[ i ].simulatedTime - snapshots[ i - 1 ].simulatedTime, desc.samplingInterval, 1e-12 );
    }
    EXPECT_NEAR( snapshots.front().simulatedTime, desc.samplingInterval, 1e-12 );
}
