#include "session/SessionLoop.hpp"

#include "core/Log.h"
#include "core/Timer.hpp"
#include <chrono>

namespace TankTwin
{
    SessionLoop::SessionLoop( Ref<Session> session )
        : m_session( std::move( session ) )
    {
    }

    SessionLoop::~SessionLoop()
    {
        Stop();
    }

    Result SessionLoop::Start()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        if( m_started )
            return Result::SUCCESS;
        if( m_session->GetStatus() == SessionStatus::CLOSED )
            return Result::SESSION_CLOSED;

        m_session->Start();
        m_started = true;
        m_thread  = std::thread( &SessionLoop::Run, this );
        return Result::SUCCESS;
    }

    void SessionLoop::Stop()
    {
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            m_stopRequested = true;
        }
        m_cv.notify_all();

        if( m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id() )
            m_thread.join();
    }

    bool_t SessionLoop::IsRunning() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_started && !m_stopRequested && m_session->GetStatus() != SessionStatus::CLOSED;
    }

    void SessionLoop::Run()
    {
        using Clock = std::chrono::steady_clock;

        auto interval = std::chrono::duration_cast<Clock::duration>( std::chrono::duration<float64_t>( m_session->GetSamplingInterval() ) );
        if( interval.count() <= 0 )
            interval = Clock::duration( 1 );

        auto       deadline = Clock::now() + interval;
        Timer      tickTimer;

        while( true )
        {
            {
                std::unique_lock<std::mutex> lock( m_mutex );
                if( m_cv.wait_until( lock, deadline, [ this ]() { return m_stopRequested; } ) )
                    break;
            }

            tickTimer.Reset();
            Result res = m_session->Tick();
            if( res != Result::SUCCESS )
            {
                TT_WARN( "[SessionLoop {}] Stopping: tick returned {}.", m_session->GetHandle().ToString(), toString( res ) );
                break;
            }

            deadline += interval;

            // Overrun: skip the ticks we missed instead of bursting to catch up
            auto now = Clock::now();
            if( now >= deadline )
            {
                uint64_t missed = static_cast<uint64_t>( ( now - deadline ) / interval ) + 1;
                deadline += interval * static_cast<int64_t>( missed );
                m_skippedTicks += missed;
                TT_WARN( "[SessionLoop {}] Tick took {:.3f} ms, skipping {} tick(s).", m_session->GetHandle().ToString(), tickTimer.ElapsedMillis(),
                         missed );
            }
        }
    }
} // namespace TankTwin
