#include "session/SnapshotStream.h"

#include "core/Log.h"

namespace TankTwin
{
    SnapshotStream::SnapshotStream( uint32_t capacity )
        : m_capacity( capacity > 0 ? capacity : 1 )
    {
    }

    void SnapshotStream::Push( StreamEvent event )
    {
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            if( m_terminalPushed )
                return;

            if( event.IsTerminal() )
            {
                // Terminal events bypass the bound
                m_terminalPushed = true;
            }
            else if( m_events.size() >= m_capacity )
            {
                m_events.pop_front();
                m_dropped++;
                TT_TRACE( "[SnapshotStream] Subscriber lagging, dropped oldest snapshot ({} total).", m_dropped );
            }

            m_events.push_back( std::move( event ) );
        }
        m_cv.notify_one();
    }

    Result SnapshotStream::PopLocked( StreamEvent& out )
    {
        if( m_events.empty() )
            return m_finished ? Result::SESSION_CLOSED : Result::TIMEOUT;

        out = std::move( m_events.front() );
        m_events.pop_front();
        if( out.IsTerminal() )
            m_finished = true;
        return Result::SUCCESS;
    }

    Result SnapshotStream::Pop( StreamEvent& out, std::chrono::milliseconds timeout )
    {
        std::unique_lock<std::mutex> lock( m_mutex );
        m_cv.wait_for( lock, timeout, [ this ]() { return !m_events.empty() || m_finished; } );
        return PopLocked( out );
    }

    Result SnapshotStream::TryPop( StreamEvent& out )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return PopLocked( out );
    }

    bool_t SnapshotStream::IsFinished() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_finished;
    }

    uint64_t SnapshotStream::GetDroppedCount() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_dropped;
    }

    size_t SnapshotStream::GetPendingCount() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_events.size();
    }
} // namespace TankTwin
