#include "session/CommandQueue.hpp"

namespace TankTwin
{
    Result CommandQueue::Push( const Command& command )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        if( m_closed )
            return Result::SESSION_CLOSED;

        m_pending.push_back( command );
        return Result::SUCCESS;
    }

    void CommandQueue::Drain( std::vector<Command>& out )
    {
        out.clear();

        // Swap the batch out to keep the lock short
        std::lock_guard<std::mutex> lock( m_mutex );
        if( m_pending.empty() )
            return;
        out.swap( m_pending );
    }

    void CommandQueue::Close()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_closed = true;
        m_pending.clear();
    }

    bool_t CommandQueue::IsClosed() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_closed;
    }

    size_t CommandQueue::GetPendingCount() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_pending.size();
    }
} // namespace TankTwin
