#pragma once
#include "TankTwinTypes.h"
#include <mutex>
#include <vector>

namespace TankTwin
{
    /**
     * @brief Multi-producer, single-consumer queue of operator commands.
     * Producers push from any thread; the session loop drains the whole batch at a
     * tick boundary by swapping the buffer out under the lock.
     */
    class CommandQueue
    {
    public:
        /**
         * @brief Appends a command in receipt order.
         * @return SESSION_CLOSED once the queue has been closed.
         */
        Result Push( const Command& command );

        /**
         * @brief Moves every pending command into `out` (cleared first).
         */
        void Drain( std::vector<Command>& out );

        /**
         * @brief Rejects further pushes and discards pending commands.
         */
        void Close();

        bool_t IsClosed() const;
        size_t GetPendingCount() const;

    private:
        mutable std::mutex   m_mutex;
        std::vector<Command> m_pending;
        bool_t               m_closed = false;
    };
} // namespace TankTwin
