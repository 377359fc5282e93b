#pragma once
#include "TankTwinTypes.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace TankTwin
{
    /**
     * @brief Bounded buffer of stream events between a session loop and one subscriber.
     *
     * The producer never blocks: when the buffer is full the oldest snapshot is dropped.
     * A terminal event (CLOSED / FAILED) is always kept and ends the stream.
     */
    class TT_API SnapshotStream
    {
    public:
        explicit SnapshotStream( uint32_t capacity = 64 );

        /**
         * @brief Appends an event. Ignored once a terminal event has been pushed.
         */
        void Push( StreamEvent event );

        /**
         * @brief Waits up to `timeout` for the next event.
         * @return SUCCESS with `out` filled, TIMEOUT, or SESSION_CLOSED once the terminal
         * event has been consumed.
         */
        Result Pop( StreamEvent& out, std::chrono::milliseconds timeout );

        /**
         * @brief Non-blocking variant of Pop (returns TIMEOUT when empty).
         */
        Result TryPop( StreamEvent& out );

        bool_t   IsFinished() const;
        uint64_t GetDroppedCount() const;
        uint32_t GetCapacity() const { return m_capacity; }
        size_t   GetPendingCount() const;

    private:
        Result PopLocked( StreamEvent& out );

        const uint32_t          m_capacity;
        mutable std::mutex      m_mutex;
        std::condition_variable m_cv;
        std::deque<StreamEvent> m_events;
        bool_t                  m_terminalPushed = false;
        bool_t                  m_finished       = false; // terminal event consumed
        uint64_t                m_dropped        = 0;
    };
} // namespace TankTwin
