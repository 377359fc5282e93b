#pragma once
#include "session/Session.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace TankTwin
{
    /**
     * @brief Dedicated thread that ticks one session every sampling interval.
     * Wakes on a steady-clock deadline; late ticks are skipped rather than replayed.
     */
    class SessionLoop
    {
    public:
        explicit SessionLoop( Ref<Session> session );
        ~SessionLoop();

        SessionLoop( const SessionLoop& )            = delete;
        SessionLoop& operator=( const SessionLoop& ) = delete;

        /**
         * @brief Starts the session and spawns the loop thread.
         */
        Result Start();

        /**
         * @brief Requests a stop, lets the current tick finish and joins. Idempotent.
         * Does not close the session.
         */
        void Stop();

        bool_t   IsRunning() const;
        uint64_t GetSkippedTicks() const { return m_skippedTicks; }

        const Ref<Session>& GetSession() const { return m_session; }

    private:
        void Run();

        Ref<Session>            m_session;
        std::thread             m_thread;
        mutable std::mutex      m_mutex;
        std::condition_variable m_cv;
        bool_t                  m_stopRequested = false;
        bool_t                  m_started       = false;
        std::atomic<uint64_t>   m_skippedTicks{ 0 };
    };
} // namespace TankTwin
