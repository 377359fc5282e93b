#pragma once
#include "core/HandlePool.h"
#include "session/SessionLoop.hpp"
#include <mutex>

namespace TankTwin
{
    /**
     * @brief Owns every live session loop, addressed by SessionHandle.
     * A handle stays valid until the session is closed; a diverged session remains
     * registered (status CLOSED) until it is closed explicitly.
     */
    class SessionRegistry
    {
    public:
        SessionRegistry() = default;
        ~SessionRegistry();

        /**
         * @brief Builds a session, starts its loop and registers it.
         */
        Result Create( const TankTwinConfig& config, const SessionDesc& desc, Scope<Controller> controller, SessionHandle* outHandle );

        /**
         * @return The session, or nullptr for unknown/closed handles.
         */
        Ref<Session> Find( SessionHandle handle ) const;

        /**
         * @brief Stops the loop (after its current tick) and closes the session.
         * Unknown or already closed handles are a no-op.
         */
        void Close( SessionHandle handle );

        void     CloseAll();
        uint32_t GetCount() const;

    private:
        mutable std::mutex                     m_mutex;
        HandlePool<SessionLoop, SessionHandle> m_loops;
    };
} // namespace TankTwin
