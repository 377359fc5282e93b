#pragma once
#include "TankTwinTypes.h"

#include "core/Core.h"
#include "session/SnapshotStream.h"

namespace TankTwin
{

    class TT_API TankTwin
    {
    public:
        TankTwin();
        ~TankTwin();

        Result Initialize( const TankTwinConfig& config );
        void   Shutdown();

        /**
         * @brief Validates the description, then starts a new session loop.
         * @return INVALID_ARGS when the description is rejected.
         */
        Result CreateSession( const SessionDesc& desc, SessionHandle* outHandle );

        /**
         * @brief Queues a command; it takes effect at the session's next tick boundary.
         * @return SESSION_CLOSED, INVALID_ARGS or UNKNOWN_COMMAND on rejection.
         */
        Result SubmitCommand( SessionHandle handle, const Command& command );

        /**
         * @brief Opens a new event stream on a session.
         */
        Result Subscribe( SessionHandle handle, Ref<SnapshotStream>* outStream );

        // Idempotent: closing an unknown or closed session succeeds
        Result CloseSession( SessionHandle handle );
        Result OnTransportLost( SessionHandle handle );

        // CLOSED for unknown handles
        SessionStatus GetSessionStatus( SessionHandle handle ) const;
        uint32_t      GetSessionCount() const;

        bool_t                IsInitialized() const;
        const TankTwinConfig& GetConfig() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace TankTwin
