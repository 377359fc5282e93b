#include "TankTwin.h"

#include "core/Log.h"
#include "session/SessionRegistry.hpp"
#include "session/Validation.hpp"

namespace TankTwin
{

    // Impl
    struct TankTwin::Impl
    {
        TankTwinConfig         m_config;
        bool                   m_initialized;
        Scope<SessionRegistry> m_registry;

        Impl()
            : m_initialized( false )
        {
        }

        Result Initialize( const TankTwinConfig& config )
        {
            if( m_initialized )
                return Result::SUCCESS;

            // 1. Logger
            Log::Init();
            TT_INFO( "Initializing TankTwin..." );

            // 2. Config
            std::string reason;
            Result      res = ValidateConfig( config, reason );
            if( res != Result::SUCCESS )
            {
                TT_ERROR( "Invalid configuration: {}", reason );
                return res;
            }
            m_config = config;

            // 3. Sessions
            m_registry = CreateScope<SessionRegistry>();

            m_initialized = true;
            TT_INFO( "TankTwin initialized ({} integrator, step {}s, time scale {}).", toString( m_config.integrationMethod ),
                     m_config.integrationStep, m_config.timeScale );
            return Result::SUCCESS;
        }

        void Shutdown()
        {
            if( !m_initialized )
                return;

            TT_INFO( "Shutting down TankTwin..." );
            m_registry->CloseAll();
            m_registry.reset();
            m_initialized = false;
        }

        Ref<Session> Find( SessionHandle handle ) const { return m_initialized ? m_registry->Find( handle ) : nullptr; }
    };

    TankTwin::TankTwin()
        : m_impl( CreateScope<Impl>() )
    {
    }

    TankTwin::~TankTwin()
    {
        Shutdown();
    }

    Result TankTwin::Initialize( const TankTwinConfig& config )
    {
        return m_impl->Initialize( config );
    }

    void TankTwin::Shutdown()
    {
        if( m_impl )
            m_impl->Shutdown();
    }

    Result TankTwin::CreateSession( const SessionDesc& desc, SessionHandle* outHandle )
    {
        if( !m_impl->m_initialized )
        {
            TT_ERROR( "CreateSession called before Initialize." );
            return Result::FAIL;
        }
        if( outHandle == nullptr )
            return Result::INVALID_ARGS;

        std::string reason;
        Result      res = ValidateSessionDesc( desc, m_impl->m_config, reason );
        if( res != Result::SUCCESS )
        {
            TT_WARN( "Rejected session: {}", reason );
            return res;
        }

        return m_impl->m_registry->Create( m_impl->m_config, desc, nullptr, outHandle );
    }

    Result TankTwin::SubmitCommand( SessionHandle handle, const Command& command )
    {
        Ref<Session> session = m_impl->Find( handle );
        if( !session )
            return Result::SESSION_CLOSED;
        return session->Submit( command );
    }

    Result TankTwin::Subscribe( SessionHandle handle, Ref<SnapshotStream>* outStream )
    {
        if( outStream == nullptr )
            return Result::INVALID_ARGS;

        Ref<Session> session = m_impl->Find( handle );
        if( !session )
            return Result::SESSION_CLOSED;

        auto   stream = CreateRef<SnapshotStream>( m_impl->m_config.streamCapacity );
        Result res    = session->Subscribe( stream );
        if( res == Result::SUCCESS )
            *outStream = stream;
        return res;
    }

    Result TankTwin::CloseSession( SessionHandle handle )
    {
        if( m_impl->m_initialized )
            m_impl->m_registry->Close( handle );
        return Result::SUCCESS;
    }

    Result TankTwin::OnTransportLost( SessionHandle handle )
    {
        TT_WARN( "Transport lost for session {}, closing.", handle.ToString() );
        return CloseSession( handle );
    }

    SessionStatus TankTwin::GetSessionStatus( SessionHandle handle ) const
    {
        Ref<Session> session = m_impl->Find( handle );
        return session ? session->GetStatus() : SessionStatus::CLOSED;
    }

    uint32_t TankTwin::GetSessionCount() const
    {
        return m_impl->m_initialized ? m_impl->m_registry->GetCount() : 0;
    }

    bool_t TankTwin::IsInitialized() const
    {
        return m_impl->m_initialized;
    }

    const TankTwinConfig& TankTwin::GetConfig() const
    {
        return m_impl->m_config;
    }

} // namespace TankTwin
