#include "session/SessionRegistry.hpp"

namespace TankTwin
{
    SessionRegistry::~SessionRegistry()
    {
        CloseAll();
    }

    Result SessionRegistry::Create( const TankTwinConfig& config, const SessionDesc& desc, Scope<Controller> controller, SessionHandle* outHandle )
    {
        if( outHandle == nullptr )
            return Result::INVALID_ARGS;

        std::lock_guard<std::mutex> lock( m_mutex );

        SessionHandle handle  = m_loops.PeekNextHandle();
        auto          session = CreateRef<Session>( handle, config, desc, std::move( controller ) );
        auto          loop    = CreateScope<SessionLoop>( session );

        Result res = loop->Start();
        if( res != Result::SUCCESS )
            return res;

        *outHandle = m_loops.Insert( std::move( loop ) );
        TT_INFO( "[SessionRegistry] Session {} created ({} active).", outHandle->ToString(), m_loops.GetCount() );
        return Result::SUCCESS;
    }

    Ref<Session> SessionRegistry::Find( SessionHandle handle ) const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        SessionLoop*                loop = m_loops.Get( handle );
        return loop ? loop->GetSession() : nullptr;
    }

    void SessionRegistry::Close( SessionHandle handle )
    {
        Scope<SessionLoop> loop;
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            loop = m_loops.Remove( handle );
        }
        if( !loop )
            return;

        // Join outside the lock so other sessions stay reachable meanwhile
        loop->Stop();
        loop->GetSession()->Close();
    }

    void SessionRegistry::CloseAll()
    {
        std::vector<Scope<SessionLoop>> loops;
        {
            std::lock_guard<std::mutex> lock( m_mutex );
            loops = m_loops.RemoveAll();
        }

        for( auto& loop: loops )
            loop->Stop();
        for( auto& loop: loops )
            loop->GetSession()->Close();

        if( !loops.empty() )
            TT_INFO( "[SessionRegistry] Closed {} session(s).", loops.size() );
    }

    uint32_t SessionRegistry::GetCount() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_loops.GetCount();
    }
} // namespace TankTwin
