#include "core/Log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace TankTwin
{

    Ref<spdlog::logger> Log::s_CoreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_ClientLogger = nullptr;

    void Log::Init()
    {
        if( s_CoreLogger != nullptr )
        {
            return;
        }

        spdlog::set_pattern( "%^[%T] %n: %v%$" );

        // Reuse loggers registered by an earlier Init in the same process (e.g. a second facade).
        s_CoreLogger = spdlog::get( "TANKTWIN" );
        if( !s_CoreLogger )
            s_CoreLogger = spdlog::stdout_color_mt( "TANKTWIN" );

        s_ClientLogger = spdlog::get( "APP" );
        if( !s_ClientLogger )
            s_ClientLogger = spdlog::stdout_color_mt( "APP" );

        s_CoreLogger->set_level( spdlog::level::trace );
        s_ClientLogger->set_level( spdlog::level::trace );

        s_CoreLogger->info( "Logging system initialized." );
    }

    void Log::SetLevel( spdlog::level::level_enum level )
    {
        Init();
        s_CoreLogger->set_level( level );
        s_ClientLogger->set_level( level );
    }

} // namespace TankTwin
