#pragma once

#include "core/Core.h"
#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace TankTwin
{

    class TT_API Log
    {
    public:
        /**
         * @brief Creates the core and client loggers. Safe to call more than once.
         */
        static void Init();

        /**
         * @brief Changes the level of both loggers (e.g. to silence trace output in long runs).
         */
        static void SetLevel( spdlog::level::level_enum level );

        inline static std::shared_ptr<spdlog::logger>& GetCoreLogger() { return s_CoreLogger; }
        inline static std::shared_ptr<spdlog::logger>& GetClientLogger() { return s_ClientLogger; }

    private:
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
        static std::shared_ptr<spdlog::logger> s_ClientLogger;
    };

} // namespace TankTwin

// Automatically detect if we are inside the library or a client (app, tests)
#ifdef TT_BUILD_LIBRARY
  // Core Logging
#    define TT_TRACE( ... )    ::TankTwin::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#    define TT_INFO( ... )     ::TankTwin::Log::GetCoreLogger()->info( __VA_ARGS__ )
#    define TT_WARN( ... )     ::TankTwin::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#    define TT_ERROR( ... )    ::TankTwin::Log::GetCoreLogger()->error( __VA_ARGS__ )
#    define TT_CRITICAL( ... ) ::TankTwin::Log::GetCoreLogger()->critical( __VA_ARGS__ )
#else
  // Client Logging
#    define TT_TRACE( ... )    ::TankTwin::Log::GetClientLogger()->trace( __VA_ARGS__ )
#    define TT_INFO( ... )     ::TankTwin::Log::GetClientLogger()->info( __VA_ARGS__ )
#    define TT_WARN( ... )     ::TankTwin::Log::GetClientLogger()->warn( __VA_ARGS__ )
#    define TT_ERROR( ... )    ::TankTwin::Log::GetClientLogger()->error( __VA_ARGS__ )
#    define TT_CRITICAL( ... ) ::TankTwin::Log::GetClientLogger()->critical( __VA_ARGS__ )
#endif

#if defined( _MSC_VER )
#    define TT_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define TT_DEBUGBREAK() raise( SIGTRAP )
#else
#    define TT_DEBUGBREAK()
#endif

#ifdef TT_DEBUG
#    define TT_ASSERT( x, ... )                                                                                                                      \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                TT_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                                    \
                TT_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define TT_ASSERT( x, ... )
#endif
