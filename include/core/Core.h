#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

// Static builds export nothing. Shared Windows builds switch on TT_SHARED.
#if defined( _WIN32 ) && defined( TT_SHARED )
#    ifdef TT_BUILD_LIBRARY
#        define TT_API __declspec( dllexport )
#    else
#        define TT_API __declspec( dllimport )
#    endif
#else
#    define TT_API
#endif

namespace TankTwin
{
    using bool_t    = bool;
    using float64_t = double;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS         = 0,
        FAIL            = -1,
        NOT_IMPLEMENTED = -2,
        INVALID_ARGS    = -3,
        TIMEOUT         = -4,
        SESSION_CLOSED  = -6,
        UNKNOWN_COMMAND = -7,
        DIVERGED        = -8,
        OUT_OF_MEMORY   = -10
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::NOT_IMPLEMENTED:
                return "NOT_IMPLEMENTED";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::TIMEOUT:
                return "TIMEOUT";
            case Result::SESSION_CLOSED:
                return "SESSION_CLOSED";
            case Result::UNKNOWN_COMMAND:
                return "UNKNOWN_COMMAND";
            case Result::DIVERGED:
                return "DIVERGED";
            case Result::OUT_OF_MEMORY:
                return "OUT_OF_MEMORY";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace TankTwin
