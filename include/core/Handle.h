#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace TankTwin
{
    /**
     * @brief Opaque reference to an object owned by a registry.
     * Packs a slot index (32-bit) and a generation (32-bit) so a handle to a closed
     * session never resolves to the session that later reuses its slot.
     */
    struct Handle
    {
        uint64_t value = 0;

        Handle() = default;
        Handle( uint32_t index, uint32_t generation ) { value = ( ( uint64_t )generation << 32 ) | index; }

        inline uint32_t GetIndex() const { return ( uint32_t )( value & 0xFFFFFFFF ); }
        inline uint32_t GetGeneration() const { return ( uint32_t )( value >> 32 ); }
        inline bool     IsValid() const { return value != 0; }

        explicit operator bool() const { return IsValid(); }

        // "index:generation", used in log lines
        std::string ToString() const { return std::to_string( GetIndex() ) + ":" + std::to_string( GetGeneration() ); }

        inline bool operator==( const Handle& other ) const { return value == other.value; }
        inline bool operator!=( const Handle& other ) const { return value != other.value; }
        inline bool operator<( const Handle& other ) const { return value < other.value; }
    };

} // namespace TankTwin

namespace std
{
    template<>
    struct hash<TankTwin::Handle>
    {
        size_t operator()( const TankTwin::Handle& h ) const { return hash<uint64_t>()( h.value ); }
    };
} // namespace std

/**
 * @brief Defines a strong handle type derived from Handle.
 * Usage: DEFINE_HANDLE( SessionHandle );
 */
#define DEFINE_HANDLE( Name )                                                                                                                        \
    struct Name : public ::TankTwin::Handle                                                                                                          \
    {                                                                                                                                                \
        using Handle::Handle;                                                                                                                        \
        static const Name Invalid;                                                                                                                   \
    };                                                                                                                                               \
    inline const Name Name::Invalid = Name( 0, 0 )
