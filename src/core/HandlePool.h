#pragma once
#include "core/Log.h"
#include <queue>
#include <vector>

namespace TankTwin
{
    /**
     * @brief Owning slot pool addressed by generational handles.
     * Not thread-safe; owners guard it with their own lock.
     */
    template<typename T, typename HandleType>
    class HandlePool
    {
        struct Slot
        {
            Scope<T> object     = nullptr;
            uint32_t generation = 1; // 0 is reserved for Invalid handles
        };

    public:
        /**
         * @brief Takes ownership of an object and returns its handle.
         */
        HandleType Insert( Scope<T> object )
        {
            TT_ASSERT( object != nullptr, "HandlePool::Insert called with a null object" );

            uint32_t index;
            if( !m_freeIndices.empty() )
            {
                index = m_freeIndices.front();
                m_freeIndices.pop();
            }
            else
            {
                index = static_cast<uint32_t>( m_slots.size() );
                m_slots.emplace_back();
            }

            Slot& slot  = m_slots[ index ];
            slot.object = std::move( object );
            m_count++;

            return HandleType( index, slot.generation );
        }

        /**
         * @return Pointer to T or nullptr if the handle is invalid or stale.
         */
        T* Get( HandleType handle ) const
        {
            if( !handle.IsValid() )
                return nullptr;

            uint32_t index = handle.GetIndex();
            if( index >= m_slots.size() )
                return nullptr;

            const Slot& slot = m_slots[ index ];
            if( slot.generation != handle.GetGeneration() )
                return nullptr;

            return slot.object.get();
        }

        /**
         * @brief Removes an object and returns ownership. Stale handles return nullptr.
         */
        Scope<T> Remove( HandleType handle )
        {
            if( Get( handle ) == nullptr )
                return nullptr;

            Slot&    slot   = m_slots[ handle.GetIndex() ];
            Scope<T> object = std::move( slot.object );

            // Invalidate every outstanding handle to this slot
            slot.generation++;
            m_freeIndices.push( handle.GetIndex() );
            m_count--;

            return object;
        }

        /**
         * @brief Moves every live object out, leaving the pool empty.
         */
        std::vector<Scope<T>> RemoveAll()
        {
            std::vector<Scope<T>> objects;
            for( uint32_t index = 0; index < m_slots.size(); ++index )
            {
                Slot& slot = m_slots[ index ];
                if( !slot.object )
                    continue;

                objects.push_back( std::move( slot.object ) );
                slot.generation++;
                m_freeIndices.push( index );
            }
            m_count = 0;
            return objects;
        }

        uint32_t GetCount() const { return m_count; }

        // Index the next Insert will use, so callers can build the handle up front
        HandleType PeekNextHandle() const
        {
            if( !m_freeIndices.empty() )
            {
                uint32_t index = m_freeIndices.front();
                return HandleType( index, m_slots[ index ].generation );
            }
            return HandleType( static_cast<uint32_t>( m_slots.size() ), 1 );
        }

    private:
        std::vector<Slot>    m_slots;
        std::queue<uint32_t> m_freeIndices;
        uint32_t             m_count = 0;
    };
} // namespace TankTwin
