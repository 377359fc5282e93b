#pragma once
#include "core/Core.h"
#include <chrono>

namespace TankTwin
{

    class Timer
    {
    public:
        Timer() { Reset(); }

        void Reset() { m_start = std::chrono::steady_clock::now(); }

        // Returns elapsed time in seconds
        float64_t Elapsed() const
        {
            return std::chrono::duration_cast<std::chrono::nanoseconds>( std::chrono::steady_clock::now() - m_start ).count() * 1e-9;
        }

        // Returns elapsed time in milliseconds
        float64_t ElapsedMillis() const { return Elapsed() * 1000.0; }

    private:
        std::chrono::time_point<std::chrono::steady_clock> m_start;
    };
} // namespace TankTwin
