#pragma once
#include "core/Core.h"

namespace TankTwin
{
    /**
     * @brief Owns the simulated clock of a session.
     * Converts a wall-clock sampling interval into simulated time.
     */
    class TimeController
    {
    public:
        /**
         * @brief Sets the speed multiplier for the simulation.
         * 1.0 = Real-time, 2.0 = 2x speed.
         */
        void SetTimeScale( float64_t scale ) { m_timeScale = scale; }

        /**
         * @brief Returns the total accumulated simulation time (in seconds).
         */
        float64_t GetSimTime() const { return m_simTime; }

        /**
         * @brief Simulated span covered by one tick of the given wall-clock length.
         */
        float64_t GetSimDeltaTime( float64_t realDt ) const { return realDt * m_timeScale; }

        /**
         * @brief Adds an integrated span to the simulated clock.
         */
        void Advance( float64_t simDt ) { m_simTime += simDt; }

        void Reset() { m_simTime = 0.0; }

    private:
        float64_t m_timeScale = 1.0;
        float64_t m_simTime   = 0.0;
    };
} // namespace TankTwin
