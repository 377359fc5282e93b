#pragma once
#include "TankTwinTypes.h"
#include "control/Controller.hpp"
#include "control/NoiseInjector.hpp"
#include "core/TimeController.hpp"
#include "process/Integrator.hpp"
#include "process/ProcessModel.hpp"
#include "session/CommandQueue.hpp"
#include "session/SnapshotStream.h"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace TankTwin
{
    /**
     * @brief One running simulation of the plant.
     *
     * State machine: INITIALIZED -> RUNNING <-> PAUSED, RESET -> RUNNING, any -> CLOSED.
     * Tick() is driven by exactly one thread (the session loop, or a test). Other threads
     * only Submit commands, Subscribe, read the status, or Close.
     */
    class Session
    {
    public:
        /**
         * @param controller Control law; a ProportionalController over the equilibrium is
         * created when null.
         */
        Session( SessionHandle handle, const TankTwinConfig& config, const SessionDesc& desc, Scope<Controller> controller = nullptr );
        ~Session();

        Session( const Session& )            = delete;
        Session& operator=( const Session& ) = delete;

        /**
         * @brief INITIALIZED -> RUNNING. No effect in any other state.
         */
        void Start();

        /**
         * @brief Validates and queues a command for the next tick boundary.
         */
        Result Submit( const Command& command );

        /**
         * @brief Runs one tick: drain commands, control, integrate, publish.
         * @return SUCCESS, DIVERGED or INVALID_ARGS (the session is now closed), or SESSION_CLOSED.
         */
        Result Tick();

        /**
         * @brief Registers a subscriber. Fails with SESSION_CLOSED once closed.
         */
        Result Subscribe( const Ref<SnapshotStream>& stream );

        /**
         * @brief Moves to CLOSED and ends every stream. Idempotent.
         * @param reason SUCCESS for a normal close (CLOSED event), any error code otherwise
         * (FAILED event).
         */
        void Close( Result reason = Result::SUCCESS, const std::string& message = {} );

        SessionHandle GetHandle() const { return m_handle; }
        SessionStatus GetStatus() const { return m_status.load(); }
        float64_t     GetSamplingInterval() const { return m_desc.samplingInterval; }

        // Loop-thread views, used by tests driving Tick() directly
        const PlantState&    GetPlantState() const { return m_plant; }
        const ControlValues& GetControls() const { return m_controls; }
        float64_t            GetSimTime() const { return m_clock.GetSimTime(); }
        uint64_t             GetSequence() const { return m_sequence; }
        const ClampStats&    GetClampStats() const { return m_integrator->GetClampStats(); }

    private:
        // Returns true when the batch contained a Reset
        bool ApplyCommands();
        void ApplyCommand( const Command& command, bool& resetRequested );
        void RestoreEquilibrium();
        void Publish( const PlantState& reported );

        SessionHandle       m_handle;
        TankTwinConfig      m_config;
        SessionDesc         m_desc;
        ProcessModel        m_model;
        Scope<Integrator>   m_integrator;
        Scope<Controller>   m_controller;
        NoiseInjector       m_noise;
        TimeController      m_clock;
        CommandQueue        m_commands;
        SetpointTable       m_setpoints;
        std::vector<Command> m_batch;

        PlantState    m_plant;
        ControlValues m_controls;
        uint64_t      m_sequence = 0;

        std::atomic<SessionStatus> m_status{ SessionStatus::INITIALIZED };

        std::mutex                       m_subscriberMutex;
        std::vector<Ref<SnapshotStream>> m_subscribers;
    };
} // namespace TankTwin
