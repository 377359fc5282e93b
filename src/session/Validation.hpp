#pragma once
#include "TankTwinTypes.h"
#include <string>

namespace TankTwin
{
    /**
     * @brief Synchronous checks applied before anything reaches a session.
     * Each function returns Result::SUCCESS or the rejecting code, and fills `reason`
     * with a human readable explanation for the log.
     */
    Result ValidateConfig( const TankTwinConfig& config, std::string& reason );
    Result ValidateSessionDesc( const SessionDesc& desc, const TankTwinConfig& config, std::string& reason );
    Result ValidateCommand( const Command& command, const PlantParameters& plant, std::string& reason );
} // namespace TankTwin
