#include "process/ProcessModel.hpp"

#include <cmath>

namespace TankTwin
{
    namespace
    {
        constexpr float64_t PI = 3.14159265358979323846;
    }

    ProcessModel::ProcessModel( const PlantParameters& params )
        : m_params( params )
    {
    }

    float64_t ProcessModel::ConeRadius( TankId id, float64_t level ) const
    {
        const ConicalTankParams& cone = m_params.Process( id );
        return cone.baseRadius + ( cone.topRadius - cone.baseRadius ) * level / cone.maxLevel;
    }

    float64_t ProcessModel::CrossSection( TankId id, float64_t level ) const
    {
        if( !IsProcessTank( id ) )
        {
            float64_t r = m_params.Utility( id ).radius;
            return PI * r * r;
        }
        float64_t r = ConeRadius( id, level );
        return PI * r * r;
    }

    float64_t ProcessModel::Volume( TankId id, float64_t level ) const
    {
        if( !IsProcessTank( id ) )
            return CrossSection( id, level ) * level;

        // Frustum between the base and the liquid surface
        float64_t r0 = m_params.Process( id ).baseRadius;
        float64_t r  = ConeRadius( id, level );
        return PI * level * ( r0 * r0 + r0 * r + r * r ) / 3.0;
    }

    float64_t ProcessModel::OutletFlow( TankId id, float64_t level, float64_t opening ) const
    {
        if( level <= 0.0 )
            return 0.0;
        return opening * m_params.Process( id ).dischargeCoefficient * std::sqrt( 2.0 * m_params.gravity * level );
    }

    PlantRates ProcessModel::ComputeRates( const PlantState& state, const ControlValues& controls ) const
    {
        PlantRates rates{};

        const float64_t eps        = m_params.levelEpsilon;
        const bool_t    waterReady = state[ TankId::A ].level > eps;
        const bool_t    brineReady = state[ TankId::B ].level > eps;
        const float64_t waterConc  = 0.0;
        const float64_t brineConc  = m_params.brineConcentration;

        float64_t waterDemand = 0.0;
        float64_t brineDemand = 0.0;

        for( TankId id: { TankId::C, TankId::D, TankId::E } )
        {
            const ConicalTankParams& cone  = m_params.Process( id );
            const TankState&         tank  = state[ id ];
            const float64_t          h     = tank.level;

            // Pumps run dry once their reservoir is empty
            float64_t qWater = waterReady ? cone.waterPumpGain * controls[ ChannelFor( id, ActuatorKind::WATER_PUMP ) ] : 0.0;
            float64_t qBrine = brineReady ? cone.brinePumpGain * controls[ ChannelFor( id, ActuatorKind::BRINE_PUMP ) ] : 0.0;
            float64_t qOut   = OutletFlow( id, h, controls[ ChannelFor( id, ActuatorKind::OUTLET_VALVE ) ] );

            waterDemand += qWater;
            brineDemand += qBrine;

            rates[ id ].level = ( qWater + qBrine - qOut ) / CrossSection( id, h );

            if( h < eps )
            {
                rates[ id ].concentration = 0.0;
            }
            else
            {
                float64_t inflowMass      = qWater * waterConc + qBrine * brineConc;
                rates[ id ].concentration = ( inflowMass - tank.concentration * ( qWater + qBrine ) ) / Volume( id, h );
            }
        }

        const CylindricalTankParams& a = m_params.Utility( TankId::A );
        const CylindricalTankParams& b = m_params.Utility( TankId::B );

        rates[ TankId::A ].level = ( a.supplyGain * controls[ ControlChannel::SUPPLY_VALVE_A ] - waterDemand ) / CrossSection( TankId::A, 0.0 );
        rates[ TankId::B ].level = ( b.supplyGain * controls[ ControlChannel::SUPPLY_VALVE_B ] - brineDemand ) / CrossSection( TankId::B, 0.0 );

        return rates;
    }
} // namespace TankTwin
