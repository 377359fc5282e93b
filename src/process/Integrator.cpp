#include "process/Integrator.hpp"

#include "core/Log.h"
#include <algorithm>
#include <cmath>

namespace TankTwin
{
    namespace
    {
        bool IsFinite( const PlantState& s )
        {
            for( const auto& tank: s.tanks )
            {
                if( !std::isfinite( tank.level ) || !std::isfinite( tank.concentration ) )
                    return false;
            }
            return true;
        }

        // out = base + rates * dt
        PlantState Offset( const PlantState& base, const PlantRates& rates, float64_t dt )
        {
            PlantState out = base;
            for( uint32_t i = 0; i < TANK_COUNT; ++i )
            {
                out.tanks[ i ].level += rates.tanks[ i ].level * dt;
                out.tanks[ i ].concentration += rates.tanks[ i ].concentration * dt;
            }
            return out;
        }
    } // namespace

    Integrator::Integrator( const ProcessModel& model )
        : m_model( model )
    {
    }

    Result Integrator::Step( PlantState& state, const ControlValues& controls, float64_t dt )
    {
        PlantState next;
        if( !Advance( state, controls, dt, next ) || !IsFinite( next ) )
        {
            TT_ERROR( "[Integrator] Non-finite state after a {} step of {}s.", toString( GetMethod() ), dt );
            return Result::DIVERGED;
        }

        Clamp( next );

        // Utility tanks hold fixed fluids
        next[ TankId::A ].concentration = 0.0;
        next[ TankId::B ].concentration = m_model.GetParameters().brineConcentration;

        state = next;
        return Result::SUCCESS;
    }

    void Integrator::Clamp( PlantState& state )
    {
        const PlantParameters& params = m_model.GetParameters();

        for( uint32_t i = 0; i < TANK_COUNT; ++i )
        {
            TankId     id   = static_cast<TankId>( i );
            TankState& tank = state[ id ];

            float64_t maxLevel = params.MaxLevel( id );
            float64_t level    = std::clamp( tank.level, 0.0, maxLevel );
            if( level != tank.level )
            {
                TT_TRACE( "[Integrator] Clamped level of tank {} from {} to {}.", toString( id ), tank.level, level );
                tank.level = level;
                m_clampStats.levelClamps++;
            }

            if( !IsProcessTank( id ) )
                continue;

            float64_t conc = std::clamp( tank.concentration, 0.0, params.maxConcentration );
            if( conc != tank.concentration )
            {
                TT_TRACE( "[Integrator] Clamped concentration of tank {} from {} to {}.", toString( id ), tank.concentration, conc );
                tank.concentration = conc;
                m_clampStats.concentrationClamps++;
            }
        }
    }

    bool EulerIntegrator::Advance( const PlantState& state, const ControlValues& controls, float64_t dt, PlantState& next ) const
    {
        PlantRates k1 = m_model.ComputeRates( state, controls );
        if( !IsFinite( k1 ) )
            return false;

        next = Offset( state, k1, dt );
        return true;
    }

    bool RK4Integrator::Advance( const PlantState& state, const ControlValues& controls, float64_t dt, PlantState& next ) const
    {
        // Stages are evaluated on unclamped intermediate states; only the final state is clamped
        PlantRates k1 = m_model.ComputeRates( state, controls );
        if( !IsFinite( k1 ) )
            return false;

        PlantRates k2 = m_model.ComputeRates( Offset( state, k1, dt * 0.5 ), controls );
        if( !IsFinite( k2 ) )
            return false;

        PlantRates k3 = m_model.ComputeRates( Offset( state, k2, dt * 0.5 ), controls );
        if( !IsFinite( k3 ) )
            return false;

        PlantRates k4 = m_model.ComputeRates( Offset( state, k3, dt ), controls );
        if( !IsFinite( k4 ) )
            return false;

        next = state;
        for( uint32_t i = 0; i < TANK_COUNT; ++i )
        {
            next.tanks[ i ].level +=
                dt / 6.0 * ( k1.tanks[ i ].level + 2.0 * k2.tanks[ i ].level + 2.0 * k3.tanks[ i ].level + k4.tanks[ i ].level );
            next.tanks[ i ].concentration += dt / 6.0 *
                                             ( k1.tanks[ i ].concentration + 2.0 * k2.tanks[ i ].concentration + 2.0 * k3.tanks[ i ].concentration +
                                               k4.tanks[ i ].concentration );
        }
        return true;
    }

    Scope<Integrator> CreateIntegrator( IntegrationMethod method, const ProcessModel& model )
    {
        switch( method )
        {
            case IntegrationMethod::EULER:
                return CreateScope<EulerIntegrator>( model );
            case IntegrationMethod::RK4:
            default:
                return CreateScope<RK4Integrator>( model );
        }
    }
} // namespace TankTwin
