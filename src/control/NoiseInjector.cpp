#include "control/NoiseInjector.hpp"

#include <algorithm>

namespace TankTwin
{
    NoiseInjector::NoiseInjector( const PlantParameters& params, uint64_t seed )
        : m_params( params )
        , m_engine( seed )
    {
    }

    void NoiseInjector::Configure( bool_t enabled, float64_t level )
    {
        m_enabled = enabled;
        m_level   = level;
    }

    float64_t NoiseInjector::Perturb( float64_t value, float64_t upperBound )
    {
        // Multiplicative noise has nothing to scale on an empty tank
        if( value == 0.0 )
            return value;

        float64_t noisy = value * ( 1.0 + m_level * m_normal( m_engine ) );
        return std::clamp( noisy, 0.0, upperBound );
    }

    PlantState NoiseInjector::Apply( const PlantState& trueState )
    {
        PlantState reported = trueState;
        if( !m_enabled || m_level <= 0.0 )
            return reported;

        for( uint32_t i = 0; i < TANK_COUNT; ++i )
        {
            TankId id                = static_cast<TankId>( i );
            reported[ id ].level     = Perturb( trueState[ id ].level, m_params.MaxLevel( id ) );

            if( IsProcessTank( id ) )
                reported[ id ].concentration = Perturb( trueState[ id ].concentration, m_params.maxConcentration );
        }
        return reported;
    }
} // namespace TankTwin
