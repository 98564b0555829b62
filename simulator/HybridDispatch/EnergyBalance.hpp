/*==============================================================================
Energy Balance

The energy balance of a time step compares the solar production with the
consumption. The production directly used by the load is the smaller of the
two, the excess is the production not used by the load, and the deficit is
the consumption not covered by the production. At most one of the excess and
the deficit is positive for any time step.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_ENERGY_BALANCE
#define HYBRID_DISPATCH_ENERGY_BALANCE

#include "Typedefs.hpp"           // Series
#include "TimeSeries.hpp"         // The input series

namespace HybridDispatch
{

class EnergyBalance
{
public:

  const Series Excess, Deficit, DirectUse;

  inline Index Size( void ) const
  { return Excess.size(); }

  // The balance is derived from the consumption and the production vectors
  // that must have the same length.

  EnergyBalance( const Series & Load, const Series & Production );

  EnergyBalance( const InputSeries & Input )
  : EnergyBalance( Input.Load, Input.Production )
  {}

  EnergyBalance( void ) = delete;
};

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_ENERGY_BALANCE
