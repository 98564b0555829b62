/*==============================================================================
Cycle Boundaries

A charging cycle of the battery ends when there is a new opportunity to
recharge from a solar surplus. The candidate cycle boundaries are therefore
the time steps where a block of excess production begins, i.e. where the
excess rises above a threshold after a step where it was at or below the
threshold. The first step is a candidate if it has excess production.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_CYCLE_BOUNDARIES
#define HYBRID_DISPATCH_CYCLE_BOUNDARIES

#include <vector>                 // The candidate indices
#include "Typedefs.hpp"           // Series and index

namespace HybridDispatch
{
  std::vector< Index > CycleCandidates( const Series & Excess,
                                        double Threshold );
}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_CYCLE_BOUNDARIES
