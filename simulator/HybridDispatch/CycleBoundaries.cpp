/*==============================================================================
Cycle Boundaries

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include "CycleBoundaries.hpp"

std::vector< HybridDispatch::Index >
HybridDispatch::CycleCandidates( const Series & Excess, double Threshold )
{
  std::vector< Index > Candidates;
  bool PreviousInBlock = false;

  for ( Index t = 0; t < Excess.size(); t++ )
  {
    bool InBlock = Excess[t] > Threshold;

    if ( InBlock && !PreviousInBlock )
      Candidates.push_back( t );

    PreviousInBlock = InBlock;
  }

  return Candidates;
}
