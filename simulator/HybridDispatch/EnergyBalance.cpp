/*==============================================================================
Energy Balance

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Standard min and max
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include "EnergyBalance.hpp"

namespace
{
  // The vectors are constant members and must be computed before the
  // constructor body executes. The size check is therefore done by the
  // helper computing the first of them.

  HybridDispatch::Series
  Difference( const HybridDispatch::Series & Minuend,
              const HybridDispatch::Series & Subtrahend )
  {
    if ( Minuend.size() != Subtrahend.size() )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The energy balance needs as many consumption values ("
                   << Subtrahend.size() << ") as production values ("
                   << Minuend.size() << ")";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    HybridDispatch::Series Result( Minuend.size() );

    std::transform( Minuend.begin(), Minuend.end(), Subtrahend.begin(),
                    Result.begin(), []( double a, double b )->double{
                      return std::max( a - b, 0.0 ); } );

    return Result;
  }

  HybridDispatch::Series
  Minimum( const HybridDispatch::Series & First,
           const HybridDispatch::Series & Second )
  {
    HybridDispatch::Series Result( First.size() );

    std::transform( First.begin(), First.end(), Second.begin(),
                    Result.begin(), []( double a, double b )->double{
                      return std::min( a, b ); } );

    return Result;
  }
}

HybridDispatch::EnergyBalance::EnergyBalance( const Series & Load,
                                              const Series & Production )
: Excess( Difference( Production, Load ) ),
  Deficit( Difference( Load, Production ) ),
  DirectUse( Minimum( Production, Load ) )
{}
