/*==============================================================================
Horizon Solver

This implements the solution type and the charge weights.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include "HorizonSolver.hpp"

// -----------------------------------------------------------------------------
// Solution
// -----------------------------------------------------------------------------

HybridDispatch::HorizonSolution::HorizonSolution( Outcome SolutionType,
  const Series & ChargeValues, const Series & DischargeValues )
: Result( SolutionType ), Charge( ChargeValues ), Discharge( DischargeValues )
{
  if ( Charge.size() != Discharge.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "A horizon solution must have one discharge value for "
                 << "each of the " << Charge.size() << " charge values, but "
                 << Discharge.size() << " were given";

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

HybridDispatch::HorizonSolution
HybridDispatch::HorizonSolution::Idle( Index WindowLength )
{
  if ( WindowLength == 0 )
    return HorizonSolution( Outcome::Empty, Series(), Series() );
  else
    return HorizonSolution( Outcome::Fallback, Series( WindowLength, 0.0 ),
                            Series( WindowLength, 0.0 ) );
}

std::string HybridDispatch::OutcomeName( HorizonSolution::Outcome Result )
{
  switch( Result )
  {
    case HorizonSolution::Outcome::Optimal:
      return "optimal";
    case HorizonSolution::Outcome::Fallback:
      return "fallback";
    case HorizonSolution::Outcome::Empty:
      break;
  }

  return "empty";
}

// -----------------------------------------------------------------------------
// Weights
// -----------------------------------------------------------------------------

HybridDispatch::Series
HybridDispatch::ChargeWeights( Index WindowLength, ChargeWeighting Shape )
{
  Series Weights( WindowLength, 1.0 );

  if ( ( Shape == ChargeWeighting::Linear ) && ( WindowLength > 1 ) )
    for ( Index i = 0; i < WindowLength; i++ )
      Weights[i] = 1.0 - static_cast< double >( i ) /
                         static_cast< double >( WindowLength - 1 );

  return Weights;
}
