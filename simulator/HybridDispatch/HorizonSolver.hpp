/*==============================================================================
Horizon Solver

A horizon is a window of consecutive time steps over which the battery
dispatch is optimised as one problem. The solver takes the half-open window
[Start, End) and the state of charge at the start of the window, and returns
the energy to charge and to discharge for each step of the window.

The solution is returned as an explicit result type telling if the decisions
are the optimal solution of the window problem, or if the solver failed and
the decisions are the all-zero fallback leaving the battery idle over the
window. An empty window gives an empty solution.

The solver is an abstract class so that the dispatch scheduler can be given
any implementation, and the standard implementation is the linear program
solver defined in its own header.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_HORIZON_SOLVER
#define HYBRID_DISPATCH_HORIZON_SOLVER

#include <string>                 // Outcome names
#include "Typedefs.hpp"           // Series and index
#include "Parameters.hpp"         // The charge weighting

namespace HybridDispatch
{
/*==============================================================================

 Solution

==============================================================================*/

class HorizonSolution
{
public:

  enum class Outcome
  {
    Optimal,
    Fallback,
    Empty
  };

  const Outcome Result;
  const Series  Charge, Discharge;

  inline Index Size( void ) const
  { return Charge.size(); }

  HorizonSolution( Outcome SolutionType, const Series & ChargeValues,
                   const Series & DischargeValues );

  // The fallback solution for a window of a given length has only zero
  // decisions.

  static HorizonSolution Idle( Index WindowLength );

  HorizonSolution( void ) = delete;
};

std::string OutcomeName( HorizonSolution::Outcome Result );

/*==============================================================================

 Charge weights

==============================================================================*/
//
// The early charge bonus of each step of a window is weighted. The linear
// weighting decays from 1 at the first step to 0 at the last step of the
// window, and a window of a single step has weight 1. The uniform weighting
// is 1 for all steps.

Series ChargeWeights( Index WindowLength, ChargeWeighting Shape );

/*==============================================================================

 Solver interface

==============================================================================*/

class HorizonSolver
{
public:

  virtual HorizonSolution Solve( Index Start, Index End,
                                 double InitialSOC ) = 0;

  HorizonSolver( void )
  {}

  virtual ~HorizonSolver( void )
  {}
};

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_HORIZON_SOLVER
