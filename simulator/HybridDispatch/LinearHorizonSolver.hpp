/*==============================================================================
Linear Horizon Solver

The dispatch of a window is formulated as a linear program. The decision
variables are the energy charged and the energy discharged for each step of
the window, and one slack variable for the soft end-of-window target.

The charge of a step is bounded by the excess production of the step and the
power limit of the battery, and the discharge is bounded by the deficit and
the power limit. The state of charge after step k relative to the state of
charge at the start of the window is the cumulative sum

  D[k] = Sum_{i <= k} ( eta_c * c[i] - d[i] / eta_d ) / Capacity

and it must stay between SOCMin - SOC0 and SOCMax - SOC0 for all steps. This
gives two inequality constraints per step. The state of charge at the end of
the window may exceed the end target only by the slack variable s, i.e.

  D[n-1] - s / Capacity <= EndTarget - SOC0

The objective is to minimise

  - Sum_i Bonus * w[i] * c[i] - Sum_i Price[i] * d[i] + Penalty * s

where w[i] is the charge weight of the step. Hence charging early in the
window is rewarded, discharging is valued at the price of the step, and
ending the window with a high state of charge is penalised.

Variables whose upper bound is zero cannot take any other value than zero,
and they are not given to the solver. Only steps where at least one variable
is free contribute state of charge constraints since the cumulative sum does
not change over the other steps. If there are no free variables at all, the
idle solution is optimal and the solver is not invoked.

The linear program is solved with NLopt's sequential quadratic programming
algorithm. If the solver fails, or the returned point violates the
constraints, the fallback solution is returned for the window.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_LINEAR_HORIZON_SOLVER
#define HYBRID_DISPATCH_LINEAR_HORIZON_SOLVER

#include <vector>                            // Variable bounds
#include <algorithm>                         // Standard min

// The optimization library
#include "Variables.hpp"                     // Variable types
#include "Objective.hpp"                     // Linear objective
#include "Constraints.hpp"                   // Linear constraints
#include "NonLinear/Algorithms.hpp"          // The algorithms
#include "NonLinear/Optimizer.hpp"           // The solver
#include "NonLinear/QuasiNewton.hpp"         // The SLSQP interface

// The hybrid dispatch definitions
#include "Typedefs.hpp"                      // Series and index
#include "Parameters.hpp"                    // Battery and dispatch parameters
#include "TimeSeries.hpp"                    // Prices
#include "EnergyBalance.hpp"                 // Excess and deficit
#include "HorizonSolver.hpp"                 // The solver interface

namespace NL = Optimization::NonLinear;

namespace HybridDispatch
{

class LinearHorizonSolver
: public HorizonSolver,
  virtual public
  NL::Optimizer< NL::Algorithm::Local::QuasiNewton::QuadraticProgramming >,
  virtual public Optimization::LinearObjective,
  virtual public Optimization::LinearInEqConstraints
{
private:

  // The solver keeps its own copy of the series defining the windows

  const Series Price, Excess, Deficit;

  const BatteryParameters  Battery;
  const DispatchParameters Dispatch;

  // The bounds of the current window problem are computed when the problem is
  // set up and returned when the optimizer creates the solver.

  std::vector< Interval > VariableBounds;

  // A returned solution is only accepted if no constraint is violated by more
  // than this tolerance in state of charge units.

  static constexpr double FeasibilityTolerance = 1e-6;

protected:

  virtual std::vector< Interval > BoundConstraints( void ) override
  { return VariableBounds; }

public:

  // The upper bound of the charge and the discharge of a step of the window
  // starting at the given index.

  inline double ChargeLimit( Index t ) const
  { return std::min( Excess[t], Battery.PowerLimit ); }

  inline double DischargeLimit( Index t ) const
  { return std::min( Deficit[t], Battery.PowerLimit ); }

  // Solving the window problem. It throws an out of range exception if the
  // window is not inside the series given to the constructor.

  virtual HorizonSolution Solve( Index Start, Index End,
                                 double InitialSOC ) override;

  // The constructor takes the prices and the energy balance of the full
  // time series, and the validated parameters.

  LinearHorizonSolver( const Series & Prices, const EnergyBalance & Balance,
                       const BatteryParameters & BatteryValues,
                       const DispatchParameters & DispatchValues );

  LinearHorizonSolver( void ) = delete;
  LinearHorizonSolver( const LinearHorizonSolver & Other ) = delete;

  virtual ~LinearHorizonSolver( void )
  {}
};

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_LINEAR_HORIZON_SOLVER
