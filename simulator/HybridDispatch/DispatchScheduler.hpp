/*==============================================================================
Dispatch Scheduler

The scheduler partitions the time series into charging cycles. A cycle starts
at the beginning of a block of excess solar production where the battery has
room for more energy, and it ends at the beginning of the next such block.
The dispatch of each cycle is optimised by the horizon solver for the window
of the cycle, starting from the state of charge left by the previous cycle.

If the battery is still full at the end of a window, the next block of excess
production is not a real opportunity to charge. The window is then extended to
the following block start, and the extended window is solved again from the
start of the cycle. The number of extensions is limited so that the scheduler
terminates for any input, and the window is accepted when the battery has
room at its end, when it ends at the end of the time series, or when the
extension limit is reached.

The time steps before the first cycle, between cycles, and after the last
cycle are simulated passively: The battery is idle, the deficit is imported
from the grid and the excess is curtailed. If there are no blocks of excess
production at all, the battery is idle over the whole series and there is
nothing to curtail.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_SCHEDULER
#define HYBRID_DISPATCH_SCHEDULER

#include <vector>                 // Candidates

#include "Typedefs.hpp"           // Series and index
#include "Parameters.hpp"         // Battery and dispatch parameters
#include "EnergyBalance.hpp"      // Excess and deficit
#include "HorizonSolver.hpp"      // The window solver
#include "DispatchResult.hpp"     // The result buffer

namespace HybridDispatch
{

class DispatchScheduler
{
public:

  using CandidateIndex = std::vector< Index >::size_type;

  // A planned cycle is the accepted window with the decisions of the solver
  // and the state of charge after each step of the window. The next candidate
  // is the position in the candidate list of the candidate ending the window,
  // or the size of the list if the window ends at the end of the series.

  struct CyclePlan
  {
    Index Start, End;
    unsigned int Extensions;
    HorizonSolution::Outcome Result;
    Series Charge, Discharge, SOC;
    double EndSOC;
    CandidateIndex NextCandidate;
  };

private:

  const Series Excess, Deficit;
  const BatteryParameters  Battery;
  const DispatchParameters Dispatch;
  const std::vector< Index > Candidates;

  // The solver is owned by the caller

  HorizonSolver & Solver;

  // The state of charge is updated by a step's decisions and kept within the
  // limits of the battery. A battery without capacity keeps its state.

  double NextSOC( double SOC, double Charge, double Discharge ) const;

  // The passive steps of an interval are recorded with the battery idle at
  // the given state of charge.

  void RecordPassive( DispatchResult & Result, Index From, Index To,
                      double SOC, bool Curtail = true ) const;

public:

  inline bool HasHeadroom( double SOC ) const
  { return SOC < Battery.SOCMax - Dispatch.FullTolerance; }

  inline const std::vector< Index > & GetCandidates( void ) const
  { return Candidates; }

  // Planning a cycle starts from the given time step and state of charge,
  // and the tentative end of the window is the candidate at the given
  // position of the candidate list.

  CyclePlan PlanCycle( Index Start, double StartSOC,
                       CandidateIndex NextCandidate );

  // The full simulation returns a completely recorded result buffer.

  DispatchResult Run( void );

  DispatchScheduler( const EnergyBalance & Balance,
                     const BatteryParameters & BatteryValues,
                     const DispatchParameters & DispatchValues,
                     HorizonSolver & WindowSolver );

  DispatchScheduler( void ) = delete;
  DispatchScheduler( const DispatchScheduler & Other ) = delete;
};

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_SCHEDULER
