/*==============================================================================
Dispatch Result

The result of the dispatch simulation is one record per time step giving the
energy charged and discharged, the energy imported from the grid, the surplus
production curtailed, and the state of charge of the battery after the step.
The result buffer is allocated for the full time series when it is created,
and each time step can be recorded only once. The buffer also keeps a summary
of the cycles that were optimised.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_RESULT
#define HYBRID_DISPATCH_RESULT

#include <vector>                 // Flags and cycle summaries

#include "Typedefs.hpp"           // Series and index
#include "HorizonSolver.hpp"      // Solution outcome

namespace HybridDispatch
{

class DispatchResult
{
public:

  // An accepted cycle is described by its window, the number of times the
  // window was extended before it was accepted, and the outcome of the final
  // solution of the window.

  struct CycleSummary
  {
    Index Start, End;
    unsigned int Extensions;
    HorizonSolution::Outcome Result;
  };

private:

  Series ChargeValues, DischargeValues, GridImportValues, CurtailmentValues,
         SOCValues;

  std::vector< bool >         Recorded;
  std::vector< CycleSummary > CycleRecords;

public:

  // Recording a time step throws a logic error if the step has already been
  // recorded, and an out of range exception if the step is not part of the
  // buffer.

  void Record( Index t, double Charge, double Discharge, double GridImport,
               double Curtailment, double SOC );

  inline void AddCycle( const CycleSummary & Cycle )
  { CycleRecords.push_back( Cycle ); }

  // The buffer is complete when all time steps have been recorded.

  bool Complete( void ) const;

  inline Index Size( void ) const
  { return Recorded.size(); }

  // Access to the columns

  inline const Series & Charge( void ) const
  { return ChargeValues; }

  inline const Series & Discharge( void ) const
  { return DischargeValues; }

  inline const Series & GridImport( void ) const
  { return GridImportValues; }

  inline const Series & Curtailment( void ) const
  { return CurtailmentValues; }

  inline const Series & SOC( void ) const
  { return SOCValues; }

  inline const std::vector< CycleSummary > & Cycles( void ) const
  { return CycleRecords; }

  DispatchResult( Index NumberOfSteps );
  DispatchResult( void ) = delete;
};

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_RESULT
