/*==============================================================================
Dispatch Scheduler

This is the implementation of the cycle construction.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Clamping
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#ifdef HybridDispatch_DEBUG
  #include <iostream>
#endif

#include "CycleBoundaries.hpp"     // Cycle candidates
#include "DispatchScheduler.hpp"

// -----------------------------------------------------------------------------
// Battery state
// -----------------------------------------------------------------------------

double HybridDispatch::DispatchScheduler::NextSOC( double SOC, double Charge,
                                                   double Discharge ) const
{
  if ( Battery.Capacity <= 0.0 )
    return SOC;

  double Updated = SOC + ( Charge * Battery.ChargeEfficiency
                           - Discharge / Battery.DischargeEfficiency )
                         / Battery.Capacity;

  return std::clamp( Updated, Battery.SOCMin, Battery.SOCMax );
}

void HybridDispatch::DispatchScheduler::RecordPassive( DispatchResult & Result,
  Index From, Index To, double SOC, bool Curtail ) const
{
  for ( Index t = From; t < To; t++ )
    Result.Record( t, 0.0, 0.0, Deficit[t], Curtail ? Excess[t] : 0.0, SOC );
}

// -----------------------------------------------------------------------------
// Planning a cycle
// -----------------------------------------------------------------------------
//
// The window is solved from the start of the cycle, and the decisions are
// replayed to find the state of charge at the end of the window. Since the
// tentative end is always a candidate or the end of the series, the battery
// must have room at a tentative end inside the series for the window to be
// accepted.

HybridDispatch::DispatchScheduler::CyclePlan
HybridDispatch::DispatchScheduler::PlanCycle( Index Start, double StartSOC,
                                              CandidateIndex NextCandidate )
{
  const Index SeriesEnd = Excess.size();

  auto TentativeEnd = [&]( CandidateIndex Position )->Index{
    return Position < Candidates.size() ? Candidates[ Position ] : SeriesEnd;
  };

  CyclePlan Cycle{ Start, TentativeEnd( NextCandidate ), 0,
                   HorizonSolution::Outcome::Empty, Series(), Series(),
                   Series(), StartSOC, NextCandidate };

  if ( Cycle.End <= Start )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The cycle starting at " << Start << " cannot end at "
                 << Cycle.End;

    throw std::logic_error( ErrorMessage.str() );
  }

  while ( true )
  {
    HorizonSolution Solution = Solver.Solve( Start, Cycle.End, StartSOC );

    if ( Solution.Size() != Cycle.End - Start )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The solution for the window [" << Start << ","
                   << Cycle.End << ") has " << Solution.Size()
                   << " steps";

      throw std::logic_error( ErrorMessage.str() );
    }

    Cycle.Result    = Solution.Result;
    Cycle.Charge    = Solution.Charge;
    Cycle.Discharge = Solution.Discharge;
    Cycle.SOC.clear();

    double SOC = StartSOC;

    for ( Index Step = 0; Step < Solution.Size(); Step++ )
    {
      SOC = NextSOC( SOC, Solution.Charge[ Step ], Solution.Discharge[ Step ] );
      Cycle.SOC.push_back( SOC );
    }

    Cycle.EndSOC = SOC;

    #ifdef HybridDispatch_DEBUG
      std::cout << "Cycle [" << Start << "," << Cycle.End << ") extension "
                << Cycle.Extensions << " " << OutcomeName( Cycle.Result )
                << " end SOC " << Cycle.EndSOC << std::endl;
    #endif

    if ( ( Cycle.End == SeriesEnd ) || HasHeadroom( Cycle.EndSOC ) ||
         ( Cycle.Extensions >= Dispatch.MaxExtensions ) )
      break;

    // The battery is full at the next charging opportunity, and the window is
    // merged with the following one.

    Cycle.NextCandidate++;
    Cycle.End = TentativeEnd( Cycle.NextCandidate );
    Cycle.Extensions++;
  }

  return Cycle;
}

// -----------------------------------------------------------------------------
// Simulation
// -----------------------------------------------------------------------------

HybridDispatch::DispatchResult HybridDispatch::DispatchScheduler::Run( void )
{
  const Index SeriesEnd = Excess.size();
  DispatchResult Result( SeriesEnd );
  double SOC = Battery.SOCInitial;

  if ( Candidates.empty() )
  {
    RecordPassive( Result, 0, SeriesEnd, SOC, false );
    return Result;
  }

  // The first cycle starts at the first candidate where the battery has room.
  // The state of charge is constant until then, and if the battery is full
  // the first cycle starts at the first candidate anyway.

  CandidateIndex Position = 0;

  while ( ( Position < Candidates.size() ) && !HasHeadroom( SOC ) )
    Position++;

  if ( Position >= Candidates.size() )
    Position = 0;

  Index Current = Candidates[ Position ];

  RecordPassive( Result, 0, Current, SOC );

  CandidateIndex NextCandidate = Position + 1;

  while ( Current < SeriesEnd )
  {
    CyclePlan Cycle = PlanCycle( Current, SOC, NextCandidate );

    for ( Index t = Cycle.Start; t < Cycle.End; t++ )
    {
      Index Step = t - Cycle.Start;

      Result.Record( t, Cycle.Charge[ Step ], Cycle.Discharge[ Step ],
                     Deficit[t] - Cycle.Discharge[ Step ],
                     Excess[t]  - Cycle.Charge[ Step ], Cycle.SOC[ Step ] );
    }

    Result.AddCycle( { Cycle.Start, Cycle.End, Cycle.Extensions,
                       Cycle.Result } );

    SOC           = Cycle.EndSOC;
    Current       = Cycle.End;
    NextCandidate = Cycle.NextCandidate;

    while ( ( NextCandidate < Candidates.size() ) &&
            ( Candidates[ NextCandidate ] < Current ) )
      NextCandidate++;

    if ( Current >= SeriesEnd )
      break;

    // The next cycle starts at the first remaining candidate where the
    // battery has room. The battery is idle until then, and if it has no room
    // now it will not have room at any later candidate either.

    if ( ( NextCandidate < Candidates.size() ) && HasHeadroom( SOC ) )
    {
      Index NextStart = Candidates[ NextCandidate ];

      RecordPassive( Result, Current, NextStart, SOC );

      Current = NextStart;
      NextCandidate++;
    }
    else
    {
      RecordPassive( Result, Current, SeriesEnd, SOC );
      Current = SeriesEnd;
    }
  }

  return Result;
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------

HybridDispatch::DispatchScheduler::DispatchScheduler(
  const EnergyBalance & Balance, const BatteryParameters & BatteryValues,
  const DispatchParameters & DispatchValues, HorizonSolver & WindowSolver )
: Excess( Balance.Excess ), Deficit( Balance.Deficit ),
  Battery( BatteryValues ), Dispatch( DispatchValues ),
  Candidates( CycleCandidates( Balance.Excess,
                               DispatchValues.ExcessThreshold ) ),
  Solver( WindowSolver )
{}
