/*==============================================================================
Scheduler test

Testing the construction of the charging cycles and the recording of the
dispatch. Some test cases use a window solver that records the windows it is
asked to solve and leaves the battery idle, while the others use the linear
program solver.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <cmath>
#include <algorithm>
#include <vector>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include "Parameters.hpp"
#include "EnergyBalance.hpp"
#include "HorizonSolver.hpp"
#include "LinearHorizonSolver.hpp"
#include "DispatchResult.hpp"
#include "DispatchScheduler.hpp"

using namespace HybridDispatch;

namespace
{
  BatteryParameters UnitBattery( double InitialSOC )
  {
    BatteryParameters Battery;

    Battery.Capacity            = 1.0;
    Battery.PowerLimit          = 1.0;
    Battery.ChargeEfficiency    = 0.95;
    Battery.DischargeEfficiency = 0.95;
    Battery.SOCMin              = 0.1;
    Battery.SOCMax              = 0.9;
    Battery.SOCInitial          = InitialSOC;

    return Battery;
  }

  DispatchParameters DefaultDispatch( const BatteryParameters & Battery )
  {
    DispatchParameters Dispatch;

    ValidateParameters( Battery, Dispatch );

    return Dispatch;
  }

  // Production of one unit every second step and no load, so that every
  // second step is the start of a block of excess production.

  Series AlternatingProduction( Index Blocks )
  {
    Series Production;

    for ( Index i = 0; i < Blocks; i++ )
    {
      Production.push_back( 1.0 );
      Production.push_back( 0.0 );
    }

    return Production;
  }

  // The recording solver forwards to another solver if one is given, or
  // returns the idle battery. The windows and the initial states of charge
  // are remembered.

  class RecordingSolver : public HorizonSolver
  {
  public:

    struct Call
    {
      Index Start, End;
      double InitialSOC;
    };

    std::vector< Call > Calls;

  private:

    HorizonSolver * Inner;

  public:

    virtual HorizonSolution Solve( Index Start, Index End,
                                   double InitialSOC ) override
    {
      Calls.push_back( { Start, End, InitialSOC } );

      if ( Inner == nullptr )
        return HorizonSolution::Idle( End > Start ? End - Start : 0 );
      else
        return Inner->Solve( Start, End, InitialSOC );
    }

    RecordingSolver( HorizonSolver * Forward = nullptr )
    : HorizonSolver(), Calls(), Inner( Forward )
    {}
  };

  // A solver returning a window of the wrong length

  class ShortSolver : public HorizonSolver
  {
  public:

    virtual HorizonSolution Solve( Index Start, Index End, double ) override
    { return HorizonSolution::Idle( End - Start - 1 ); }
  };
}

/*==============================================================================

 Result buffer

==============================================================================*/

BOOST_AUTO_TEST_SUITE( ResultBuffer )

BOOST_AUTO_TEST_CASE( StepsAreRecordedOnce )
{
  DispatchResult Result( 2 );

  BOOST_CHECK( !Result.Complete() );

  Result.Record( 0, 0.5, 0.0, 0.0, 0.1, 0.6 );

  BOOST_CHECK_THROW( Result.Record( 0, 0.0, 0.0, 0.0, 0.0, 0.6 ),
                     std::logic_error );
  BOOST_CHECK_THROW( Result.Record( 2, 0.0, 0.0, 0.0, 0.0, 0.6 ),
                     std::out_of_range );
  BOOST_CHECK( !Result.Complete() );

  Result.Record( 1, 0.0, 0.2, 0.3, 0.0, 0.4 );

  BOOST_CHECK( Result.Complete() );
  BOOST_CHECK_EQUAL( Result.Charge()[0], 0.5 );
  BOOST_CHECK_EQUAL( Result.Discharge()[1], 0.2 );
  BOOST_CHECK_EQUAL( Result.GridImport()[1], 0.3 );
  BOOST_CHECK_EQUAL( Result.Curtailment()[0], 0.1 );
  BOOST_CHECK_EQUAL( Result.SOC()[1], 0.4 );
}

BOOST_AUTO_TEST_SUITE_END()

/*==============================================================================

 Cycle construction

==============================================================================*/

BOOST_AUTO_TEST_SUITE( CycleConstruction )

// Without any excess production the battery is idle, all load is imported
// and the solver is never used.

BOOST_AUTO_TEST_CASE( NoExcessMeansPassiveSeries )
{
  BatteryParameters  Battery( UnitBattery( 0.5 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );
  EnergyBalance      Balance( Series( 3, 1.0 ), Series( 3, 0.0 ) );
  RecordingSolver    Solver;

  DispatchScheduler Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchResult    Result( Scheduler.Run() );

  BOOST_CHECK( Result.Complete() );
  BOOST_CHECK( Solver.Calls.empty() );
  BOOST_CHECK( Result.Cycles().empty() );
  BOOST_CHECK( Result.Charge()      == Series( 3, 0.0 ) );
  BOOST_CHECK( Result.Discharge()   == Series( 3, 0.0 ) );
  BOOST_CHECK( Result.GridImport()  == Series( 3, 1.0 ) );
  BOOST_CHECK( Result.Curtailment() == Series( 3, 0.0 ) );
  BOOST_CHECK( Result.SOC()         == Series( 3, 0.5 ) );
}

// One block of excess production followed by an expensive hour

BOOST_AUTO_TEST_CASE( SingleCycleStoresAndUsesTheSurplus )
{
  BatteryParameters  Battery( UnitBattery( 0.1 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );

  Series Price{ 10.0, 20.0, 5.0, 30.0, 15.0 };
  EnergyBalance Balance( Series( 5, 1.0 ), Series{ 0.0, 0.0, 3.0, 0.0, 0.0 } );

  LinearHorizonSolver LinearSolver( Price, Balance, Battery, Dispatch );
  RecordingSolver     Solver( &LinearSolver );
  DispatchScheduler   Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchResult      Result( Scheduler.Run() );

  BOOST_REQUIRE( Result.Complete() );
  BOOST_REQUIRE_EQUAL( Result.Cycles().size(), 1 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].Start, 2 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].End, 5 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].Extensions, 0 );
  BOOST_CHECK( Result.Cycles()[0].Result == HorizonSolution::Outcome::Optimal );

  BOOST_REQUIRE_EQUAL( Solver.Calls.size(), 1 );
  BOOST_CHECK_EQUAL( Solver.Calls[0].Start, 2 );
  BOOST_CHECK_EQUAL( Solver.Calls[0].End, 5 );
  BOOST_CHECK_EQUAL( Solver.Calls[0].InitialSOC, 0.1 );

  // Passive steps before the cycle

  for ( Index t = 0; t < 2; t++ )
  {
    BOOST_CHECK_EQUAL( Result.Charge()[t], 0.0 );
    BOOST_CHECK_EQUAL( Result.Discharge()[t], 0.0 );
    BOOST_CHECK_EQUAL( Result.GridImport()[t], 1.0 );
    BOOST_CHECK_EQUAL( Result.SOC()[t], 0.1 );
  }

  BOOST_CHECK_CLOSE( Result.Charge()[2], 0.8 / 0.95, 0.1 );
  BOOST_CHECK_CLOSE( Result.Curtailment()[2], 3.0 - 1.0 - 0.8 / 0.95, 0.1 );
  BOOST_CHECK_CLOSE( Result.SOC()[2], 0.9, 0.1 );

  BOOST_CHECK_CLOSE( Result.Discharge()[3], 0.76, 0.1 );
  BOOST_CHECK_CLOSE( Result.GridImport()[3], 1.0 - Result.Discharge()[3],
                     1e-9 );
  BOOST_CHECK_CLOSE( Result.SOC()[3], 0.1, 0.1 );
  BOOST_CHECK_CLOSE( Result.GridImport()[4], 1.0, 0.1 );
}

// A full battery at every block start extends the window until the extension
// limit is reached.

BOOST_AUTO_TEST_CASE( FullBatteryExtendsToTheLimit )
{
  BatteryParameters  Battery( UnitBattery( 0.9 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );

  Series        Production( AlternatingProduction( 15 ) );
  EnergyBalance Balance( Series( Production.size(), 0.0 ), Production );

  LinearHorizonSolver LinearSolver( Series( Production.size(), 10.0 ),
                                    Balance, Battery, Dispatch );
  DispatchScheduler   Scheduler( Balance, Battery, Dispatch, LinearSolver );
  DispatchResult      Result( Scheduler.Run() );

  BOOST_REQUIRE( Result.Complete() );
  BOOST_REQUIRE_EQUAL( Result.Cycles().size(), 1 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].Start, 0 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].End, 22 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].Extensions, 10 );

  for ( Index t = 0; t < Production.size(); t++ )
  {
    BOOST_CHECK_SMALL( Result.Charge()[t], 1e-5 );
    BOOST_CHECK_CLOSE( Result.SOC()[t], 0.9, 1e-3 );
  }

  // The steps after the cycle are passive and the excess is curtailed

  BOOST_CHECK_EQUAL( Result.Curtailment()[22], 1.0 );
  BOOST_CHECK_EQUAL( Result.Charge()[22], 0.0 );
}

BOOST_AUTO_TEST_CASE( ExtensionStopsAtTheEndOfTheSeries )
{
  BatteryParameters  Battery( UnitBattery( 0.9 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );

  Series        Production( AlternatingProduction( 3 ) );
  EnergyBalance Balance( Series( Production.size(), 0.0 ), Production );

  LinearHorizonSolver LinearSolver( Series( Production.size(), 10.0 ),
                                    Balance, Battery, Dispatch );
  DispatchScheduler   Scheduler( Balance, Battery, Dispatch, LinearSolver );
  DispatchResult      Result( Scheduler.Run() );

  BOOST_REQUIRE_EQUAL( Result.Cycles().size(), 1 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].End, 6 );
  BOOST_CHECK_EQUAL( Result.Cycles()[0].Extensions, 2 );
}

// Every extended window is solved again from the start of the cycle with the
// state of charge at the start of the cycle.

BOOST_AUTO_TEST_CASE( ExtendedWindowsAreSolvedFromTheCycleStart )
{
  BatteryParameters  Battery( UnitBattery( 0.9 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );

  Series        Production( AlternatingProduction( 3 ) );
  EnergyBalance Balance( Series( Production.size(), 0.0 ), Production );
  RecordingSolver Solver;

  DispatchScheduler Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchResult    Result( Scheduler.Run() );

  BOOST_REQUIRE_EQUAL( Solver.Calls.size(), 3 );

  for ( Index i = 0; i < 3; i++ )
  {
    BOOST_CHECK_EQUAL( Solver.Calls[i].Start, 0 );
    BOOST_CHECK_EQUAL( Solver.Calls[i].End, 2 * ( i + 1 ) );
    BOOST_CHECK_EQUAL( Solver.Calls[i].InitialSOC, 0.9 );
  }

  BOOST_CHECK( Result.Cycles()[0].Result ==
               HorizonSolution::Outcome::Fallback );
}

BOOST_AUTO_TEST_CASE( PlanningRespectsTheExtensionLimit )
{
  BatteryParameters  Battery( UnitBattery( 0.9 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );

  Dispatch.MaxExtensions = 2;

  Series        Production( AlternatingProduction( 15 ) );
  EnergyBalance Balance( Series( Production.size(), 0.0 ), Production );
  RecordingSolver Solver;

  DispatchScheduler Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchScheduler::CyclePlan Cycle( Scheduler.PlanCycle( 0, 0.9, 1 ) );

  BOOST_CHECK_EQUAL( Cycle.Start, 0 );
  BOOST_CHECK_EQUAL( Cycle.End, 6 );
  BOOST_CHECK_EQUAL( Cycle.Extensions, 2 );
  BOOST_CHECK_EQUAL( Cycle.NextCandidate, 3 );
  BOOST_CHECK_EQUAL( Cycle.SOC.size(), 6 );
  BOOST_CHECK_EQUAL( Cycle.EndSOC, 0.9 );
  BOOST_CHECK_EQUAL( Solver.Calls.size(), 3 );

  // A window cannot end before it starts

  BOOST_CHECK_THROW( Scheduler.PlanCycle( 4, 0.5, 1 ), std::logic_error );
}

BOOST_AUTO_TEST_CASE( HeadroomIsStrict )
{
  BatteryParameters  Battery( UnitBattery( 0.5 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );
  EnergyBalance      Balance( Series( 2, 0.0 ), Series( 2, 1.0 ) );
  RecordingSolver    Solver;

  DispatchScheduler Scheduler( Balance, Battery, Dispatch, Solver );

  BOOST_CHECK( Scheduler.HasHeadroom( 0.5 ) );
  BOOST_CHECK( Scheduler.HasHeadroom( 0.9 - 2.0 * Dispatch.FullTolerance ) );
  BOOST_CHECK( !Scheduler.HasHeadroom( 0.9 ) );
  BOOST_CHECK( !Scheduler.HasHeadroom( 0.9 - 0.5 * Dispatch.FullTolerance ) );
}

BOOST_AUTO_TEST_CASE( WrongSolutionLengthIsALogicError )
{
  BatteryParameters  Battery( UnitBattery( 0.5 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );
  EnergyBalance      Balance( Series( 4, 0.0 ), Series( 4, 1.0 ) );
  ShortSolver        Solver;

  DispatchScheduler Scheduler( Balance, Battery, Dispatch, Solver );

  BOOST_CHECK_THROW( Scheduler.Run(), std::logic_error );
}

BOOST_AUTO_TEST_SUITE_END()

/*==============================================================================

 Simulation properties

==============================================================================*/
//
// Three days of hourly values with solar production around noon, an evening
// load peak, and high prices in the evening.

namespace
{
  struct ThreeDays
  {
    Series Price, Load, Production;

    ThreeDays( void )
    : Price(), Load(), Production()
    {
      const double Pi = 3.14159265358979323846;

      for ( Index t = 0; t < 72; t++ )
      {
        Index Hour = t % 24;

        Production.push_back( ( Hour >= 6 ) && ( Hour <= 18 ) ?
          3.0 * std::sin( Pi * ( Hour - 6.0 ) / 12.0 ) * ( 1.0 + 0.1 * ( t / 24 ) )
          : 0.0 );

        Load.push_back( ( Hour >= 17 ) && ( Hour < 22 ) ? 1.5 : 0.6 );
        Price.push_back( 20.0 + ( ( Hour >= 17 ) && ( Hour < 21 ) ? 40.0 : 0.0 )
                         + 2.0 * ( t % 5 ) );
      }
    }
  };
}

BOOST_AUTO_TEST_SUITE( SimulationProperties )

BOOST_AUTO_TEST_CASE( DispatchRespectsTheBatteryAndTheBalance )
{
  ThreeDays Data;

  BatteryParameters Battery( UnitBattery( 0.5 ) );
  Battery.Capacity   = 2.0;
  Battery.PowerLimit = 0.8;

  DispatchParameters Dispatch( DefaultDispatch( Battery ) );
  EnergyBalance      Balance( Data.Load, Data.Production );

  LinearHorizonSolver LinearSolver( Data.Price, Balance, Battery, Dispatch );
  RecordingSolver     Solver( &LinearSolver );
  DispatchScheduler   Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchResult      Result( Scheduler.Run() );

  BOOST_REQUIRE( Result.Complete() );
  BOOST_CHECK_EQUAL( Result.Cycles().size(), 3 );

  const double Epsilon = 1e-6;

  for ( Index t = 0; t < Result.Size(); t++ )
  {
    BOOST_CHECK_GE( Result.Charge()[t], -Epsilon );
    BOOST_CHECK_LE( Result.Charge()[t],
                    std::min( Balance.Excess[t], Battery.PowerLimit ) + Epsilon );
    BOOST_CHECK_GE( Result.Discharge()[t], -Epsilon );
    BOOST_CHECK_LE( Result.Discharge()[t],
                    std::min( Balance.Deficit[t], Battery.PowerLimit ) + Epsilon );
    BOOST_CHECK_GE( Result.GridImport()[t], -Epsilon );
    BOOST_CHECK_GE( Result.Curtailment()[t], -Epsilon );
    BOOST_CHECK_GE( Result.SOC()[t], Battery.SOCMin );
    BOOST_CHECK_LE( Result.SOC()[t], Battery.SOCMax );
  }

  // The cycles follow each other, and each starts from the state of charge
  // left by the previous step

  for ( Index i = 1; i < Result.Cycles().size(); i++ )
    BOOST_CHECK_LE( Result.Cycles()[i-1].End, Result.Cycles()[i].Start );

  for ( const auto & Call : Solver.Calls )
    BOOST_CHECK_EQUAL( Call.InitialSOC, Call.Start == 0 ?
                       Battery.SOCInitial : Result.SOC()[ Call.Start - 1 ] );
}

BOOST_AUTO_TEST_CASE( SimulationIsDeterministic )
{
  ThreeDays Data;

  BatteryParameters  Battery( UnitBattery( 0.3 ) );
  DispatchParameters Dispatch( DefaultDispatch( Battery ) );
  EnergyBalance      Balance( Data.Load, Data.Production );

  LinearHorizonSolver FirstSolver( Data.Price, Balance, Battery, Dispatch ),
                      SecondSolver( Data.Price, Balance, Battery, Dispatch );

  DispatchScheduler FirstScheduler( Balance, Battery, Dispatch, FirstSolver ),
                    SecondScheduler( Balance, Battery, Dispatch, SecondSolver );

  DispatchResult First( FirstScheduler.Run() ), Second( SecondScheduler.Run() );

  BOOST_CHECK( First.Charge()      == Second.Charge() );
  BOOST_CHECK( First.Discharge()   == Second.Discharge() );
  BOOST_CHECK( First.GridImport()  == Second.GridImport() );
  BOOST_CHECK( First.Curtailment() == Second.Curtailment() );
  BOOST_CHECK( First.SOC()         == Second.SOC() );
}

// A battery that cannot move energy still gives a complete simulation, and
// the number of windows solved is bounded by the extension limit.

BOOST_AUTO_TEST_CASE( IdleBatteryTerminates )
{
  ThreeDays Data;

  BatteryParameters Battery( UnitBattery( 0.5 ) );
  Battery.PowerLimit = 0.0;

  DispatchParameters  Dispatch( DefaultDispatch( Battery ) );
  EnergyBalance       Balance( Data.Load, Data.Production );
  LinearHorizonSolver LinearSolver( Data.Price, Balance, Battery, Dispatch );
  RecordingSolver     Solver( &LinearSolver );
  DispatchScheduler   Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchResult      Result( Scheduler.Run() );

  BOOST_REQUIRE( Result.Complete() );
  BOOST_CHECK_LE( Solver.Calls.size(), Scheduler.GetCandidates().size()
                                       * ( Dispatch.MaxExtensions + 1 ) );

  for ( Index t = 0; t < Result.Size(); t++ )
  {
    BOOST_CHECK_EQUAL( Result.Charge()[t], 0.0 );
    BOOST_CHECK_EQUAL( Result.Discharge()[t], 0.0 );
    BOOST_CHECK_EQUAL( Result.SOC()[t], 0.5 );
    BOOST_CHECK_CLOSE( Result.GridImport()[t] + Data.Production[t]
                       - Result.Curtailment()[t], Data.Load[t], 1e-9 );
  }
}

// The capacity is not validated here, and a battery that cannot store any
// energy keeps its initial state of charge through all windows.

BOOST_AUTO_TEST_CASE( BatteryWithoutCapacityTerminates )
{
  ThreeDays Data;

  BatteryParameters Battery( UnitBattery( 0.5 ) );
  Battery.Capacity = 0.0;

  DispatchParameters  Dispatch;
  EnergyBalance       Balance( Data.Load, Data.Production );
  LinearHorizonSolver LinearSolver( Data.Price, Balance, Battery, Dispatch );
  RecordingSolver     Solver( &LinearSolver );
  DispatchScheduler   Scheduler( Balance, Battery, Dispatch, Solver );
  DispatchResult      Result( Scheduler.Run() );

  BOOST_REQUIRE( Result.Complete() );
  BOOST_CHECK( !Solver.Calls.empty() );
  BOOST_CHECK_LE( Solver.Calls.size(), Scheduler.GetCandidates().size()
                                       * ( Dispatch.MaxExtensions + 1 ) );

  for ( const auto & Cycle : Result.Cycles() )
    BOOST_CHECK( Cycle.Result == HorizonSolution::Outcome::Optimal );

  for ( Index t = 0; t < Result.Size(); t++ )
  {
    BOOST_CHECK_EQUAL( Result.Charge()[t], 0.0 );
    BOOST_CHECK_EQUAL( Result.Discharge()[t], 0.0 );
    BOOST_CHECK_EQUAL( Result.SOC()[t], 0.5 );
  }
}

BOOST_AUTO_TEST_SUITE_END()
