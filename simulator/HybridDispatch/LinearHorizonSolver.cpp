/*==============================================================================
Linear Horizon Solver

This is the implementation of the linear program for one dispatch window.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <algorithm>                         // Set union and clamping
#include <iterator>                          // Back inserter
#include <cmath>                             // Finite values
#include <sstream>                           // For nicely formatted errors
#include <stdexcept>                         // Standard exceptions
#include <string>                            // Error messages

#include <armadillo>                         // Constraint matrix

#ifdef HybridDispatch_DEBUG
  #include <iostream>
#endif

#include "LinearHorizonSolver.hpp"

/*==============================================================================

 Solving a window

==============================================================================*/

HybridDispatch::HorizonSolution
HybridDispatch::LinearHorizonSolver::Solve( Index Start, Index End,
                                            double InitialSOC )
{
  if ( End <= Start )
    return HorizonSolution::Idle( 0 );

  if ( End > Price.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The window [" << Start << "," << End << ") is not "
                 << "inside the " << Price.size() << " time steps";

    throw std::out_of_range( ErrorMessage.str() );
  }

  Index WindowLength = End - Start;

  // ---------------------------------------------------------------------------
  // Free variables
  // ---------------------------------------------------------------------------
  //
  // The steps are stored relative to the start of the window. A battery
  // without capacity cannot store anything and all variables are fixed.

  std::vector< Index > ChargeSteps, DischargeSteps;

  if ( Battery.Capacity > 0.0 )
    for ( Index Step = 0; Step < WindowLength; Step++ )
    {
      if ( ChargeLimit( Start + Step ) > 0.0 )
        ChargeSteps.push_back( Step );

      if ( DischargeLimit( Start + Step ) > 0.0 )
        DischargeSteps.push_back( Step );
    }

  if ( ChargeSteps.empty() && DischargeSteps.empty() )
    return HorizonSolution( HorizonSolution::Outcome::Optimal,
                            Series( WindowLength, 0.0 ),
                            Series( WindowLength, 0.0 ) );

  const Index NumberOfCharges    = ChargeSteps.size(),
              NumberOfDischarges = DischargeSteps.size(),
              SlackVariable      = NumberOfCharges + NumberOfDischarges;

  const Optimization::Dimension NumberOfVariables = SlackVariable + 1;

  // ---------------------------------------------------------------------------
  // Objective and bounds
  // ---------------------------------------------------------------------------
  //
  // The variables are ordered as all charge variables, all discharge variables
  // and finally the slack variable. The slack is the energy above the end
  // target, and it can never exceed the capacity.

  Series Weights( ChargeWeights( WindowLength, Dispatch.ChargeShape ) );
  Optimization::GradientVector Costs;

  VariableBounds.clear();

  for ( Index Step : ChargeSteps )
  {
    Costs.push_back( - Dispatch.ChargeBonusRate * Weights[ Step ] );
    VariableBounds.emplace_back( 0.0, ChargeLimit( Start + Step ) );
  }

  for ( Index Step : DischargeSteps )
  {
    Costs.push_back( - Price[ Start + Step ] );
    VariableBounds.emplace_back( 0.0, DischargeLimit( Start + Step ) );
  }

  Costs.push_back( Dispatch.EndSOCPenalty );
  VariableBounds.emplace_back( 0.0, Battery.Capacity );

  SetCostCoefficients( Costs );

  // ---------------------------------------------------------------------------
  // State of charge constraints
  // ---------------------------------------------------------------------------
  //
  // Each step with a free variable has an upper and a lower limit row for the
  // cumulative state of charge change. A variable contributes to all rows of
  // steps at or after its own step. The last row is the soft end target.

  const double ChargeGain    = Battery.ChargeEfficiency / Battery.Capacity,
               DischargeLoss = 1.0 / ( Battery.DischargeEfficiency
                                       * Battery.Capacity );

  std::vector< Index > ConstrainedSteps;

  std::set_union( ChargeSteps.begin(), ChargeSteps.end(),
                  DischargeSteps.begin(), DischargeSteps.end(),
                  std::back_inserter( ConstrainedSteps ) );

  const Index EndRow = 2 * ConstrainedSteps.size();

  arma::mat Coefficients( EndRow + 1, NumberOfVariables, arma::fill::zeros );
  arma::vec Limits( EndRow + 1 );

  for ( Index Row = 0; Row < ConstrainedSteps.size(); Row++ )
  {
    const Index Step     = ConstrainedSteps[ Row ],
                UpperRow = 2 * Row,
                LowerRow = UpperRow + 1;

    for ( Index Variable = 0; Variable < NumberOfCharges; Variable++ )
      if ( ChargeSteps[ Variable ] <= Step )
      {
        Coefficients( UpperRow, Variable ) =   ChargeGain;
        Coefficients( LowerRow, Variable ) = - ChargeGain;
      }

    for ( Index Variable = 0; Variable < NumberOfDischarges; Variable++ )
      if ( DischargeSteps[ Variable ] <= Step )
      {
        Coefficients( UpperRow, NumberOfCharges + Variable ) = - DischargeLoss;
        Coefficients( LowerRow, NumberOfCharges + Variable ) =   DischargeLoss;
      }

    Limits( UpperRow ) = Battery.SOCMax - InitialSOC;
    Limits( LowerRow ) = InitialSOC - Battery.SOCMin;
  }

  for ( Index Variable = 0; Variable < NumberOfCharges; Variable++ )
    Coefficients( EndRow, Variable ) = ChargeGain;

  for ( Index Variable = 0; Variable < NumberOfDischarges; Variable++ )
    Coefficients( EndRow, NumberOfCharges + Variable ) = - DischargeLoss;

  Coefficients( EndRow, SlackVariable ) = -1.0 / Battery.Capacity;
  Limits( EndRow ) = Dispatch.EndTarget( Battery ) - InitialSOC;

  SetLinearConstraints( Coefficients, Limits );

  // ---------------------------------------------------------------------------
  // Solving
  // ---------------------------------------------------------------------------
  //
  // The idle battery is a feasible starting point provided that the slack
  // covers a start above the end target.

  Optimization::Variables InitialValues( NumberOfVariables, 0.0 );

  InitialValues[ SlackVariable ] = std::clamp(
    ( InitialSOC - Dispatch.EndTarget( Battery ) ) * Battery.Capacity,
    0.0, Battery.Capacity );

  CreateSolver( NumberOfVariables, Goal::Minimize );
  RelativeObjectiveValueTolerance( 1e-10 );
  AbsoluteVariableValueTolerance( 1e-10 );
  MaxNumberOfEvaluations( Dispatch.SolverMaxEvaluations );
  MaxTime( Dispatch.SolverTimeLimit );

  OptimalSolution Solution = FindSolution( InitialValues );

  // The status of the solver is checked, and a round off limited search is
  // accepted if the best point found is feasible. A stop on the evaluation
  // limit or the time limit, and all failures give the fallback solution.

  std::ostringstream Context;
  std::string        Diagnosis;
  bool               Accepted = true;

  Context << "solving the window [" << Start << "," << End << ")";

  try
  {
    CheckStatus( Solution.Status, Context.str() );
  }
  catch ( RoundoffLimited & Limitation )
  {
    Diagnosis = Limitation.what();
  }
  catch ( ConditionalSuccess & Stop )
  {
    Accepted  = false;
    Diagnosis = Stop.what();
  }
  catch ( std::runtime_error & Failure )
  {
    Accepted  = false;
    Diagnosis = Failure.what();
  }

  if ( Accepted )
  {
    bool Finite = std::all_of( Solution.VariableValues.begin(),
                               Solution.VariableValues.end(),
                               []( double Value ){ return std::isfinite( Value ); } );

    if ( !Finite ||
         ( MaxViolation( Solution.VariableValues ) > FeasibilityTolerance ) )
    {
      Accepted  = false;
      Diagnosis = "The solution violates the constraints when " + Context.str();
    }
  }

  #ifdef HybridDispatch_DEBUG
    std::cout << "Window [" << Start << "," << End << ") from SOC "
              << InitialSOC << ": NLopt status " << Solution.Status
              << " objective " << Solution.ObjectiveValue;

    if ( !Diagnosis.empty() )
      std::cout << " (" << Diagnosis << ")";

    std::cout << ( Accepted ? " accepted" : " fallback" ) << std::endl;
  #endif

  if ( !Accepted )
    return HorizonSolution::Idle( WindowLength );

  // The values are mapped back to the steps of the window and clamped to
  // the bounds to remove round off outside the bounds.

  Series Charge( WindowLength, 0.0 ), Discharge( WindowLength, 0.0 );

  for ( Index Variable = 0; Variable < NumberOfCharges; Variable++ )
  {
    Index Step = ChargeSteps[ Variable ];

    Charge[ Step ] = std::clamp( Solution.VariableValues[ Variable ], 0.0,
                                 ChargeLimit( Start + Step ) );
  }

  for ( Index Variable = 0; Variable < NumberOfDischarges; Variable++ )
  {
    Index Step = DischargeSteps[ Variable ];

    Discharge[ Step ] = std::clamp(
      Solution.VariableValues[ NumberOfCharges + Variable ], 0.0,
      DischargeLimit( Start + Step ) );
  }

  return HorizonSolution( HorizonSolution::Outcome::Optimal, Charge,
                          Discharge );
}

/*==============================================================================

 Constructor

==============================================================================*/
//
// The price and balance series must have the same length. The tolerance
// statuses of NLopt are the normal way for the solver to terminate, and they
// are mapped to success.

HybridDispatch::LinearHorizonSolver::LinearHorizonSolver(
  const Series & Prices, const EnergyBalance & Balance,
  const BatteryParameters & BatteryValues,
  const DispatchParameters & DispatchValues )
: Optimization::Objective(), Optimization::ObjectiveGradient(),
  Optimization::LinearObjective(),
  Optimization::GradientInEqConstraints(),
  Optimization::LinearInEqConstraints(),
  NL::Optimizer< NL::Algorithm::Local::QuasiNewton::QuadraticProgramming >(
    DispatchValues.ConstraintTolerance ),
  HorizonSolver(),
  Price( Prices ), Excess( Balance.Excess ), Deficit( Balance.Deficit ),
  Battery( BatteryValues ), Dispatch( DispatchValues ), VariableBounds()
{
  if ( Price.size() != Excess.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "There are " << Price.size() << " prices for an energy "
                 << "balance of " << Excess.size() << " time steps";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  IgnoreStatus( NLOPT_FTOL_REACHED );
  IgnoreStatus( NLOPT_XTOL_REACHED );
}
