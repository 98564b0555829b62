/*==============================================================================
Parameters

This implements the parsing of the charge weighting name and the validation
of the parameter groups.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <string>                    // Standard strings
#include <sstream>                   // For nicely formatted errors
#include <stdexcept>                 // Standard exceptions

#include "Parameters.hpp"

// -----------------------------------------------------------------------------
// Charge weighting
// -----------------------------------------------------------------------------

HybridDispatch::ChargeWeighting
HybridDispatch::ParseChargeWeighting( const std::string & ShapeName )
{
  if ( ShapeName == "linear" )
    return ChargeWeighting::Linear;
  else
    return ChargeWeighting::Uniform;
}

std::string HybridDispatch::ChargeWeightingName( ChargeWeighting Shape )
{
  switch( Shape )
  {
    case ChargeWeighting::Linear:
      return "linear";
    case ChargeWeighting::Uniform:
      break;
  }

  return "uniform";
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------
//
// All range violations are reported the same way, and the error message will
// name the parameter and the offending value.

namespace
{
  void RangeError( const char * File, int Line, const std::string & Parameter,
                   double Value, const std::string & Requirement )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << File << " at line " << Line << ": "
                 << "The parameter " << Parameter << " = " << Value
                 << " is invalid: " << Requirement;

    throw std::invalid_argument( ErrorMessage.str() );
  }
}

void HybridDispatch::ValidateParameters( const BatteryParameters & Battery,
                                         const DispatchParameters & Dispatch )
{
  if ( !( Battery.Capacity > 0.0 ) )
    RangeError( __FILE__, __LINE__, "battery_capacity", Battery.Capacity,
                "the capacity must be positive" );

  if ( !( Battery.PowerLimit >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "battery_power_limit", Battery.PowerLimit,
                "the power limit cannot be negative" );

  if ( !( Battery.ChargeEfficiency > 0.0 && Battery.ChargeEfficiency <= 1.0 ) )
    RangeError( __FILE__, __LINE__, "charge_efficiency",
                Battery.ChargeEfficiency, "must be in the interval (0,1]" );

  if ( !( Battery.DischargeEfficiency > 0.0 &&
          Battery.DischargeEfficiency <= 1.0 ) )
    RangeError( __FILE__, __LINE__, "discharge_efficiency",
                Battery.DischargeEfficiency, "must be in the interval (0,1]" );

  if ( !( Battery.SOCMin >= 0.0 && Battery.SOCMin <= 1.0 ) )
    RangeError( __FILE__, __LINE__, "soc_min", Battery.SOCMin,
                "must be in the interval [0,1]" );

  if ( !( Battery.SOCMax >= 0.0 && Battery.SOCMax <= 1.0 ) )
    RangeError( __FILE__, __LINE__, "soc_max", Battery.SOCMax,
                "must be in the interval [0,1]" );

  if ( !( Battery.SOCMin < Battery.SOCMax ) )
    RangeError( __FILE__, __LINE__, "soc_min", Battery.SOCMin,
                "must be less than soc_max = " + std::to_string( Battery.SOCMax ) );

  if ( !( Battery.SOCInitial >= Battery.SOCMin &&
          Battery.SOCInitial <= Battery.SOCMax ) )
    RangeError( __FILE__, __LINE__, "soc_initial", Battery.SOCInitial,
                "must be within [soc_min, soc_max]" );

  if ( !( Dispatch.FullTolerance >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "soc_full_epsilon", Dispatch.FullTolerance,
                "the tolerance cannot be negative" );

  if ( !( Dispatch.ExcessThreshold >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "excess_threshold",
                Dispatch.ExcessThreshold, "the threshold cannot be negative" );

  if ( !( Dispatch.EndSOCPenalty >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "end_soc_penalty_rate",
                Dispatch.EndSOCPenalty, "the penalty rate cannot be negative" );

  if ( !( Dispatch.ChargeBonusRate >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "charge_early_bonus_rate",
                Dispatch.ChargeBonusRate, "the bonus rate cannot be negative" );

  if ( !( Dispatch.ConstraintTolerance >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "constraint_tolerance",
                Dispatch.ConstraintTolerance, "the tolerance cannot be negative" );

  if ( Dispatch.SolverTimeLimit.count() <= 0 )
    RangeError( __FILE__, __LINE__, "solver_time_limit",
                Dispatch.SolverTimeLimit.count(),
                "the solver must be given some time" );

  if ( Dispatch.SolverMaxEvaluations <= 0 )
    RangeError( __FILE__, __LINE__, "solver_max_evaluations",
                Dispatch.SolverMaxEvaluations,
                "the solver must be allowed at least one evaluation" );

  // A given end target must be a legal state of charge

  if ( Dispatch.EndSOCTarget &&
       !( *Dispatch.EndSOCTarget >= 0.0 && *Dispatch.EndSOCTarget <= 1.0 ) )
    RangeError( __FILE__, __LINE__, "end_soc_target", *Dispatch.EndSOCTarget,
                "must be in the interval [0,1]" );
}

void HybridDispatch::ValidateParameters( const FinancialParameters & Finance )
{
  if ( !( Finance.PVPower > 0.0 ) )
    RangeError( __FILE__, __LINE__, "pv_mw", Finance.PVPower,
                "the installed PV power must be positive" );

  if ( !( Finance.PVReferencePower > 0.0 ) )
    RangeError( __FILE__, __LINE__, "pv_reference_mw", Finance.PVReferencePower,
                "the reference PV power must be positive" );

  if ( !( Finance.PVInvestment >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "capex_pv", Finance.PVInvestment,
                "the investment cannot be negative" );

  if ( !( Finance.BatteryInvestment >= 0.0 ) )
    RangeError( __FILE__, __LINE__, "capex_battery", Finance.BatteryInvestment,
                "the investment cannot be negative" );

  if ( !( Finance.DiscountRate >= 0.0 && Finance.DiscountRate < 1.0 ) )
    RangeError( __FILE__, __LINE__, "discount_rate", Finance.DiscountRate,
                "must be in the interval [0,1)" );

  if ( !( Finance.RoundTripEfficiency >= 0.0 &&
          Finance.RoundTripEfficiency <= 1.0 ) )
    RangeError( __FILE__, __LINE__, "roundtrip_efficiency",
                Finance.RoundTripEfficiency,
                "must be in the interval (0,1], or zero to be computed" );

  if ( Finance.PVLifetime == 0 )
    RangeError( __FILE__, __LINE__, "pv_lifetime", Finance.PVLifetime,
                "the PV installation must live at least one year" );
}
