/*==============================================================================
Parameters

The simulation is governed by three groups of parameters. The battery
parameters describe the physical storage, the dispatch parameters tune the
cycle construction and the linear program solved for each cycle, and the
financial parameters are only used for the key performance indicators. The
parameters are plain data, and the validation functions will throw an invalid
argument exception describing the first parameter found to be out of range.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_PARAMETERS
#define HYBRID_DISPATCH_PARAMETERS

#include <string>             // For the shape names
#include <chrono>             // Solver time limit
#include <optional>           // End target given or not

namespace HybridDispatch {

// The incentive to charge early in a window can either decay linearly from
// the first to the last step of the window, or be uniform over the window.

enum class ChargeWeighting
{
  Linear,
  Uniform
};

// Only the string "linear" selects the linear weighting, and the comparison is
// case sensitive. Any other string gives the uniform weighting.

ChargeWeighting ParseChargeWeighting( const std::string & ShapeName );
std::string     ChargeWeightingName( ChargeWeighting Shape );

// -----------------------------------------------------------------------------
// Battery
// -----------------------------------------------------------------------------
//
// The capacity is in energy units (MWh) and the power limit in energy per time
// step (MW for hourly steps). The state of charge values are fractions of the
// capacity.

struct BatteryParameters
{
  double Capacity            = 1.0,
         PowerLimit          = 1.0,
         ChargeEfficiency    = 0.95,
         DischargeEfficiency = 0.95,
         SOCMin              = 0.1,
         SOCMax              = 0.9,
         SOCInitial          = 0.5;
};

// -----------------------------------------------------------------------------
// Dispatch
// -----------------------------------------------------------------------------
//
// The end state of charge target is by default the minimum state of charge.
// The target is only stored if it has been given, and the target used by the
// windows is resolved against the battery.

struct DispatchParameters
{
  double FullTolerance      = 1e-4,
         ExcessThreshold    = 1e-6,
         EndSOCPenalty      = 2000.0,
         ChargeBonusRate    = 0.01,
         ConstraintTolerance = 1e-9;

  std::optional< double > EndSOCTarget;

  ChargeWeighting ChargeShape = ChargeWeighting::Linear;

  unsigned int MaxExtensions = 10;

  std::chrono::seconds SolverTimeLimit = std::chrono::seconds( 10 );
  int                  SolverMaxEvaluations = 2000;

  inline double EndTarget( const BatteryParameters & Battery ) const
  { return EndSOCTarget.value_or( Battery.SOCMin ); }
};

// -----------------------------------------------------------------------------
// Finance
// -----------------------------------------------------------------------------
//
// The PV capacity is in MW and the investments are per kWp and per kWh
// respectively. A round trip efficiency of zero means that it is computed
// from the charge and discharge efficiencies of the battery.

struct FinancialParameters
{
  double PVPower             = 1.0,
         PVReferencePower    = 1.0,
         PVInvestment        = 0.0,
         BatteryInvestment   = 0.0,
         DiscountRate        = 0.0,
         RoundTripEfficiency = 0.0;

  unsigned int PVLifetime       = 25,
               GuaranteedCycles = 6000;
};

// The validation functions check the ranges of the parameters. The dispatch
// parameters are checked together with the battery since the battery is
// checked first.

void ValidateParameters( const BatteryParameters & Battery,
                         const DispatchParameters & Dispatch );

void ValidateParameters( const FinancialParameters & Finance );

}      // end name space HybridDispatch
#endif // HYBRID_DISPATCH_PARAMETERS
