/*==============================================================================
Performance Indicators

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // Standard max
#include <cmath>                   // Powers and floor
#include <numeric>                 // Accumulate and inner product
#include <iomanip>                 // Formatting
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include <boost/io/ios_state.hpp>  // Restoring the caller's format

#include "PerformanceIndicators.hpp"

double HybridDispatch::AnnuityFactor( double DiscountRate, double Years )
{
  if ( DiscountRate == 0.0 )
    return Years;
  else
    return ( 1.0 - std::pow( 1.0 + DiscountRate, -Years ) ) / DiscountRate;
}

namespace
{
  inline double Sum( const HybridDispatch::Series & Values )
  { return std::accumulate( Values.begin(), Values.end(), 0.0 ); }

  inline double Dot( const HybridDispatch::Series & First,
                     const HybridDispatch::Series & Second )
  {
    return std::inner_product( First.begin(), First.end(), Second.begin(),
                               0.0 );
  }
}

HybridDispatch::PerformanceIndicators::PerformanceIndicators(
  const InputSeries & Input, const EnergyBalance & Balance,
  const DispatchResult & Dispatch, const BatteryParameters & Battery,
  const FinancialParameters & Finance )
: GridOnlyCost( 0.0 ), PVAndGridCost( 0.0 ), PVBatteryAndGridCost( 0.0 ),
  PVShare( 0.0 ), PVAndBatteryShare( 0.0 ), PVEquivalentHours( 0.0 ),
  PVLevelisedCost(), CurtailmentShare( 0.0 ), BatteryCycles( 0.0 ),
  BatteryLifetime(), BatteryLevelisedCost(),
  RoundTripEfficiency( Finance.RoundTripEfficiency > 0.0 ?
                       Finance.RoundTripEfficiency :
                       Battery.ChargeEfficiency * Battery.DischargeEfficiency )
{
  if ( ( Input.Size() == 0 ) || ( Balance.Size() != Input.Size() ) ||
       ( Dispatch.Size() != Input.Size() ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The indicators need a non-empty simulation with the same "
                 << "length of the input (" << Input.Size() << "), the energy "
                 << "balance (" << Balance.Size() << ") and the dispatch ("
                 << Dispatch.Size() << ")";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  const double Years = static_cast< double >( Input.Size() ) / HoursPerYear;

  // PV production and curtailment

  const double TotalProduction  = Sum( Input.Production ),
               TotalCurtailment = Sum( Dispatch.Curtailment() ),
               UsedProduction   = TotalProduction - TotalCurtailment;

  if ( TotalProduction > 0.0 )
    CurtailmentShare = 100.0 * TotalCurtailment / TotalProduction;

  PVEquivalentHours = TotalProduction / Years / Finance.PVPower;

  const double UsedHours = UsedProduction / Years / Finance.PVPower;

  if ( UsedHours > 0.0 )
    PVLevelisedCost = Finance.PVInvestment / UsedHours
                      / AnnuityFactor( Finance.DiscountRate, Finance.PVLifetime )
                      * 1000.0;

  // Battery cycles, lifetime and cost

  const double TotalDischarge = Sum( Dispatch.Discharge() );

  BatteryCycles = TotalDischarge / Battery.Capacity / Years;

  if ( BatteryCycles > 0.0 )
  {
    BatteryLifetime = std::floor( Finance.GuaranteedCycles / BatteryCycles );

    double Annuity = BatteryLifetime.value() > 0.0 ?
                     AnnuityFactor( Finance.DiscountRate,
                                    BatteryLifetime.value() ) : 1.0;

    if ( Annuity > 0.0 )
      BatteryLevelisedCost = Finance.BatteryInvestment
                             / ( BatteryCycles * RoundTripEfficiency * Annuity )
                             * 1000.0;
  }

  // Costs

  GridOnlyCost = Dot( Input.Load, Input.Price );

  double GridWithoutBattery = 0.0;

  for ( Index t = 0; t < Input.Size(); t++ )
    GridWithoutBattery += std::max( Input.Load[t] - Balance.DirectUse[t], 0.0 )
                          * Input.Price[t];

  const double DirectUse = Sum( Balance.DirectUse );

  PVAndGridCost = GridWithoutBattery + DirectUse * PVEnergyCost();

  PVBatteryAndGridCost = Dot( Dispatch.GridImport(), Input.Price )
                         + DirectUse * PVEnergyCost()
                         + TotalDischarge * BatteryEnergyCost();

  // Self consumption

  const double TotalLoad = Sum( Input.Load );

  if ( TotalLoad > 0.0 )
  {
    PVShare           = 100.0 * DirectUse / TotalLoad;
    PVAndBatteryShare = 100.0 * ( DirectUse + TotalDischarge ) / TotalLoad;
  }
}

// -----------------------------------------------------------------------------
// Printing
// -----------------------------------------------------------------------------

std::ostream & HybridDispatch::operator << ( std::ostream & Output,
  const PerformanceIndicators & Indicators )
{
  boost::io::ios_all_saver CallerFormat( Output );

  auto Optional = [&Output]( const std::optional< double > & Value,
                             const char * Missing ){
    if ( Value )
      Output << Value.value();
    else
      Output << Missing;
  };

  Output << std::fixed << std::setprecision( 2 )
         << "KPI1  Cost with all energy from the grid: "
         << Indicators.GridOnlyCost << std::endl
         << "KPI2  Cost of PV and grid without battery: "
         << Indicators.PVAndGridCost << std::endl
         << "KPI3  Cost of PV, battery and grid: "
         << Indicators.PVBatteryAndGridCost << std::endl
         << "KPI4  PV share of the consumption without battery (%): "
         << Indicators.PVShare << std::endl
         << "KPI5  PV and battery share of the consumption (%): "
         << Indicators.PVAndBatteryShare << std::endl
         << "KPI6  Equivalent PV hours per year: "
         << std::setprecision( 1 ) << Indicators.PVEquivalentHours
         << std::setprecision( 2 ) << std::endl
         << "KPI7  Levelised cost of used PV energy: ";

  Optional( Indicators.PVLevelisedCost, "not available" );

  Output << std::endl
         << "KPI8  Equivalent battery cycles per year: "
         << std::setprecision( 1 ) << Indicators.BatteryCycles
         << std::setprecision( 2 ) << std::endl
         << "KPI9  Estimated battery lifetime (years): "
         << std::setprecision( 0 );

  Optional( Indicators.BatteryLifetime, "unlimited" );

  Output << std::setprecision( 2 ) << std::endl
         << "KPI10 Levelised cost of battery energy: ";

  Optional( Indicators.BatteryLevelisedCost, "not available" );

  Output << std::endl
         << "KPI11 PV curtailment (%): " << Indicators.CurtailmentShare
         << std::endl
         << "Round trip efficiency: " << std::setprecision( 4 )
         << Indicators.RoundTripEfficiency << std::endl;

  return Output;
}
