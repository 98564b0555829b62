/*==============================================================================
Performance Indicators

The key performance indicators summarise the simulated dispatch in terms of
energy costs, self consumption, and the technical and economic figures of the
PV installation and the battery. The costs of the energy from the PV panels
and from the battery are levelised over the lifetime of the equipment using
the annuity factor for the discount rate

  A(r,n) = ( 1 - (1+r)^(-n) ) / r

which is n for a zero discount rate. The simulated period is taken to be a
fraction of a year given by the number of hourly time steps divided by the
8760 hours of a year.

The levelised costs are undefined if no PV energy is used or if the battery
is never discharged. They are then reported as not available, and a zero cost
is used in the cost indicators.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_PERFORMANCE_INDICATORS
#define HYBRID_DISPATCH_PERFORMANCE_INDICATORS

#include <optional>               // Undefined values
#include <ostream>                // Printing the indicators

#include "Typedefs.hpp"           // Series
#include "Parameters.hpp"         // Battery and financial parameters
#include "TimeSeries.hpp"         // The input series
#include "EnergyBalance.hpp"      // Directly used PV energy
#include "DispatchResult.hpp"     // The simulated dispatch

namespace HybridDispatch
{

constexpr double HoursPerYear = 8760.0;

double AnnuityFactor( double DiscountRate, double Years );

class PerformanceIndicators
{
public:

  // Energy costs
  double GridOnlyCost,                       // KPI1
         PVAndGridCost,                      // KPI2
         PVBatteryAndGridCost;               // KPI3

  // Self consumption in percent of the consumption
  double PVShare,                            // KPI4
         PVAndBatteryShare;                  // KPI5

  // PV figures
  double PVEquivalentHours;                  // KPI6
  std::optional< double > PVLevelisedCost;   // KPI7
  double CurtailmentShare;                   // KPI11

  // Battery figures
  double BatteryCycles;                      // KPI8
  std::optional< double > BatteryLifetime;   // KPI9 in whole years
  std::optional< double > BatteryLevelisedCost; // KPI10
  double RoundTripEfficiency;

  // The costs used for the energy taken from the PV panels and the battery

  inline double PVEnergyCost( void ) const
  { return PVLevelisedCost.value_or( 0.0 ); }

  inline double BatteryEnergyCost( void ) const
  { return BatteryLevelisedCost.value_or( 0.0 ); }

  PerformanceIndicators( const InputSeries & Input,
                         const EnergyBalance & Balance,
                         const DispatchResult & Dispatch,
                         const BatteryParameters & Battery,
                         const FinancialParameters & Finance );

  PerformanceIndicators( void ) = delete;
};

std::ostream & operator << ( std::ostream & Output,
                             const PerformanceIndicators & Indicators );

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_PERFORMANCE_INDICATORS
