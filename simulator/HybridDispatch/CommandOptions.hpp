/*==============================================================================
Options

The command line options are processed using Boost::Program Options. The parsing
is done in a class that can be instantiated on the command line argument vector
and the argument count. All options can also be given in a configuration file
with one "name = value" line per option. A value given on the command line
takes precedence over the value in the configuration file.

The following options are currently supported:

-h [ --help ]                    = help message
-f [ --Configuration <file> ]    = configuration file
-p [ --Prices <CSV> ]            = CSV time series for the prices
-s [ --Production <CSV> ]        = CSV time series for the solar production
-c [ --Consumption <CSV> ]       = CSV time series for the consumption
Optional parameters:
-d [ --Directory ]               = Working directory. Default: current directory
-r [ --Results <name> ]          = Result file name. Default: Results.csv

The battery is described by the required options battery_capacity,
battery_power_limit, charge_efficiency, discharge_efficiency, soc_min,
soc_max, and soc_initial. The dispatch is tuned by soc_full_epsilon,
excess_threshold, end_soc_target, end_soc_penalty_rate,
charge_early_bonus_rate, charge_early_shape, max_extension_steps,
constraint_tolerance, solver_time_limit, and solver_max_evaluations. The
financial options pv_mw, pv_reference_mw, capex_pv, capex_battery,
pv_lifetime, discount_rate, guaranteed_cycles and roundtrip_efficiency are
used for the performance indicators.

Each CSV file has lines of the form <POSIX seconds>, <value>.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_OPTIONS
#define HYBRID_DISPATCH_OPTIONS

#include <filesystem>               // Portable filesystem
#include "Parameters.hpp"           // The simulation parameters

namespace HybridDispatch {

class CommandLineOptions
{
private:

  // The working directory, the input files and the results

  std::filesystem::path
  WorkingDirectory, PriceProfile, ProductionProfile, ConsumptionProfile,
  Results;

  // The validated parameters

  BatteryParameters   Battery;
  DispatchParameters  Dispatch;
  FinancialParameters Finance;

public:

  // The files are returned as absolute files in the working directory.

  inline std::filesystem::path PriceFile( void ) const
  { return WorkingDirectory / PriceProfile; }

  inline std::filesystem::path ProductionFile( void ) const
  { return WorkingDirectory / ProductionProfile; }

  inline std::filesystem::path ConsumptionFile( void ) const
  { return WorkingDirectory / ConsumptionProfile; }

  inline std::filesystem::path ResultFile( void ) const
  { return WorkingDirectory / Results;  }

  inline const BatteryParameters & GetBattery( void ) const
  { return Battery; }

  inline const DispatchParameters & GetDispatch( void ) const
  { return Dispatch; }

  inline const FinancialParameters & GetFinance( void ) const
  { return Finance; }

  // The production time series is scaled to the installed PV power

  inline double ProductionScale( void ) const
  { return Finance.PVPower / Finance.PVReferencePower; }

  // The constructor must have the argument count and the argument vector
  // and it will do all the parsing. Parsing errors and invalid parameters
  // are reported by exceptions.

  CommandLineOptions( int argc, const char * const argv[] );
  CommandLineOptions( void ) = delete;
  CommandLineOptions( const CommandLineOptions & Other ) = delete;
};

}      // end name space HybridDispatch
#endif // HYBRID_DISPATCH_OPTIONS
