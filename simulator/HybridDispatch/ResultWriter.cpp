/*==============================================================================
Result Writer

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <fstream>                 // Result file
#include <limits>                  // Full precision output
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include <boost/io/ios_state.hpp>  // Restoring the caller's format

#include "ResultWriter.hpp"

void HybridDispatch::WriteResults( std::ostream & Output,
  const InputSeries & Input, const EnergyBalance & Balance,
  const DispatchResult & Dispatch, const BatteryParameters & Battery,
  const PerformanceIndicators & Indicators )
{
  if ( ( Balance.Size() != Input.Size() ) ||
       ( Dispatch.Size() != Input.Size() ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Cannot write " << Input.Size() << " input steps with "
                 << Balance.Size() << " balance steps and " << Dispatch.Size()
                 << " dispatch steps";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  boost::io::ios_all_saver CallerFormat( Output );

  Output << "time,price,load,production,direct_use,charge,discharge,"
         << "grid_import,curtailment,soc,battery_energy,hourly_cost"
         << std::endl;

  Output.precision( std::numeric_limits< double >::max_digits10 );

  for ( Index t = 0; t < Input.Size(); t++ )
  {
    double HourlyCost = Dispatch.GridImport()[t] * Input.Price[t]
                      + Balance.DirectUse[t] * Indicators.PVEnergyCost()
                      + Dispatch.Discharge()[t] * Indicators.BatteryEnergyCost();

    Output << Input.Times[t]              << ","
           << Input.Price[t]              << ","
           << Input.Load[t]               << ","
           << Input.Production[t]         << ","
           << Balance.DirectUse[t]        << ","
           << Dispatch.Charge()[t]        << ","
           << Dispatch.Discharge()[t]     << ","
           << Dispatch.GridImport()[t]    << ","
           << Dispatch.Curtailment()[t]   << ","
           << Dispatch.SOC()[t]           << ","
           << Dispatch.SOC()[t] * Battery.Capacity << ","
           << HourlyCost                  << "\n";
  }

  Output.flush();
}

void HybridDispatch::WriteResults( const std::filesystem::path & ResultFile,
  const InputSeries & Input, const EnergyBalance & Balance,
  const DispatchResult & Dispatch, const BatteryParameters & Battery,
  const PerformanceIndicators & Indicators )
{
  std::ofstream Output( ResultFile );

  if ( !Output )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The result file " << ResultFile
                 << " could not be opened for writing";

    throw std::runtime_error( ErrorMessage.str() );
  }

  WriteResults( Output, Input, Balance, Dispatch, Battery, Indicators );

  Output.close();
}
