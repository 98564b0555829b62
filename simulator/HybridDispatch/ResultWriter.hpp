/*==============================================================================
Result Writer

The simulated dispatch is written to a CSV file with one row per time step.
The columns are the input values, the production used directly by the load,
the dispatch decisions and the resulting grid import, curtailment and state of
charge, the energy stored in the battery, and the hourly cost of the energy
served to the load. The hourly cost values the grid import at the price of
the step, and the energy from the PV panels and from the battery at their
levelised costs. The first line of the file is a header with the column names.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_RESULT_WRITER
#define HYBRID_DISPATCH_RESULT_WRITER

#include <filesystem>             // File names
#include <ostream>                // Output streams

#include "Parameters.hpp"              // Battery parameters
#include "TimeSeries.hpp"              // The input series
#include "EnergyBalance.hpp"           // Directly used PV energy
#include "DispatchResult.hpp"          // The simulated dispatch
#include "PerformanceIndicators.hpp"   // Levelised costs

namespace HybridDispatch
{

void WriteResults( std::ostream & Output, const InputSeries & Input,
                   const EnergyBalance & Balance,
                   const DispatchResult & Dispatch,
                   const BatteryParameters & Battery,
                   const PerformanceIndicators & Indicators );

// The file version creates or overwrites the file and throws a runtime error
// if the file cannot be written.

void WriteResults( const std::filesystem::path & ResultFile,
                   const InputSeries & Input,
                   const EnergyBalance & Balance,
                   const DispatchResult & Dispatch,
                   const BatteryParameters & Battery,
                   const PerformanceIndicators & Indicators );

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_RESULT_WRITER
