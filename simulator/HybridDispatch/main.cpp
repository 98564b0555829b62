/*==============================================================================
Hybrid Dispatch simulator

The Hybrid Dispatch simulator computes the hourly dispatch of a battery
serving a load together with a solar PV installation and the electricity grid.
The prices, the PV production and the consumption are known for the whole
simulated period, and the battery is operated to minimise the cost of the
energy taken from the grid.

The time series is partitioned into charging cycles starting at the beginning
of blocks of excess PV production, and the dispatch of each cycle is found as
the solution of a linear program solved by the NLOpt [1] implementation of the
sequential quadratic programming algorithm [2]. The simulated dispatch is
summarised by key performance indicators printed to the console, and the
hourly values are written to the result file.

The Command Options header documents the supported command line options, or a
summary can be obtained from using 'HybridDispatchSimulator --help'. An example
could be

HybridDispatchSimulator --Configuration Battery.cfg --Prices Prices.csv
          --Production PV.csv --Consumption Load.csv --Directory ./Data
          --Results Dispatch.csv

where each of the time series files have lines of the format
<POSIX seconds>, <value>
and the configuration file has lines like "battery_capacity = 4".

References:
[1] Steven G. Johnson: The NLopt nonlinear-optimization package,
    http://ab-initio.mit.edu/nlopt
[2] Dieter Kraft: "A software package for sequential quadratic programming",
    Technical Report DFVLR-FB 88-28, Institut für Dynamik der Flugsysteme,
    Oberpfaffenhofen, July 1988.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <iostream>                   // Status messages
#include <exception>                  // Standard exceptions
#include <cstdlib>                    // Exit codes

#include "CommandOptions.hpp"         // The command line options
#include "TimeSeries.hpp"             // Reading the input
#include "EnergyBalance.hpp"          // Excess and deficit
#include "LinearHorizonSolver.hpp"    // The window solver
#include "DispatchScheduler.hpp"      // The cycles
#include "PerformanceIndicators.hpp"  // Summary
#include "ResultWriter.hpp"           // Result file

int main( int argc, char **argv )
{
  try
  {
    // Parsing the command line options

    HybridDispatch::CommandLineOptions Options( argc, argv );

    std::cout << "Loading the time series" << std::endl;

    HybridDispatch::InputSeries Input(
      HybridDispatch::LoadInputSeries( Options.PriceFile(),
        Options.ProductionFile(), Options.ConsumptionFile(),
        Options.ProductionScale() ) );

    HybridDispatch::EnergyBalance Balance( Input );

    // Simulating the dispatch

    std::cout << "Simulating " << Input.Size() << " time steps with "
              << HybridDispatch::ChargeWeightingName(
                   Options.GetDispatch().ChargeShape )
              << " charge weights" << std::endl;

    HybridDispatch::LinearHorizonSolver
    Solver( Input.Price, Balance, Options.GetBattery(), Options.GetDispatch() );

    HybridDispatch::DispatchScheduler
    Scheduler( Balance, Options.GetBattery(), Options.GetDispatch(), Solver );

    HybridDispatch::DispatchResult Dispatch( Scheduler.Run() );

    unsigned int Fallbacks = 0;

    for ( const auto & Cycle : Dispatch.Cycles() )
      if ( Cycle.Result == HybridDispatch::HorizonSolution::Outcome::Fallback )
        Fallbacks++;

    std::cout << Dispatch.Cycles().size() << " cycles were optimised";

    if ( Fallbacks > 0 )
      std::cout << " and the battery was left idle in " << Fallbacks
                << " of them";

    std::cout << std::endl;

    // Reporting

    HybridDispatch::PerformanceIndicators
    Indicators( Input, Balance, Dispatch, Options.GetBattery(),
                Options.GetFinance() );

    std::cout << std::endl << Indicators << std::endl;

    HybridDispatch::WriteResults( Options.ResultFile(), Input, Balance,
                                  Dispatch, Options.GetBattery(), Indicators );

    std::cout << "Results written to " << Options.ResultFile() << std::endl;
  }
  catch ( std::exception & Error )
  {
    std::cerr << Error.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
