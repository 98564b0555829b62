/*==============================================================================
Time Series

The input to the dispatch simulation is three time series: the electricity
price, the solar production and the consumption. They are read from CSV files
consisting of rows with two columns: One for the time stamp in POSIX seconds
and one for the value of the time step. The CSV parser is Ben Strasser's fast
C++ CSV Reader class [1].

The series are aligned on the time stamps of the price series, and every
price time stamp must have a production value and a consumption value. No
gap filling is done, and a missing value is an invalid argument. The solar
production is scaled by the ratio between the installed PV power and the PV
power for which the production series was recorded.

References:
[1] https://github.com/ben-strasser/fast-cpp-csv-parser

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_TIME_SERIES
#define HYBRID_DISPATCH_TIME_SERIES

#include <map>                    // Time to value map
#include <vector>                 // The aligned series
#include <filesystem>             // File names

#include "Typedefs.hpp"           // Time and series

namespace HybridDispatch
{
// The aligned input has one element per time step in all the vectors.

class InputSeries
{
public:

  std::vector< Time > Times;
  Series Price, Load, Production;

  inline Index Size( void ) const
  { return Times.size(); }

  // The consistency check ensures that all vectors have the same length and
  // that the time stamps are strictly increasing. It throws an invalid
  // argument exception if this is not the case.

  void Validate( void ) const;

  InputSeries( void )
  : Times(), Price(), Load(), Production()
  {}

  InputSeries( const std::vector< Time > & TimeStamps,
               const Series & Prices, const Series & Consumption,
               const Series & PVProduction )
  : Times( TimeStamps ), Price( Prices ), Load( Consumption ),
    Production( PVProduction )
  { Validate(); }
};

// A single CSV file is read into a map from the time stamp to the value, and
// an empty file is an invalid argument.

std::map< Time, double > CSVtoTimeSeries( const std::filesystem::path & FileName );

// The alignment takes the three maps and builds the input series for the
// time stamps of the prices.

InputSeries AlignSeries( const std::map< Time, double > & Prices,
                         const std::map< Time, double > & Production,
                         const std::map< Time, double > & Consumption,
                         double ProductionScale = 1.0 );

// Reading and aligning the three files is combined in the loader function.

InputSeries LoadInputSeries( const std::filesystem::path & PriceFile,
                             const std::filesystem::path & ProductionFile,
                             const std::filesystem::path & ConsumptionFile,
                             double ProductionScale = 1.0 );

}      // name space HybridDispatch
#endif // HYBRID_DISPATCH_TIME_SERIES
