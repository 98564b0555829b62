/*==============================================================================
Time Series

This is the implementation of the utility functions to read a time series
consisting of rows with two columns and to align the three input series on
the price time stamps.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <string>                  // Standard strings
#include <map>                     // The time series map
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include "TimeSeries.hpp"          // Function signatures
#include "csv.h"                   // The CSV parser

// -----------------------------------------------------------------------------
// Consistency
// -----------------------------------------------------------------------------

void HybridDispatch::InputSeries::Validate( void ) const
{
  if ( ( Price.size() != Times.size() ) || ( Load.size() != Times.size() ) ||
       ( Production.size() != Times.size() ) )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The input series must have equal length, but there are "
                 << Times.size() << " time stamps, " << Price.size()
                 << " prices, " << Load.size() << " consumption values and "
                 << Production.size() << " production values";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  for ( Index t = 1; t < Times.size(); t++ )
    if ( Times[t] <= Times[ t-1 ] )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The time stamps must be increasing, but time stamp "
                   << Times[t] << " at step " << t << " follows "
                   << Times[ t-1 ];

      throw std::invalid_argument( ErrorMessage.str() );
    }
}

// -----------------------------------------------------------------------------
// Reading
// -----------------------------------------------------------------------------

std::map< HybridDispatch::Time, double >
HybridDispatch::CSVtoTimeSeries( const std::filesystem::path & FileName )
{
  std::map< Time, double > TimeSeries;        // The time series to return
  Time                     TimeStamp;         // To store read time stamp
  double                   Value;             // To store the read value

  // Parse two comma separated columns from the file ignoring spaces and tabs
  // around the values.

  io::CSVReader<2, io::trim_chars<' ', '\t'>, io::no_quote_escape<','> >
      CSVParser( FileName.string() );

  // The files have no header line, and the column names are simply defined.

  CSVParser.set_header("Time", "Value");

  while ( CSVParser.read_row( TimeStamp, Value ) )
    TimeSeries.emplace( TimeStamp, Value );

  if ( TimeSeries.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage <<  __FILE__ << " at line " << __LINE__ << ": "
                 << "CSV Read error: File " <<  FileName
                 << " does not contain any data";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  return TimeSeries;
}

// -----------------------------------------------------------------------------
// Alignment
// -----------------------------------------------------------------------------
//
// The price series defines the time grid. For each price time stamp the
// production and the consumption must be found at exactly the same time.

HybridDispatch::InputSeries HybridDispatch::AlignSeries(
  const std::map< Time, double > & Prices,
  const std::map< Time, double > & Production,
  const std::map< Time, double > & Consumption,
  double ProductionScale )
{
  if ( Prices.empty() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "There are no prices to define the time steps";

    throw std::invalid_argument( ErrorMessage.str() );
  }

  InputSeries Aligned;

  for ( const auto & [ TimeStamp, Price ] : Prices )
  {
    auto PVValue   = Production.find( TimeStamp );
    auto LoadValue = Consumption.find( TimeStamp );

    if ( ( PVValue == Production.end() ) || ( LoadValue == Consumption.end() ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The price time stamp " << TimeStamp
                   << " has no matching "
                   << ( PVValue == Production.end() ? "production" : "consumption" )
                   << " value";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Aligned.Times.push_back( TimeStamp );
    Aligned.Price.push_back( Price );
    Aligned.Load.push_back( LoadValue->second );
    Aligned.Production.push_back( PVValue->second * ProductionScale );
  }

  Aligned.Validate();

  return Aligned;
}

HybridDispatch::InputSeries HybridDispatch::LoadInputSeries(
  const std::filesystem::path & PriceFile,
  const std::filesystem::path & ProductionFile,
  const std::filesystem::path & ConsumptionFile,
  double ProductionScale )
{
  return AlignSeries( CSVtoTimeSeries( PriceFile ),
                      CSVtoTimeSeries( ProductionFile ),
                      CSVtoTimeSeries( ConsumptionFile ), ProductionScale );
}
