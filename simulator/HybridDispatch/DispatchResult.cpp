/*==============================================================================
Dispatch Result

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <algorithm>               // All of
#include <sstream>                 // For error messages
#include <stdexcept>               // For standard exceptions

#include "DispatchResult.hpp"

void HybridDispatch::DispatchResult::Record( Index t, double Charge,
  double Discharge, double GridImport, double Curtailment, double SOC )
{
  if ( t >= Recorded.size() )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Time step " << t << " is outside the result buffer of "
                 << Recorded.size() << " time steps";

    throw std::out_of_range( ErrorMessage.str() );
  }

  if ( Recorded[t] )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "Time step " << t << " has already been recorded";

    throw std::logic_error( ErrorMessage.str() );
  }

  ChargeValues[t]      = Charge;
  DischargeValues[t]   = Discharge;
  GridImportValues[t]  = GridImport;
  CurtailmentValues[t] = Curtailment;
  SOCValues[t]         = SOC;
  Recorded[t]          = true;
}

bool HybridDispatch::DispatchResult::Complete( void ) const
{
  return std::all_of( Recorded.begin(), Recorded.end(),
                      []( bool Done ){ return Done; } );
}

HybridDispatch::DispatchResult::DispatchResult( Index NumberOfSteps )
: ChargeValues( NumberOfSteps, 0.0 ), DischargeValues( NumberOfSteps, 0.0 ),
  GridImportValues( NumberOfSteps, 0.0 ),
  CurtailmentValues( NumberOfSteps, 0.0 ), SOCValues( NumberOfSteps, 0.0 ),
  Recorded( NumberOfSteps, false ), CycleRecords()
{}
