/*==============================================================================
Bounds

The decision variables of a dispatch window are bounded by the physical limits
of the time step. The bounds are basically intervals, and they are therefore
defined in terms of the boost intervals, and the bounds constraint function
returns a vector of intervals, one for each variable of the problem. A
variable without an upper limit has infinity as upper bound.

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR_BOUNDS
#define OPTIMIZATION_NON_LINEAR_BOUNDS

#include <vector>											        // For variables and values
#include <sstream>                            // For error reporting
#include <stdexcept>                          // For standard exceptions
#include <boost/numeric/interval.hpp>         // For variable domains (ranges)
#include <nlopt.h>                            // The C-style interface

#include "../Variables.hpp"                   // Variable definitions
#include "Algorithms.hpp"                     // Algorithm definitions

namespace Optimization::NonLinear
{

class Bound
{
protected:

	using Interval = boost::numeric::interval< VariableType >;

	virtual std::vector< Interval > BoundConstraints( void ) = 0;

	// Normally the above function is only called indirectly via the function to
	// set the bounds for a given solver. The NLopt interface for the bounds is
	// to set them separately, and hence they must be taken from the intervals
	// returned by the constraint function. There must be exactly one interval
	// per variable of the solver.

	inline void SetBounds( SolverPointer Solver )
	{
		std::vector< VariableType > Lower, Upper;

		for ( const Interval & VariableRange : BoundConstraints() )
		{
			Lower.push_back( VariableRange.lower() );
			Upper.push_back( VariableRange.upper() );
		}

		if ( Lower.size() != nlopt_get_dimension( Solver ) )
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << Lower.size() << " variable bounds were given for a "
			             << "solver with " << nlopt_get_dimension( Solver )
			             << " variables";

			throw std::invalid_argument( ErrorMessage.str() );
		}

		if ( ( nlopt_set_lower_bounds( Solver, Lower.data() ) != NLOPT_SUCCESS ) ||
		     ( nlopt_set_upper_bounds( Solver, Upper.data() ) != NLOPT_SUCCESS ) )
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << "The solver refused the variable bounds";

			throw std::invalid_argument( ErrorMessage.str() );
		}
	}

public:

	virtual ~Bound( void )
	{ }
};

}      // Name space Optimization non-linear
#endif // OPTIMIZATION_NON_LINEAR_BOUNDS
