/*==============================================================================
Objective function

The abstract objective class defines the real function to optimize taking a
vector of real values as argument values and returning a real number for the
objective function at that point.

The abstract gradient class defines a gradient function that is required by
the gradient based algorithms. It takes a vector of real values and returns a
vector of real values of the same size as the argument vector representing the
gradient at the evaluation point.

For a linear objective c'x both are given by the cost vector c, and the linear
objective class stores this vector and implements both functions. A problem
class only has to set the cost coefficients before the solver is created.

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_OBJECTIVE
#define OPTIMIZATION_OBJECTIVE

#include <vector>                             // For the cost vector
#include <sstream>                            // For error reporting
#include <stdexcept>                          // For standard exceptions
#include <numeric>                            // Inner product

#include "Variables.hpp"

namespace Optimization
{

// -----------------------------------------------------------------------------
// Objective and gradient interfaces
// -----------------------------------------------------------------------------
//
// The objective is a real function of the variable values. It is a virtual
// base class since the problem and the solver specific wrappers share it.

class Objective
{
public:

	enum class Goal
	{
		Minimize,
		Maximize
	};

protected:

	virtual VariableType
	ObjectiveFunction( const Variables & VariableValues ) = 0;

	Objective( void )
	{}

public:

	virtual ~Objective( void )
	{}
};

// The gradient has one partial derivative per variable.

class ObjectiveGradient : virtual public Objective
{
protected:

	virtual GradientVector
	GradientFunction( const Variables & VariableValues ) = 0;

	ObjectiveGradient( void )
	: Objective()
	{}

public:

	virtual ~ObjectiveGradient( void )
	{}
};

/*==============================================================================

 Linear objective

==============================================================================*/
//
// The linear objective keeps the cost coefficients. The gradient is the
// cost vector regardless of where it is evaluated, and the value is the inner
// product of the cost vector and the variable values. A dimension mismatch
// indicates that the problem was set up for a different number of variables
// and a logic error is thrown.

class LinearObjective : virtual public ObjectiveGradient
{
private:

	GradientVector CostCoefficients;

protected:

	inline void SetCostCoefficients( const GradientVector & Costs )
	{ CostCoefficients = Costs; }

	virtual VariableType
	ObjectiveFunction( const Variables & VariableValues ) override
	{
		if ( VariableValues.size() == CostCoefficients.size() )
			return std::inner_product( VariableValues.begin(), VariableValues.end(),
			                           CostCoefficients.begin(), 0.0 );
		else
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << "The linear objective has " << CostCoefficients.size()
			             << " cost coefficients but was evaluated for "
			             << VariableValues.size() << " variables";

			throw std::logic_error( ErrorMessage.str() );
		}
	}

	virtual GradientVector
	GradientFunction( const Variables & VariableValues ) override
	{
		if ( VariableValues.size() == CostCoefficients.size() )
			return CostCoefficients;
		else
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << "The gradient of the linear objective was requested for "
			             << VariableValues.size() << " variables while there are "
			             << CostCoefficients.size() << " cost coefficients";

			throw std::logic_error( ErrorMessage.str() );
		}
	}

	LinearObjective( void )
	: Objective(), ObjectiveGradient(), CostCoefficients()
	{}

public:

	virtual ~LinearObjective( void )
	{}
};

}      // end name space Optimization
#endif // OPTIMIZATION_OBJECTIVE
