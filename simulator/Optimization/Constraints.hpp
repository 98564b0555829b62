/*==============================================================================
Constraints

Inequality constraints confine the search space, and a variable assignment is
feasible if it satisfies all constraints. The constraints are stated in the
standard form g(x) <= 0 where g is a vector valued function with one element
per constraint.

Some optimisation algorithms will also need to evaluate the constraint
gradients. The gradient is the partial derivative of the constraint function
with respect to each of the variables. In other words, if there are n
variables, then the gradient is a vector of n values - for each constraint.
Hence, the constraint gradients are represented as an Armadillo [1] matrix.
If C[j] is constraint j the column j consists of the partial derivatives of
this with respect to each variable value x[i], in other words dC[j]/dx[i]. The
reason for having the columns representing the constraints is because Armadillo
stores the matrix in column order.

The linear programs of this library have constraints of the form A x <= b
where each row of A holds the coefficients of one constraint. The values are
then A x - b, and the gradient matrix is simply the transpose of A.

References:

[1] Conrad Sanderson and Ryan Curtin: Armadillo: a template-based C++ library
		for linear algebra. Journal of Open Source Software, Vol. 1, pp. 26, 2016.
		http://arma.sourceforge.net/

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_CONSTRAINTS
#define OPTIMIZATION_CONSTRAINTS

#include <vector>											        // For variables and values
#include <sstream>                            // Formatted error messages
#include <stdexcept>                          // Standard exceptions
#include <algorithm>                          // Iterator based algorithms
#include <armadillo>                          // Matrix library

#include "Variables.hpp"

namespace Optimization
{
// The values of the constraints are assumed to be of the same type as the
// variables, hence the constraint values is a vector of that type

using ConstraintValues = std::vector< VariableType >;
using GradientMatrix   = arma::Mat< VariableType >;

/*==============================================================================

 Inequality constraints with gradients

==============================================================================*/
//
// The interface is abstract and defines the number of constraints, the vector
// of constraint values, and the gradient matrix with one row per variable and
// one column per constraint. It is used as a virtual base class since both the
// problem definition and the solver specific constraint mapper derive from it.

class GradientInEqConstraints
{
protected:

	virtual Dimension NumberOfInEqConstraints( void ) = 0;

	virtual ConstraintValues
	InEqConstraintValue( const Variables & VariableValues ) = 0;

	virtual GradientMatrix
	InEqConstraintGradient( const Variables & VariableValues ) = 0;

public:

	GradientInEqConstraints( void )
	{}

	virtual ~GradientInEqConstraints( void )
	{}
};

/*==============================================================================

 Linear inequality constraints

==============================================================================*/
//
// The linear constraints store the coefficient matrix and the right hand side
// limits. The matrix is given with one row per constraint and as many columns
// as there are variables.

class LinearInEqConstraints : virtual public GradientInEqConstraints
{
private:

	arma::Mat< VariableType > Coefficients;
	arma::Col< VariableType > Limits;

protected:

	// The constraints are set in one go and it is verified that there is one
	// limit for each row of the coefficient matrix.

	inline void SetLinearConstraints(
							const arma::Mat< VariableType > & ConstraintCoefficients,
							const arma::Col< VariableType > & ConstraintLimits )
	{
		if ( ConstraintCoefficients.n_rows == ConstraintLimits.n_elem )
		{
			Coefficients = ConstraintCoefficients;
			Limits       = ConstraintLimits;
		}
		else
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << "The constraint matrix has " << ConstraintCoefficients.n_rows
			             << " rows but " << ConstraintLimits.n_elem
			             << " limits were given";

			throw std::invalid_argument( ErrorMessage.str() );
		}
	}

	virtual Dimension NumberOfInEqConstraints( void ) override
	{ return Coefficients.n_rows; }

	// The values are computed as A x - b and copied to a standard vector

	virtual ConstraintValues
	InEqConstraintValue( const Variables & VariableValues ) override
	{
		if ( VariableValues.size() == Coefficients.n_cols )
		{
			arma::Col< VariableType > Values
				= Coefficients * arma::Col< VariableType >( VariableValues ) - Limits;

			return arma::conv_to< ConstraintValues >::from( Values );
		}
		else
		{
			std::ostringstream ErrorMessage;

			ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
			             << "The linear constraints are defined for "
			             << Coefficients.n_cols << " variables and they were "
			             << "evaluated for " << VariableValues.size() << " variables";

			throw std::invalid_argument( ErrorMessage.str() );
		}
	}

	// The gradient does not depend on the variable values.

	virtual GradientMatrix
	InEqConstraintGradient( const Variables & VariableValues ) override
	{ return Coefficients.t(); }

	// The largest constraint value is used to verify a solution returned from
	// a solver. It is negative or zero for a feasible assignment.

	inline VariableType MaxViolation( const Variables & VariableValues )
	{
		ConstraintValues Values( InEqConstraintValue( VariableValues ) );

		if ( Values.empty() )
			return 0.0;
		else
			return *std::max_element( Values.begin(), Values.end() );
	}

public:

	LinearInEqConstraints( void )
	: GradientInEqConstraints(), Coefficients(), Limits()
	{}

	virtual ~LinearInEqConstraints( void )
	{}
};

}      // End name space Optimization
#endif // OPTIMIZATION_CONSTRAINTS
