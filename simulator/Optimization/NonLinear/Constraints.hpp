/*==============================================================================
Constraints

NLopt can evaluate a set of m inequality constraints c(x) <= 0 in one call to
a C function that fills an array of m constraint values and, if requested, an
array of m * n partial derivatives. The derivatives are stored constraint by
constraint, so element i + j * n is the derivative of constraint j with
respect to variable i. This is exactly the column order storage of an
Armadillo matrix with one row per variable and one column per constraint,
and the gradient matrix of the constraint interface can be copied directly.

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR_CONSTRAINTS
#define OPTIMIZATION_NON_LINEAR_CONSTRAINTS

#include <vector>                             // Tolerances
#include <sstream>                            // For error reporting
#include <stdexcept>                          // For standard exceptions
#include <algorithm>                          // Copying values
#include <type_traits>                        // For meta-programming
#include <armadillo>                          // Matrix library

#include <nlopt.h>                            // The C-style interface

#include "../Variables.hpp"                   // The dimension and value type
#include "../Constraints.hpp"                 // The generic constraint classes
#include "Algorithms.hpp"                     // Fundamental definitions

namespace Optimization::NonLinear
{

template< Algorithm::ID OptimizerAlgorithm, class Enable = void >
class InEqConstraints;

// The inequality constraints exist for the gradient based algorithms that
// accept inequality constraints. The problem provides the values and the
// gradients through the generic constraint interface.

template< Algorithm::ID OptimizerAlgorithm >
class InEqConstraints< OptimizerAlgorithm,
  std::enable_if_t< Algorithm::RequiresGradient( OptimizerAlgorithm ) &&
                    Algorithm::SupportsInequalityConstraints( OptimizerAlgorithm ) > >
: virtual public Optimization::GradientInEqConstraints
{
private:

  static void ConstraintMapper( unsigned int NumberOfConstraints,
                                double * Values, unsigned int Size,
                                const double * VariableValues,
                                double * Gradient, void * This )
  {
    InEqConstraints * Problem = static_cast< InEqConstraints * >( This );
    Variables Assignment( VariableValues, VariableValues + Size );

    ConstraintValues Constraints( Problem->InEqConstraintValue( Assignment ) );

    if ( Constraints.size() != NumberOfConstraints )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << Constraints.size() << " constraint values were computed "
                   << "and " << NumberOfConstraints << " were expected";

      throw std::logic_error( ErrorMessage.str() );
    }

    std::copy( Constraints.begin(), Constraints.end(), Values );

    if ( Gradient != nullptr )
    {
      GradientMatrix Derivatives( Problem->InEqConstraintGradient( Assignment ) );

      if ( ( Derivatives.n_rows != Size ) ||
           ( Derivatives.n_cols != NumberOfConstraints ) )
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "The constraint gradient is a " << Derivatives.n_rows
                     << " by " << Derivatives.n_cols << " matrix and it "
                     << "should be " << Size << " by " << NumberOfConstraints;

        throw std::logic_error( ErrorMessage.str() );
      }

      std::copy( Derivatives.begin(), Derivatives.end(), Gradient );
    }
  }

protected:

  // All constraints are registered with the same tolerance. It is a logic
  // error to register constraints for a problem that has none.

  inline nlopt_result SetInEqConstraints( SolverPointer Solver,
                                          double Tolerance )
  {
    Dimension NumberOfConstraints = NumberOfInEqConstraints();

    if ( NumberOfConstraints == 0 )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The problem has no inequality constraints to register";

      throw std::logic_error( ErrorMessage.str() );
    }

    std::vector< double > Tolerances( NumberOfConstraints, Tolerance );

    return nlopt_add_inequality_mconstraint( Solver, NumberOfConstraints,
                                             &ConstraintMapper, this,
                                             Tolerances.data() );
  }

  InEqConstraints( void )
  : GradientInEqConstraints()
  {}

public:

  virtual ~InEqConstraints( void )
  {}
};

}      // name space Optimization non-linear
#endif // OPTIMIZATION_NON_LINEAR_CONSTRAINTS
