/*==============================================================================
Objective

NLopt evaluates the objective through a C function that receives the variable
values, an optional array for the gradient, and a data pointer. The objective
interface provides this function as a static member, and registers it with the
object's own address as the data pointer so that the call is forwarded to the
problem's objective function.

The gradient objective is defined only for the algorithms requiring the
gradient, and a problem defined for such an algorithm must provide the
gradient function.

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR_OBJECTIVE
#define OPTIMIZATION_NON_LINEAR_OBJECTIVE

#include <sstream>                            // For error reporting
#include <stdexcept>                          // For standard exceptions
#include <algorithm>                          // Copying the gradient
#include <type_traits>                        // For meta programming

#include <nlopt.h>                            // The C-style interface

#include "../Variables.hpp"                   // Basic definitions
#include "../Objective.hpp"                   // Objective function
#include "Algorithms.hpp"                     // Non-linear definitions

namespace Optimization::NonLinear
{

template< Algorithm::ID OptimizerAlgorithm, class Enable = void >
class Objective;

// -----------------------------------------------------------------------------
// Objective interface
// -----------------------------------------------------------------------------

class ObjectiveInterface
: virtual public Optimization::Objective
{
protected:

  // Only the gradient objective provides the gradient, and reaching this
  // version means that NLopt asked for a gradient the problem cannot give.

  virtual GradientVector ComputeGradient( const Variables & VariableValues )
  {
    std::ostringstream ErrorMessage;

    ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                 << "The solver requested the objective gradient for "
                 << VariableValues.size() << " variables from a problem "
                 << "without a gradient";

    throw std::logic_error( ErrorMessage.str() );
  }

private:

  static double ObjectiveMapper( unsigned int Size, const double * Values,
                                 double * Gradient, void * This )
  {
    ObjectiveInterface * Problem = static_cast< ObjectiveInterface * >( This );
    Variables VariableValues( Values, Values + Size );

    if ( Gradient != nullptr )
    {
      GradientVector Derivatives( Problem->ComputeGradient( VariableValues ) );

      if ( Derivatives.size() != Size )
      {
        std::ostringstream ErrorMessage;

        ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                     << "The objective gradient has " << Derivatives.size()
                     << " elements for " << Size << " variables";

        throw std::logic_error( ErrorMessage.str() );
      }

      std::copy( Derivatives.begin(), Derivatives.end(), Gradient );
    }

    return Problem->ObjectiveFunction( VariableValues );
  }

protected:

  inline nlopt_result SetObjective( SolverPointer Solver,
                                    Goal Direction = Goal::Minimize )
  {
    if ( Direction == Goal::Maximize )
      return nlopt_set_max_objective( Solver, &ObjectiveMapper, this );
    else
      return nlopt_set_min_objective( Solver, &ObjectiveMapper, this );
  }

public:

  virtual ~ObjectiveInterface( void )
  {}
};

// -----------------------------------------------------------------------------
// Gradient objective
// -----------------------------------------------------------------------------

template< Algorithm::ID OptimizerAlgorithm >
class Objective< OptimizerAlgorithm,
  std::enable_if_t< Algorithm::RequiresGradient( OptimizerAlgorithm ) > >
: virtual public ObjectiveInterface,
  virtual public Optimization::ObjectiveGradient
{
protected:

  virtual GradientVector
  ComputeGradient( const Variables & VariableValues ) final
  { return GradientFunction( VariableValues ); }

  Objective( void )
  : ObjectiveInterface(), ObjectiveGradient()
  {}

public:

  virtual ~Objective( void )
  {}
};

}      // name space Optimization non-linear
#endif // OPTIMIZATION_NON_LINEAR_OBJECTIVE
