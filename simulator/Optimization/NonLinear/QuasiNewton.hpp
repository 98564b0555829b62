/*==============================================================================
Quasi Newton

This file implements the specialisation for the sequential quadratic
programming algorithm (SLSQP) [1,2] that solves a sequence of quadratic
sub-problems where the Hessian of the objective is approximated by the
Broyden–Fletcher–Goldfarb–Shanno (BFGS) update. It supports bounds on the
variables and general inequality constraints, and it requires the gradients
of both the objective and the constraints.

For a linear program the quadratic sub-problem of the first iteration is
already the problem itself, and the algorithm converges in few iterations
provided that the initial point satisfies the bounds.

References:

[1] Dieter Kraft: "A software package for sequential quadratic programming",
    Technical Report DFVLR-FB 88-28, Institut für Dynamik der Flugsysteme,
    Oberpfaffenhofen, July 1988.
[2] Dieter Kraft: "Algorithm 733: TOMP–Fortran modules for optimal control
    calculations," ACM Transactions on Mathematical Software, vol. 20, no. 3,
    pp. 262-281, 1994.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR_QUASI_NEWTON
#define OPTIMIZATION_NON_LINEAR_QUASI_NEWTON

#include "../Variables.hpp"                   // Basic definitions

#include "Algorithms.hpp"                     // Definition of the algorithms
#include "Objective.hpp"                      // Objective function
#include "Optimizer.hpp"                      // Optimizer interface
#include "Bounds.hpp"                         // Variable domain bounds
#include "Constraints.hpp"                    // Constraint functions

namespace Optimization::NonLinear
{
/*==============================================================================

 SLSQP: Sequential Least Squares Quadratic Programming

==============================================================================*/
//
// The problem must provide the bounds for all variables, and the inequality
// constraints are optional. A problem without constraints is then just a
// bounded optimisation problem.

template<>
class Optimizer< Algorithm::Local::QuasiNewton::QuadraticProgramming >
: virtual public
  NonLinear::Objective< Algorithm::Local::QuasiNewton::QuadraticProgramming >,
  virtual public NonLinear::Bound,
  virtual public
  NonLinear::InEqConstraints< Algorithm::Local::QuasiNewton::QuadraticProgramming >,
  public NonLinear::OptimizerInterface
{
private:

  // The tolerance used for the inequality constraints. A constraint is
  // taken as satisfied if its value is less than this tolerance.

  double Tolerance;

  using ObjectiveBase = NonLinear::Objective<
                        Algorithm::Local::QuasiNewton::QuadraticProgramming >;
  using ConstraintBase = NonLinear::InEqConstraints<
                         Algorithm::Local::QuasiNewton::QuadraticProgramming >;

protected:

  virtual Algorithm::ID GetAlgorithm( void ) override
  { return Algorithm::Local::QuasiNewton::QuadraticProgramming; }

  // The function to create the solver will also initialise the objective,
  // the bounds and the constraints for the problem. It must therefore be
  // called after the problem has been fully defined for the dimension given.

  virtual SolverPointer CreateSolver( Dimension NumberOfVariables,
                                      Goal Direction ) final
  {
    SolverPointer TheSolver =
                  OptimizerInterface::CreateSolver( NumberOfVariables,
                                                    Direction );

    CheckStatus( ObjectiveInterface::SetObjective( TheSolver, Direction ),
                 "Setting the objective function" );
    SetBounds( TheSolver );

    if ( NumberOfInEqConstraints() > 0 )
      CheckStatus( ConstraintBase::SetInEqConstraints( TheSolver, Tolerance ),
                   "Setting the inequality constraints" );

    return TheSolver;
  }

  // The constructor is protected to ensure that it only will be called by
  // derived classes defining the objective function and the constraints.
  // Note that the virtual base classes must be initialised before the
  // interface class.

  Optimizer( double ConstraintTolerance )
  : ObjectiveBase(), Bound(), ConstraintBase(),
    OptimizerInterface(),
    Tolerance( ConstraintTolerance )
  {}

  Optimizer( void ) = delete;

public:

  virtual ~Optimizer( void )
  {}
};

}      // Name space Optimization non-linear
#endif // OPTIMIZATION_NON_LINEAR_QUASI_NEWTON
