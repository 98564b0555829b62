/*==============================================================================
Simple problem

This test problem creates a small linear program showing how to use the
optimization interface. The problem is as follows:

minimize -x[0] - 2 x[1]

subject to

0 <= x[0] <= 3 (Bound constraint)
0 <= x[1] <= 2 (Bound constraint)
x[0] + x[1] <= 4

The optimum is x = (2,2) with the objective value -6. The same problem is
also solved with a constraint that cannot be satisfied to verify that the
solver reports the violation rather than returning a feasible looking point.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE OptimizationTests

#include <vector>            // Parameter vectors
#include <chrono>            // Time limit

#include <armadillo>         // Constraint matrix
#include <boost/test/unit_test.hpp>

#include "Variables.hpp"
#include "Objective.hpp"
#include "Constraints.hpp"
#include "NonLinear.hpp"

namespace NL = Optimization::NonLinear;

class SimpleProblem
: virtual public NL::Optimizer<
    NL::Algorithm::Local::QuasiNewton::QuadraticProgramming >,
  virtual public Optimization::LinearObjective,
  virtual public Optimization::LinearInEqConstraints
{
private:

  std::vector< Interval > Domains;

protected:

  virtual std::vector< Interval > BoundConstraints( void ) override
  { return Domains; }

public:

  // The solution is returned as the variable values and the largest
  // constraint value at the solution.

  struct Result
  {
    Optimization::Variables Values;
    double ObjectiveValue;
    double Violation;
    nlopt_result Status;
  };

  Result Solve( const Optimization::Variables & InitialValues )
  {
    CreateSolver( 2, Goal::Minimize );
    RelativeObjectiveValueTolerance( 1e-10 );
    MaxNumberOfEvaluations( 500 );
    MaxTime( std::chrono::seconds( 5 ) );
    IgnoreStatus( NLOPT_FTOL_REACHED );
    IgnoreStatus( NLOPT_XTOL_REACHED );

    OptimalSolution Solution = FindSolution( InitialValues );

    return Result{ Solution.VariableValues, Solution.ObjectiveValue,
                   MaxViolation( Solution.VariableValues ), Solution.Status };
  }

  void SetRightHandSide( double Limit )
  {
    arma::mat A = { { 1.0, 1.0 } };
    arma::vec b = { Limit };

    SetLinearConstraints( A, b );
  }

  SimpleProblem( void )
  : NL::Optimizer< NL::Algorithm::Local::QuasiNewton::QuadraticProgramming >(
      1e-9 ),
    Optimization::Objective(), ObjectiveGradient(), LinearObjective(),
    GradientInEqConstraints(), LinearInEqConstraints(),
    Domains({ Interval( 0.0, 3.0 ), Interval( 0.0, 2.0 ) })
  {
    SetCostCoefficients( { -1.0, -2.0 } );
    SetRightHandSide( 4.0 );
  }

  virtual ~SimpleProblem( void )
  {}
};

BOOST_AUTO_TEST_SUITE( LinearProgram )

BOOST_AUTO_TEST_CASE( FindsTheVertexOptimum )
{
  SimpleProblem Problem;
  SimpleProblem::Result Solution = Problem.Solve( { 0.0, 0.0 } );

  BOOST_CHECK_CLOSE( Solution.Values[0], 2.0, 1e-3 );
  BOOST_CHECK_CLOSE( Solution.Values[1], 2.0, 1e-3 );
  BOOST_CHECK_CLOSE( Solution.ObjectiveValue, -6.0, 1e-3 );
  BOOST_CHECK_LE( Solution.Violation, 1e-6 );
}

BOOST_AUTO_TEST_CASE( SolverCanBeRecreated )
{
  SimpleProblem Problem;

  Problem.Solve( { 0.0, 0.0 } );
  Problem.SetRightHandSide( 1.0 );

  SimpleProblem::Result Solution = Problem.Solve( { 0.0, 0.0 } );

  BOOST_CHECK_SMALL( Solution.Values[0], 1e-4 );
  BOOST_CHECK_CLOSE( Solution.Values[1], 1.0, 1e-3 );
}

// The sum of the variables is at least zero within the bounds, and a negative
// right hand side cannot be met. Whatever the solver returns, the violation
// must be visible to the caller.

BOOST_AUTO_TEST_CASE( InfeasibleProblemIsDetected )
{
  SimpleProblem Problem;
  Problem.SetRightHandSide( -1.0 );

  double Violation = 0.0;

  try
  {
    Violation = Problem.Solve( { 0.0, 0.0 } ).Violation;
  }
  catch ( std::runtime_error & Error )
  {
    Violation = 1.0;
  }

  BOOST_CHECK_GT( Violation, 1e-6 );
}

BOOST_AUTO_TEST_SUITE_END()
