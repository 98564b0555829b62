/*==============================================================================
Optimizer

The optimizer owns the NLopt solver object of a problem. The generic part
defined here creates and destroys the solver, sets the stop criteria, runs the
search and translates the status codes returned by NLopt into exceptions. The
algorithm specific specialisations of the optimizer register the objective,
the bounds and the constraints supported by the algorithm when the solver is
created.

A problem may be solved many times with different dimensions. The solver is
therefore created for each solution, and a previously created solver is
destroyed first.

Author and Copyright: Geir Horn, 2018-2019
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR_OPTIMIZER
#define OPTIMIZATION_NON_LINEAR_OPTIMIZER

#include <cerrno>                            // System error codes
#include <chrono>                            // Search time limit in seconds
#include <set>                               // Ignored status codes
#include <sstream>                           // Formatted error messages
#include <stdexcept>                         // Standard exceptions
#include <string>                            // Strings
#include <system_error>                      // Error categories

#include <nlopt.h>                           // The C-style interface

#include "../Variables.hpp"                  // Basic definitions
#include "Algorithms.hpp"                    // Definition of the algorithms
#include "Objective.hpp"                     // Objective function

namespace Optimization::NonLinear
{

// The optimizer is specialised for the algorithms, and the second template
// argument allows a specialisation to cover a group of algorithms.

template< Algorithm::ID PrimaryAlgorithm, class Enable = void >
class Optimizer;

// -----------------------------------------------------------------------------
// Optimizer interface
// -----------------------------------------------------------------------------

class OptimizerInterface : virtual public ObjectiveInterface
{
private:

  SolverPointer Solver;

  // Status codes that a problem has declared as normal terminations of the
  // search. They are treated as success by the status check.

  std::set< nlopt_result > IgnoredStatus;

protected:

  virtual Algorithm::ID GetAlgorithm( void ) = 0;

  inline std::string GetAlgorithmName( void )
  {
    return nlopt_algorithm_name(
           static_cast< nlopt_algorithm >( GetAlgorithm() ) );
  }

  inline Dimension GetDimension( void ) const
  { return Solver == nullptr ? 0 : nlopt_get_dimension( Solver ); }

  inline void DeleteSolver( void )
  {
    if ( Solver != nullptr )
    {
      nlopt_destroy( Solver );
      Solver = nullptr;
    }
  }

  // The specialisations override the creation to register the problem
  // functions, and they must call this version first to obtain the solver.

  virtual SolverPointer CreateSolver( Dimension NumberOfVariables,
                                      Goal Direction = Goal::Minimize )
  {
    DeleteSolver();

    if ( !( GetAlgorithm() < Algorithm::ID::MaxNumber ) )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The optimizer has no legal NLopt algorithm";

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Solver = nlopt_create( static_cast< nlopt_algorithm >( GetAlgorithm() ),
                           NumberOfVariables );

    if ( Solver == nullptr )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "NLopt could not allocate a solver for "
                   << NumberOfVariables << " variables";

      throw std::runtime_error( ErrorMessage.str() );
    }

    return Solver;
  }

  // ---------------------------------------------------------------------------
  // Status handling
  // ---------------------------------------------------------------------------
  //
  // Failures of the solver are runtime errors, and the two that may still
  // leave a useful point have their own types so that they can be caught
  // separately.

  class RoundoffLimited : public std::runtime_error
  {
  public:

    RoundoffLimited( const std::string & ErrorMessage )
    : std::runtime_error( ErrorMessage )
    {}
  };

  class ForcedStop : public std::runtime_error
  {
  public:

    ForcedStop( const std::string & ErrorMessage )
    : std::runtime_error( ErrorMessage )
    {}
  };

  // A stop criterion ending the search is not an error since the returned
  // point is the best found. The status tells which criterion it was.

  class ConditionalSuccess
  {
  public:

    const nlopt_result Status;
    const std::string  Explanation;

    inline std::string what( void ) const
    { return Explanation; }

    ConditionalSuccess( nlopt_result Reason, const std::string & Description )
    : Status( Reason ), Explanation( Description )
    {}
  };

  inline void IgnoreStatus( nlopt_result Status )
  { IgnoredStatus.insert( Status ); }

  // The context is a description of the operation that returned the status
  // and it is used in the exception messages.

  void CheckStatus( const nlopt_result Status,
                    const std::string & Context = std::string() )
  {
    if ( ( Status == NLOPT_SUCCESS ) || ( IgnoredStatus.count( Status ) > 0 ) )
      return;

    std::ostringstream Message;

    switch ( Status )
    {
      case NLOPT_FAILURE:
        Message << "General NLopt failure when " << Context;
        throw std::runtime_error( Message.str() );
      case NLOPT_INVALID_ARGS:
        Message << "Invalid arguments for the algorithm "
                << GetAlgorithmName() << " when " << Context;
        throw std::invalid_argument( Message.str() );
      case NLOPT_OUT_OF_MEMORY:
        throw std::system_error( ENOMEM, std::generic_category(), Context );
      case NLOPT_ROUNDOFF_LIMITED:
        Message << "Round off limited search when " << Context;
        throw RoundoffLimited( Message.str() );
      case NLOPT_FORCED_STOP:
        Message << "Forced stop when " << Context;
        throw ForcedStop( Message.str() );
      case NLOPT_STOPVAL_REACHED:
        Message << "Stop value reached when " << Context;
        break;
      case NLOPT_FTOL_REACHED:
        Message << "Objective value tolerance reached when " << Context;
        break;
      case NLOPT_XTOL_REACHED:
        Message << "Variable value tolerance reached when " << Context;
        break;
      case NLOPT_MAXEVAL_REACHED:
        Message << "Evaluation limit reached when " << Context;
        break;
      case NLOPT_MAXTIME_REACHED:
        Message << "Time limit reached when " << Context;
        break;
      default:
        Message << __FILE__ << " at line " << __LINE__ << ": "
                << "Unknown NLopt status " << Status << " when " << Context;
        throw std::invalid_argument( Message.str() );
    }

    throw ConditionalSuccess( Status, Message.str() );
  }

  // ---------------------------------------------------------------------------
  // Stopping criteria
  // ---------------------------------------------------------------------------
  //
  // The criteria belong to the solver, and they must be set after the solver
  // has been created.

private:

  inline void RequireSolver( const std::string & Criterion )
  {
    if ( Solver == nullptr )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << "The " << Criterion << " cannot be set before the "
                   << "solver is created";

      throw std::logic_error( ErrorMessage.str() );
    }
  }

protected:

  // Stop when an iteration changes the objective value by less than the
  // tolerance times its absolute value.

  inline void RelativeObjectiveValueTolerance( double Tolerance )
  {
    RequireSolver( "relative objective value tolerance" );
    CheckStatus( nlopt_set_ftol_rel( Solver, Tolerance ),
                 "setting the relative objective value tolerance" );
  }

  // Stop when no variable changes by more than the tolerance.

  inline void AbsoluteVariableValueTolerance( double Tolerance )
  {
    RequireSolver( "absolute variable value tolerance" );
    CheckStatus( nlopt_set_xtol_abs1( Solver, Tolerance ),
                 "setting the absolute variable value tolerance" );
  }

  inline void MaxNumberOfEvaluations( int MaxEval )
  {
    RequireSolver( "evaluation limit" );
    CheckStatus( nlopt_set_maxeval( Solver, MaxEval ),
                 "setting the evaluation limit" );
  }

  inline void MaxTime( std::chrono::seconds Timeout )
  {
    RequireSolver( "time limit" );
    CheckStatus( nlopt_set_maxtime( Solver,
                 static_cast< double >( Timeout.count() ) ),
                 "setting the time limit" );
  }

  // ---------------------------------------------------------------------------
  // Finding a solution
  // ---------------------------------------------------------------------------
  //
  // The solution holds the final point, its objective value and the status
  // of the search. The status is not checked, and the caller decides which
  // outcomes to accept.

  struct OptimalSolution
  {
    const Variables    VariableValues;
    const double       ObjectiveValue;
    const nlopt_result Status;
  };

  OptimalSolution FindSolution( const Variables & InitialVariableValues )
  {
    if ( GetDimension() != InitialVariableValues.size() )
    {
      std::ostringstream ErrorMessage;

      ErrorMessage << __FILE__ << " at line " << __LINE__ << ": "
                   << InitialVariableValues.size() << " initial values were "
                   << "given for a solver of dimension " << GetDimension();

      throw std::invalid_argument( ErrorMessage.str() );
    }

    Variables Values( InitialVariableValues );
    double    Value  = 0.0;
    nlopt_result Status = nlopt_optimize( Solver, Values.data(), &Value );

    return OptimalSolution{ Values, Value, Status };
  }

  OptimizerInterface( void )
  : Optimization::Objective(), Solver( nullptr ), IgnoredStatus()
  {}

  OptimizerInterface( const OptimizerInterface & Other ) = delete;

public:

  virtual ~OptimizerInterface( void )
  { DeleteSolver(); }
};

}      // name space Optimization non-linear
#endif // OPTIMIZATION_NON_LINEAR_OPTIMIZER
