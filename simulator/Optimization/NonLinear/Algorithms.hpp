/*==============================================================================
Algorithms

NLopt [1] identifies its algorithms by the values of a plain C enumeration, so
any integer is accepted where an algorithm is expected and nothing prevents a
problem from being combined with an algorithm that cannot solve it. The
algorithm ID is here redefined as a scoped enumeration, and compile time
predicates tell which problem components an algorithm needs or supports. The
objective and constraint classes use the predicates to exist only for the
algorithms that can use them.

Only the gradient based algorithms for inequality constrained problems are
listed. The dispatch windows are linear programs with bounded variables, and
they are solved with the sequential quadratic programming algorithm (SLSQP).

References:

[1] Steven G. Johnson: The NLopt nonlinear-optimization package,
    http://ab-initio.mit.edu/nlopt

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR_ALGORITHMS
#define OPTIMIZATION_NON_LINEAR_ALGORITHMS

#include <nlopt.h>

namespace Optimization::NonLinear
{

class Algorithm
{
public:

  // The enumeration takes its values from the NLopt algorithm values, and the
  // number of NLopt algorithms is the first illegal value.

  enum class ID : unsigned short int {
    MaxNumber = NLOPT_NUM_ALGORITHMS
  };

  static constexpr bool RequiresGradient( const ID TheAlgorithm )
  {
    switch ( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_LD_MMA:
      case NLOPT_LD_CCSAQ:
      case NLOPT_LD_SLSQP:
        return true;
      default:
        return false;
    }
  }

  static constexpr bool SupportsInequalityConstraints( const ID TheAlgorithm )
  {
    switch ( static_cast< nlopt_algorithm >( TheAlgorithm ) )
    {
      case NLOPT_LD_MMA:
      case NLOPT_LD_CCSAQ:
      case NLOPT_LD_SLSQP:
        return true;
      default:
        return false;
    }
  }

  // The algorithms are grouped as in the NLopt documentation. A linear
  // program is convex, so a local algorithm finds the global optimum.

  struct Local
  {
    // SLSQP approximates the Hessian with a dense matrix and the memory
    // grows with the square of the number of variables.

    struct QuasiNewton
    {
      static constexpr ID QuadraticProgramming = ID{ NLOPT_LD_SLSQP };
    };
  };
};

// The NLopt solver object is allocated when the dimension of the problem is
// known, which is when the problem is about to be solved.

using SolverPointer = nlopt_opt;

}       // name space Optimization non-linear
#endif  // OPTIMIZATION_NON_LINEAR_ALGORITHMS
