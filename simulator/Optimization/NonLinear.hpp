/*==============================================================================
Non-Linear optimization

This class uses the NLOpt library [1] of algorithms to do the required
optimisation by wrapping the necessary interface classes since the NLopt
library is fundamentally C-style and the C++ interface to NLopt is unfortunately
not complete and this interface replaces the automatically generated NLopt
C++ interface directly using the C-style interface of NLopt.

The purpose of this redesigned C++ interface is to prevent the user from setting
up optimisation problems that will fail on execution. For instance, with the
automatically generated interface it is perfectly possible not to provide bounds
on the search domain even if an algorithm requires that; or one may fail to
provide the gradient functions for algorithms requiring them. Such code will
simply not compile with this interface.

Only the gradient based sequential quadratic programming algorithm is wrapped
as it is sufficient for the linear programs of the dispatch windows. The headers
are included here, so one may still include only this file and get all the
algorithm classes.

References:

[1] Steven G. Johnson: The NLopt nonlinear-optimization package,
    http://ab-initio.mit.edu/nlopt

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_NON_LINEAR
#define OPTIMIZATION_NON_LINEAR

// -----------------------------------------------------------------------------
// Core interface
// -----------------------------------------------------------------------------

#include "NonLinear/Algorithms.hpp"           // Definition of the algorithms
#include "NonLinear/Objective.hpp"            // Objective function
#include "NonLinear/Optimizer.hpp"            // Optimizer interface
#include "NonLinear/Bounds.hpp"               // Variable domain bounds
#include "NonLinear/Constraints.hpp"          // Constraint functions

// -----------------------------------------------------------------------------
// Optimisers for various algorithms
// -----------------------------------------------------------------------------

#include "NonLinear/QuasiNewton.hpp"          // Sequential quadratic programming

#endif // OPTIMIZATION_NON_LINEAR
