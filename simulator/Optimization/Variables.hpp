/*==============================================================================
Variables

The variables of the linear programs solved in this library are continuous
quantities like the energy charged or discharged in a time step, and the
library wraps numerical solvers implemented in C for real variables in double
precision. The variable type is therefore defined to be a standard double. It
is important to use the defined variable type instead of a standard double as
its definition could change in the future.

Author and Copyright: Geir Horn, 2018
License: LGPL 3.0
==============================================================================*/

#ifndef OPTIMIZATION_VARIABLES
#define OPTIMIZATION_VARIABLES

#include <vector>

namespace Optimization
{
using VariableType   = double;
using Variables      = std::vector< VariableType >;
using GradientVector = std::vector< VariableType >;
using Dimension      = typename Variables::size_type;

}      // End name space Optimization
#endif // OPTIMIZATION_VARIABLES
