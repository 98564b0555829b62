/*==============================================================================
Type definitions

The purpose of this file is to group all type definitions in one place to
ensure that all classes uses the same definitions and so that they are not
depending on including other class definitions that may not be needed.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#ifndef HYBRID_DISPATCH_TYPES
#define HYBRID_DISPATCH_TYPES

#include <vector>             // Standard vectors
#include <chrono>             // Time representation

namespace HybridDispatch {

// Time is measured in POSIX seconds and the representation is taken from the
// standard chrono library to make sure it matches the representation of
// seconds on the current platform.

using Time = std::chrono::seconds::rep;

// All quantities of the simulation are hourly values stored in vectors
// indexed by the time step.

using Series = std::vector< double >;
using Index  = Series::size_type;

}      // end name space HybridDispatch
#endif // HYBRID_DISPATCH_TYPES
