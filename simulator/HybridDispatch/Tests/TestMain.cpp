/*==============================================================================
Hybrid Dispatch tests

The test cases of the hybrid dispatch library are grouped in test suites in
the different files of this directory, and this file only defines the test
module so that the Boost unit test framework generates the main function.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#define BOOST_TEST_MODULE HybridDispatchTests
#include <boost/test/unit_test.hpp>
