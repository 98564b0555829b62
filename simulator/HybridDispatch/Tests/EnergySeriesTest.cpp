/*==============================================================================
Energy series test

Testing the energy balance derived from the consumption and production, and
the detection of the starts of the excess production blocks.

Author and Copyright: Geir Horn, 2019
License: LGPL 3.0
==============================================================================*/

#include <vector>
#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include "EnergyBalance.hpp"
#include "CycleBoundaries.hpp"

using namespace HybridDispatch;

BOOST_AUTO_TEST_SUITE( EnergySeries )

BOOST_AUTO_TEST_CASE( BalanceSplitsProductionAndLoad )
{
  EnergyBalance Balance( Series{ 1.0, 1.0, 2.0, 0.5 },
                         Series{ 0.0, 3.0, 2.0, 0.2 } );

  BOOST_CHECK( Balance.Excess    == Series({ 0.0, 2.0, 0.0, 0.0 }) );
  BOOST_CHECK( Balance.DirectUse == Series({ 0.0, 1.0, 2.0, 0.2 }) );
  BOOST_CHECK_CLOSE( Balance.Deficit[0], 1.0, 1e-9 );
  BOOST_CHECK_SMALL( Balance.Deficit[1], 1e-12 );
  BOOST_CHECK_SMALL( Balance.Deficit[2], 1e-12 );
  BOOST_CHECK_CLOSE( Balance.Deficit[3], 0.3, 1e-9 );

  for ( Index t = 0; t < Balance.Size(); t++ )
    BOOST_CHECK( Balance.Excess[t] == 0.0 || Balance.Deficit[t] == 0.0 );
}

BOOST_AUTO_TEST_CASE( BalanceRejectsDifferentLengths )
{
  BOOST_CHECK_THROW( EnergyBalance( Series{ 1.0, 1.0 }, Series{ 1.0 } ),
                     std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( CandidatesAreRisingEdges )
{
  Series Excess{ 0.5, 0.2, 0.0, 0.0, 1.0, 1.0, 0.0, 2.0 };

  BOOST_CHECK( CycleCandidates( Excess, 1e-6 ) ==
               std::vector< Index >({ 0, 4, 7 }) );
}

BOOST_AUTO_TEST_CASE( CandidatesRespectTheThreshold )
{
  Series Excess{ 0.0, 0.05, 0.3, 0.05, 0.3, 0.3 };

  BOOST_CHECK( CycleCandidates( Excess, 0.1 ) ==
               std::vector< Index >({ 2, 4 }) );
  BOOST_CHECK( CycleCandidates( Excess, 1.0 ).empty() );
  BOOST_CHECK( CycleCandidates( Series(), 1e-6 ).empty() );
}

BOOST_AUTO_TEST_SUITE_END()
