

//    --------------------------------------------------------------------
//
//    This file is part of Scatter.
//
//    SCATTER is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    Scatter is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with Scatter. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include <catch2/catch.hpp>

#include "culprit/target.h"
#include "tests/fixtures.h"

#include <cmath>

using fixtures::error_of;


TEST_CASE( "lowpass options" , "[target]" )
{
  const lowpass_t f = lowpass_t::parse( "2.5" );
  CHECK( f.is_fixed() );
  CHECK( f.f == 2.5 );

  CHECK( lowpass_t::parse( "average" ).policy == LOWPASS_AVERAGE );
  CHECK( lowpass_t::parse( "MAX" ).policy == LOWPASS_MAX );
  CHECK_FALSE( lowpass_t::parse( "max" ).is_fixed() );

  CHECK( error_of( []() { lowpass_t::parse( "mean" ); } ) == INVALID_ARGUMENT );
  CHECK( error_of( []() { lowpass_t::parse( "" ); } ) == INVALID_ARGUMENT );
}


TEST_CASE( "cutoffs derived from the predictors" , "[target]" )
{
  // column means 1, 2, 3; column maxima 2, 4, 5
  Eigen::MatrixXd P( 2 , 3 );
  P << 0 , 0 , 1 ,
       2 , 4 , 5 ;

  CHECK( culprit::resolve_cutoff( lowpass_t::derived( LOWPASS_AVERAGE ) , P ) == Approx( 3.0 ) );
  CHECK( culprit::resolve_cutoff( lowpass_t::derived( LOWPASS_MAX ) , P ) == Approx( 5.0 ) );

  // fixed cutoffs ignore the predictors
  CHECK( culprit::resolve_cutoff( lowpass_t::fixed( 1.25 ) , P ) == 1.25 );

  const Eigen::MatrixXd none( 2 , 0 );
  CHECK( error_of( [&]() { culprit::resolve_cutoff( lowpass_t::derived( LOWPASS_MAX ) , none ); } ) == INSUFFICIENT_DATA );
}


TEST_CASE( "target lowpass" , "[target]" )
{
  const double sr = 256;
  const std::vector<double> x = fixtures::sine( 1024 , sr , 1 );

  SECTION( "in range" )
    {
      const std::vector<double> y = culprit::filter_target( x , sr , 10 );
      REQUIRE( y.size() == x.size() );
      CHECK( y[ 512 ] == Approx( x[ 512 ] ).margin( 0.01 ) );
    }

  SECTION( "at or above Nyquist" )
    {
      CHECK( error_of( [&]() { culprit::filter_target( x , sr , 128 ); } ) == INVALID_ARGUMENT );
      CHECK( error_of( [&]() { culprit::filter_target( x , sr , 300 ); } ) == INVALID_ARGUMENT );
    }

  SECTION( "non-positive" )
    {
      CHECK( error_of( [&]() { culprit::filter_target( x , sr , 0 ); } ) == INVALID_ARGUMENT );
      CHECK( error_of( [&]() { culprit::filter_target( x , sr , std::nan( "" ) ); } ) == INVALID_ARGUMENT );
    }
}
