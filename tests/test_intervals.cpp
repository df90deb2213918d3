

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

#include "intervals/intervals.h"
#include "tests/fixtures.h"

using fixtures::error_of;


TEST_CASE( "windows from an anchor time" , "[intervals]" )
{

  SECTION( "center" )
    {
      const event_window_t w = timeline::resolve_window( 1005 , 10 , ANCHOR_CENTER );
      CHECK( w.start == 1000 );
      CHECK( w.end == 1010 );
      CHECK( w.duration() == 10 );
      CHECK( w.mid() == 1005 );
    }

  SECTION( "start and end" )
    {
      CHECK( timeline::resolve_window( 1005 , 10 , ANCHOR_START ) == event_window_t( 1005 , 1015 ) );
      CHECK( timeline::resolve_window( 1005 , 10 , ANCHOR_END ) == event_window_t( 995 , 1005 ) );
    }

  SECTION( "named anchors" )
    {
      CHECK( timeline::resolve_window( 100 , 4 , "start" ) == event_window_t( 100 , 104 ) );
      CHECK( timeline::resolve_window( 100 , 4 , "end" ) == event_window_t( 96 , 100 ) );
      CHECK( error_of( []() { timeline::resolve_window( 100 , 4 , "middle" ); } ) == INVALID_ARGUMENT );
    }

  SECTION( "bad durations" )
    {
      CHECK( error_of( []() { timeline::resolve_window( 100 , 0 , ANCHOR_CENTER ); } ) == INVALID_ARGUMENT );
      CHECK( error_of( []() { timeline::resolve_window( 100 , -5 , ANCHOR_START ); } ) == INVALID_ARGUMENT );
      CHECK( error_of( []() { event_window_t( 10 , 10 ); } ) == INVALID_ARGUMENT );
    }

  SECTION( "half-open" )
    {
      const event_window_t w( 1000 , 1010 );
      CHECK( w.contains( 1000 ) );
      CHECK( w.contains( 1009.99 ) );
      CHECK_FALSE( w.contains( 1010 ) );
    }
}


TEST_CASE( "anchor times from persisted bounds" , "[intervals]" )
{
  CHECK( timeline::anchor_of( 1000 , 1010 , ANCHOR_START ) == 1000 );
  CHECK( timeline::anchor_of( 1000 , 1010 , ANCHOR_END ) == 1010 );
  CHECK( timeline::anchor_of( 1000 , 1010 , ANCHOR_CENTER ) == 1005 );

  // odd sums round down
  CHECK( timeline::anchor_of( 1000 , 1011 , ANCHOR_CENTER ) == 1005 );
  CHECK( timeline::anchor_of( -11 , 0 , ANCHOR_CENTER ) == -6 );

  CHECK( timeline::window_id( 1005.0 ) == "1005" );
  CHECK( timeline::window_id( 1005.7 ) == "1005" );
}
