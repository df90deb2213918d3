

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

#include "lock/lock.h"
#include "tests/fixtures.h"

namespace {

  lock_segment_t segment( double start , double end , double step , double flag = 1 )
  {
    lock_segment_t s;
    for (double t = start; t <= end + 1e-9; t += step)
      s.push_back( lock_sample_t( t , flag ) );
    return s;
  }

}


TEST_CASE( "instruments from channel names" , "[lock]" )
{
  CHECK( lock::resolve_instrument( "L1:GDS-CALIB_STRAIN" ) == INSTRUMENT_L1 );
  CHECK( lock::resolve_instrument( "h1:ASC-X_TR_A_NSUM_OUT_DQ" ) == INSTRUMENT_H1 );
  CHECK( lock::resolve_instrument( "V1:Hrec_hoft_16384Hz" ) == INSTRUMENT_V1 );
  CHECK( lock::resolve_instrument( "K1:CAL-CS_PROC_DARM" ) == INSTRUMENT_UNKNOWN );
  CHECK( lock::resolve_instrument( "strain" ) == INSTRUMENT_UNKNOWN );
  CHECK( lock::resolve_instrument( "\xc3\xa9" "1:X" ) == INSTRUMENT_UNKNOWN );

  CHECK( lock::policy( INSTRUMENT_L1 ) == LOCK_SEGMENTS );
  CHECK( lock::policy( INSTRUMENT_H1 ) == LOCK_SEGMENTS );
  CHECK( lock::policy( INSTRUMENT_V1 ) == LOCK_FLAGS );
  CHECK( lock::policy( INSTRUMENT_UNKNOWN ) == LOCK_NONE );
}


TEST_CASE( "segment lock: one segment spanning the window" , "[lock]" )
{
  const event_window_t w( 1000 , 1010 );

  lock_series_t series;

  SECTION( "exact span" )
    {
      series.push_back( segment( 1000 , 1010 , 1 ) );
      CHECK( lock::check_segments( series , w ).ok() );
    }

  SECTION( "late start" )
    {
      series.push_back( segment( 1001 , 1010 , 1 ) );
      const lock_check_t lc = lock::check_segments( series , w );
      CHECK_FALSE( lc.ok() );
      CHECK( lc.reason != "" );
    }

  SECTION( "early end" )
    {
      series.push_back( segment( 1000 , 1009 , 1 ) );
      const lock_check_t lc = lock::check_segments( series , w );
      CHECK_FALSE( lc.ok() );
      CHECK( lc.reason.find( "1009" ) != std::string::npos );
    }

  SECTION( "two segments" )
    {
      series.push_back( segment( 1000 , 1004 , 1 ) );
      series.push_back( segment( 1006 , 1010 , 1 ) );
      CHECK_FALSE( lock::check_segments( series , w ).ok() );
    }

  SECTION( "no segments" )
    {
      CHECK_FALSE( lock::check_segments( series , w ).ok() );
    }
}


TEST_CASE( "flag lock: every sample locked" , "[lock]" )
{
  lock_series_t series;

  SECTION( "all locked" )
    {
      series.push_back( segment( 0 , 5 , 1 , 1 ) );
      CHECK( lock::check_flags( series , 1 ).ok() );
    }

  SECTION( "one unlocked sample" )
    {
      series.push_back( segment( 0 , 5 , 1 , 1 ) );
      series[0][3].flag = 0;
      CHECK_FALSE( lock::check_flags( series , 1 ).ok() );
    }

  SECTION( "nothing to check" )
    {
      CHECK( lock::check_flags( series , 1 ).ok() );
    }
}


TEST_CASE( "lock validation per instrument" , "[lock]" )
{
  const config_t config;
  const event_window_t w( 1000 , 1010 );

  fixtures::stub_state_t state;

  SECTION( "segments for L1" )
    {
      state.series.push_back( segment( 1000 , 1010 , 0.5 ) );
      CHECK( lock::validate( config , state , INSTRUMENT_L1 , w ).ok() );
      CHECK( state.last_channel == "L1:DMT-ANALYSIS_READY:1" );
    }

  SECTION( "flags for V1" )
    {
      // a partial segment is fine for a flag channel
      state.series.push_back( segment( 1002 , 1008 , 1 , 1 ) );
      CHECK( lock::validate( config , state , INSTRUMENT_V1 , w ).ok() );
      CHECK( state.last_channel == "V1:META_ITF_LOCK_index" );

      state.series[0][2].flag = 0;
      CHECK_FALSE( lock::validate( config , state , INSTRUMENT_V1 , w ).ok() );
    }

  SECTION( "unknown instruments are not checked" )
    {
      CHECK( lock::validate( config , state , INSTRUMENT_UNKNOWN , w ).ok() );
      CHECK( state.last_channel == "" );
    }
}
