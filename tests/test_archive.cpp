

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

#include "sources/archive.h"
#include "sources/meanfreq.h"
#include "tests/fixtures.h"

using fixtures::error_of;


TEST_CASE( "text archive channels" , "[archive]" )
{
  fixtures::temp_folder_t tmp;

  // 20 s from t = 990 at 64 Hz, one candidate at 32 Hz
  fixtures::write_series( tmp.root , "L1:GDS-CALIB_STRAIN" , 990 , 64 , fixtures::sine( 1280 , 64 , 3 ) );
  fixtures::write_series( tmp.root , "L1:SUS-ETMX_M0_DAMP_L" , 990 , 64 , fixtures::sine( 1280 , 64 , 0.5 ) );
  fixtures::write_series( tmp.root , "L1:SUS-ITMY_M0_DAMP_P" , 990 , 32 , fixtures::sine( 640 , 32 , 0.2 ) );

  archive_t archive( tmp.root );

  const std::vector<std::string> candidates = { "L1:SUS-ETMX_M0_DAMP_L" , "L1:SUS-ITMY_M0_DAMP_P" };

  SECTION( "file names" )
    {
      CHECK( archive_t::channel_file( "arch" , "L1:SUS-ETMX_M0_DAMP_L" ) == "arch/L1_SUS-ETMX_M0_DAMP_L.txt" );
      CHECK( archive.read( tmp.root , "L1:GDS-CALIB_STRAIN" ).sr == Approx( 64 ) );
    }

  SECTION( "same-rate channels" )
    {
      double sr = 0;
      const channel_matrix_t m = archive.fetch_channels( "" , "L1:GDS-CALIB_STRAIN" ,
							 std::vector<std::string>( 1 , candidates[0] ) ,
							 1000 , 1010 , 64 , &sr );
      CHECK( sr == 64 );
      CHECK( m.channels() == 2 );
      CHECK( m.samples() == 640 );
      CHECK( m.labels[0] == "L1:GDS-CALIB_STRAIN" );
      CHECK( m.candidate_labels() == std::vector<std::string>( 1 , candidates[0] ) );

      // window starts at sample 640 of the file
      CHECK( m.X(0,0) == Approx( fixtures::sine( 1280 , 64 , 3 )[640] ).margin( 1e-6 ) );
    }

  SECTION( "the lowest native rate wins" )
    {
      double sr = 0;
      const channel_matrix_t m = archive.fetch_channels( tmp.root , "L1:GDS-CALIB_STRAIN" , candidates ,
							 1000 , 1010 , 256 , &sr );
      CHECK( sr == Approx( 32 ) );
      CHECK( m.sr == Approx( 32 ) );
      CHECK( m.channels() == 3 );
      CHECK( m.samples() == 320 );
    }

  SECTION( "windows outside the archive" )
    {
      double sr = 0;
      CHECK( error_of( [&]() { archive.fetch_channels( "" , "L1:GDS-CALIB_STRAIN" , candidates , 2000 , 2010 , 64 , &sr ); } ) == INSUFFICIENT_DATA );
      CHECK( error_of( [&]() { archive.fetch_channels( "" , "L1:NOT-A-CHANNEL" , candidates , 1000 , 1010 , 64 , &sr ); } ) == IO_ERROR );
      CHECK( error_of( [&]() { archive.fetch_channels( "" , "L1:GDS-CALIB_STRAIN" , candidates , 1000 , 1010 , 0 , &sr ); } ) == INVALID_ARGUMENT );
    }

  SECTION( "band-limited mean frequency of an archived channel" )
    {
      spectral_mean_frequency_t mf( archive , tmp.root , 64 );
      CHECK( mf.mean_frequency( "L1:GDS-CALIB_STRAIN" , 990 , 1010 , 1 , 10 ) == Approx( 3 ).margin( 0.25 ) );
    }
}


TEST_CASE( "malformed archive files" , "[archive]" )
{
  fixtures::temp_folder_t tmp;
  archive_t archive( tmp.root );

  fixtures::write_file( tmp.path( "L1_BAD.txt" ) , "0 1\n1 two\n" );
  CHECK( error_of( [&]() { archive.read( tmp.root , "L1:BAD" ); } ) == IO_ERROR );

  fixtures::write_file( tmp.path( "L1_BACK.txt" ) , "0 1\n2 1\n1 1\n" );
  CHECK( error_of( [&]() { archive.read( tmp.root , "L1:BACK" ); } ) == IO_ERROR );

  fixtures::write_file( tmp.path( "L1_ONE.txt" ) , "% one sample\n0 1\n" );
  CHECK( error_of( [&]() { archive.read( tmp.root , "L1:ONE" ); } ) == INSUFFICIENT_DATA );

  // commas and comments are fine
  fixtures::write_file( tmp.path( "L1_CSV.txt" ) , "# t,x\n0.0,1\n0.5,2\n1.0,3\n" );
  CHECK( archive.read( tmp.root , "L1:CSV" ).x.size() == 3 );
  CHECK( archive.read( tmp.root , "L1:CSV" ).sr == Approx( 2 ) );
}


TEST_CASE( "lock state from the archive" , "[archive][lock]" )
{
  fixtures::temp_folder_t tmp;

  // 1 Hz segment flag, with a gap between 1004 and 1007
  std::string s;
  for (int t = 995; t <= 1015; t++)
    if ( t <= 1004 || t >= 1007 )
      s += Helper::int2str( t ) + " 1\n";
  fixtures::write_file( tmp.path( "L1_DMT-ANALYSIS_READY_1.txt" ) , s );

  archive_t archive( tmp.root );

  const lock_series_t full = archive.fetch_state( "L1:DMT-ANALYSIS_READY:1" , 1000 , 1010 );
  REQUIRE( full.size() == 2 );
  CHECK( full[0].front().t == 1000 );
  CHECK( full[0].back().t == 1004 );
  CHECK( full[1].front().t == 1007 );
  CHECK( full[1].back().t == 1010 );

  const lock_series_t part = archive.fetch_state( "L1:DMT-ANALYSIS_READY:1" , 1007 , 1012 );
  REQUIRE( part.size() == 1 );
  CHECK( part[0].size() == 6 );
}
