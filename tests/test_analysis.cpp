

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

#include "culprit/analysis.h"
#include "sstore/store.h"
#include "dsp/predictor.h"
#include "dsp/correl.h"
#include "stats/eigen_ops.h"
#include "param.h"
#include "tests/fixtures.h"

#include <cmath>

using fixtures::error_of;

namespace {

  const double sr = 64;
  const int n = 640;
  const int smooth = 8;

  // target + three candidates over [1000, 1010): L1:B drives the target,
  // L1:A sits still and L1:C moves at an unrelated rate
  channel_matrix_t channels( const std::string & target = "L1:GDS-CALIB_STRAIN" )
  {
    channel_matrix_t m;
    m.sr = sr;
    m.labels = { target , "L1:A" , "L1:B" , "L1:C" };
    m.X = Eigen::MatrixXd::Zero( n , 4 );

    for (int i=0; i<n; i++)
      {
	const double t = i / sr;
	m.X(i,1) = 0.25;
	m.X(i,2) = sin( 2 * M_PI * 0.3 * t );
	m.X(i,3) = 0.5 * sin( 2 * M_PI * 2.1 * t + 1.0 );
      }

    // fringe-like target: B's predictor plus a fast ripple
    const Eigen::VectorXd pb = dsptools::predictor( m.X.col(2) , sr , smooth , 1 , 1.064 );
    for (int i=0; i<n; i++)
      m.X(i,0) = pb[i] + 0.2 * sin( 2 * M_PI * 25.0 * i / sr );

    return m;
  }

  analysis_request_t request( const std::string & out )
  {
    analysis_request_t req;
    req.gps = 1005;
    req.duration = 10;
    req.anchor = ANCHOR_CENTER;
    req.target_channel = "L1:GDS-CALIB_STRAIN";
    req.channels = { "L1:A" , "L1:B" , "L1:C" };
    req.channels_list = "channels.txt";
    req.output_path = out;
    req.lowpass = lowpass_t::fixed( 10 );
    req.sr = sr;
    req.scattering = 1;
    req.smoothing_window = smooth;
    return req;
  }

}


TEST_CASE( "the driving channel is identified" , "[analysis]" )
{
  fixtures::temp_folder_t tmp;
  const config_t config;

  fixtures::stub_channels_t data;
  data.m = channels();

  fixtures::stub_meanfreq_t meanfreq( 0.6 );

  analysis_t engine( config , data , meanfreq );

  const outcome_t outcome = engine.run( request( tmp.root ) );

  REQUIRE( outcome.is_completed() );
  CHECK( outcome.folder == tmp.path( "1005" ) );

  // window handed to the data provider
  CHECK( data.last_start == 1000 );
  CHECK( data.last_end == 1010 );

  // same pipeline, computed directly
  const Eigen::MatrixXd P = dsptools::predictors( data.m.candidates() , sr , smooth , 1 , config.lambda );
  const std::vector<double> y = culprit::filter_target( data.m.target() , sr , 10 , config.filter_order );
  const double expected = dsptools::pearson( y , eigen_ops::copy_vector( Eigen::VectorXd( P.col(1) ) ) );

  const correlation_t best = outcome.record.best();
  CHECK( best.channel == "L1:B" );
  CHECK( best.index == 1 );
  CHECK( best.correlation == Approx( expected ) );
  CHECK( best.correlation > 0.9 );
  CHECK( best.mean_frequency == 0.6 );

  REQUIRE( meanfreq.requests.size() == 1 );
  CHECK( meanfreq.requests[0].channel == "L1:B" );
  CHECK( meanfreq.requests[0].start == 1000 );
  CHECK( meanfreq.requests[0].end == 1010 );
  CHECK( meanfreq.requests[0].lwr == config.bandpass_lwr );
  CHECK( meanfreq.requests[0].upr == config.bandpass_upr );

  SECTION( "the record on disk" )
    {
      const record_t r = record_t::load( outcome.folder , config.record_file );
      CHECK( r.window() == std::make_pair( 1000LL , 1010LL ) );
      CHECK( r.target_channel() == "L1:GDS-CALIB_STRAIN" );
      CHECK( r.channels_list() == "channels.txt" );
      CHECK( r.output_path() == outcome.folder );
      CHECK( r.sampling_frequency() == sr );
      CHECK( r.lowpass_frequency() == 10 );
      CHECK( r.smoothing_window() == smooth );
      CHECK( r.n_results() == 1 );
      CHECK( r.result( 1 ).channel == "L1:B" );
    }

  SECTION( "the predictor sidecar holds the winning column" )
    {
      const std::vector<double> v = record_t::load_predictors( record_t::predictors_file( outcome.folder ,
											  "L1:GDS-CALIB_STRAIN" ,
											  config.predictors_ext ) );
      REQUIRE( v.size() == n );
      CHECK( v[100] == Approx( P(100,1) ) );

      const store_t store( config );
      CHECK( store.valid( outcome.folder ) );
    }
}


TEST_CASE( "ranked culprits and derived cutoffs" , "[analysis]" )
{
  fixtures::temp_folder_t tmp;
  const config_t config;

  fixtures::stub_channels_t data;
  data.m = channels();

  fixtures::stub_meanfreq_t meanfreq;

  analysis_t engine( config , data , meanfreq );

  analysis_request_t req = request( tmp.root );
  req.rank = 2;
  req.lowpass = lowpass_t::derived( LOWPASS_AVERAGE );

  const outcome_t outcome = engine.run( req );
  REQUIRE( outcome.is_completed() );

  const std::vector<correlation_t> r = outcome.record.results();
  REQUIRE( r.size() == 2 );
  CHECK( r[0].channel == "L1:B" );
  CHECK( r[0].index == 1 );
  CHECK( r[1].index == 2 );
  CHECK( meanfreq.requests.size() == 2 );

  const Eigen::MatrixXd P = dsptools::predictors( data.m.candidates() , sr , smooth , 1 , config.lambda );
  CHECK( outcome.record.lowpass_frequency() == Approx( eigen_ops::column_means( P ).maxCoeff() ) );
}


TEST_CASE( "lock gate" , "[analysis][lock]" )
{
  fixtures::temp_folder_t tmp;
  const config_t config;

  fixtures::stub_channels_t data;
  fixtures::stub_meanfreq_t meanfreq;
  fixtures::stub_state_t state;

  analysis_request_t req = request( tmp.root );
  req.check_lock = true;

  SECTION( "a broken segment skips the window" )
    {
      data.m = channels();
      lock_segment_t s1 , s2;
      for (int t=1000; t<=1004; t++) s1.push_back( lock_sample_t( t , 1 ) );
      for (int t=1006; t<=1010; t++) s2.push_back( lock_sample_t( t , 1 ) );
      state.series.push_back( s1 );
      state.series.push_back( s2 );

      analysis_t engine( config , data , meanfreq , &state );
      const outcome_t outcome = engine.run( req );

      CHECK_FALSE( outcome.is_completed() );
      CHECK( outcome.reason != "" );
      CHECK( state.last_channel == "L1:DMT-ANALYSIS_READY:1" );

      // nothing fetched, nothing written
      CHECK( data.calls == 0 );
      CHECK_FALSE( Helper::folderExists( tmp.path( "1005" ) ) );
    }

  SECTION( "a full segment proceeds" )
    {
      data.m = channels();
      lock_segment_t s;
      for (int t=1000; t<=1010; t++) s.push_back( lock_sample_t( t , 1 ) );
      state.series.push_back( s );

      analysis_t engine( config , data , meanfreq , &state );
      CHECK( engine.run( req ).is_completed() );
    }

  SECTION( "flag channels need every sample locked" )
    {
      data.m = channels( "V1:Hrec_hoft_16384Hz" );
      req.target_channel = "V1:Hrec_hoft_16384Hz";
      req.channels = { "V1:A" , "V1:B" , "V1:C" };

      lock_segment_t s;
      for (int t=1000; t<=1009; t++) s.push_back( lock_sample_t( t , t == 1003 ? 0 : 1 ) );
      state.series.push_back( s );

      analysis_t engine( config , data , meanfreq , &state );
      const outcome_t outcome = engine.run( req );
      CHECK_FALSE( outcome.is_completed() );
      CHECK( state.last_channel == "V1:META_ITF_LOCK_index" );
    }

  SECTION( "a lock check needs a state source" )
    {
      data.m = channels();
      analysis_t engine( config , data , meanfreq );
      CHECK( error_of( [&]() { engine.run( req ); } ) == INVALID_ARGUMENT );
    }
}


TEST_CASE( "failed windows leave nothing behind" , "[analysis]" )
{
  fixtures::temp_folder_t tmp;
  const config_t config;

  fixtures::stub_channels_t data;
  data.m = channels();
  fixtures::stub_meanfreq_t meanfreq;

  analysis_t engine( config , data , meanfreq );

  analysis_request_t req = request( tmp.root );

  SECTION( "cutoff at Nyquist" )
    {
      req.lowpass = lowpass_t::fixed( 32 );
      CHECK( error_of( [&]() { engine.run( req ); } ) == INVALID_ARGUMENT );
      CHECK_FALSE( Helper::folderExists( tmp.path( "1005" ) ) );
    }

  SECTION( "smoothing longer than the window" )
    {
      req.smoothing_window = n + 1;
      CHECK( error_of( [&]() { engine.run( req ); } ) == INSUFFICIENT_DATA );
      CHECK_FALSE( Helper::folderExists( tmp.path( "1005" ) ) );
    }

  SECTION( "no candidates" )
    {
      req.channels.clear();
      CHECK( error_of( [&]() { engine.run( req ); } ) == INVALID_ARGUMENT );
    }

  SECTION( "provider returns the wrong channels" )
    {
      req.channels.pop_back();
      CHECK( error_of( [&]() { engine.run( req ); } ) == INTERNAL_ERROR );
    }

  SECTION( "no sidecar on request" )
    {
      req.save_data = false;
      const outcome_t outcome = engine.run( req );
      REQUIRE( outcome.is_completed() );
      CHECK( Helper::fileExists( Helper::join_path( outcome.folder , config.record_file ) ) );
      CHECK( Helper::glob( outcome.folder , "*." + config.predictors_ext ).size() == 0 );
    }
}


TEST_CASE( "requests from options" , "[analysis][param]" )
{
  fixtures::temp_folder_t tmp;
  fixtures::write_file( tmp.path( "channels.txt" ) , "L1:A\nL1:B\n" );

  param_t param;
  param.parse( "gps=1187008882.4" );
  param.parse( "dur=20" );
  param.parse( "event=start" );
  param.parse( "target=L1:GDS-CALIB_STRAIN" );
  param.parse( "channels=" + tmp.path( "channels.txt" ) );
  param.parse( "out=" + tmp.path( "out" ) );
  param.parse( "lowpass=max" );
  param.parse( "bounce=3" );
  param.parse( "no-data" );

  const config_t config;
  const analysis_request_t req = analysis_request_t::from_param( param , config );

  CHECK( req.gps == Approx( 1187008882.4 ) );
  CHECK( req.anchor == ANCHOR_START );
  CHECK( req.channels.size() == 2 );
  CHECK( req.lowpass.policy == LOWPASS_MAX );
  CHECK( req.scattering == 3 );
  CHECK( req.smoothing_window == config.default_smoothing );
  CHECK( req.sr == config.default_sr );
  CHECK( req.rank == 1 );
  CHECK_FALSE( req.check_lock );
  CHECK_FALSE( req.save_data );

  CHECK( analysis_t::folder( "out" , req.gps ) == "out/1187008882" );

  SECTION( "unknown lowpass" )
    {
      param_t p2;
      p2.parse( "gps=1" );
      p2.parse( "dur=1" );
      p2.parse( "target=L1:X" );
      p2.parse( "channels=" + tmp.path( "channels.txt" ) );
      p2.parse( "out=x" );
      p2.parse( "lowpass=median" );
      CHECK( error_of( [&]() { analysis_request_t::from_param( p2 , config ); } ) == INVALID_ARGUMENT );
    }
}
