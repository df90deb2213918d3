

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

#include "culprit/analysis.h"

#include "intervals/intervals.h"
#include "lock/lock.h"
#include "dsp/predictor.h"
#include "stats/eigen_ops.h"
#include "param.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <cmath>

extern logger_t logger;


analysis_request_t::analysis_request_t()
{
  gps = 0;
  duration = 0;
  anchor = ANCHOR_CENTER;
  sr = 256;
  scattering = 1;
  smoothing_window = 50;
  rank = 1;
  check_lock = false;
  save_data = true;
}


analysis_request_t analysis_request_t::from_param( const param_t & param , const config_t & config )
{

  analysis_request_t req;

  req.gps = param.requires_dbl( "gps" );

  req.duration = param.requires_dbl( "dur" );

  if ( param.has( "event" ) )
    req.anchor = globals::anchor( param.value( "event" ) );

  req.target_channel = param.requires( "target" );

  req.channels_list = param.requires( "channels" );

  req.channels = Helper::file2strvector( req.channels_list );

  req.output_path = param.requires( "out" );

  req.lowpass = lowpass_t::parse( param.requires( "lowpass" ) );

  req.archive = param.has( "archive" ) ? param.value( "archive" ) : "";

  req.sr = param.has( "fs" ) ? param.requires_dbl( "fs" ) : config.default_sr;

  req.scattering = param.has( "bounce" ) ? param.requires_int( "bounce" ) : config.default_scattering;

  req.smoothing_window = param.has( "smooth" ) ? param.requires_int( "smooth" ) : config.default_smoothing;

  req.rank = param.has( "rank" ) ? param.requires_int( "rank" ) : 1;

  req.check_lock = param.yesno( "check-lock" );

  req.save_data = ! param.yesno( "no-data" );

  return req;
}


outcome_t outcome_t::completed( const record_t & record , const std::string & folder )
{
  outcome_t o;
  o.status = COMPLETED;
  o.record = record;
  o.folder = folder;
  return o;
}


outcome_t outcome_t::skipped( const std::string & reason )
{
  outcome_t o;
  o.status = SKIPPED;
  o.reason = reason;
  return o;
}


analysis_t::analysis_t( const config_t & config ,
			channel_source_t & channels ,
			mean_frequency_t & meanfreq ,
			state_source_t * state )
  : config( config ) , channels( channels ) , meanfreq( meanfreq ) , state( state )
{
}


std::string analysis_t::folder( const std::string & root , double gps )
{
  return Helper::join_path( root , timeline::window_id( gps ) );
}


outcome_t analysis_t::run( const analysis_request_t & req )
{

  //
  // window
  //

  const event_window_t window = timeline::resolve_window( req.gps , req.duration , req.anchor );

  logger << "  analysing " << req.target_channel << " over " << window.as_string()
	 << " (" << globals::anchor( req.anchor ) << " anchor " << req.gps << ")\n";

  if ( req.channels.size() == 0 )
    Helper::halt( INVALID_ARGUMENT , "no candidate channels" );

  if ( req.rank < 1 )
    Helper::halt( INVALID_ARGUMENT , "rank must be at least 1" );


  //
  // lock gate
  //

  if ( req.check_lock )
    {

      if ( state == NULL )
	Helper::halt( INVALID_ARGUMENT , "lock check requested without a state source" );

      const instrument_t instrument = lock::resolve_instrument( req.target_channel );

      lock_check_t lc = lock::validate( config , *state , instrument , window );

      if ( ! lc.ok() )
	{
	  logger << "  skipping window: " << lc.reason << "\n";
	  return outcome_t::skipped( lc.reason );
	}
    }


  //
  // channel data
  //

  double sr = req.sr;

  channel_matrix_t m = channels.fetch_channels( req.archive ,
						req.target_channel ,
						req.channels ,
						window.start , window.end ,
						req.sr , &sr );

  if ( m.channels() != req.channels.size() + 1 || m.labels.size() != m.channels() )
    Helper::halt( INTERNAL_ERROR , "channel source returned " + Helper::int2str( m.channels() )
		  + " channels, expected " + Helper::int2str( (int)req.channels.size() + 1 ) );

  logger << "  " << m.channels() << " channels, " << m.samples() << " samples at " << sr << " Hz\n";


  //
  // predictors
  //

  const Eigen::MatrixXd P = dsptools::predictors( m.candidates() , sr ,
						  req.smoothing_window ,
						  req.scattering ,
						  config.lambda );

  logger << "  built " << P.cols() << " predictors (bounce = " << req.scattering
	 << ", smoothing = " << req.smoothing_window << " samples)\n";


  //
  // target
  //

  const double cutoff = culprit::resolve_cutoff( req.lowpass , P );

  const std::vector<double> y = culprit::filter_target( m.target() , sr , cutoff , config.filter_order );


  //
  // scores
  //

  scorer_t scorer;

  scorer.score( y , P , m.candidate_labels() );

  std::vector<correlation_t> culprits = scorer.rank( req.rank );

  for (int i=0; i<culprits.size(); i++)
    {
      culprits[i].mean_frequency = meanfreq.mean_frequency( culprits[i].channel ,
							    window.start , window.end ,
							    config.bandpass_lwr ,
							    config.bandpass_upr );

      logger << "  culprit " << culprits[i].index << ": " << culprits[i].channel
	     << " (r = " << culprits[i].correlation
	     << ", mean frequency = " << culprits[i].mean_frequency << " Hz)\n";
    }


  //
  // record
  //

  const std::string dir = folder( req.output_path , req.gps );

  analysis_params_t p;
  p.start = llround( window.start );
  p.end = llround( window.end );
  p.target_channel = req.target_channel;
  p.channels_list = req.channels_list;
  p.output_path = dir;
  p.sampling_frequency = sr;
  p.lowpass_frequency = cutoff;
  p.scattering = req.scattering;
  p.smoothing_window = req.smoothing_window;

  record_t record;
  record.write_parameters( p );
  record.write_result( culprits );


  //
  // persist: sidecar first, so that a folder with a record always has one
  //

  if ( req.save_data )
    {
      const int w = scorer.winner();
      record_t::save_predictors( dir , req.target_channel , config.predictors_ext ,
				 eigen_ops::copy_vector( Eigen::VectorXd( P.col( w ) ) ) );
    }

  record.save( dir , config.record_file );

  logger << "  written " << Helper::join_path( dir , config.record_file ) << "\n";

  return outcome_t::completed( record , dir );

}
