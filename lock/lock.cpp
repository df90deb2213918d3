

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

#include "lock/lock.h"

#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


instrument_t lock::resolve_instrument( const std::string & channel )
{
  const size_t p = channel.find( ':' );
  if ( p == std::string::npos ) return INSTRUMENT_UNKNOWN;

  const std::string site = Helper::toupper( channel.substr( 0 , p ) );

  if ( site == "L1" ) return INSTRUMENT_L1;
  if ( site == "H1" ) return INSTRUMENT_H1;
  if ( site == "V1" ) return INSTRUMENT_V1;

  return INSTRUMENT_UNKNOWN;
}


lock_policy_t lock::policy( instrument_t instrument )
{
  switch ( instrument )
    {
    case INSTRUMENT_L1 :
    case INSTRUMENT_H1 :
      return LOCK_SEGMENTS;
    case INSTRUMENT_V1 :
      return LOCK_FLAGS;
    default :
      return LOCK_NONE;
    }
}


lock_check_t lock::check_segments( const lock_series_t & series , const event_window_t & window )
{

  if ( series.size() != 1 )
    return lock_check_t::skipped( "expecting a single lock segment, found " + Helper::int2str( (int)series.size() ) );

  const lock_segment_t & segment = series[0];

  if ( segment.size() == 0 )
    return lock_check_t::skipped( "empty lock segment" );

  // exact match on both ends
  if ( segment.front().t != window.start || segment.back().t != window.end )
    return lock_check_t::skipped( "lock segment " + Helper::dbl2str( segment.front().t )
				  + " - " + Helper::dbl2str( segment.back().t )
				  + " does not span window " + window.as_string() );

  return lock_check_t::proceed();
}


lock_check_t lock::check_flags( const lock_series_t & series , const double locked )
{
  for (int s=0; s<series.size(); s++)
    for (int i=0; i<series[s].size(); i++)
      if ( series[s][i].flag != locked )
	return lock_check_t::skipped( "instrument not locked at " + Helper::dbl2str( series[s][i].t ) );

  return lock_check_t::proceed();
}


lock_check_t lock::validate( const config_t & config ,
			     state_source_t & source ,
			     instrument_t instrument ,
			     const event_window_t & window )
{

  const lock_policy_t p = policy( instrument );

  std::string channel;

  if ( p == LOCK_NONE || ! config.lock_channel( instrument , &channel ) )
    {
      logger << "  no lock channel for " << globals::instrument( instrument ) << ", skipping lock check\n";
      return lock_check_t::proceed();
    }

  logger << "  checking lock state with " << channel << " over " << window.as_string() << "\n";

  lock_series_t series = source.fetch_state( channel , window.start , window.end );

  if ( p == LOCK_SEGMENTS )
    return check_segments( series , window );

  return check_flags( series , config.locked_flag );
}
