

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

#include "intervals/intervals.h"
#include "helper/helper.h"

#include <cmath>

std::ostream & operator<<( std::ostream & out , const event_window_t & rhs )
{
  out << rhs.start << "-" << rhs.end;
  return out;
}

event_window_t::event_window_t( double start , double end )
  : start( start ) , end( end )
{
  if ( ! ( start < end ) )
    Helper::halt( INVALID_ARGUMENT , "invalid window, start must precede end: "
		  + Helper::dbl2str( start ) + " " + Helper::dbl2str( end ) );
}


event_window_t timeline::resolve_window( double t , double d , anchor_t anchor )
{

  if ( ! ( d > 0 ) )
    Helper::halt( INVALID_ARGUMENT , "window duration must be positive" );

  if ( anchor == ANCHOR_START )
    return event_window_t( t , t + d );

  if ( anchor == ANCHOR_END )
    return event_window_t( t - d , t );

  const double h = d / 2.0;
  return event_window_t( t - h , t + h );

}


event_window_t timeline::resolve_window( double t , double d , const std::string & anchor )
{
  if ( ! globals::is_anchor( anchor ) )
    Helper::halt( INVALID_ARGUMENT , "event time can only be: start, center, end (not '" + anchor + "')" );
  return resolve_window( t , d , globals::anchor( anchor ) );
}


long long timeline::anchor_of( long long start , long long end , anchor_t anchor )
{
  if ( anchor == ANCHOR_START ) return start;
  if ( anchor == ANCHOR_END ) return end;

  // floor division, also for negative sums
  const long long s = start + end;
  return s >= 0 ? s / 2 : - ( ( -s + 1 ) / 2 );
}


std::string timeline::window_id( double t )
{
  return Helper::int2str( (long long)std::floor( t ) );
}
