

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

#ifndef __SCATTER_INTERVALS_H__
#define __SCATTER_INTERVALS_H__

#include "defs/defs.h"

#include <sstream>
#include <ostream>
#include <string>


//
// analysis windows are defined from the start (inclusive) to the end
// (exclusive), in seconds (GPS time); start < end always
//

struct event_window_t
{

  friend std::ostream & operator<<( std::ostream & out , const event_window_t & rhs );

  event_window_t( double start , double end );

  double duration() const { return end - start ; }

  double mid() const { return start + ( end - start ) / 2.0 ; }

  bool contains( const double t ) const
  {
    return t >= start && t < end;
  }

  bool operator==( const event_window_t & rhs ) const
  {
    return start == rhs.start && end == rhs.end;
  }

  bool operator<( const event_window_t & rhs ) const
  {
    if ( start == rhs.start ) return end < rhs.end;
    return start < rhs.start;
  }

  std::string as_string( const int prec = 2 ) const
  {
    std::stringstream ss;
    ss.precision( prec );
    ss << std::fixed << start << "->" << end;
    return ss.str();
  }

  const double start;

  const double end;

};


namespace timeline {

  // anchor time t, duration d (seconds), and where t sits in the window
  event_window_t resolve_window( double t , double d , anchor_t anchor );

  event_window_t resolve_window( double t , double d , const std::string & anchor );

  // inverse mapping on integer (persisted) window bounds; centre uses floor division
  long long anchor_of( long long start , long long end , anchor_t anchor );

  // folder name for a window, i.e. the integer anchor time
  std::string window_id( double t );

}

#endif
