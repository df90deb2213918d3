

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

#ifndef __SCATTER_LOCK_H__
#define __SCATTER_LOCK_H__

#include "defs/defs.h"
#include "defs/config.h"
#include "intervals/intervals.h"
#include "sources/sources.h"

#include <string>


// outcome of the lock precondition: a skip is not an error
struct lock_check_t
{

  enum status_t { PROCEED , SKIPPED };

  static lock_check_t proceed() { return lock_check_t( PROCEED , "" ); }

  static lock_check_t skipped( const std::string & reason ) { return lock_check_t( SKIPPED , reason ); }

  bool ok() const { return status == PROCEED; }

  status_t status;

  std::string reason;

private:

  lock_check_t( status_t s , const std::string & r ) : status(s) , reason(r) { }

};


namespace lock {

  // site prefix before the first ':' (e.g. L1:GDS-CALIB_STRAIN -> L1)
  instrument_t resolve_instrument( const std::string & channel );

  lock_policy_t policy( instrument_t instrument );

  // Policy A: exactly one segment spanning the window exactly
  lock_check_t check_segments( const lock_series_t & series , const event_window_t & window );

  // Policy B: every sample locked
  lock_check_t check_flags( const lock_series_t & series , const double locked );

  // resolve the lock channel, fetch the state and apply the instrument's policy
  lock_check_t validate( const config_t & config ,
			 state_source_t & source ,
			 instrument_t instrument ,
			 const event_window_t & window );

}

#endif
