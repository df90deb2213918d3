

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

#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <iostream>

extern logger_t logger;

std::string globals::version;
std::string globals::date;

int globals::retcode = 0;

char globals::folder_delimiter = '/';
std::string globals::mkdir_command = "mkdir -p";

void (*globals::bail_function) ( const std::string & ) = NULL;

bool globals::silent = false;
bool globals::cache_log = false;


void globals::api()
{
  silent = true;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.4.1";

  date    = "12-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  //
  // Output
  //

  silent = false;

  cache_log = false;

  //
  // Misc.
  //

#ifdef WINDOWS
  folder_delimiter = '\\';
  mkdir_command = "mkdir";
#else
  folder_delimiter = '/';
  mkdir_command = "mkdir -p";
#endif

}


std::string globals::anchor( anchor_t a )
{
  if ( a == ANCHOR_START ) return "start";
  if ( a == ANCHOR_CENTER ) return "center";
  if ( a == ANCHOR_END ) return "end";
  return "?";
}

bool globals::is_anchor( const std::string & s )
{
  return s == "start" || s == "center" || s == "end";
}

anchor_t globals::anchor( const std::string & s )
{
  if ( s == "start" ) return ANCHOR_START;
  if ( s == "center" ) return ANCHOR_CENTER;
  if ( s == "end" ) return ANCHOR_END;
  Helper::halt( INVALID_ARGUMENT , "event time can only be: start, center, end (not '" + s + "')" );
  return ANCHOR_CENTER;
}

std::string globals::instrument( instrument_t i )
{
  if ( i == INSTRUMENT_L1 ) return "L1";
  if ( i == INSTRUMENT_H1 ) return "H1";
  if ( i == INSTRUMENT_V1 ) return "V1";
  return "?";
}

std::string globals::lowpass( lowpass_policy_t p )
{
  if ( p == LOWPASS_AVERAGE ) return "average";
  if ( p == LOWPASS_MAX ) return "max";
  return "fixed";
}
