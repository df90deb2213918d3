

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

#ifndef __SCATTER_DEFS_H__
#define __SCATTER_DEFS_H__

#include <map>
#include <set>
#include <string>
#include <stdint.h>
#include <vector>

enum window_function_t
  {
    WINDOW_NONE = 0 ,
    WINDOW_HANN
  };

// position of the anchor (event) time within the analysed window
enum anchor_t
  {
    ANCHOR_START ,
    ANCHOR_CENTER ,
    ANCHOR_END
  };

// instruments (sites) are resolved once from the channel-name prefix
enum instrument_t
  {
    INSTRUMENT_L1 ,
    INSTRUMENT_H1 ,
    INSTRUMENT_V1 ,
    INSTRUMENT_UNKNOWN
  };

// how an instrument reports being locked
enum lock_policy_t
  {
    LOCK_NONE ,      // no lock information: check always passes
    LOCK_SEGMENTS ,  // discrete segments, window must be one full segment
    LOCK_FLAGS       // continuous flag channel, every sample must be locked
  };

// symbolic lowpass cutoffs
enum lowpass_policy_t
  {
    LOWPASS_FIXED ,
    LOWPASS_AVERAGE ,
    LOWPASS_MAX
  };

// layout of a result folder
enum store_variant_t
  {
    VARIANT_RAW ,  // output record + predictors
    VARIANT_IMF    // also needs the instantaneous-amplitude (envelope) file
  };


struct globals
{

  static std::string version;
  static std::string date;

  // return code
  static int retcode;

  static char folder_delimiter;

  static std::string mkdir_command;

  // function to bail to if needed (called before the error is thrown)
  static void (*bail_function) ( const std::string & msg );

  // no console output
  static bool silent;

  // keep a copy of the log in memory
  static bool cache_log;

  // name helpers for enumerated options
  static std::string anchor( anchor_t );

  static anchor_t anchor( const std::string & );

  static bool is_anchor( const std::string & );

  static std::string instrument( instrument_t );

  static std::string lowpass( lowpass_policy_t );

  // global functions: primary initiation of all globals
  void init_defs();

  // quiet mode, e.g. for tests
  void api();

};

#endif
