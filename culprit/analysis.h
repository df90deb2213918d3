

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

#ifndef __SCATTER_ANALYSIS_H__
#define __SCATTER_ANALYSIS_H__

#include "defs/defs.h"
#include "defs/config.h"
#include "culprit/target.h"
#include "culprit/scorer.h"
#include "sources/sources.h"
#include "sstore/record.h"

#include <string>
#include <vector>

struct param_t;


// one window to analyse

struct analysis_request_t
{

  analysis_request_t();

  // from key=value options (gps= dur= target= channels= out= lowpass= ...)
  static analysis_request_t from_param( const param_t & param , const config_t & config );

  // anchor time, duration (s) and where the anchor sits in the window
  double gps;
  double duration;
  anchor_t anchor;

  std::string target_channel;

  // candidate channels, and the list file they came from
  std::vector<std::string> channels;
  std::string channels_list;

  // root of the result store
  std::string output_path;

  std::string archive;

  lowpass_t lowpass;

  // requested rate (the provider may lower it)
  double sr;

  int scattering;

  int smoothing_window;

  // number of culprits recorded
  int rank;

  bool check_lock;

  // write the predictor sidecar
  bool save_data;

};


struct outcome_t
{

  enum status_t { COMPLETED , SKIPPED };

  static outcome_t completed( const record_t & record , const std::string & folder );

  static outcome_t skipped( const std::string & reason );

  bool is_completed() const { return status == COMPLETED; }

  status_t status;

  // why the window was skipped
  std::string reason;

  // where the record was written
  std::string folder;

  record_t record;

};


//
// The engine: window -> lock gate -> channels -> predictors -> target
// filter -> scores -> record; nothing is written unless every stage
// succeeds
//

struct analysis_t
{

  // the state source is only needed for lock checks
  analysis_t( const config_t & config ,
	      channel_source_t & channels ,
	      mean_frequency_t & meanfreq ,
	      state_source_t * state = NULL );

  outcome_t run( const analysis_request_t & request );

  // folder of a window in the store
  static std::string folder( const std::string & root , double gps );

private:

  const config_t config;

  channel_source_t & channels;

  mean_frequency_t & meanfreq;

  state_source_t * state;

};

#endif
