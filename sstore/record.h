

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

#ifndef __SCATTER_RECORD_H__
#define __SCATTER_RECORD_H__

#include "culprit/scorer.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <utility>


// the parameters section of a record

struct analysis_params_t
{

  analysis_params_t()
    : start(0) , end(0) ,
      sampling_frequency(0) , lowpass_frequency(0) ,
      scattering(1) , smoothing_window(1) { }

  // window bounds, persisted as integers
  long long start;
  long long end;

  std::string target_channel;

  // channel-list source (file name)
  std::string channels_list;

  std::string output_path;

  double sampling_frequency;

  // always the resolved numeric cutoff
  double lowpass_frequency;

  int scattering;

  int smoothing_window;

};


//
// Analysis record: a 'parameters' object (written once) and a 'result'
// array (replaced as a whole); every accessor fails with VALUE_NOT_FOUND
// rather than returning a default
//

struct record_t
{

  record_t();

  void write_parameters( const analysis_params_t & p );

  void write_result( const std::vector<correlation_t> & res );

  bool has_parameters() const;

  bool has_result() const;

  // accessors

  std::pair<long long,long long> window() const;

  std::string target_channel() const;

  std::string channels_list() const;

  std::string output_path() const;

  double sampling_frequency() const;

  double lowpass_frequency() const;

  int scattering() const;

  int smoothing_window() const;

  analysis_params_t parameters() const;

  int n_results() const;

  // i-th entry, 1-based
  correlation_t result( int i ) const;

  // largest correlation (earliest on ties)
  correlation_t best() const;

  std::vector<correlation_t> results() const;

  // persistence

  std::string dump() const;

  void save( const std::string & folder , const std::string & filename ) const;

  static record_t load( const std::string & folder , const std::string & filename );

  // predictor sidecar: <target, ':' -> '_'>.<ext>, int32 count then doubles

  static std::string predictors_file( const std::string & folder ,
				      const std::string & target ,
				      const std::string & ext );

  static void save_predictors( const std::string & folder ,
			       const std::string & target ,
			       const std::string & ext ,
			       const std::vector<double> & values );

  static std::vector<double> load_predictors( const std::string & filename );

private:

  const nlohmann::json & section( const std::string & name ) const;

  const nlohmann::json & field( const std::string & sect , const std::string & key ) const;

  std::string str_field( const std::string & key ) const;

  double dbl_field( const std::string & key ) const;

  int int_field( const std::string & key ) const;

  static correlation_t entry( const nlohmann::json & e );

  nlohmann::json content;

};

#endif
