

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

#ifndef __SCATTER_STORE_H__
#define __SCATTER_STORE_H__

#include "defs/defs.h"
#include "defs/config.h"
#include "culprit/scorer.h"

#include <string>
#include <vector>


// which entries of each record go in a comparison table

struct selection_t
{

  selection_t() : best( true ) { }

  // "best", or integers (1-based result positions)
  static selection_t parse( const std::vector<std::string> & tokens );

  int size() const { return best ? 1 : indices.size(); }

  std::string as_string() const;

  bool best;

  std::vector<int> indices;

};


struct summary_row_t
{

  // anchor time of the window (or the folder name, if the record is unreadable)
  std::string window;

  // one per selected entry; 'present' false means missing
  std::vector<correlation_t> entries;

  std::vector<bool> present;

};


struct summary_table_t
{

  std::vector<std::string> header() const;

  // formatted cells, 'na' for missing values
  std::vector<std::string> cells( int r , const std::string & na ) const;

  selection_t selection;

  anchor_t anchor;

  std::vector<summary_row_t> rows;

};


struct culprit_count_t
{
  culprit_count_t() : n(0) , mean_correlation(0) , mean_frequency(0) { }
  std::string channel;
  int n;
  double mean_correlation;
  double mean_frequency;
};


//
// Result store: one sub-folder per analysed window, named by its integer
// anchor time and holding the record plus sidecars
//

struct store_t
{

  store_t( const config_t & config , store_variant_t variant = VARIANT_RAW );

  // sub-folders of root; if filtering, only valid folders that also
  // contain a match for every must_include pattern
  std::vector<std::string> folders( const std::string & root ,
				    bool filter_non_valid = true ,
				    const std::vector<std::string> & must_include = std::vector<std::string>() ,
				    bool sort = true ) const;

  // readable record, exactly one predictor sidecar (and one envelope
  // sidecar for the multi-component variant)
  bool valid( const std::string & folder , std::string * reason = NULL ) const;

  // one row per folder, never dropped
  summary_table_t summary_table( const std::vector<std::string> & folders ,
				 const selection_t & selection ,
				 anchor_t anchor ) const;

  // CSV to <root>/<comparison>/<name>; returns the path written
  std::string write_table( const summary_table_t & table ,
			   const std::string & root ,
			   const std::string & name ) const;

  // windows per culprit (first selected entry of each row), most frequent first
  std::vector<culprit_count_t> culprit_counts( const summary_table_t & table ) const;

  // as write_table(), with '.counts' inserted before the extension
  std::string write_counts( const std::vector<culprit_count_t> & counts ,
			    const std::string & root ,
			    const std::string & name ) const;

  static std::string counts_name( const std::string & name );

private:

  config_t config;

  store_variant_t variant;

};

#endif
