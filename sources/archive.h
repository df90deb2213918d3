

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

#ifndef __SCATTER_ARCHIVE_H__
#define __SCATTER_ARCHIVE_H__

#include "sources/sources.h"

#include <samplerate.h>

#include <map>
#include <string>
#include <vector>

//
// Plain-text channel archive: one file per channel in a folder, named
// after the channel with ':' replaced by '_' plus a .txt extension, each
// line holding 'time value' (uniformly sampled, ascending time)
//

struct archive_series_t
{
  archive_series_t() : sr(0) { }
  std::vector<double> t;
  std::vector<double> x;
  double sr;
};


struct archive_t : public channel_source_t , public state_source_t
{

  // folder used for the lock channels (and for fetches without an archive)
  archive_t( const std::string & folder = "" , int converter = SRC_SINC_FASTEST );

  static std::string channel_file( const std::string & folder , const std::string & channel );

  // full series of one channel (cached)
  const archive_series_t & read( const std::string & folder , const std::string & channel );

  virtual channel_matrix_t fetch_channels( const std::string & archive ,
					   const std::string & target ,
					   const std::vector<std::string> & candidates ,
					   double start , double end ,
					   double sr ,
					   double * resolved_sr );

  // samples in [start, end], split at gaps above 1.5 sample intervals
  virtual lock_series_t fetch_state( const std::string & channel ,
				     double start , double end );

private:

  std::string folder;

  int converter;

  std::map<std::string,archive_series_t> cache;

};

#endif
