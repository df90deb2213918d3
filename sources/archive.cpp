

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

#include "sources/archive.h"

#include "dsp/resample.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <cmath>

extern logger_t logger;


archive_t::archive_t( const std::string & folder , int converter )
  : folder( folder ) , converter( converter )
{
}


std::string archive_t::channel_file( const std::string & folder , const std::string & channel )
{
  return Helper::join_path( folder , Helper::search_replace( channel , ':' , '_' ) + ".txt" );
}


const archive_series_t & archive_t::read( const std::string & dir , const std::string & channel )
{

  const std::string filename = channel_file( dir , channel );

  std::map<std::string,archive_series_t>::const_iterator cc = cache.find( filename );
  if ( cc != cache.end() ) return cc->second;

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( IO_ERROR , "could not find data for " + channel + " (" + filename + ")" );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  archive_series_t s;

  int line = 0;

  while ( ! IN1.eof() )
    {
      std::string l;
      Helper::safe_getline( IN1 , l );
      ++line;

      if ( IN1.eof() && l == "" ) break;

      l = Helper::lrtrim( l );
      if ( l == "" || l[0] == '#' || l[0] == '%' ) continue;

      std::vector<std::string> tok = Helper::parse( l , " \t," );

      double t = 0 , x = 0;
      if ( tok.size() != 2 || ! Helper::str2dbl( tok[0] , &t ) || ! Helper::str2dbl( tok[1] , &x ) )
	Helper::halt( IO_ERROR , "bad format, expecting 'time value' at line "
		      + Helper::int2str( line ) + " of " + filename );

      if ( s.t.size() != 0 && t <= s.t.back() )
	Helper::halt( IO_ERROR , "time must be ascending, line " + Helper::int2str( line ) + " of " + filename );

      s.t.push_back( t );
      s.x.push_back( x );
    }

  IN1.close();

  if ( s.t.size() < 2 )
    Helper::halt( INSUFFICIENT_DATA , "need at least two samples for " + channel );

  // native rate from the mean sample interval, rounded to 1e-6 Hz
  const double dt = ( s.t.back() - s.t.front() ) / (double)( s.t.size() - 1 );
  s.sr = round( 1e6 / dt ) / 1e6;

  logger << "  read " << s.t.size() << " samples for " << channel << " (" << s.sr << " Hz)\n";

  cache[ filename ] = s;
  return cache[ filename ];
}


channel_matrix_t archive_t::fetch_channels( const std::string & archive ,
					    const std::string & target ,
					    const std::vector<std::string> & candidates ,
					    double start , double end ,
					    double sr ,
					    double * resolved_sr )
{

  if ( sr <= 0 )
    Helper::halt( INVALID_ARGUMENT , "requested sampling rate must be positive" );

  const std::string dir = archive == "" ? folder : archive;

  std::vector<std::string> channels( 1 , target );
  channels.insert( channels.end() , candidates.begin() , candidates.end() );

  const int nc = channels.size();

  // slice [start, end) from each channel
  std::vector<std::vector<double> > d( nc );
  std::vector<double> native( nc );

  double rsr = sr;

  for (int c=0; c<nc; c++)
    {
      const archive_series_t & s = read( dir , channels[c] );

      for (int i=0; i<s.t.size(); i++)
	if ( s.t[i] >= start && s.t[i] < end )
	  d[c].push_back( s.x[i] );

      if ( d[c].size() == 0 )
	Helper::halt( INSUFFICIENT_DATA , "no data for " + channels[c]
		      + " in " + Helper::dbl2str( start ) + " - " + Helper::dbl2str( end ) );

      native[c] = s.sr;
      if ( s.sr < rsr ) rsr = s.sr;
    }

  if ( rsr != sr )
    logger << "  resampling to " << rsr << " Hz (lowest native rate)\n";

  // resample to a common rate, truncate to a common length
  int n = -1;

  for (int c=0; c<nc; c++)
    {
      d[c] = dsptools::resample( d[c] , native[c] , rsr , converter );
      if ( n == -1 || d[c].size() < n ) n = d[c].size();
    }

  if ( n < 1 )
    Helper::halt( INSUFFICIENT_DATA , "no samples left after resampling" );

  channel_matrix_t m;
  m.labels = channels;
  m.sr = rsr;
  m.X = Eigen::MatrixXd::Zero( n , nc );

  for (int c=0; c<nc; c++)
    for (int i=0; i<n; i++)
      m.X(i,c) = d[c][i];

  if ( resolved_sr != NULL ) *resolved_sr = rsr;

  return m;
}


lock_series_t archive_t::fetch_state( const std::string & channel ,
				      double start , double end )
{

  const archive_series_t & s = read( folder , channel );

  const double gap = 1.5 / s.sr;

  lock_series_t series;

  for (int i=0; i<s.t.size(); i++)
    {
      if ( s.t[i] < start || s.t[i] > end ) continue;

      if ( series.size() == 0 || s.t[i] - series.back().back().t > gap )
	series.push_back( lock_segment_t() );

      series.back().push_back( lock_sample_t( s.t[i] , s.x[i] ) );
    }

  logger << "  " << series.size() << " lock segment(s) for " << channel << "\n";

  return series;
}
