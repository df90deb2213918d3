

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

#include "tests/fixtures.h"

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cmath>
#include <unistd.h>

fixtures::temp_folder_t::temp_folder_t()
{
  char tmpl[] = "/tmp/scatter-test-XXXXXX";
  if ( mkdtemp( tmpl ) == NULL )
    Helper::halt( IO_ERROR , "could not create a temporary folder" );
  root = tmpl;
}

fixtures::temp_folder_t::~temp_folder_t()
{
  const std::string cmd = "rm -rf \"" + root + "\"";
  if ( system( cmd.c_str() ) != 0 )
    std::cerr << "could not remove " << root << "\n";
}

std::string fixtures::temp_folder_t::path( const std::string & f ) const
{
  if ( f == "" ) return root;
  return Helper::join_path( root , f );
}

void fixtures::write_file( const std::string & filename , const std::string & content )
{
  std::ofstream O1( filename.c_str() , std::ios::out );
  if ( ! O1.good() ) Helper::halt( IO_ERROR , "could not write " + filename );
  O1 << content;
  O1.close();
}

void fixtures::write_series( const std::string & folder ,
			     const std::string & channel ,
			     double t0 , double sr ,
			     const std::vector<double> & x )
{
  std::stringstream ss;
  ss.precision( 12 );
  ss << "# " << channel << "\n";
  for (int i=0; i<x.size(); i++)
    ss << t0 + i / sr << "\t" << x[i] << "\n";
  write_file( Helper::join_path( folder , Helper::search_replace( channel , ':' , '_' ) + ".txt" ) , ss.str() );
}

std::vector<double> fixtures::sine( int n , double sr , double f , double amp , double phase )
{
  std::vector<double> x( n );
  for (int i=0; i<n; i++)
    x[i] = amp * sin( 2.0 * M_PI * f * i / sr + phase );
  return x;
}

channel_matrix_t fixtures::stub_channels_t::fetch_channels( const std::string & archive ,
							    const std::string & target ,
							    const std::vector<std::string> & candidates ,
							    double start , double end ,
							    double sr ,
							    double * resolved_sr )
{
  ++calls;
  last_start = start;
  last_end = end;
  if ( resolved_sr != NULL ) *resolved_sr = m.sr;
  return m;
}

lock_series_t fixtures::stub_state_t::fetch_state( const std::string & channel ,
						   double start , double end )
{
  last_channel = channel;
  return series;
}

double fixtures::stub_meanfreq_t::mean_frequency( const std::string & channel ,
						  double start , double end ,
						  double lwr , double upr )
{
  request_t r;
  r.channel = channel;
  r.start = start;
  r.end = end;
  r.lwr = lwr;
  r.upr = upr;
  requests.push_back( r );
  return value;
}
