

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

#include "dsp/resample.h"

#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


int dsptools::converter( const std::string & m )
{
  if ( m == "best" ) return SRC_SINC_BEST_QUALITY;
  if ( m == "medium" ) return SRC_SINC_MEDIUM_QUALITY;
  if ( m == "fastest" ) return SRC_SINC_FASTEST;  // default
  if ( m == "zoh" || m == "ZOH" ) return SRC_ZERO_ORDER_HOLD;
  if ( m == "linear" ) return SRC_LINEAR;
  return -1;
}

std::vector<double> dsptools::resample( const std::vector<double> & d ,
					double sr1 , double sr2 ,
					int converter )
{

  if ( sr1 <= 0 || sr2 <= 0 )
    Helper::halt( INVALID_ARGUMENT , "resample() requires positive sampling rates" );

  if ( sr1 == sr2 ) return d;

  int n = d.size();

  if ( n == 0 ) return d;

  std::vector<float> f( n );
  for (int i=0;i<n;i++) f[i] = d[i];

  const double ratio = sr2 / sr1;
  const int n2 = n * ratio;

  if ( n2 == 0 )
    Helper::halt( INSUFFICIENT_DATA , "too few samples to resample from "
		  + Helper::dbl2str( sr1 ) + " to " + Helper::dbl2str( sr2 ) + " Hz" );

  std::vector<float> f2( n2 );

  // pad a little at end
  for (int i=0;i<10;i++)
    {
      ++n;
      f.push_back(0);
    }

  SRC_DATA src;
  src.data_in = &(f[0]);
  src.input_frames = n;
  src.data_out = &(f2[0]);
  src.output_frames = n2;
  src.src_ratio = ratio;

  int r = src_simple( &src, converter , 1 );

  if ( r )
    {
      logger << "  " << src_strerror ( r ) << "\n";
      Helper::halt( INTERNAL_ERROR , "problem in resample(): " + std::string( src_strerror( r ) ) );
    }

  std::vector<double> out( n2 );
  for (int i=0;i<n2;i++) out[i] = f2[i];

  return out;
}
