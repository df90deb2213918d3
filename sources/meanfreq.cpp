

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

#include "sources/meanfreq.h"

#include "dsp/iir.h"
#include "fftw/fftwrap.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


spectral_mean_frequency_t::spectral_mean_frequency_t( channel_source_t & source ,
						      const std::string & archive ,
						      double sr ,
						      int order )
  : source( source ) , archive( archive ) , sr( sr ) , order( order )
{
}


double spectral_mean_frequency_t::mean_frequency( const std::string & channel ,
						  double start , double end ,
						  double lwr , double upr )
{

  double rsr = sr;

  channel_matrix_t m = source.fetch_channels( archive , channel , std::vector<std::string>() ,
					      start , end , sr , &rsr );

  return mean_frequency( m.target() , rsr , lwr , upr , order );

}


double spectral_mean_frequency_t::mean_frequency( const std::vector<double> & x ,
						  double sr ,
						  double lwr , double upr ,
						  int order )
{

  if ( ! ( lwr > 0 ) || ! ( upr > lwr ) )
    Helper::halt( INVALID_ARGUMENT , "invalid band for mean frequency: "
		  + Helper::dbl2str( lwr ) + " - " + Helper::dbl2str( upr ) );

  const int n = x.size();

  if ( n < 2 )
    Helper::halt( INSUFFICIENT_DATA , "too few samples for a mean frequency" );

  const double nyquist = sr / 2.0;

  if ( lwr >= nyquist )
    Helper::halt( INVALID_ARGUMENT , "band " + Helper::dbl2str( lwr ) + " - " + Helper::dbl2str( upr )
		  + " Hz is above Nyquist (" + Helper::dbl2str( nyquist ) + " Hz)" );

  // the upper edge cannot pass Nyquist: highpass only, band clipped
  std::vector<double> f;

  if ( upr >= nyquist )
    {
      logger << "  upper band edge " << upr << " Hz clipped to Nyquist (" << nyquist << " Hz)\n";
      f = dsptools::butterworth_highpass( x , order , sr , lwr );
      upr = nyquist;
    }
  else
    f = dsptools::butterworth_bandpass( x , order , sr , lwr , upr );

  real_FFT fft( n , n , sr , WINDOW_HANN );
  fft.apply( f );

  return fft.mean_frequency( lwr , upr );

}
