

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

#include "fftw/fftwrap.h"

#include "helper/helper.h"
#include "miscmath/miscmath.h"

#include <cmath>
#include <limits>


// --------------------------------------------------------------------------
//
// Real 1D DFT (real to complex)
//
// --------------------------------------------------------------------------

real_FFT::real_FFT()
{
  in = NULL;
  out = NULL;
  p = NULL;
  Ndata = Nfft = cutoff = 0;
  Fs = 0;
  window = WINDOW_NONE;
  normalisation_factor = 0;
}

real_FFT::real_FFT( int Ndata , int Nfft , double Fs , window_function_t window )
{
  in = NULL;
  out = NULL;
  p = NULL;
  init( Ndata , Nfft , Fs , window );
}

void real_FFT::reset()
{
  if ( p != NULL ) fftw_destroy_plan(p);
  if ( in != NULL ) fftw_free(in);
  if ( out != NULL ) fftw_free(out);
  p = NULL;
  in = NULL;
  out = NULL;
}

real_FFT::~real_FFT()
{
  reset();
}


void real_FFT::init( int Ndata_, int Nfft_, double Fs_ , window_function_t window_ )
{

  reset();

  Ndata = Ndata_;
  Nfft = Nfft_;
  Fs = Fs_;
  window = window_;

  if ( Ndata < 1 ) Helper::halt( INSUFFICIENT_DATA , "FFT requires at least one sample" );
  if ( Ndata > Nfft ) Helper::halt( "Ndata cannot be larger than Nfft" );
  if ( Fs <= 0 ) Helper::halt( INVALID_ARGUMENT , "FFT requires a positive sampling rate" );

  // Allocate storage for input/output
  in = (double*) fftw_malloc(sizeof(double) * Nfft);
  if ( in == NULL ) Helper::halt( "FFT failed to allocate input buffer" );

  out = (fftw_complex*) fftw_malloc(sizeof(fftw_complex) * ( Nfft / 2 + 1 ) );
  if ( out == NULL ) Helper::halt( "FFT failed to allocate output buffer" );

  for (int i=0;i<Nfft;i++) { in[i] = 0; }

  // Generate plan: nb. r2c 1D plan
  p = fftw_plan_dft_r2c_1d( Nfft, in, out , FFTW_ESTIMATE ) ;

  // positive spectrum only
  cutoff = Nfft % 2 == 0 ? Nfft/2+1 : (Nfft+1)/2 ;
  X.assign(cutoff,0);
  mag.assign(cutoff,0);
  frq.assign(cutoff,0);

  const double T = Nfft/Fs;

  for (int i=0;i<cutoff;i++) frq[i] = i/T;

  //
  // Normalisation factor for PSD  (1/value)
  // i.e. equiv. to 1/(N.Fs) in unweighted case, otherwise
  // we take the window into account
  //

  w.assign( Ndata , 1 ); // i.e. default of no window

  if ( window == WINDOW_HANN ) w = MiscMath::hann_window(Ndata);

  normalisation_factor = 0;
  for (int i=0;i<Ndata;i++) normalisation_factor += w[i] * w[i];
  normalisation_factor *= Fs;
  normalisation_factor = 1.0/normalisation_factor;

}

bool real_FFT::apply( const std::vector<double> & x )
{
  return apply( x.data() , x.size() );
}


bool real_FFT::apply( const double * x , const int n )
{

  if ( p == NULL ) Helper::halt( "FFT not initialized" );

  if ( n != Ndata ) Helper::halt( "FFT input size does not match Ndata" );

  //
  // Load up (windowed) input buffer
  //

  if ( window == WINDOW_NONE )
    for (int i=0;i<Ndata;i++) in[i] = x[i];
  else
    for (int i=0;i<Ndata;i++) in[i] = x[i] * w[i];

  // zero-padding
  for (int i=Ndata;i<Nfft;i++) in[i] = 0;

  fftw_execute(p);

  //
  // psdx = (1/(Fs*N)) * abs(xdft).^2;
  //

  for (int i=0;i<cutoff;i++)
    {

      double a = out[i][0];
      double b = out[i][1];

      X[i] =  ( a*a + b*b ) * normalisation_factor;
      mag[i] = sqrt( a*a + b*b );

      // one-sided: double all but DC (and Nyquist, for even Nfft)
      if ( i > 0 && ( i < cutoff-1 || Nfft % 2 == 1 ) ) X[i] *= 2;

    }

  return true;

}


double real_FFT::mean_frequency( double lwr , double upr ) const
{
  double s = 0 , sf = 0;
  for (int i=0;i<cutoff;i++)
    if ( frq[i] >= lwr && frq[i] <= upr )
      {
	s += X[i];
	sf += X[i] * frq[i];
      }

  if ( s == 0 ) return std::numeric_limits<double>::quiet_NaN();

  return sf / s;
}
