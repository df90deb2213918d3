

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

#ifndef __SCATTER_FFTWRAP_H__
#define __SCATTER_FFTWRAP_H__

#include <fftw3.h>

#include <vector>

#include "defs/defs.h"


//
// Real 1D DFT
//

class real_FFT
{

 public:

  real_FFT();

  real_FFT( int Ndata , int Nfft , double Fs , window_function_t window = WINDOW_NONE );

  void init( int Ndata , int Nfft , double Fs , window_function_t window = WINDOW_NONE );

  void reset() ;

  ~real_FFT();

 private:

  // not copyable (owns the FFTW buffers and plan)
  real_FFT( const real_FFT & );
  real_FFT & operator=( const real_FFT & );

  // Size of data
  int Ndata;

  // Sampling rate, so we can construct the appropriate Hz for the PSD
  double Fs;

  // Optional windowing function
  window_function_t window;
  std::vector<double> w;

  // Input signal (real)
  double * in;

  // Output signal
  fftw_complex *out;

  // FFT plan from FFTW3
  fftw_plan p;

  // Size (NFFT)
  int Nfft;

  // Normalisation factor given the window
  double normalisation_factor;

 public:

  int cutoff;
  std::vector<double> X;
  std::vector<double> mag;
  std::vector<double> frq;

 public:

  bool apply( const std::vector<double> & x );
  bool apply( const double * x , const int n );

  // power-weighted mean frequency within [lwr, upr]; NaN if no power there
  double mean_frequency( double lwr , double upr ) const;

};

#endif
