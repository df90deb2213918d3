

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

#include "dsp/iir.h"

#include "helper/helper.h"

#include <algorithm>
#include <cmath>

//
// Butterworth designs as cascaded biquads (bilinear transform, with
// prewarped cutoff); odd orders add a single first-order section
//

iir_t::iir_t()
{
  order = 0;
}


void iir_t::init( iir_type_t type , int ord , double sr , double f1 , double f2 )
{

  if ( ord < 1 )
    Helper::halt( INVALID_ARGUMENT , "filter order must be positive" );

  if ( sr <= 0 )
    Helper::halt( INVALID_ARGUMENT , "sampling rate must be positive" );

  const double nyquist = sr / 2.0;

  if ( f1 <= 0 || f1 >= nyquist )
    Helper::halt( INVALID_ARGUMENT , "cutoff frequency must be in (0, Nyquist): "
		  + Helper::dbl2str( f1 ) + " (sr = " + Helper::dbl2str( sr ) + ")" );

  sos.clear();
  order = ord;

  if ( type == BUTTERWORTH_LOWPASS )
    add_lowpass( ord , sr , f1 );
  else if ( type == BUTTERWORTH_HIGHPASS )
    add_highpass( ord , sr , f1 );
  else if ( type == BUTTERWORTH_BANDPASS )
    {
      if ( f2 <= f1 || f2 >= nyquist )
	Helper::halt( INVALID_ARGUMENT , "invalid bandpass: "
		      + Helper::dbl2str( f1 ) + " - " + Helper::dbl2str( f2 ) + " Hz" );
      add_highpass( ord , sr , f1 );
      add_lowpass( ord , sr , f2 );
    }
  else
    Helper::halt( "unknown IIR filter type" );

}


void iir_t::add_lowpass( int ord , double sr , double f )
{

  const double K = tan( M_PI * f / sr );
  const double K2 = K * K;

  const int pairs = ord / 2;

  for (int k=0; k<pairs; k++)
    {
      const double Q = 1.0 / ( 2.0 * sin( ( 2 * k + 1 ) * M_PI / ( 2.0 * ord ) ) );
      const double norm = 1.0 / ( 1.0 + K / Q + K2 );
      const double b0 = K2 * norm;
      sos.push_back( biquad_t( b0 , 2.0 * b0 , b0 ,
			       2.0 * ( K2 - 1.0 ) * norm ,
			       ( 1.0 - K / Q + K2 ) * norm ) );
    }

  if ( ord % 2 )
    {
      const double norm = 1.0 / ( 1.0 + K );
      sos.push_back( biquad_t( K * norm , K * norm , 0 , ( K - 1.0 ) * norm , 0 ) );
    }

}


void iir_t::add_highpass( int ord , double sr , double f )
{

  const double K = tan( M_PI * f / sr );
  const double K2 = K * K;

  const int pairs = ord / 2;

  for (int k=0; k<pairs; k++)
    {
      const double Q = 1.0 / ( 2.0 * sin( ( 2 * k + 1 ) * M_PI / ( 2.0 * ord ) ) );
      const double norm = 1.0 / ( 1.0 + K / Q + K2 );
      sos.push_back( biquad_t( norm , -2.0 * norm , norm ,
			       2.0 * ( K2 - 1.0 ) * norm ,
			       ( 1.0 - K / Q + K2 ) * norm ) );
    }

  if ( ord % 2 )
    {
      const double norm = 1.0 / ( 1.0 + K );
      sos.push_back( biquad_t( norm , -norm , 0 , ( K - 1.0 ) * norm , 0 ) );
    }

}


void iir_t::reset()
{
  for (int s=0; s<sos.size(); s++) sos[s].reset();
}


void iir_t::prime( double u )
{
  // steady state of the cascade for a constant input
  for (int s=0; s<sos.size(); s++)
    {
      sos[s].prime( u );
      u *= sos[s].gain();
    }
}


std::vector<double> iir_t::apply( const std::vector<double> & x )
{

  if ( sos.size() == 0 )
    Helper::halt( "IIR filter not initialized" );

  const int n = x.size();
  std::vector<double> y( n , 0 );

  for (int i=0; i<n; i++)
    {
      double v = x[i];
      for (int s=0; s<sos.size(); s++)
	v = sos[s].apply( v );
      y[i] = v;
    }

  return y;
}


Eigen::VectorXd iir_t::apply( const Eigen::VectorXd & x )
{
  std::vector<double> y = apply( std::vector<double>( x.data() , x.data() + x.size() ) );
  return Eigen::Map<Eigen::VectorXd>( y.data() , y.size() );
}


std::vector<double> iir_t::filtfilt( const std::vector<double> & x )
{

  const int n = x.size();

  if ( n == 0 ) return x;

  if ( sos.size() == 0 )
    Helper::halt( "IIR filter not initialized" );

  int padlen = 3 * ( 2 * sos.size() + 1 );
  if ( padlen > n - 1 ) padlen = n - 1;

  // odd reflection about each end point
  std::vector<double> ext( n + 2 * padlen );

  for (int i=0; i<padlen; i++)
    ext[i] = 2.0 * x[0] - x[ padlen - i ];

  for (int i=0; i<n; i++)
    ext[ padlen + i ] = x[i];

  for (int i=0; i<padlen; i++)
    ext[ padlen + n + i ] = 2.0 * x[n-1] - x[ n - 2 - i ];

  // forward
  prime( ext[0] );
  std::vector<double> f = apply( ext );

  // backward
  std::reverse( f.begin() , f.end() );
  prime( f[0] );
  std::vector<double> b = apply( f );
  std::reverse( b.begin() , b.end() );

  reset();

  return std::vector<double>( b.begin() + padlen , b.begin() + padlen + n );
}


std::vector<double> dsptools::butterworth_lowpass( const std::vector<double> & x , int order , double sr , double f )
{
  iir_t iir;
  iir.init( BUTTERWORTH_LOWPASS , order , sr , f );
  return iir.filtfilt( x );
}


std::vector<double> dsptools::butterworth_highpass( const std::vector<double> & x , int order , double sr , double f )
{
  iir_t iir;
  iir.init( BUTTERWORTH_HIGHPASS , order , sr , f );
  return iir.filtfilt( x );
}


std::vector<double> dsptools::butterworth_bandpass( const std::vector<double> & x , int order , double sr , double f1 , double f2 )
{
  iir_t iir;
  iir.init( BUTTERWORTH_BANDPASS , order , sr , f1 , f2 );
  return iir.filtfilt( x );
}
