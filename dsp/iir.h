

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

#ifndef __SCATTER_DSP_IIR_H__
#define __SCATTER_DSP_IIR_H__

#include <vector>
#include <Eigen/Dense>

enum iir_type_t {
  BUTTERWORTH_LOWPASS ,
  BUTTERWORTH_HIGHPASS ,
  BUTTERWORTH_BANDPASS
};


// second-order section, transposed direct form II

struct biquad_t {

  biquad_t( double b0 , double b1 , double b2 , double a1 , double a2 )
    : b0(b0) , b1(b1) , b2(b2) , a1(a1) , a2(a2) , z1(0) , z2(0) { }

  double apply( const double x )
  {
    const double y = b0 * x + z1;
    z1 = b1 * x - a1 * y + z2;
    z2 = b2 * x - a2 * y;
    return y;
  }

  // DC gain
  double gain() const { return ( b0 + b1 + b2 ) / ( 1.0 + a1 + a2 ); }

  // set state to the steady state for a constant input u
  void prime( const double u )
  {
    const double y = u * gain();
    z1 = y - b0 * u;
    z2 = b2 * u - a2 * y;
  }

  void reset() { z1 = z2 = 0; }

  double b0, b1, b2, a1, a2;

  double z1, z2;

};


struct iir_t {

  iir_t();

  // order, sampling rate, f1 (and f2 for bandpass), all in Hz
  void init( iir_type_t type , int order , double sr , double f1 , double f2 = 0 );

  // single causal pass
  std::vector<double> apply( const std::vector<double> & x );

  Eigen::VectorXd apply( const Eigen::VectorXd & x );

  // forward-backward (zero phase), with odd-reflection padding
  std::vector<double> filtfilt( const std::vector<double> & x );

  int sections() const { return sos.size(); }

  void reset();

private:

  void add_lowpass( int order , double sr , double f );

  void add_highpass( int order , double sr , double f );

  void prime( double u );

  std::vector<biquad_t> sos;

  int order;

};


namespace dsptools {

  // zero-phase Butterworth filters
  std::vector<double> butterworth_lowpass( const std::vector<double> & x , int order , double sr , double f );

  std::vector<double> butterworth_highpass( const std::vector<double> & x , int order , double sr , double f );

  std::vector<double> butterworth_bandpass( const std::vector<double> & x , int order , double sr , double f1 , double f2 );

}

#endif
