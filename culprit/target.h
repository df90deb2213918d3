

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

#ifndef __SCATTER_TARGET_H__
#define __SCATTER_TARGET_H__

#include "defs/defs.h"

#include <Eigen/Dense>
#include <string>
#include <vector>


// lowpass cutoff: a fixed frequency, or derived from the predictors

struct lowpass_t
{

  lowpass_t() : policy( LOWPASS_FIXED ) , f(0) { }

  static lowpass_t fixed( double f ) { return lowpass_t( LOWPASS_FIXED , f ); }

  static lowpass_t derived( lowpass_policy_t p ) { return lowpass_t( p , 0 ); }

  // "average", "max" or a number (Hz)
  static lowpass_t parse( const std::string & s );

  bool is_fixed() const { return policy == LOWPASS_FIXED; }

  lowpass_policy_t policy;

  double f;

private:

  lowpass_t( lowpass_policy_t p , double f ) : policy(p) , f(f) { }

};


namespace culprit {

  // numeric cutoff; average = max of column means, max = max of column maxima
  double resolve_cutoff( const lowpass_t & lowpass , const Eigen::MatrixXd & P );

  // zero-phase Butterworth lowpass, same length as x
  std::vector<double> filter_target( const std::vector<double> & x ,
				     double sr ,
				     double cutoff ,
				     int order = 4 );

}

#endif
