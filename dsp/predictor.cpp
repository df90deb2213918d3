

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

#include "dsp/predictor.h"

#include "stats/eigen_ops.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>


Eigen::VectorXd dsptools::predictor( const Eigen::VectorXd & x ,
				     double sr ,
				     int smooth_win ,
				     int n_scattering ,
				     double lambda )
{

  if ( n_scattering < 1 )
    Helper::halt( INVALID_ARGUMENT , "scattering (bounce) order must be at least 1" );

  if ( smooth_win < 1 )
    Helper::halt( INVALID_ARGUMENT , "smoothing window must be at least 1 sample" );

  if ( sr <= 0 || lambda <= 0 )
    Helper::halt( INVALID_ARGUMENT , "sampling rate and wavelength must be positive" );

  const int n = x.size();

  if ( n < 2 || n < smooth_win )
    Helper::halt( INSUFFICIENT_DATA , "series of " + Helper::int2str( n )
		  + " samples is too short for a smoothing window of " + Helper::int2str( smooth_win ) );

  // velocity (units/s) -> speed
  std::vector<double> v = MiscMath::abs( MiscMath::gradient( eigen_ops::copy_vector( x ) , 1.0 / sr ) );

  Eigen::VectorXd p = eigen_ops::moving_average( eigen_ops::copy_vector( v ) , smooth_win );

  return p * ( 2.0 * n_scattering / lambda );

}


Eigen::MatrixXd dsptools::predictors( const Eigen::MatrixXd & X ,
				      double sr ,
				      int smooth_win ,
				      int n_scattering ,
				      double lambda )
{

  const int c = X.cols();

  Eigen::MatrixXd P = Eigen::MatrixXd::Zero( X.rows() , c );

  for (int j=0; j<c; j++)
    P.col(j) = predictor( X.col(j) , sr , smooth_win , n_scattering , lambda );

  return P;
}
