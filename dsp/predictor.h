

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

#ifndef __SCATTER_DSP_PREDICTOR_H__
#define __SCATTER_DSP_PREDICTOR_H__

#include <Eigen/Dense>

namespace dsptools {

  //
  // Scattered-light predictors: for a surface moving with speed |v|, light
  // scattered n times produces fringes at 2 n |v| / lambda; each column of
  // X (a displacement, in the units of lambda) maps to its smoothed fringe
  // frequency
  //

  Eigen::MatrixXd predictors( const Eigen::MatrixXd & X ,
			      double sr ,
			      int smooth_win ,
			      int n_scattering ,
			      double lambda );

  Eigen::VectorXd predictor( const Eigen::VectorXd & x ,
			     double sr ,
			     int smooth_win ,
			     int n_scattering ,
			     double lambda );

}

#endif
