

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

#ifndef __SCATTER_DSP_CORREL_H__
#define __SCATTER_DSP_CORREL_H__

#include <Eigen/Dense>
#include <vector>

namespace dsptools {

  // Pearson r; NaN when either series is constant, or on empty or
  // mismatched inputs
  double pearson( const std::vector<double> & x , const std::vector<double> & y );

  double pearson( const Eigen::VectorXd & x , const Eigen::VectorXd & y );

  // r of y against every column of X
  std::vector<double> pearson( const Eigen::VectorXd & y , const Eigen::MatrixXd & X );

}

#endif
