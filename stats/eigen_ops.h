

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

#ifndef __SCATTER_EIGEN_OPS_H__
#define __SCATTER_EIGEN_OPS_H__

#include <Eigen/Dense>
#include <vector>

namespace eigen_ops {

  std::vector<double> copy_vector( const Eigen::VectorXd & e );

  Eigen::VectorXd copy_vector( const std::vector<double> & e );

  // centred moving average over s samples; the window is truncated at the
  // edges (the mean is taken over the samples that exist)
  Eigen::VectorXd moving_average( const Eigen::VectorXd & x , int s );

  // per-column summaries
  Eigen::VectorXd column_means( const Eigen::MatrixXd & X );

  Eigen::VectorXd column_maxes( const Eigen::MatrixXd & X );

}

#endif
