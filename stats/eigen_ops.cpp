

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

#include "stats/eigen_ops.h"

#include "helper/helper.h"

// nb. using Eigen:::Ref<>
// for a writable reference:    Eigen::Ref<Eigen::VectorXd>
// for a const ref:             const Eigen::Ref<const Eigen::VectorXd> &

std::vector<double> eigen_ops::copy_vector( const Eigen::VectorXd & e )
{
  std::vector<double> v( e.data() , e.data() + e.size() );
  return v;
}

Eigen::VectorXd eigen_ops::copy_vector( const std::vector<double> & e )
{
  Eigen::VectorXd v = Eigen::VectorXd::Zero( e.size() );
  for ( int i=0; i<e.size(); i++) v[i] = e[i];
  return v;
}


Eigen::VectorXd eigen_ops::moving_average( const Eigen::VectorXd & x , int s )
{

  if ( s < 1 )
    Helper::halt( INVALID_ARGUMENT , "moving average window must be at least 1 sample" );

  if ( s == 1 ) return x;

  const int n = x.size();

  if ( n == 0 ) return x;

  // window [ i - lwr , i + upr ], lwr + upr + 1 == s
  const int lwr = ( s - 1 ) / 2;
  const int upr = s - 1 - lwr;

  // running sums: c[i] = x[0] + ... + x[i-1]
  Eigen::VectorXd c = Eigen::VectorXd::Zero( n + 1 );
  for (int i=0; i<n; i++) c[i+1] = c[i] + x[i];

  Eigen::VectorXd a = Eigen::VectorXd::Zero( n );

  for (int i=0; i<n; i++)
    {
      const int p = i - lwr < 0 ? 0 : i - lwr;
      const int q = i + upr >= n ? n - 1 : i + upr;
      a[i] = ( c[q+1] - c[p] ) / (double)( q - p + 1 );
    }

  return a;
}


Eigen::VectorXd eigen_ops::column_means( const Eigen::MatrixXd & X )
{
  if ( X.rows() == 0 )
    Helper::halt( INSUFFICIENT_DATA , "no rows" );
  return X.colwise().mean().transpose();
}


Eigen::VectorXd eigen_ops::column_maxes( const Eigen::MatrixXd & X )
{
  if ( X.rows() == 0 )
    Helper::halt( INSUFFICIENT_DATA , "no rows" );
  return X.colwise().maxCoeff().transpose();
}
