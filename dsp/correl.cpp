

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

#include "dsp/correl.h"

#include <cmath>
#include <limits>

double dsptools::pearson( const Eigen::VectorXd & x , const Eigen::VectorXd & y )
{

  const double nan = std::numeric_limits<double>::quiet_NaN();

  const int n = x.size();

  if ( n == 0 || y.size() != n ) return nan;

  // centred two-pass form
  const double mx = x.mean();
  const double my = y.mean();

  double sxy = 0 , sxx = 0 , syy = 0;

  for (int i=0; i<n; i++)
    {
      const double dx = x[i] - mx;
      const double dy = y[i] - my;
      sxy += dx * dy;
      sxx += dx * dx;
      syy += dy * dy;
    }

  if ( sxx == 0 || syy == 0 ) return nan;

  double r = sxy / sqrt( sxx * syy );

  // rounding can leave |r| marginally above 1
  if ( r > 1 ) r = 1;
  else if ( r < -1 ) r = -1;

  return r;
}


double dsptools::pearson( const std::vector<double> & x , const std::vector<double> & y )
{
  if ( x.size() == 0 || x.size() != y.size() )
    return std::numeric_limits<double>::quiet_NaN();

  const Eigen::VectorXd a = Eigen::Map<const Eigen::VectorXd>( x.data() , x.size() );
  const Eigen::VectorXd b = Eigen::Map<const Eigen::VectorXd>( y.data() , y.size() );

  return pearson( a , b );
}


std::vector<double> dsptools::pearson( const Eigen::VectorXd & y , const Eigen::MatrixXd & X )
{
  std::vector<double> r( X.cols() );
  for (int j=0; j<X.cols(); j++)
    {
      const Eigen::VectorXd x = X.col(j);
      r[j] = pearson( x , y );
    }
  return r;
}
