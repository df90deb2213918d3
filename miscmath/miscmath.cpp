

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

#include "miscmath/miscmath.h"

#include "helper/helper.h"

#include <cmath>
#include <limits>

std::vector<double> MiscMath::gradient( const std::vector<double> & x , double dt )
{

  const int n = x.size();

  if ( n < 2 )
    Helper::halt( INSUFFICIENT_DATA , "need at least two samples for a gradient" );

  if ( dt <= 0 )
    Helper::halt( INVALID_ARGUMENT , "sample interval must be positive" );

  std::vector<double> g( n );

  g[0] = ( x[1] - x[0] ) / dt;
  g[n-1] = ( x[n-1] - x[n-2] ) / dt;

  for (int i=1; i<n-1; i++)
    g[i] = ( x[i+1] - x[i-1] ) / ( 2.0 * dt );

  return g;
}


int MiscMath::which_max( const std::vector<double> & x )
{
  int idx = -1;
  for (int i=0; i<x.size(); i++)
    {
      if ( std::isnan( x[i] ) ) continue;
      // strictly greater: ties keep the first
      if ( idx == -1 || x[i] > x[idx] ) idx = i;
    }
  return idx;
}


std::vector<double> MiscMath::abs( const std::vector<double> & x )
{
  std::vector<double> a( x.size() );
  for (int i=0; i<x.size(); i++) a[i] = fabs( x[i] );
  return a;
}


std::vector<double> MiscMath::hann_window( int N )
{
  std::vector<double> w(N);
  if ( N == 1 ) { w[0] = 1; return w; }
  for (int i = 0; i < N; i++)
    w[i] = 0.5*(1 - cos(2.0*M_PI*i/(double)(N - 1)));
  return w;
}
