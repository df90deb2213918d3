

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

#ifndef __SCATTER_MISCMATH_H__
#define __SCATTER_MISCMATH_H__

#include <vector>
#include <cstddef>

namespace MiscMath
{

  // second-order central differences, one-sided at the ends; dt = sample interval
  std::vector<double> gradient( const std::vector<double> & x , double dt = 1.0 );

  // index of the maximum, ignoring NaN; -1 if all NaN (or empty)
  int which_max( const std::vector<double> & x );

  std::vector<double> abs( const std::vector<double> & x );

  // windows
  std::vector<double> hann_window( int N );

}

#endif
