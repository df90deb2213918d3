

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

#ifndef __SCATTER_RESAMPLE_H__
#define __SCATTER_RESAMPLE_H__

#include <vector>
#include <string>

#include <samplerate.h>


// interface to SRC libsamplerate (which must be installed on system)
// http://www.mega-nerd.com/SRC/

namespace dsptools
{

  // sr1 -> sr2; a copy when the rates match
  std::vector<double> resample( const std::vector<double> & d , double sr1 , double sr2 , int converter = SRC_SINC_FASTEST );

  // -1 for an unknown converter name
  int converter( const std::string & m );

}


#endif
