

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

#ifndef __SCATTER_MEANFREQ_H__
#define __SCATTER_MEANFREQ_H__

#include "sources/sources.h"

#include <string>

//
// mean frequency of a channel: Butterworth bandpass, then the power-weighted
// mean frequency of its periodogram within the band
//

struct spectral_mean_frequency_t : public mean_frequency_t
{

  spectral_mean_frequency_t( channel_source_t & source ,
			     const std::string & archive ,
			     double sr ,
			     int order = 4 );

  virtual double mean_frequency( const std::string & channel ,
				 double start , double end ,
				 double lwr , double upr );

  // the same statistic on a series already in memory
  static double mean_frequency( const std::vector<double> & x ,
				double sr ,
				double lwr , double upr ,
				int order );

private:

  channel_source_t & source;

  std::string archive;

  double sr;

  int order;

};

#endif
