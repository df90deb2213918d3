

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

#ifndef __SCATTER_SCORER_H__
#define __SCATTER_SCORER_H__

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <limits>


// one reported culprit: rank position (1 = best), channel, Pearson r and
// the channel's mean frequency (Hz)

struct correlation_t
{

  correlation_t()
    : index(0) ,
      correlation( std::numeric_limits<double>::quiet_NaN() ) ,
      mean_frequency( std::numeric_limits<double>::quiet_NaN() ) { }

  correlation_t( int index , const std::string & channel , double r ,
		 double mf = std::numeric_limits<double>::quiet_NaN() )
    : index(index) , channel(channel) , correlation(r) , mean_frequency(mf) { }

  int index;

  std::string channel;

  double correlation;

  double mean_frequency;

};


//
// Correlates the filtered target with every predictor; selection keeps the
// first of equal scores (channel-list order) and NaN never beats a number
//

struct scorer_t
{

  void score( const std::vector<double> & target ,
	      const Eigen::MatrixXd & P ,
	      const std::vector<std::string> & labels );

  int size() const { return r.size(); }

  const std::vector<double> & scores() const { return r; }

  // column of the winner; the first candidate if every score is NaN
  int winner() const;

  correlation_t best() const;

  // the k best, in descending order (k is truncated to the number of candidates)
  std::vector<correlation_t> rank( int k ) const;

private:

  std::vector<std::string> labels;

  std::vector<double> r;

};

#endif
