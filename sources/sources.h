

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

#ifndef __SCATTER_SOURCES_H__
#define __SCATTER_SOURCES_H__

#include <Eigen/Dense>

#include <string>
#include <vector>

//
// Data handed over by the external collaborators: channel data, lock
// (instrument) state, and the mean-frequency statistic
//


// equal-length channels sampled at one rate; column 0 is the target
struct channel_matrix_t
{

  channel_matrix_t() : sr(0) { }

  int channels() const { return X.cols(); }

  int samples() const { return X.rows(); }

  // target (column 0)
  std::vector<double> target() const
  {
    return std::vector<double>( X.col(0).data() , X.col(0).data() + X.rows() );
  }

  // candidate channels only (columns 1..)
  Eigen::MatrixXd candidates() const { return X.rightCols( X.cols() - 1 ); }

  std::vector<std::string> candidate_labels() const
  {
    return std::vector<std::string>( labels.begin() + 1 , labels.end() );
  }

  std::vector<std::string> labels;

  Eigen::MatrixXd X;

  double sr;

};


// one lock-state sample: (timestamp, flag value)
struct lock_sample_t
{
  lock_sample_t( double t , double flag ) : t(t) , flag(flag) { }
  double t;
  double flag;
};

typedef std::vector<lock_sample_t> lock_segment_t;

typedef std::vector<lock_segment_t> lock_series_t;


struct state_source_t
{
  virtual ~state_source_t() { }

  // lock/state samples over [start, end], split into contiguous segments
  virtual lock_series_t fetch_state( const std::string & channel ,
				     double start , double end ) = 0;
};


struct channel_source_t
{
  virtual ~channel_source_t() { }

  // target + candidates over [start, end), resampled to (at most) 'sr';
  // the rate actually used is returned in *resolved_sr
  virtual channel_matrix_t fetch_channels( const std::string & archive ,
					   const std::string & target ,
					   const std::vector<std::string> & candidates ,
					   double start , double end ,
					   double sr ,
					   double * resolved_sr ) = 0;
};


struct mean_frequency_t
{
  virtual ~mean_frequency_t() { }

  // dominant motion frequency of a channel in a band [lwr, upr] Hz
  virtual double mean_frequency( const std::string & channel ,
				 double start , double end ,
				 double lwr , double upr ) = 0;
};


#endif
