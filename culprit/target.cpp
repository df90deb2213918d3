

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

#include "culprit/target.h"

#include "dsp/iir.h"
#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;


lowpass_t lowpass_t::parse( const std::string & s0 )
{

  const std::string s = Helper::lrtrim( s0 );

  if ( Helper::iequals( s , "average" ) ) return derived( LOWPASS_AVERAGE );

  if ( Helper::iequals( s , "max" ) ) return derived( LOWPASS_MAX );

  double f = 0;
  if ( ! Helper::str2dbl( s , &f ) )
    Helper::halt( INVALID_ARGUMENT , "lowpass must be a frequency, 'average' or 'max' (not '" + s0 + "')" );

  return fixed( f );
}


double culprit::resolve_cutoff( const lowpass_t & lowpass , const Eigen::MatrixXd & P )
{

  if ( lowpass.is_fixed() ) return lowpass.f;

  if ( P.cols() == 0 )
    Helper::halt( INSUFFICIENT_DATA , "no predictors to derive a lowpass cutoff from" );

  const Eigen::VectorXd s = lowpass.policy == LOWPASS_AVERAGE
    ? eigen_ops::column_means( P )
    : eigen_ops::column_maxes( P );

  const double f = s.maxCoeff();

  logger << "  lowpass '" << globals::lowpass( lowpass.policy ) << "' resolved to " << f << " Hz\n";

  return f;
}


std::vector<double> culprit::filter_target( const std::vector<double> & x ,
					    double sr ,
					    double cutoff ,
					    int order )
{

  // nb. a design exactly at Nyquist is degenerate
  if ( ! ( cutoff > 0 ) || cutoff >= sr / 2.0 )
    Helper::halt( INVALID_ARGUMENT , "lowpass cutoff " + Helper::dbl2str( cutoff )
		  + " Hz outside (0, " + Helper::dbl2str( sr / 2.0 ) + ") Hz" );

  return dsptools::butterworth_lowpass( x , order , sr , cutoff );

}
