

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

#include "culprit/scorer.h"

#include "dsp/correl.h"
#include "miscmath/miscmath.h"
#include "stats/eigen_ops.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <algorithm>
#include <cmath>

extern logger_t logger;


void scorer_t::score( const std::vector<double> & target ,
		      const Eigen::MatrixXd & P ,
		      const std::vector<std::string> & labels_ )
{

  if ( P.cols() != labels_.size() )
    Helper::halt( INVALID_ARGUMENT , "predictor/label mismatch: "
		  + Helper::int2str( (int)P.cols() ) + " vs " + Helper::int2str( (int)labels_.size() ) );

  if ( P.cols() == 0 )
    Helper::halt( INSUFFICIENT_DATA , "no candidate channels to score" );

  if ( P.rows() != target.size() )
    Helper::halt( INVALID_ARGUMENT , "target and predictors differ in length" );

  labels = labels_;

  r = dsptools::pearson( eigen_ops::copy_vector( target ) , P );

  int nan = 0;
  for (int j=0; j<r.size(); j++) if ( std::isnan( r[j] ) ) ++nan;

  logger << "  scored " << r.size() << " candidate channels";
  if ( nan ) logger << " (" << nan << " undefined, zero variance)";
  logger << "\n";

}


int scorer_t::winner() const
{
  if ( r.size() == 0 )
    Helper::halt( "no scores" );

  const int w = MiscMath::which_max( r );

  return w == -1 ? 0 : w;
}


correlation_t scorer_t::best() const
{
  const int w = winner();
  return correlation_t( 1 , labels[w] , r[w] );
}


std::vector<correlation_t> scorer_t::rank( int k ) const
{

  if ( k < 1 )
    Helper::halt( INVALID_ARGUMENT , "rank must be at least 1" );

  if ( r.size() == 0 )
    Helper::halt( "no scores" );

  std::vector<int> idx( r.size() );
  for (int j=0; j<idx.size(); j++) idx[j] = j;

  // descending, NaN last; stable so that ties keep channel-list order
  const std::vector<double> & s = r;
  std::stable_sort( idx.begin() , idx.end() ,
		    [&s]( int a , int b ) {
		      if ( std::isnan( s[b] ) ) return ! std::isnan( s[a] );
		      if ( std::isnan( s[a] ) ) return false;
		      return s[a] > s[b];
		    } );

  if ( k > idx.size() ) k = idx.size();

  std::vector<correlation_t> res;
  for (int i=0; i<k; i++)
    res.push_back( correlation_t( i+1 , labels[ idx[i] ] , r[ idx[i] ] ) );

  return res;
}
