

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

#include "defs/config.h"

#include "param.h"
#include "helper/helper.h"

config_t::config_t()
{
  bandpass_lwr = 0.03;
  bandpass_upr = 10.0;

  lambda = 1.064;

  filter_order = 4;

  locked_flag = 1;

  lock_channels[ INSTRUMENT_L1 ] = "L1:DMT-ANALYSIS_READY:1";
  lock_channels[ INSTRUMENT_H1 ] = "H1:DMT-ANALYSIS_READY:1";
  lock_channels[ INSTRUMENT_V1 ] = "V1:META_ITF_LOCK_index";

  default_sr = 256;
  default_scattering = 1;
  default_smoothing = 50;

  record_file = "output.json";
  predictors_ext = "predictors";
  envelope_ext = "imf";
  comparison_folder = "comparison";

  missing = "NA";
}


config_t config_t::from_param( const param_t & param )
{
  config_t c;

  if ( param.has( "bandpass" ) )
    {
      std::vector<double> b = param.dblvector( "bandpass" );
      if ( b.size() != 2 || b[0] <= 0 || b[1] <= b[0] )
	Helper::halt( INVALID_ARGUMENT , "expecting bandpass=<lwr>,<upr> with 0 < lwr < upr" );
      c.bandpass_lwr = b[0];
      c.bandpass_upr = b[1];
    }

  if ( param.has( "lambda" ) )
    {
      c.lambda = param.requires_dbl( "lambda" );
      if ( c.lambda <= 0 ) Helper::halt( INVALID_ARGUMENT , "lambda must be positive" );
    }

  if ( param.has( "order" ) )
    {
      c.filter_order = param.requires_int( "order" );
      if ( c.filter_order < 1 || c.filter_order > 12 )
	Helper::halt( INVALID_ARGUMENT , "order must be between 1 and 12" );
    }

  if ( param.has( "na" ) )
    c.missing = param.value( "na" );

  return c;
}


bool config_t::lock_channel( instrument_t instrument , std::string * channel ) const
{
  std::map<instrument_t,std::string>::const_iterator ii = lock_channels.find( instrument );
  if ( ii == lock_channels.end() ) return false;
  *channel = ii->second;
  return true;
}
