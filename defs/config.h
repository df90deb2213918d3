

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

#ifndef __SCATTER_CONFIG_H__
#define __SCATTER_CONFIG_H__

#include "defs/defs.h"

#include <string>
#include <map>

struct param_t;

//
// Analysis-wide constants; built once (defaults + optional overrides),
// then held read-only by the engine and the store
//

struct config_t
{

  config_t();

  // defaults, overridden by any of: bandpass=lwr,upr lambda= order= na=
  static config_t from_param( const param_t & param );

  // lock-status channel for an instrument; false if there is none
  bool lock_channel( instrument_t instrument , std::string * channel ) const;

  // band for the mean-frequency statistic (Hz)
  double bandpass_lwr;
  double bandpass_upr;

  // laser wavelength (um): predictor = 2 n |v| / lambda
  double lambda;

  // Butterworth order for the target lowpass and the mean-frequency bandpass
  int filter_order;

  // value of a 'locked' sample in flag-type lock channels
  double locked_flag;

  std::map<instrument_t,std::string> lock_channels;

  // defaults for the analysis request
  double default_sr;
  int default_scattering;
  int default_smoothing;

  // result folder layout
  std::string record_file;
  std::string predictors_ext;
  std::string envelope_ext;
  std::string comparison_folder;

  // missing-value marker in comparison tables
  std::string missing;

};

#endif
