

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

#ifndef __SCATTER_H__
#define __SCATTER_H__

#include "defs/defs.h"
#include "defs/config.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"
#include "intervals/intervals.h"
#include "lock/lock.h"
#include "sources/sources.h"
#include "sources/archive.h"
#include "sources/meanfreq.h"
#include "dsp/iir.h"
#include "dsp/resample.h"
#include "dsp/predictor.h"
#include "dsp/correl.h"
#include "fftw/fftwrap.h"
#include "stats/eigen_ops.h"
#include "miscmath/miscmath.h"
#include "culprit/target.h"
#include "culprit/scorer.h"
#include "culprit/analysis.h"
#include "sstore/record.h"
#include "sstore/store.h"

#endif
