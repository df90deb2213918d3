

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

#ifndef __SCATTER_MAIN_H__
#define __SCATTER_MAIN_H__

#include <string>
#include <new>

struct param_t;
struct config_t;

// misc helper: build params from the command line (key=value, @param-file)
void build_param( param_t * , int argc , char** argv , int );

// single window: scatter gps= dur= target= channels= out= lowpass= ...
int proc_analysis( const param_t & , const config_t & );

// comparison table: scatter --summary root= table= ...
int proc_summary( const param_t & , const config_t & );

// misc helper: manage memory resource issues
void NoMem();

// misc helper: return version
std::string scatter_version();

#endif
