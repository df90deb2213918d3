

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

#ifndef __SCATTER_TEST_FIXTURES_H__
#define __SCATTER_TEST_FIXTURES_H__

#include "sources/sources.h"
#include "helper/helper.h"

#include <string>
#include <vector>

namespace fixtures {

  // scratch folder under /tmp, removed on destruction
  struct temp_folder_t
  {
    temp_folder_t();
    ~temp_folder_t();
    std::string path( const std::string & f = "" ) const;
    std::string root;
  private:
    temp_folder_t( const temp_folder_t & );
    temp_folder_t & operator=( const temp_folder_t & );
  };

  void write_file( const std::string & filename , const std::string & content );

  // two-column text archive file: t0 + i/sr, x[i]
  void write_series( const std::string & folder ,
		     const std::string & channel ,
		     double t0 , double sr ,
		     const std::vector<double> & x );

  std::vector<double> sine( int n , double sr , double f , double amp = 1.0 , double phase = 0 );

  // error code thrown by f(), or -1 if nothing was thrown
  template<typename F>
    int error_of( F f )
    {
      try
	{
	  f();
	}
      catch ( const scatter_error_t & e )
	{
	  return e.code;
	}
      return -1;
    }

  // in-memory channel data
  struct stub_channels_t : public channel_source_t
  {
    stub_channels_t() : calls(0) , last_start(0) , last_end(0) { }

    virtual channel_matrix_t fetch_channels( const std::string & archive ,
					     const std::string & target ,
					     const std::vector<std::string> & candidates ,
					     double start , double end ,
					     double sr ,
					     double * resolved_sr );
    channel_matrix_t m;
    int calls;
    double last_start;
    double last_end;
  };

  // fixed lock state
  struct stub_state_t : public state_source_t
  {
    virtual lock_series_t fetch_state( const std::string & channel ,
				       double start , double end );
    lock_series_t series;
    std::string last_channel;
  };

  // fixed mean frequency; remembers every request
  struct stub_meanfreq_t : public mean_frequency_t
  {
    struct request_t
    {
      std::string channel;
      double start, end, lwr, upr;
    };

    stub_meanfreq_t( double value = 1.5 ) : value( value ) { }

    virtual double mean_frequency( const std::string & channel ,
				   double start , double end ,
				   double lwr , double upr );
    double value;
    std::vector<request_t> requests;
  };

}

#endif
