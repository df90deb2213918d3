

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

// console logger: optionally mirrored to a file, or cached in memory

#ifndef __SCATTER_LOGGER_H__
#define	__SCATTER_LOGGER_H__

#include <iostream>
#include <sstream>
#include <ctime>
#include <string>
#include <fstream>

#include "defs/defs.h"

class logger_t
{

 private:

  const std::string _log_header;

  std::ostream & _out_stream;

  std::ofstream  _log_file;

  // in-memory copy, when globals::cache_log is set
  std::stringstream cache;

  bool           save_log;

  bool           is_off;

  // the closing rule is only printed for sessions opened by banner()
  bool           started;

  static std::string timestamp()
  {
    time_t rawtime;
    time( &rawtime );
    char buf[50];
    strftime( buf , sizeof( buf ) , "%d-%b-%Y %H:%M:%S" , localtime( &rawtime ) );
    return buf;
  }

  template<typename T>
    void emit( const T & data )
    {
      _out_stream << data;
      if ( save_log ) _log_file << data;
    }

 public:

 logger_t( const std::string & log_header  ,
	  std::ostream& out_stream = std::cerr)
   : _log_header( log_header ) , _out_stream( out_stream ) ,
    save_log( false ) , is_off( false ) , started( false )
  { }

  // mirror everything that follows into log_file
  void write_log( const std::string & log_file )
  {
    if ( is_off || globals::silent ) return;
    stop_writing_log();
    _log_file.open( log_file.c_str() );
    save_log = _log_file.good();
    if ( ! save_log )
      _out_stream << " ** warning: could not open log file " << log_file << " ** " << std::endl;
  }

  void stop_writing_log()
  {
    if ( ! save_log ) return;
    _log_file.close();
    save_log = false;
  }

  void off()
  {
    _out_stream.flush();
    cache.str( std::string() );
    stop_writing_log();
    is_off = true;
  }

  void banner( const std::string & v , const std::string & bd )
  {
    if ( is_off || globals::silent ) return;
    started = true;
    std::stringstream b;
    b << "===================================================================\n"
      << _log_header << " | " << v << ", " << bd << " | starting " << timestamp() << " +++\n"
      << "===================================================================\n";
    emit( b.str() );
    _out_stream.flush();
  }

  ~logger_t()
    {
      if ( is_off || globals::silent || ! started ) return;
      std::stringstream b;
      b << "-------------------------------------------------------------------\n"
	<< "+++ scatter | finishing " << timestamp() << "                    +++\n"
	<< "===================================================================\n";
      emit( b.str() );
      _out_stream.flush();
      stop_writing_log();
    }

  void warning( const std::string & msg )
  {
    if ( is_off ) return;
    if ( globals::cache_log )
      cache << " ** warning: " << msg << " ** " << std::endl;
    else if ( ! globals::silent )
      {
	emit( " ** warning: " + msg + " ** \n" );
	_out_stream.flush();
      }
  }

  template<typename T>
    logger_t& operator<< (const T& data)
    {
      if ( is_off ) return *this;
      if ( ! globals::silent ) emit( data );
      if ( globals::cache_log ) cache << data;
      return *this;
    }

  // returns and clears the in-memory copy
  std::string print_buffer()
    {
      std::string retval = cache.str();
      cache.str( std::string() );
      return retval;
    }

};


#endif
