

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

#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>

extern logger_t logger;


//
// param_t
//

void param_t::add( const std::string & option , const std::string & value )
{
  // set key=value pairs to opt[]

  if ( option == "" ) return;

  // special case: key+=value, then ","-append to any existing list

  const bool append_mode = option[ option.size() - 1 ] == '+';

  if ( append_mode )
    {
      const std::string option1 = option.substr( 0 , option.size() - 1 );
      if ( option1 == "" ) return;
      if ( opt.find( option1 ) == opt.end() )
	opt[ option1 ] = value;
      else
	opt[ option1 ] = opt[ option1 ] + "," + value;
      return;
    }

  // multiple versions of the same key make no sense
  if ( opt.find( option ) != opt.end() )
    Helper::halt( INVALID_ARGUMENT , option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value;

}


int param_t::size() const
{
  return opt.size();
}


void param_t::parse( const std::string & s )
{
  std::vector<std::string> tok = Helper::parse( s , "=" );
  if ( tok.size() == 2 )     add( tok[0] , tok[1] );
  else if ( tok.size() == 1 ) add( tok[0] , "__null__" );
  else if ( tok.size() == 0 ) return;
  else // ignore subsequent '=' signs in 'value'
    {
      std::string v = tok[1];
      for (int i=2;i<tok.size();i++) v += "=" + tok[i];
      add( tok[0] , v );
    }
}


void param_t::parse_file( const std::string & filename )
{
  if ( ! Helper::fileExists( filename ) )
    Helper::halt( IO_ERROR , "could not find parameter file " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  while ( 1 )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;

      // skip comments
      if ( line.size() == 0 || line[0] == '%' ) continue;

      std::vector<std::string> tok = Helper::parse( line , " \t" );
      for (int i=0; i<tok.size(); i++)
	parse( tok[i] );

      if ( IN1.eof() ) break;
    }

  IN1.close();
}


bool param_t::has(const std::string & s ) const
{
  return opt.find(s) != opt.end();
}

bool param_t::empty(const std::string & s ) const
{
  if ( ! has( s ) ) return true; // no key
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno(const std::string & s ) const
{
  if ( ! has( s ) ) return false;
  // a bare flag means yes
  if ( empty( s ) ) return true;
  return Helper::yesno( opt.find( s )->second ) ;
}

std::string param_t::value( const std::string & s , const bool uppercase ) const
{
  if ( has( s ) )
    return uppercase ?
      Helper::remove_all_quotes( Helper::toupper( opt.find( s )->second ) )
      : Helper::remove_all_quotes( opt.find( s )->second );
  else
    return "";
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( ! has(s) || empty(s) ) Helper::halt( INVALID_ARGUMENT , "command requires parameter " + s );
  return value(s, uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( INVALID_ARGUMENT , "command requires parameter " + s );
  int r;
  if ( ! Helper::str2int( value(s) , &r ) )
    Helper::halt( INVALID_ARGUMENT , "command requires parameter " + s + " to have an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  if ( ! has(s) ) Helper::halt( INVALID_ARGUMENT , "command requires parameter " + s );
  double r;
  if ( ! Helper::str2dbl( value(s) , &r ) )
    Helper::halt( INVALID_ARGUMENT , "command requires parameter " + s + " to have a numeric value" );
  return r;
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  int sz = opt.size();
  int cnt = 1;
  std::stringstream ss;
  while ( ii != opt.end() )
    {

      if ( ii->second != "__null__" )
	ss << indent << ii->first << "=" << ii->second;
      else
	ss << indent << ii->first ;

      if ( cnt != sz )
	ss << delim;

      ++cnt;
      ++ii;
    }
  return ss.str();
}

std::vector<std::string> param_t::strvector( const std::string & k , const std::string delim , const bool uppercase ) const
{
  std::vector<std::string> s;
  if ( ! has(k) || empty(k) ) return s;
  std::vector<std::string> tok = Helper::parse( value(k,uppercase) , delim );
  for (int i=0;i<tok.size();i++)
    s.push_back( Helper::unquote( tok[i]) );
  return s;
}

std::vector<double> param_t::dblvector( const std::string & k , const std::string delim ) const
{
  std::vector<double> s;
  if ( ! has(k) ) return s;
  std::vector<std::string> tok = Helper::parse( value(k) , delim );
  for (int i=0;i<tok.size();i++)
    {
      std::string str = Helper::unquote( tok[i]);
      double d = 0;
      if ( ! Helper::str2dbl( str , &d ) ) Helper::halt( INVALID_ARGUMENT , "Option " + k + " requires a double value(s)" );
      s.push_back(d);
    }
  return s;
}

