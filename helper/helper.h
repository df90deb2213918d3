

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

#ifndef __SCATTER_HELPER_H__
#define __SCATTER_HELPER_H__

#include <iostream>

#include <string>
#include <sstream>
#include <vector>
#include <set>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <cctype>
#include <locale>
#include <stdint.h>
#include <map>
#include <cmath>


//
// error taxonomy: every halt() carries one of these codes
//

enum error_code_t
  {
    INVALID_ARGUMENT ,   // bad option, bad cutoff, bad selection index
    INSUFFICIENT_DATA ,  // series shorter than required
    VALUE_NOT_FOUND ,    // missing section/field in a persisted record
    IO_ERROR ,           // folder creation, file read/write
    INTERNAL_ERROR
  };

struct scatter_error_t : public std::runtime_error
{
  scatter_error_t( error_code_t code , const std::string & msg )
    : std::runtime_error( msg ) , code( code ) { }

  error_code_t code;
};


namespace Helper
{

  std::string toupper( const std::string & );

  // trim from start
  static inline std::string ltrim( std::string s ) {
    s.erase(s.begin(), std::find_if( s.begin(), s.end(),  [](unsigned char c) {return !std::isspace(c);} ));
    return s;
  }

  // trim from end
  static inline std::string rtrim(std::string s) {
    s.erase(std::find_if( s.rbegin(), s.rend(),  [](unsigned char c) {return !std::isspace(c);} ).base(), s.end() );
    return s;
  }

  // trim from both ends
  static inline std::string lrtrim( std::string s ) {
    return ltrim(rtrim(s));
  }

  static inline std::string unquote(const std::string &s , const char q2 = '"' ) {
    if ( s.size() == 0 ) return s;
    int a = ( s[0] == '"' || s[0] == q2 ) ? 1 : 0;
    int b = ( s[s.size()-1] == '"' || s[s.size()-1] == q2 ) ? 1 : 0 ;
    return s.substr(a,s.size()-a-b);
  }

  std::string remove_all_quotes(const std::string &s , const char q2 = '"' );

  bool yesno( const std::string & );

  std::string search_replace( const std::string & , char a , char b );


  // folders

  bool fileExists(const std::string &);

  bool folderExists(const std::string &);

  void make_folder( const std::string & );

  std::string join_path( const std::string & folder , const std::string & file );

  std::string basename( const std::string & path );


  // sub-folders (full paths) of a folder
  std::vector<std::string> list_folders( const std::string & folder );

  // files matching a shell pattern, e.g. folder/*.predictors
  std::vector<std::string> glob( const std::string & folder , const std::string & pattern );

  std::vector<std::string> file2strvector( const std::string & );

  // binary I/O

  void bwrite( std::ofstream & O , int i );
  void bwrite( std::ofstream & O , double d );
  int bread_int( std::ifstream & I );
  double bread_dbl( std::ifstream & I );

  // case insenstive string comparison
  bool iequals(const std::string& a, const std::string& b);

  std::istream& safe_getline(std::istream& is, std::string& t);

  // errors are raised here; optional bail hook, then throw
  void halt( const std::string & msg );
  void halt( error_code_t code , const std::string & msg );


  std::string int2str(int n);
  std::string int2str(long n);
  std::string int2str(long long n);
  std::string dbl2str(double n);
  std::string dbl2str(double n, int dp);
  // shortest form that reads back to the same double
  std::string dbl2str_full(double n);

  template<typename T>
    std::string stringize( const T & t , const std::string & delim = "," )
    {
      std::stringstream ss;

      typename T::const_iterator tt = t.begin();
      while ( tt != t.end() )
	{
	  if ( tt != t.begin() ) ss << delim;
	  ss << *tt;
	  ++tt;
	}
      return ss.str();
    }

  // whole-string numeric conversion ( "12x" fails )
  bool str2dbl(const std::string & , double * );
  bool str2int(const std::string & , int * );
  bool str2int64(const std::string & , long long * );

  template <class T>
    bool from_string(T& t,
		     const std::string& s,
		     std::ios_base& (*f)(std::ios_base&))
    {
      std::istringstream iss(s);
      if ( (iss >> f >> t).fail() ) return false;
      iss >> std::ws;
      return iss.eof();
    }

  std::vector<std::string> parse(const std::string & item, const std::string & s = " \t\n" , bool empty = false );
  std::vector<std::string> parse(const std::string & item, const char s , bool empty = false );

  std::vector<std::string> char_split( const std::string & s , const char c , bool empty );
  std::vector<std::string> char_split( const std::string & s , const char c , const char c2 , bool empty );
  std::vector<std::string> char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty );

}

#endif
