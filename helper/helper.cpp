

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

#include "helper/helper.h"
#include "defs/defs.h"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <cstdio>
#include <cstdlib>

#include <sys/stat.h>
#include <dirent.h>
#include <glob.h>

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( (unsigned char)s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  const int n = s.size();
  int n2 = 0;
  for (int i=0; i<n; i++) { if ( ! ( s[i] == '"' || s[i] == q2 ) ) ++n2; }
  if ( n2 == n ) return s;
  std::string r( n2 , ' ' );
  int j = 0;
  for	(int i=0; i<n; i++)
    {
      if ( ! ( s[i] == '"' || s[i] == q2 ) )
	{
	  r[j] = s[i];
	  ++j;
	}
    }
  return r;
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else  (including empty, i.e. 'var'  --> 'var=T'
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

std::string Helper::search_replace( const std::string & s , char a , char b )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) if ( j[i] == a ) j[i] = b;
  return j;
}

void Helper::halt( const std::string & msg )
{
  halt( INTERNAL_ERROR , msg );
}

void Helper::halt( error_code_t code , const std::string & msg )
{
  // some other code wants to see the message first (e.g. to log it)?
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  throw scatter_error_t( code , msg );
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}


std::string Helper::dbl2str_full(double n)
{
  const int maxp = std::numeric_limits<double>::max_digits10;
  for (int p = maxp - 2; p < maxp; p++)
    {
      std::ostringstream ss( std::stringstream::out );
      ss << std::setprecision( p ) << n;
      if ( strtod( ss.str().c_str() , NULL ) == n ) return ss.str();
    }
  std::ostringstream ss( std::stringstream::out );
  ss << std::setprecision( maxp ) << n;
  return ss.str();
}


bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

bool Helper::str2int64(const std::string & s , long long * i)
{
  return from_string<long long>(*i,s,std::dec);
}


std::vector<std::string> Helper::parse(const std::string & item, const char s , bool empty )
{
  return Helper::char_split( item , s , empty );
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{
  if ( s.size() == 1 ) return Helper::char_split( item , s[0] , empty );
  if ( s.size() == 2 ) return Helper::char_split( item , s[0] , s[1] , empty );
  if ( s.size() == 3 ) return Helper::char_split( item , s[0] , s[1] , s[2] , empty );
  Helper::halt("silly internal error in parse/char_split");
  std::vector<std::string> dummy;
  return dummy;
}


std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{

  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , bool empty )
{
  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c || s[j] == c2 )
	{
	  if ( j == p ) // empty slot?
	    {
	      if (empty) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty )
{
  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c || s[j] == c2 || s[j] == c3 )
	{
	  if ( j == p ) // empty slot?
	    {
	      if (empty) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}


bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if ( std::tolower( (unsigned char)a[i] ) != std::tolower( (unsigned char)b[i] ) )
      return false;
  return true;
}


std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {

      int c = sb->sbumpc();

      switch (c)
	{
	case '\n':
	  return is;

	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

	case EOF :
	  // Also handle the case when the last line has no line ending
	  if (t.empty())
	    is.setstate(std::ios::eofbit);
	  return is;
	default:
	  t += (char)c;
	}
    }
}


//
// files and folders
//

bool Helper::fileExists( const std::string & f )
{

  FILE *file;

  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }

  return false;
}

bool Helper::folderExists( const std::string & f )
{
  struct stat sb;
  if ( stat( f.c_str() , &sb ) != 0 ) return false;
  return S_ISDIR( sb.st_mode );
}

void Helper::make_folder( const std::string & f )
{
  if ( folderExists( f ) ) return;

  std::string syscmd = globals::mkdir_command + " \"" + f + "\"";

  int retval = system( syscmd.c_str() );

  if ( retval != 0 || ! folderExists( f ) )
    Helper::halt( IO_ERROR , "could not create folder " + f );
}

std::string Helper::join_path( const std::string & folder , const std::string & file )
{
  if ( folder == "" ) return file;
  if ( folder[ folder.size() - 1 ] == globals::folder_delimiter )
    return folder + file;
  return folder + globals::folder_delimiter + file;
}

std::string Helper::basename( const std::string & path )
{
  std::string p = path;
  while ( p.size() > 1 && p[ p.size() - 1 ] == globals::folder_delimiter )
    p = p.substr( 0 , p.size() - 1 );
  size_t pos = p.rfind( globals::folder_delimiter );
  if ( pos == std::string::npos ) return p;
  return p.substr( pos + 1 );
}

std::vector<std::string> Helper::list_folders( const std::string & folder )
{
  std::vector<std::string> r;

  DIR * dir;
  struct dirent *ent;
  if ( (dir = opendir ( folder.c_str() ) ) != NULL )
    {
      while ((ent = readdir (dir)) != NULL)
	{
	  std::string fname = ent->d_name;
	  if ( fname == "." || fname == ".." ) continue;
	  const std::string full = Helper::join_path( folder , fname );
	  if ( folderExists( full ) )
	    r.push_back( full );
	}
      closedir (dir);
    }
  else
    Helper::halt( IO_ERROR , "could not open folder " + folder );

  return r;
}

std::vector<std::string> Helper::glob( const std::string & folder , const std::string & pattern )
{
  std::vector<std::string> r;

  const std::string p = Helper::join_path( folder , pattern );

  glob_t g;
  int retval = ::glob( p.c_str() , 0 , NULL , &g );

  if ( retval == 0 )
    {
      for (size_t i=0; i<g.gl_pathc; i++)
	r.push_back( g.gl_pathv[i] );
    }

  globfree( &g );

  if ( retval != 0 && retval != GLOB_NOMATCH )
    Helper::halt( IO_ERROR , "problem reading " + p );

  return r;
}


std::vector<std::string> Helper::file2strvector( const std::string & filename )
{
  // one (trimmed) entry per non-blank line
  if ( ! Helper::fileExists( filename ) ) Helper::halt( IO_ERROR , "could not find " + filename );
  std::ifstream IN1( filename.c_str() , std::ios::in );
  std::vector<std::string> d;
  while ( 1 )
    {
      std::string x;
      Helper::safe_getline( IN1 , x );
      if ( IN1.eof() ) break;
      x = Helper::lrtrim( x );
      if ( x == "" ) continue;
      d.push_back(x);
    }
  IN1.close();
  return d;
}


//
// binary I/O
//

void Helper::bwrite( std::ofstream & O , int i )
{
  O.write( (char*)( &i ), sizeof(int) );
}

void Helper::bwrite( std::ofstream & O , double d )
{
  O.write( (char*)( &d ), sizeof(double) );
}

int Helper::bread_int( std::ifstream & I )
{
  int i;
  I.read( (char*)( &i ), sizeof(int) );
  return i;
}

double Helper::bread_dbl( std::ifstream & I )
{
  double d;
  I.read( (char*)( &d ), sizeof(double) );
  return d;
}
