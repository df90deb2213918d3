

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

#include "sstore/record.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <cmath>
#include <limits>

extern logger_t logger;

using json = nlohmann::json;


record_t::record_t()
  : content( json::object() )
{
}


bool record_t::has_parameters() const
{
  return content.contains( "parameters" ) && content[ "parameters" ].is_object();
}

bool record_t::has_result() const
{
  return content.contains( "result" ) && content[ "result" ].is_array();
}


void record_t::write_parameters( const analysis_params_t & p )
{

  if ( has_parameters() )
    Helper::halt( INVALID_ARGUMENT , "parameters already written for this record" );

  json s = json::object();

  s[ "gps" ] = Helper::int2str( p.start ) + "," + Helper::int2str( p.end );
  s[ "target_channel" ] = p.target_channel;
  s[ "channels_list" ] = p.channels_list;
  s[ "output_path" ] = p.output_path;
  s[ "sampling_frequency" ] = p.sampling_frequency;
  s[ "lowpass_frequency" ] = p.lowpass_frequency;
  s[ "scattering" ] = p.scattering;
  s[ "smoothing_window" ] = p.smoothing_window;

  content[ "parameters" ] = s;
}


void record_t::write_result( const std::vector<correlation_t> & res )
{

  json a = json::array();

  for (int i=0; i<res.size(); i++)
    {
      json e = json::object();
      e[ "index" ] = res[i].index;
      e[ "channel" ] = res[i].channel;

      // NaN is stored as null
      if ( std::isnan( res[i].correlation ) ) e[ "correlation" ] = nullptr;
      else e[ "correlation" ] = res[i].correlation;

      if ( std::isnan( res[i].mean_frequency ) ) e[ "mean_frequency" ] = nullptr;
      else e[ "mean_frequency" ] = res[i].mean_frequency;

      a.push_back( e );
    }

  // whole-section replacement
  content[ "result" ] = a;
}


const json & record_t::section( const std::string & name ) const
{
  if ( ! content.contains( name ) )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: no '" + name + "' section" );
  return content[ name ];
}


const json & record_t::field( const std::string & sect , const std::string & key ) const
{
  const json & s = section( sect );
  if ( ! s.is_object() || ! s.contains( key ) )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: " + sect + "/" + key );
  return s[ key ];
}


std::string record_t::str_field( const std::string & key ) const
{
  const json & f = field( "parameters" , key );
  if ( ! f.is_string() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: parameters/" + key + " is not a string" );
  return f.get<std::string>();
}


double record_t::dbl_field( const std::string & key ) const
{
  const json & f = field( "parameters" , key );
  if ( ! f.is_number() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: parameters/" + key + " is not a number" );
  return f.get<double>();
}


int record_t::int_field( const std::string & key ) const
{
  const json & f = field( "parameters" , key );
  if ( ! f.is_number_integer() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: parameters/" + key + " is not an integer" );
  return f.get<int>();
}


std::pair<long long,long long> record_t::window() const
{
  const std::string gps = str_field( "gps" );

  std::vector<std::string> tok = Helper::char_split( gps , ',' , false );

  long long s = 0 , e = 0;

  if ( tok.size() != 2 || ! Helper::str2int64( tok[0] , &s ) || ! Helper::str2int64( tok[1] , &e ) )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: malformed gps field '" + gps + "'" );

  return std::make_pair( s , e );
}

std::string record_t::target_channel() const { return str_field( "target_channel" ); }

std::string record_t::channels_list() const { return str_field( "channels_list" ); }

std::string record_t::output_path() const { return str_field( "output_path" ); }

double record_t::sampling_frequency() const { return dbl_field( "sampling_frequency" ); }

double record_t::lowpass_frequency() const { return dbl_field( "lowpass_frequency" ); }

int record_t::scattering() const { return int_field( "scattering" ); }

int record_t::smoothing_window() const { return int_field( "smoothing_window" ); }


analysis_params_t record_t::parameters() const
{
  analysis_params_t p;
  std::pair<long long,long long> w = window();
  p.start = w.first;
  p.end = w.second;
  p.target_channel = target_channel();
  p.channels_list = channels_list();
  p.output_path = output_path();
  p.sampling_frequency = sampling_frequency();
  p.lowpass_frequency = lowpass_frequency();
  p.scattering = scattering();
  p.smoothing_window = smoothing_window();
  return p;
}


correlation_t record_t::entry( const json & e )
{

  if ( ! e.is_object() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: result entry is not an object" );

  if ( ! e.contains( "index" ) || ! e[ "index" ].is_number_integer() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: result/index" );

  if ( ! e.contains( "channel" ) || ! e[ "channel" ].is_string() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: result/channel" );

  if ( ! e.contains( "correlation" ) || ! ( e[ "correlation" ].is_number() || e[ "correlation" ].is_null() ) )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: result/correlation" );

  if ( ! e.contains( "mean_frequency" ) || ! ( e[ "mean_frequency" ].is_number() || e[ "mean_frequency" ].is_null() ) )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: result/mean_frequency" );

  const double nan = std::numeric_limits<double>::quiet_NaN();

  return correlation_t( e[ "index" ].get<int>() ,
			e[ "channel" ].get<std::string>() ,
			e[ "correlation" ].is_null() ? nan : e[ "correlation" ].get<double>() ,
			e[ "mean_frequency" ].is_null() ? nan : e[ "mean_frequency" ].get<double>() );
}


int record_t::n_results() const
{
  const json & r = section( "result" );
  if ( ! r.is_array() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: 'result' is not a list" );
  return r.size();
}


correlation_t record_t::result( int i ) const
{
  const int n = n_results();

  if ( i < 1 || i > n )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: no result entry " + Helper::int2str( i )
		  + " (" + Helper::int2str( n ) + " stored)" );

  return entry( content[ "result" ][ i - 1 ] );
}


std::vector<correlation_t> record_t::results() const
{
  const int n = n_results();
  std::vector<correlation_t> res;
  for (int i=0; i<n; i++)
    res.push_back( entry( content[ "result" ][ i ] ) );
  return res;
}


correlation_t record_t::best() const
{

  std::vector<correlation_t> res = results();

  if ( res.size() == 0 )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: empty result" );

  int b = -1;
  for (int i=0; i<res.size(); i++)
    {
      if ( std::isnan( res[i].correlation ) ) continue;
      if ( b == -1 || res[i].correlation > res[b].correlation ) b = i;
    }

  return res[ b == -1 ? 0 : b ];
}


std::string record_t::dump() const
{
  return content.dump( 2 );
}


void record_t::save( const std::string & folder , const std::string & filename ) const
{

  Helper::make_folder( folder );

  const std::string f = Helper::join_path( folder , filename );

  std::ofstream O1( f.c_str() , std::ios::out );

  if ( ! O1.good() )
    Helper::halt( IO_ERROR , "could not write " + f );

  O1 << dump() << "\n";

  O1.close();

  if ( O1.fail() )
    Helper::halt( IO_ERROR , "problem writing " + f );

}


record_t record_t::load( const std::string & folder , const std::string & filename )
{

  const std::string f = Helper::join_path( folder , filename );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( IO_ERROR , "could not open " + f );

  std::ifstream IN1( f.c_str() , std::ios::in );

  record_t r;

  try
    {
      r.content = json::parse( IN1 );
    }
  catch ( const json::parse_error & e )
    {
      Helper::halt( IO_ERROR , "problem parsing " + f + ":\n --> " + e.what() );
    }

  if ( ! r.content.is_object() )
    Helper::halt( VALUE_NOT_FOUND , "Value not found: " + f + " does not hold a record" );

  return r;
}


std::string record_t::predictors_file( const std::string & folder ,
				       const std::string & target ,
				       const std::string & ext )
{
  return Helper::join_path( folder , Helper::search_replace( target , ':' , '_' ) + "." + ext );
}


void record_t::save_predictors( const std::string & folder ,
				const std::string & target ,
				const std::string & ext ,
				const std::vector<double> & values )
{

  Helper::make_folder( folder );

  const std::string f = predictors_file( folder , target , ext );

  std::ofstream O1( f.c_str() , std::ios::out | std::ios::binary );

  if ( ! O1.good() )
    Helper::halt( IO_ERROR , "could not write " + f );

  Helper::bwrite( O1 , (int)values.size() );
  for (int i=0; i<values.size(); i++)
    Helper::bwrite( O1 , values[i] );

  O1.close();

  if ( O1.fail() )
    Helper::halt( IO_ERROR , "problem writing " + f );

}


std::vector<double> record_t::load_predictors( const std::string & f )
{

  if ( ! Helper::fileExists( f ) )
    Helper::halt( IO_ERROR , "could not open " + f );

  std::ifstream IN1( f.c_str() , std::ios::in | std::ios::binary );

  const int n = Helper::bread_int( IN1 );

  if ( ! IN1.good() || n < 0 )
    Helper::halt( IO_ERROR , "bad predictor file " + f );

  std::vector<double> v( n );
  for (int i=0; i<n; i++)
    v[i] = Helper::bread_dbl( IN1 );

  if ( IN1.fail() )
    Helper::halt( IO_ERROR , "truncated predictor file " + f );

  return v;
}
