

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

#include "sstore/store.h"

#include "sstore/record.h"
#include "intervals/intervals.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <algorithm>
#include <map>
#include <cmath>

extern logger_t logger;


selection_t selection_t::parse( const std::vector<std::string> & tokens )
{

  selection_t s;

  if ( tokens.size() == 1 && Helper::iequals( Helper::lrtrim( tokens[0] ) , "best" ) )
    return s;

  if ( tokens.size() == 0 )
    Helper::halt( INVALID_ARGUMENT , "selection must be 'best' or a list of integers" );

  s.best = false;

  for (int i=0; i<tokens.size(); i++)
    {
      int idx = 0;
      if ( ! Helper::str2int( Helper::lrtrim( tokens[i] ) , &idx ) )
	Helper::halt( INVALID_ARGUMENT , "selection must be 'best' or a list of integers (not '"
		      + tokens[i] + "')" );
      s.indices.push_back( idx );
    }

  return s;
}


std::string selection_t::as_string() const
{
  if ( best ) return "best";
  return Helper::stringize( indices );
}


std::vector<std::string> summary_table_t::header() const
{
  std::vector<std::string> h( 1 , "gps" );

  if ( selection.best )
    {
      h.push_back( "culprit" );
      h.push_back( "corr" );
      h.push_back( "mean_freq" );
      return h;
    }

  for (int i=0; i<selection.indices.size(); i++)
    {
      const std::string s = Helper::int2str( selection.indices[i] );
      h.push_back( "culprit_" + s );
      h.push_back( "corr_" + s );
      h.push_back( "mean_freq_" + s );
    }

  return h;
}


std::vector<std::string> summary_table_t::cells( int r , const std::string & na ) const
{
  const summary_row_t & row = rows[r];

  std::vector<std::string> c( 1 , row.window );

  for (int i=0; i<row.entries.size(); i++)
    {
      if ( ! row.present[i] )
	{
	  c.push_back( na );
	  c.push_back( na );
	  c.push_back( na );
	  continue;
	}

      const correlation_t & e = row.entries[i];
      c.push_back( e.channel );
      c.push_back( std::isnan( e.correlation ) ? na : Helper::dbl2str_full( e.correlation ) );
      c.push_back( std::isnan( e.mean_frequency ) ? na : Helper::dbl2str_full( e.mean_frequency ) );
    }

  return c;
}


store_t::store_t( const config_t & config , store_variant_t variant )
  : config( config ) , variant( variant )
{
}


bool store_t::valid( const std::string & folder , std::string * reason ) const
{

  std::string msg;

  if ( ! Helper::fileExists( Helper::join_path( folder , config.record_file ) ) )
    msg = "no " + config.record_file;
  else
    {
      try
	{
	  record_t r = record_t::load( folder , config.record_file );
	  if ( ! r.has_parameters() ) msg = "no parameters in " + config.record_file;
	}
      catch ( const scatter_error_t & e )
	{
	  msg = e.what();
	}
    }

  if ( msg == "" && Helper::glob( folder , "*." + config.predictors_ext ).size() != 1 )
    msg = "expecting exactly one ." + config.predictors_ext + " file";

  if ( msg == "" && variant == VARIANT_IMF && Helper::glob( folder , "*." + config.envelope_ext ).size() != 1 )
    msg = "expecting exactly one ." + config.envelope_ext + " file";

  if ( reason != NULL ) *reason = msg;

  return msg == "";
}


std::vector<std::string> store_t::folders( const std::string & root ,
					   bool filter_non_valid ,
					   const std::vector<std::string> & must_include ,
					   bool sort ) const
{

  std::vector<std::string> all = Helper::list_folders( root );

  std::vector<std::string> res;

  for (int f=0; f<all.size(); f++)
    {

      if ( ! filter_non_valid )
	{
	  res.push_back( all[f] );
	  continue;
	}

      std::string reason;
      if ( ! valid( all[f] , &reason ) )
	{
	  logger << "  skipping " << all[f] << ": " << reason << "\n";
	  continue;
	}

      bool add = true;
      for (int p=0; p<must_include.size(); p++)
	if ( Helper::glob( all[f] , must_include[p] ).size() == 0 )
	  {
	    add = false;
	    break;
	  }

      if ( add ) res.push_back( all[f] );
    }

  if ( sort ) std::sort( res.begin() , res.end() );

  logger << "  found " << res.size() << " of " << all.size() << " folders in " << root << "\n";

  return res;
}


summary_table_t store_t::summary_table( const std::vector<std::string> & folders ,
					const selection_t & selection ,
					anchor_t anchor ) const
{

  summary_table_t table;
  table.selection = selection;
  table.anchor = anchor;

  const int k = selection.size();

  int nmissing = 0;

  for (int f=0; f<folders.size(); f++)
    {

      summary_row_t row;
      row.entries.assign( k , correlation_t() );
      row.present.assign( k , false );

      // window id: from the record if readable, else the folder name
      record_t rec;
      bool readable = false;

      try
	{
	  rec = record_t::load( folders[f] , config.record_file );
	  std::pair<long long,long long> w = rec.window();
	  row.window = Helper::int2str( timeline::anchor_of( w.first , w.second , anchor ) );
	  readable = true;
	}
      catch ( const scatter_error_t & e )
	{
	  logger.warning( "could not read window from " + folders[f] + ": " + e.what() );
	  row.window = Helper::basename( folders[f] );
	}

      if ( readable && valid( folders[f] ) )
	{
	  for (int i=0; i<k; i++)
	    {
	      try
		{
		  row.entries[i] = selection.best ? rec.best() : rec.result( selection.indices[i] );
		  row.present[i] = true;
		}
	      catch ( const scatter_error_t & )
		{
		  ++nmissing;
		}
	    }
	}
      else
	nmissing += k;

      table.rows.push_back( row );
    }

  logger << "  summarised " << table.rows.size() << " windows (" << selection.as_string()
	 << "), " << nmissing << " missing entries\n";

  return table;
}


std::string store_t::write_table( const summary_table_t & table ,
				  const std::string & root ,
				  const std::string & name ) const
{

  const std::string folder = Helper::join_path( root , config.comparison_folder );

  Helper::make_folder( folder );

  const std::string f = Helper::join_path( folder , name );

  std::ofstream O1( f.c_str() , std::ios::out );

  if ( ! O1.good() )
    Helper::halt( IO_ERROR , "could not write " + f );

  O1 << Helper::stringize( table.header() ) << "\n";

  for (int r=0; r<table.rows.size(); r++)
    O1 << Helper::stringize( table.cells( r , config.missing ) ) << "\n";

  O1.close();

  if ( O1.fail() )
    Helper::halt( IO_ERROR , "problem writing " + f );

  logger << "  written " << table.rows.size() << " rows to " << f << "\n";

  return f;
}


std::vector<culprit_count_t> store_t::culprit_counts( const summary_table_t & table ) const
{

  std::map<std::string,culprit_count_t> m;
  std::map<std::string,int> ncorr , nfreq;

  for (int r=0; r<table.rows.size(); r++)
    {
      const summary_row_t & row = table.rows[r];

      if ( row.entries.size() == 0 || ! row.present[0] ) continue;

      const correlation_t & e = row.entries[0];

      culprit_count_t & c = m[ e.channel ];
      c.channel = e.channel;
      ++c.n;

      if ( ! std::isnan( e.correlation ) )
	{
	  c.mean_correlation += e.correlation;
	  ++ncorr[ e.channel ];
	}

      if ( ! std::isnan( e.mean_frequency ) )
	{
	  c.mean_frequency += e.mean_frequency;
	  ++nfreq[ e.channel ];
	}
    }

  std::vector<culprit_count_t> res;

  std::map<std::string,culprit_count_t>::iterator ii = m.begin();
  while ( ii != m.end() )
    {
      culprit_count_t c = ii->second;
      const int nc = ncorr[ c.channel ];
      const int nf = nfreq[ c.channel ];
      c.mean_correlation = nc ? c.mean_correlation / (double)nc : std::nan( "" );
      c.mean_frequency = nf ? c.mean_frequency / (double)nf : std::nan( "" );
      res.push_back( c );
      ++ii;
    }

  // most frequent first; channel order within a count
  std::stable_sort( res.begin() , res.end() ,
		    []( const culprit_count_t & a , const culprit_count_t & b ) { return a.n > b.n; } );

  return res;
}


std::string store_t::counts_name( const std::string & name )
{
  const size_t d = name.rfind( '.' );
  const size_t s = name.rfind( globals::folder_delimiter );

  if ( d == std::string::npos || d == 0 || ( s != std::string::npos && d < s ) )
    return name + ".counts";

  return name.substr( 0 , d ) + ".counts" + name.substr( d );
}


std::string store_t::write_counts( const std::vector<culprit_count_t> & counts ,
				   const std::string & root ,
				   const std::string & name ) const
{

  const std::string folder = Helper::join_path( root , config.comparison_folder );

  Helper::make_folder( folder );

  const std::string f = Helper::join_path( folder , counts_name( name ) );

  std::ofstream O1( f.c_str() , std::ios::out );

  if ( ! O1.good() )
    Helper::halt( IO_ERROR , "could not write " + f );

  O1 << "culprit,n,mean_corr,mean_freq\n";

  for (int i=0; i<counts.size(); i++)
    O1 << counts[i].channel << ","
       << counts[i].n << ","
       << ( std::isnan( counts[i].mean_correlation ) ? config.missing : Helper::dbl2str_full( counts[i].mean_correlation ) ) << ","
       << ( std::isnan( counts[i].mean_frequency ) ? config.missing : Helper::dbl2str_full( counts[i].mean_frequency ) ) << "\n";

  O1.close();

  if ( O1.fail() )
    Helper::halt( IO_ERROR , "problem writing " + f );

  logger << "  written " << counts.size() << " culprit counts to " << f << "\n";

  return f;
}
