

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

#include "scatter.h"
#include "main.h"

#include <cstring>
#include <cstdlib>
#include <iostream>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << scatter_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "FFTW " << fftw_version << "\n";
      std::cerr << src_get_version() << "\n";
      std::cerr << "nlohmann json v"
		<< NLOHMANN_JSON_VERSION_MAJOR << "."
		<< NLOHMANN_JSON_VERSION_MINOR << "."
		<< NLOHMANN_JSON_VERSION_PATCH << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = scatter_version() +
    "primary usage: scatter gps=T dur=S target=CH channels=FILE out=DIR lowpass=F|average|max\n"
    "                       [archive=DIR] [event=start|center|end] [fs=256] [bounce=1] [smooth=50]\n"
    "                       [rank=1] [check-lock] [no-data] [converter=fastest]\n"
    "                       [log=FILE] [silent] [@param-file]\n"
    "       summary: scatter --summary root=DIR table=NAME.csv [select=best|1,2,...]\n"
    "                       [event=center] [must-include=GLOB,...] [variant=raw|imf] [all]\n";

  if ( argc == 1 )
    {
      logger << usage_msg << "\n";
      logger.off();
      std::exit(1);
    }

  const bool summary = strcmp( argv[1] , "--summary" ) == 0;

  try
    {

      param_t param;

      build_param( &param , argc , argv , summary ? 2 : 1 );

      if ( param.yesno( "silent" ) ) globals::silent = true;

      if ( param.has( "log" ) ) logger.write_log( param.requires( "log" ) );

      logger.banner( globals::version , globals::date );

      logger << "  options:\n" << param.dump( "    " , "\n" ) << "\n";

      const config_t config = config_t::from_param( param );

      globals::retcode = summary ? proc_summary( param , config ) : proc_analysis( param , config );

    }
  catch ( const scatter_error_t & e )
    {
      std::cerr << "error : " << e.what() << "\n";
      logger.off();
      std::exit( 1 );
    }

  std::exit( globals::retcode );

}


void build_param( param_t * param , int argc , char** argv , int from )
{
  for (int i=from; i<argc; i++)
    {
      const std::string tok = argv[i];
      if ( tok.size() > 1 && tok[0] == '@' )
	param->parse_file( tok.substr(1) );
      else
	param->parse( tok );
    }
}


int proc_analysis( const param_t & param , const config_t & config )
{

  const analysis_request_t req = analysis_request_t::from_param( param , config );

  int converter = SRC_SINC_FASTEST;
  if ( param.has( "converter" ) )
    {
      converter = dsptools::converter( param.value( "converter" ) );
      if ( converter == -1 )
	Helper::halt( INVALID_ARGUMENT , "converter must be one of: best, medium, fastest, zoh, linear" );
    }

  logger << "  reading channels from " << ( req.archive == "" ? "." : req.archive )
	 << " (" << req.channels.size() << " candidates in " << req.channels_list << ")\n";

  // text archive: channel data and lock state
  archive_t archive( req.archive , converter );

  spectral_mean_frequency_t meanfreq( archive , req.archive , req.sr , config.filter_order );

  analysis_t engine( config , archive , meanfreq , &archive );

  outcome_t outcome = engine.run( req );

  if ( ! outcome.is_completed() )
    {
      std::cout << "skipped: " << outcome.reason << "\n";
      return 0;
    }

  const correlation_t best = outcome.record.best();

  std::cout << best.channel << "\t"
	    << best.correlation << "\t"
	    << best.mean_frequency << "\t"
	    << outcome.folder << "\n";

  return 0;
}


int proc_summary( const param_t & param , const config_t & config )
{

  const std::string root = param.requires( "root" );

  const std::string name = param.requires( "table" );

  const selection_t selection = param.has( "select" )
    ? selection_t::parse( param.strvector( "select" ) )
    : selection_t();

  const anchor_t anchor = param.has( "event" ) ? globals::anchor( param.value( "event" ) ) : ANCHOR_CENTER;

  store_variant_t variant = VARIANT_RAW;
  if ( param.has( "variant" ) )
    {
      const std::string v = param.value( "variant" );
      if ( v == "imf" ) variant = VARIANT_IMF;
      else if ( v != "raw" ) Helper::halt( INVALID_ARGUMENT , "variant must be raw or imf" );
    }

  std::vector<std::string> must_include;
  if ( param.has( "must-include" ) ) must_include = param.strvector( "must-include" );

  const bool filter = ! param.yesno( "all" );

  logger << "  summarising " << root << " (" << selection.as_string() << ", "
	 << globals::anchor( anchor ) << " anchor)\n";

  store_t store( config , variant );

  std::vector<std::string> folders = store.folders( root , filter , must_include , true );

  if ( folders.size() == 0 )
    {
      logger.warning( "no result folders in " + root );
      return 0;
    }

  summary_table_t table = store.summary_table( folders , selection , anchor );

  std::cout << store.write_table( table , root , name ) << "\n";

  std::cout << store.write_counts( store.culprit_counts( table ) , root , name ) << "\n";

  return 0;
}


std::string scatter_version()
{
  std::stringstream ss;
  ss << "scatter version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "scatter build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
