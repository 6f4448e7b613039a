/*
 * Copyright (c) 2020-2023 Revolution Populi Limited, and contributors.
 * 
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include <rebac/app/http_server.hpp>
#include <rebac/app/node_config.hpp>
#include <rebac/app/permission_api.hpp>
#include <rebac/authz/authorization_engine.hpp>
#include <rebac/authz/identity_subject_resolver.hpp>
#include <rebac/authz/resource_directory.hpp>
#include <rebac/authz/subject_resolver.hpp>
#include <rebac/store/tuple_store.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/interprocess/signals.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/thread/thread.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <curl/curl.h>

#include <csignal>
#include <iostream>

using namespace rebac;
namespace bpo = boost::program_options;

namespace {

void configure_logging( const std::string& level )
{
   fc::logging_config logging_config;

   fc::console_appender::config console_appender_config;
   console_appender_config.level_colors.emplace_back(
      fc::console_appender::level_color( fc::log_level::debug, fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
      fc::console_appender::level_color( fc::log_level::warn, fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
      fc::console_appender::level_color( fc::log_level::error, fc::console_appender::color::red ) );
   console_appender_config.stream = fc::console_appender::stream::std_error;
   logging_config.appenders.push_back(
      fc::appender_config( "stderr", "console", fc::variant( console_appender_config, 20 ) ) );

   fc::logger_config logger_config( "default" );
   logger_config.level = fc::variant( level ).as<fc::log_level>( 1 );
   logger_config.appenders.push_back( "stderr" );
   logging_config.loggers.push_back( logger_config );

   fc::configure_logging( logging_config );
}

std::unique_ptr<authz::subject_resolver> make_subject_resolver( const bpo::variables_map& options )
{
   if( options.count( "identity-url" ) )
   {
      const auto url = options["identity-url"].as<std::string>();
      const auto timeout = options["identity-timeout-ms"].as<uint32_t>();
      ilog( "Resolving subjects through identity directory ${u} (timeout ${t} ms)", ("u", url)("t", timeout) );
      return std::unique_ptr<authz::subject_resolver>( new authz::identity_subject_resolver( url, timeout ) );
   }
   if( options.count( "identity-static-file" ) )
   {
      const fc::path file = options["identity-static-file"].as<boost::filesystem::path>();
      ilog( "Resolving subjects from membership table ${f}", ("f", file) );
      return authz::static_subject_resolver::from_file( file );
   }
   wlog( "Neither identity-url nor identity-static-file is set, callers resolve to user and tenant subjects only" );
   return std::unique_ptr<authz::subject_resolver>( new authz::static_subject_resolver() );
}

std::unique_ptr<authz::resource_directory> make_resource_directory( const bpo::variables_map& options,
                                                                    const store::tuple_store& tuples )
{
   if( options.count( "resource-directory-file" ) )
   {
      const fc::path file = options["resource-directory-file"].as<boost::filesystem::path>();
      ilog( "Loading tenant-of-record table ${f}", ("f", file) );
      return authz::static_resource_directory::from_file( file );
   }
   return std::unique_ptr<authz::resource_directory>( new authz::tuple_resource_directory( tuples ) );
}

} // anonymous namespace

int main( int argc, char** argv )
{
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options( "ReBAC authorization node" );
      bpo::options_description cfg_options( "ReBAC authorization node" );
      bpo::options_description cli, cfg;
      app::set_program_options( cli, cfg );
      app_options.add( cli );
      app_options.add( cfg );
      cfg_options.add( cfg );

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
      }
      catch( const boost::program_options::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count( "help" ) )
      {
         std::cout << app_options << "\n";
         return 0;
      }

      fc::path data_dir = options["data-dir"].as<boost::filesystem::path>();
      if( data_dir.is_relative() )
         data_dir = fc::current_path() / data_dir;
      if( !fc::exists( data_dir ) )
         fc::create_directories( data_dir );

      const fc::path config_ini_path = data_dir / "config.ini";
      if( !fc::exists( config_ini_path ) )
      {
         std::cerr << "Writing new config file at " << config_ini_path.preferred_string() << "\n";
         app::write_default_config( config_ini_path, cfg_options );
      }
      app::load_config_file( config_ini_path, cfg_options, options );

      configure_logging( options["log-level"].as<std::string>() );

      FC_ASSERT( curl_global_init( CURL_GLOBAL_ALL ) == CURLE_OK, "Unable to initialize libcurl" );

      store::tuple_store tuples;
      tuples.set_flush_on_write( options["flush-on-write"].as<bool>() );
      tuples.open( data_dir );

      auto resolver  = make_subject_resolver( options );
      auto directory = make_resource_directory( options, tuples );
      authz::authorization_engine engine( tuples, *resolver, *directory );

      app::permission_api_options api_options;
      api_options.enforce_share_on_grant = options["enforce-share-on-grant"].as<bool>();
      app::permission_api api( engine, api_options );

      app::http_server server( api );
      server.listen( options["http-endpoint"].as<std::string>() );

      fc::promise<int>::ptr exit_promise = fc::promise<int>::create( "UNIX Signal Handler" );

      fc::set_signal_handler( [&exit_promise]( int the_signal ) {
         wlog( "Caught SIGINT, attempting to exit cleanly" );
         exit_promise->set_value( the_signal );
      }, SIGINT );

      fc::set_signal_handler( [&exit_promise]( int the_signal ) {
         wlog( "Caught SIGTERM, attempting to exit cleanly" );
         exit_promise->set_value( the_signal );
      }, SIGTERM );

      ilog( "Started authorization node with ${n} permission tuples in ${d}", ("n", tuples.size())("d", data_dir) );

      int the_signal = exit_promise->wait();
      ilog( "Exiting from signal ${n}", ("n", the_signal) );

      tuples.close();
      curl_global_cleanup();
      return 0;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   } catch( const std::exception& e ) {
      unhandled_exception = fc::std_exception_wrapper::from_current_exception( e );
   }

   if( unhandled_exception )
   {
      elog( "Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()) );
      curl_global_cleanup();
      return 1;
   }
   return 0;
}
