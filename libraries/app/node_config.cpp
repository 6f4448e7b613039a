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

#include <rebac/app/node_config.hpp>
#include <rebac/protocol/config.hpp>

#include <fc/exception/exception.hpp>

#include <boost/filesystem/path.hpp>

#include <fstream>

namespace rebac { namespace app {

void set_program_options( bpo::options_description& cli, bpo::options_description& cfg )
{
   cli.add_options()
         ("help,h", "Print this help message and exit.")
         ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value( "authz_node_data_dir" ),
          "Directory containing the tuple snapshot and config.ini")
         ;
   cfg.add_options()
         ("http-endpoint", bpo::value<std::string>()->default_value( REBAC_DEFAULT_HTTP_ENDPOINT ),
          "Endpoint for the /permissions REST API to listen on")
         ("identity-url", bpo::value<std::string>(),
          "Base URL of the identity directory resolving user roles and tenant membership")
         ("identity-timeout-ms", bpo::value<uint32_t>()->default_value( REBAC_DEFAULT_IDENTITY_TIMEOUT_MS ),
          "Timeout of a single identity directory request, in milliseconds")
         ("identity-static-file", bpo::value<boost::filesystem::path>(),
          "JSON file with a fixed membership table, used when identity-url is not set")
         ("resource-directory-file", bpo::value<boost::filesystem::path>(),
          "JSON file mapping resources to their tenant; by default a resource belongs to the tenant of its first grant")
         ("enforce-share-on-grant", bpo::value<bool>()->default_value( false ),
          "Require SHARE on the resource to grant or revoke through the REST API")
         ("flush-on-write", bpo::value<bool>()->default_value( true ),
          "Write the tuple snapshot after every grant and revoke")
         ("log-level", bpo::value<std::string>()->default_value( "info" ),
          "Level of the default logger (all, debug, info, warn, error, off)")
         ;
}

void write_default_config( const fc::path& config_ini_path, const bpo::options_description& cfg )
{
   std::ofstream out_cfg( config_ini_path.preferred_string() );
   FC_ASSERT( out_cfg.good(), "Unable to create ${f}", ("f", config_ini_path) );
   for( const boost::shared_ptr<bpo::option_description>& od : cfg.options() )
   {
      if( !od->description().empty() )
         out_cfg << "# " << od->description() << "\n";
      boost::any store;
      if( !od->semantic()->apply_default( store ) )
         out_cfg << "# " << od->long_name() << " = \n";
      else
      {
         // The string is formatted "arg (=<interesting part>)"
         auto example = od->format_parameter();
         example.erase( 0, 6 );
         example.erase( example.length() - 1 );
         out_cfg << od->long_name() << " = " << example << "\n";
      }
      out_cfg << "\n";
   }
}

void load_config_file( const fc::path& config_ini_path, const bpo::options_description& cfg,
                       bpo::variables_map& options )
{
   try
   {
      bpo::store( bpo::parse_config_file<char>( config_ini_path.preferred_string().c_str(), cfg, true ), options );
      bpo::notify( options );
   }
   catch( const bpo::error& e )
   {
      FC_THROW_EXCEPTION( fc::assert_exception, "Error parsing ${f}: ${e}", ("f", config_ini_path)("e", e.what()) );
   }
}

} } // rebac::app
