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

#pragma once

#include <fc/filesystem.hpp>

#include <boost/program_options.hpp>

namespace rebac { namespace app {

   namespace bpo = boost::program_options;

   /// Registers the node's command line options in @p cli and its config.ini options in @p cfg
   void set_program_options( bpo::options_description& cli, bpo::options_description& cfg );

   /// Writes every option of @p cfg with its description and default value
   void write_default_config( const fc::path& config_ini_path, const bpo::options_description& cfg );

   /**
    * Parses @p config_ini_path into @p options and runs the notifiers.
    * Unknown options are ignored. Throws fc::assert_exception when the file can
    * not be read or a value does not fit its option.
    */
   void load_config_file( const fc::path& config_ini_path, const bpo::options_description& cfg,
                          bpo::variables_map& options );

} } // rebac::app
