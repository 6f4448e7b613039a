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

#include <fc/optional.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace rebac { namespace app {

   /// Transport-independent request handed to the permission API
   struct http_request
   {
      std::string                        method;
      std::string                        path;
      std::map<std::string,std::string>  query;
      std::map<std::string,std::string>  headers; ///< keys lower-cased
      std::string                        body;

      /// Split "path?a=1&b=2" into path and decoded query parameters
      void set_target( const std::string& target );
      void set_header( const std::string& key, const std::string& value );

      fc::optional<std::string> get_header( const std::string& key )const;
      fc::optional<std::string> get_query( const std::string& key )const;
   };

   struct http_response
   {
      uint16_t    status = 200;
      std::string content_type = "application/json";
      std::string body;
   };

   std::string url_decode( const std::string& s );

} } // rebac::app
