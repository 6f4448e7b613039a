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

#include <rebac/app/permission_api.hpp>

#include <fc/network/http/server.hpp>
#include <fc/network/ip.hpp>

#include <memory>
#include <string>

namespace rebac { namespace app {

   /**
    * @brief Binds a permission_api to an fc HTTP listener
    *
    * The api must outlive the server.
    */
   class http_server
   {
   public:
      explicit http_server( const permission_api& api );
      ~http_server();

      /// @param endpoint "host:port"
      void listen( const std::string& endpoint );
      fc::ip::endpoint local_endpoint()const;

   private:
      void on_request( const fc::http::request& req, const fc::http::server::response& res )const;

      const permission_api&            _api;
      std::unique_ptr<fc::http::server> _server;
   };

} } // rebac::app
