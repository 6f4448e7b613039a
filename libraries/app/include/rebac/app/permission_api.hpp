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

#include <rebac/app/http_message.hpp>
#include <rebac/authz/authorization_engine.hpp>

#include <fc/exception/exception.hpp>

#include <memory>

namespace rebac { namespace app {

   namespace detail { class permission_api_impl; }

   struct permission_api_options
   {
      /// Grant and revoke require the caller to hold SHARE on the resource
      bool enforce_share_on_grant = false;
   };

   /**
    * @class permission_api
    * @brief REST facade of the authorization engine
    *
    * Serves the /permissions endpoints. The caller's tenant and identity are
    * taken from the x-md-global-* headers set by the gateway. handle() never
    * throws: failures are rendered as {code, name, message} with the HTTP
    * status of their exception type.
    */
   class permission_api
   {
   public:
      permission_api( authz::authorization_engine& engine,
                      const permission_api_options& options = permission_api_options() );
      virtual ~permission_api();

      http_response handle( const http_request& req )const;

   private:
      std::shared_ptr<detail::permission_api_impl> my;
   };

   /// HTTP status for an exception raised while serving a request
   uint16_t http_status_for( const fc::exception& e );

} } // rebac::app

FC_REFLECT( rebac::app::permission_api_options, (enforce_share_on_grant) )
