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
#include <rebac/protocol/types.hpp>

namespace rebac { namespace app {

   using namespace rebac::protocol;

   /// Caller identity propagated by the gateway in x-md-global-* headers
   struct request_context
   {
      tenant_id_type   tenant_id = 0;
      optional<string> user_id;
      /// Informational, written to the audit log of mutations; roles are resolved by the subject resolver
      string           username;
      vector<string>   role_ids;

      /// The caller's user id when it is numeric, used as granted_by
      optional<user_id_type> grantor()const;
      /// Caller's user id; throws when the request carries none
      const string& require_user()const;
   };

   /// Throws fc::assert_exception when the tenant header is missing or not a positive integer
   request_context extract_context( const http_request& req );

} } // rebac::app

FC_REFLECT( rebac::app::request_context, (tenant_id)(user_id)(username)(role_ids) )
