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

#include <rebac/authz/authorization_engine.hpp>

#include <fc/variant_object.hpp>

namespace rebac { namespace app {

   using namespace rebac::protocol;
   using rebac::store::permission_tuple_object;

   /**
    * JSON shapes of the /permissions endpoints. Field names are camelCase,
    * enumerations travel as their tokens and timestamps as ISO-8601 UTC.
    */
   /// @{
   fc::variant to_wire( const permission_tuple_object& tuple );
   fc::variant to_wire( const rebac::store::tuple_page& page );
   fc::variant to_wire( const rebac::authz::check_result& result );
   fc::variant to_wire( const rebac::authz::accessible_resources& result );
   fc::variant to_wire( const rebac::authz::effective_permissions& result );
   /// @}

   /// Body of POST /permissions; tenant and grantor come from the request context
   grant_operation grant_from_wire( const fc::variant_object& body, tenant_id_type tenant,
                                    const optional<user_id_type>& granted_by );

   /// Body of POST /permissions/check
   struct check_request
   {
      optional<string> user_id;
      resource_type    resource = resource_type::unspecified;
      string           resource_id;
      permission_type  permission = permission_type::unspecified;
   };

   check_request check_from_wire( const fc::variant_object& body );

   /// Throws fc::assert_exception when the body is not a JSON object
   fc::variant_object parse_body( const string& body );

} } // rebac::app

FC_REFLECT( rebac::app::check_request, (user_id)(resource)(resource_id)(permission) )
