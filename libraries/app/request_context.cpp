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

#include <rebac/app/request_context.hpp>

#include <fc/exception/exception.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace rebac { namespace app {

optional<user_id_type> request_context::grantor()const
{
   if( !user_id.valid() )
      return optional<user_id_type>();
   try
   {
      return boost::lexical_cast<user_id_type>( *user_id );
   }
   catch( const boost::bad_lexical_cast& )
   {
      return optional<user_id_type>();
   }
}

const string& request_context::require_user()const
{
   FC_ASSERT( user_id.valid(), "Request carries no ${h} header.", ("h", REBAC_HEADER_USER_ID) );
   return *user_id;
}

request_context extract_context( const http_request& req )
{
   request_context ctx;

   const auto tenant = req.get_header( REBAC_HEADER_TENANT_ID );
   FC_ASSERT( tenant.valid(), "Request carries no ${h} header.", ("h", REBAC_HEADER_TENANT_ID) );
   try
   {
      ctx.tenant_id = boost::lexical_cast<tenant_id_type>( boost::algorithm::trim_copy( *tenant ) );
   }
   catch( const boost::bad_lexical_cast& )
   {
      FC_THROW_EXCEPTION( fc::assert_exception, "Invalid tenant id '${t}'", ("t", *tenant) );
   }
   FC_ASSERT( ctx.tenant_id > 0, "Tenant id must be positive." );

   const auto user = req.get_header( REBAC_HEADER_USER_ID );
   if( user.valid() && !user->empty() )
      ctx.user_id = *user;

   const auto username = req.get_header( REBAC_HEADER_USERNAME );
   if( username.valid() )
      ctx.username = *username;

   const auto roles = req.get_header( REBAC_HEADER_ROLES );
   if( roles.valid() )
   {
      vector<string> parts;
      boost::split( parts, *roles, boost::is_any_of( "," ) );
      for( auto& role : parts )
      {
         boost::algorithm::trim( role );
         if( !role.empty() )
            ctx.role_ids.push_back( role );
      }
   }
   return ctx;
}

} } // rebac::app
