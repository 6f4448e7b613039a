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

#include <rebac/authz/subject_resolver.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

namespace rebac { namespace authz {

subject_set subject_resolver::make_subject_set( tenant_id_type tenant, const string& user_id,
                                                const vector<string>& roles )
{
   subject_set subjects;
   subjects.reserve( roles.size() + 2 );
   subjects.insert( subject_ref( subject_type::user, user_id ) );
   for( const auto& role : roles )
   {
      if( !role.empty() )
         subjects.insert( subject_ref( subject_type::role, role ) );
   }
   subjects.insert( subject_ref( subject_type::tenant, tenant_subject_id( tenant ) ) );
   return subjects;
}

std::unique_ptr<static_subject_resolver> static_subject_resolver::from_file( const fc::path& file )
{ try {
   FC_ASSERT( fc::exists( file ), "Membership file ${f} does not exist.", ("f", file.string()) );

   auto resolver = std::make_unique<static_subject_resolver>();
   const fc::variant doc = fc::json::from_file( file );
   FC_ASSERT( doc.is_object(), "Membership file must contain a JSON object." );
   const fc::variant_object& obj = doc.get_object();
   if( !obj.contains( "users" ) )
      return resolver;

   for( const fc::variant& entry : obj["users"].get_array() )
   {
      const fc::variant_object& user = entry.get_object();
      FC_ASSERT( user.contains( "userId" ) && user.contains( "tenantId" ),
                 "Membership entries need userId and tenantId: ${e}", ("e", entry) );
      vector<string> roles;
      if( user.contains( "roles" ) )
      {
         for( const fc::variant& role : user["roles"].get_array() )
            roles.push_back( role.as_string() );
      }
      resolver->set_membership( user["userId"].as_string(),
                                static_cast<tenant_id_type>( user["tenantId"].as_int64() ), roles );
   }
   ilog( "Loaded ${n} static memberships from ${f}", ("n", resolver->_users.size())("f", file.string()) );
   return resolver;
} FC_CAPTURE_AND_RETHROW( (file) ) }

void static_subject_resolver::set_membership( const string& user_id, tenant_id_type tenant,
                                              const vector<string>& roles )
{
   std::lock_guard<std::mutex> guard( _mutex );
   membership& m = _users[user_id];
   m.tenant = tenant;
   m.roles = roles;
}

void static_subject_resolver::remove_user( const string& user_id )
{
   std::lock_guard<std::mutex> guard( _mutex );
   _users.erase( user_id );
}

subject_set static_subject_resolver::resolve_subjects( tenant_id_type tenant, const string& user_id )
{
   REBAC_ASSERT( _available, identity_unavailable_exception,
                 "Identity directory is unavailable.", ("user", user_id) );

   vector<string> roles;
   {
      std::lock_guard<std::mutex> guard( _mutex );
      auto itr = _users.find( user_id );
      if( itr != _users.end() )
      {
         REBAC_ASSERT( itr->second.tenant == tenant, tenant_mismatch_exception,
                       "User ${u} is not a member of tenant ${t}.", ("u", user_id)("t", tenant) );
         roles = itr->second.roles;
      }
   }
   return make_subject_set( tenant, user_id, roles );
}

} } // rebac::authz
