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

#include <rebac/authz/authorization_engine.hpp>
#include <rebac/protocol/exceptions.hpp>
#include <rebac/protocol/relation_model.hpp>

#include <fc/log/logger.hpp>

#include <set>

namespace rebac { namespace authz {

namespace {

   void validate_resource_type( resource_type resource )
   {
      REBAC_ASSERT( resource != resource_type::unspecified, resource_type_not_found_exception,
                    "Resource type is not specified.", ("r", static_cast<int>(resource)) );
      REBAC_ASSERT( is_valid( resource ), invalid_enum_exception,
                    "Invalid resource type ${r}.", ("r", static_cast<int>(resource)) );
   }

   void validate_lookup( tenant_id_type tenant, const string& user_id, resource_type resource )
   {
      FC_ASSERT( tenant > 0, "Tenant id must be positive." );
      FC_ASSERT( !user_id.empty(), "User id can not be empty." );
      validate_resource_type( resource );
   }

   void validate_permission( permission_type permission )
   {
      REBAC_ASSERT( is_valid( permission ), invalid_enum_exception,
                    "Invalid permission ${p}.", ("p", static_cast<int>(permission)) );
   }

} // anonymous namespace

authorization_engine::authorization_engine( store::tuple_store& store, subject_resolver& resolver,
                                            const resource_directory& directory )
   : _store( store ), _resolver( resolver ), _directory( directory )
{
}

fc::time_point_sec authorization_engine::now()const
{
   if( _clock )
      return _clock();
   return fc::time_point_sec( fc::time_point::now() );
}

bool authorization_engine::belongs_to_other_tenant( tenant_id_type tenant, resource_type resource,
                                                    const string& resource_id )const
{
   const auto owner = _directory.resource_tenant( resource, resource_id );
   return owner.valid() && *owner != tenant;
}

void authorization_engine::verify_resource_tenant( tenant_id_type tenant, resource_type resource,
                                                   const string& resource_id )const
{
   REBAC_ASSERT( !belongs_to_other_tenant( tenant, resource, resource_id ), tenant_mismatch_exception,
                 "Resource ${id} does not belong to tenant ${t}.", ("id", resource_id)("t", tenant) );
}

permission_tuple_object authorization_engine::grant( const grant_operation& op )
{ try {
   op.validate();
   verify_resource_tenant( op.tenant_id, op.resource, op.resource_id );

   const auto tuple = _store.upsert( op, now() );
   ilog( "Granted ${rel} on ${id} to ${st}:${sid} in tenant ${t}",
         ("rel", op.relation)("id", op.resource_id)("st", op.subject)("sid", op.subject_id)("t", op.tenant_id) );
   return tuple;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint64_t authorization_engine::revoke( const revoke_operation& op )
{ try {
   op.validate();
   verify_resource_tenant( op.tenant_id, op.resource, op.resource_id );

   const uint64_t removed = _store.remove( op );
   ilog( "Revoked ${n} tuples on ${id} from ${st}:${sid} in tenant ${t}",
         ("n", removed)("id", op.resource_id)("st", op.subject)("sid", op.subject_id)("t", op.tenant_id) );
   return removed;
} FC_CAPTURE_AND_RETHROW( (op) ) }

check_result authorization_engine::check( tenant_id_type tenant, const string& user_id, resource_type resource,
                                          const string& resource_id, permission_type permission )
{ try {
   validate_lookup( tenant, user_id, resource );
   validate_permission( permission );
   FC_ASSERT( !resource_id.empty(), "Resource id can not be empty." );

   dlog( "Checking ${p} of ${u} on ${id}", ("p", permission)("u", user_id)("id", resource_id) );

   check_result result;
   if( belongs_to_other_tenant( tenant, resource, resource_id ) )
   {
      result.reason = denial_reason::tenant_mismatch;
      return result;
   }

   subject_set subjects;
   try
   {
      subjects = _resolver.resolve_subjects( tenant, user_id );
   }
   catch( const tenant_mismatch_exception& e )
   {
      dlog( "${u} is outside tenant ${t}: ${e}", ("u", user_id)("t", tenant)("e", e.to_string()) );
      result.reason = denial_reason::tenant_mismatch;
      return result;
   }

   const auto tuples = _store.find_by_resource( tenant, resource, resource_id, subjects );
   if( tuples.empty() )
   {
      result.reason = denial_reason::no_grant;
      return result;
   }

   const auto head = now();
   bool any_active = false;
   for( const auto& tuple : tuples )
   {
      if( !tuple.is_active( head ) )
         continue;
      any_active = true;
      if( relation_grants( tuple.relation, permission ) )
      {
         result.allowed = true;
         return result;
      }
   }

   result.reason = any_active ? denial_reason::insufficient_relation : denial_reason::expired;
   return result;
} FC_CAPTURE_AND_RETHROW( (tenant)(user_id)(resource)(resource_id)(permission) ) }

accessible_resources authorization_engine::list_accessible_resources( tenant_id_type tenant, const string& user_id,
                                                                      resource_type resource,
                                                                      permission_type permission,
                                                                      const page_request& page )
{ try {
   validate_lookup( tenant, user_id, resource );
   validate_permission( permission );

   const subject_set subjects = _resolver.resolve_subjects( tenant, user_id );
   const auto tuples = _store.find_by_subjects( tenant, resource, subjects );

   const auto head = now();
   std::set<string> ids;
   for( const auto& tuple : tuples )
   {
      if( tuple.is_active( head ) && relation_grants( tuple.relation, permission ) )
         ids.insert( tuple.resource_id );
   }

   accessible_resources result;
   result.total = ids.size();
   const uint64_t offset = page.offset();
   auto itr = ids.begin();
   for( uint64_t skipped = 0; itr != ids.end() && skipped < offset; ++skipped )
      ++itr;
   for( ; itr != ids.end() && result.resource_ids.size() < page.effective_page_size(); ++itr )
      result.resource_ids.push_back( *itr );
   return result;
} FC_CAPTURE_AND_RETHROW( (tenant)(user_id)(resource)(permission)(page) ) }

effective_permissions authorization_engine::get_effective_permissions( tenant_id_type tenant, const string& user_id,
                                                                       resource_type resource,
                                                                       const string& resource_id )
{ try {
   validate_lookup( tenant, user_id, resource );
   FC_ASSERT( !resource_id.empty(), "Resource id can not be empty." );
   verify_resource_tenant( tenant, resource, resource_id );

   const subject_set subjects = _resolver.resolve_subjects( tenant, user_id );
   const auto tuples = _store.find_by_resource( tenant, resource, resource_id, subjects );

   const auto head = now();
   effective_permissions result;
   flat_set<relation_type> relations;
   for( const auto& tuple : tuples )
   {
      if( !tuple.is_active( head ) )
         continue;
      relations.insert( tuple.relation );
      const auto granted = relation_permissions( tuple.relation );
      result.permissions.insert( granted.begin(), granted.end() );
   }
   result.highest_relation = highest_relation( relations );
   return result;
} FC_CAPTURE_AND_RETHROW( (tenant)(user_id)(resource)(resource_id) ) }

tuple_page authorization_engine::list_tuples( tenant_id_type tenant, const tuple_filter& filter,
                                              const page_request& page )const
{ try {
   FC_ASSERT( tenant > 0, "Tenant id must be positive." );
   filter.validate();
   return _store.list( tenant, filter, page );
} FC_CAPTURE_AND_RETHROW( (tenant)(filter)(page) ) }

void authorization_engine::require_permission( tenant_id_type tenant, const string& user_id, resource_type resource,
                                               const string& resource_id, permission_type permission )
{
   const auto result = check( tenant, user_id, resource, resource_id, permission );
   if( !result.allowed )
      FC_THROW_EXCEPTION( permission_denied_exception, "access denied: ${reason}",
                          ("reason", to_token( *result.reason ))("user", user_id)("resource", resource_id)
                          ("permission", to_token( permission )) );
}

uint64_t authorization_engine::revoke_all_for_resource( tenant_id_type tenant, resource_type resource,
                                                        const string& resource_id )
{ try {
   FC_ASSERT( tenant > 0, "Tenant id must be positive." );
   validate_resource_type( resource );
   FC_ASSERT( !resource_id.empty(), "Resource id can not be empty." );
   verify_resource_tenant( tenant, resource, resource_id );

   const uint64_t removed = _store.remove_resource( tenant, resource, resource_id );
   ilog( "Removed ${n} tuples of ${id} in tenant ${t}", ("n", removed)("id", resource_id)("t", tenant) );
   return removed;
} FC_CAPTURE_AND_RETHROW( (tenant)(resource)(resource_id) ) }

uint64_t authorization_engine::purge_expired( tenant_id_type tenant )
{ try {
   FC_ASSERT( tenant > 0, "Tenant id must be positive." );
   return _store.remove_expired( tenant, now() );
} FC_CAPTURE_AND_RETHROW( (tenant) ) }

} } // rebac::authz
