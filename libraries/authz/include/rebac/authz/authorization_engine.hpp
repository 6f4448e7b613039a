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

#include <rebac/authz/resource_directory.hpp>
#include <rebac/authz/subject_resolver.hpp>
#include <rebac/protocol/operations.hpp>
#include <rebac/store/tuple_store.hpp>

#include <functional>

namespace rebac { namespace authz {

   using store::permission_tuple_object;
   using store::tuple_page;

   /// Denial carries a reason; a granted check carries none
   struct check_result
   {
      bool                    allowed = false;
      optional<denial_reason> reason;
   };

   struct accessible_resources
   {
      vector<string> resource_ids;
      uint64_t       total = 0;
   };

   struct effective_permissions
   {
      permission_set permissions;
      relation_type  highest_relation = relation_type::unspecified;
   };

   /**
    * @class authorization_engine
    * @brief Grants, revokes and evaluates permission tuples for one tuple store
    *
    * Every operation is scoped to the caller's tenant. A resource whose
    * tenant-of-record is another tenant, or a user who is not a member of the
    * tenant, is rejected before any tuple lookup: check() reports it as a
    * tenant_mismatch denial, every other operation throws
    * tenant_mismatch_exception.
    *
    * Failures of the subject resolver and of the store propagate unchanged
    * and are never turned into a denial. The engine holds no state of its own
    * besides its collaborators, which must outlive it.
    */
   class authorization_engine
   {
   public:
      typedef std::function<fc::time_point_sec()> clock_type;

      authorization_engine( store::tuple_store& store, subject_resolver& resolver,
                            const resource_directory& directory );

      /// Upsert on the unique key. Insert and update are not distinguished.
      permission_tuple_object grant( const grant_operation& op );

      /// @return tuples removed; revoking a missing grant returns 0
      uint64_t revoke( const revoke_operation& op );

      check_result check( tenant_id_type tenant, const string& user_id, resource_type resource,
                          const string& resource_id, permission_type permission );

      /// Distinct resource ids in ascending order, one page of them, plus the distinct total
      accessible_resources list_accessible_resources( tenant_id_type tenant, const string& user_id,
                                                      resource_type resource, permission_type permission,
                                                      const page_request& page = page_request() );

      /**
       * For rendering only. Callers about to act on a resource must use
       * check(), which evaluates against the state at the time of the action.
       */
      effective_permissions get_effective_permissions( tenant_id_type tenant, const string& user_id,
                                                       resource_type resource, const string& resource_id );

      /// Administrative listing; expired tuples are included
      tuple_page list_tuples( tenant_id_type tenant, const tuple_filter& filter,
                              const page_request& page = page_request() )const;

      /// Throws permission_denied_exception naming the denial reason
      void require_permission( tenant_id_type tenant, const string& user_id, resource_type resource,
                               const string& resource_id, permission_type permission );

      uint64_t revoke_all_for_resource( tenant_id_type tenant, resource_type resource, const string& resource_id );

      /// Remove the tenant's tuples whose expiration has passed
      uint64_t purge_expired( tenant_id_type tenant );

      void set_clock( clock_type clock ) { _clock = std::move( clock ); }
      fc::time_point_sec now()const;

   private:
      bool belongs_to_other_tenant( tenant_id_type tenant, resource_type resource, const string& resource_id )const;
      void verify_resource_tenant( tenant_id_type tenant, resource_type resource, const string& resource_id )const;

      store::tuple_store&       _store;
      subject_resolver&         _resolver;
      const resource_directory& _directory;
      clock_type                _clock;
   };

} } // rebac::authz

FC_REFLECT( rebac::authz::check_result, (allowed)(reason) )
FC_REFLECT( rebac::authz::accessible_resources, (resource_ids)(total) )
FC_REFLECT( rebac::authz::effective_permissions, (permissions)(highest_relation) )
