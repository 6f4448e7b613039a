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

#include <rebac/protocol/types.hpp>

#include <fc/filesystem.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace rebac { namespace authz {

   using namespace rebac::protocol;

   /**
    * @brief Expands a requesting user into the subjects a tuple may name
    *
    * The set holds exactly (user, user_id), (role, r) for every role the user
    * holds in the tenant, and (tenant, "<tenant>").
    *
    * Implementations throw identity_unavailable_exception when membership
    * cannot be determined and tenant_mismatch_exception when the user is not a
    * member of the tenant. Neither is ever reported as an empty set.
    */
   class subject_resolver
   {
   public:
      subject_resolver() = default;
      virtual ~subject_resolver() = default;

      virtual subject_set resolve_subjects( tenant_id_type tenant, const string& user_id ) = 0;

   protected:
      static subject_set make_subject_set( tenant_id_type tenant, const string& user_id,
                                           const vector<string>& roles );
   };

   /**
    * @brief Subject resolver backed by a fixed membership table
    *
    * Users absent from the table are members of whichever tenant asks, with
    * no roles.
    */
   class static_subject_resolver : public subject_resolver
   {
   public:
      static_subject_resolver() = default;

      /**
       * Load {"users":[{"userId":"u1","tenantId":1,"roles":["team"]}, ...]}
       */
      static std::unique_ptr<static_subject_resolver> from_file( const fc::path& file );

      void set_membership( const string& user_id, tenant_id_type tenant, const vector<string>& roles );
      void remove_user( const string& user_id );

      /// While unavailable every resolution fails with identity_unavailable_exception
      void set_available( bool available ) { _available = available; }

      subject_set resolve_subjects( tenant_id_type tenant, const string& user_id ) override;

   private:
      struct membership
      {
         tenant_id_type tenant = 0;
         vector<string> roles;
      };

      std::mutex                 _mutex;
      std::map<string,membership> _users;
      std::atomic<bool>          _available{ true };
   };

} } // rebac::authz
