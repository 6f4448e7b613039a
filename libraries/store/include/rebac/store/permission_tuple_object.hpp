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

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>

namespace rebac { namespace store {

   using namespace rebac::protocol;
   using namespace boost::multi_index;

   typedef uint64_t tuple_id_type;

   /**
    * @brief A single grant of a relation between a subject and a resource
    *
    * The tuple is active while it has no expiration or its expiration lies in
    * the future. Expired tuples stay stored until revoked or purged.
    */
   class permission_tuple_object
   {
   public:
      tuple_id_type                id = 0;
      tenant_id_type               tenant_id = 0;
      resource_type                resource = resource_type::unspecified;
      string                       resource_id;
      relation_type                relation = relation_type::unspecified;
      subject_type                 subject = subject_type::unspecified;
      string                       subject_id;
      optional<user_id_type>       granted_by;
      optional<fc::time_point_sec> expires_at;
      fc::time_point_sec           create_time;

      bool is_active( const fc::time_point_sec& now )const
      {
         return !expires_at.valid() || *expires_at > now;
      }

      /// Non-expiring tuples sort last
      fc::time_point_sec expiration_key()const
      {
         return expires_at.valid() ? *expires_at : fc::time_point_sec::maximum();
      }

      subject_ref get_subject()const { return subject_ref( subject, subject_id ); }
   };

   struct by_id;
   struct by_tuple_key;
   struct by_subject;
   struct by_tenant;
   struct by_resource;
   struct by_expiration;

   /**
    * by_tuple_key is the uniqueness constraint and serves forward lookups on
    * (tenant, resource type, resource id). by_subject serves reverse lookups,
    * by_tenant tenant-scoped administration, by_resource the tenant-of-record
    * and by_expiration cleanup.
    */
   typedef multi_index_container<
      permission_tuple_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< permission_tuple_object, tuple_id_type, &permission_tuple_object::id > >,
         ordered_unique< tag<by_tuple_key>,
            composite_key< permission_tuple_object,
               member< permission_tuple_object, tenant_id_type, &permission_tuple_object::tenant_id >,
               member< permission_tuple_object, resource_type,  &permission_tuple_object::resource >,
               member< permission_tuple_object, string,         &permission_tuple_object::resource_id >,
               member< permission_tuple_object, relation_type,  &permission_tuple_object::relation >,
               member< permission_tuple_object, subject_type,   &permission_tuple_object::subject >,
               member< permission_tuple_object, string,         &permission_tuple_object::subject_id >
            >
         >,
         ordered_unique< tag<by_subject>,
            composite_key< permission_tuple_object,
               member< permission_tuple_object, subject_type,   &permission_tuple_object::subject >,
               member< permission_tuple_object, string,         &permission_tuple_object::subject_id >,
               member< permission_tuple_object, tenant_id_type, &permission_tuple_object::tenant_id >,
               member< permission_tuple_object, resource_type,  &permission_tuple_object::resource >,
               member< permission_tuple_object, string,         &permission_tuple_object::resource_id >,
               member< permission_tuple_object, relation_type,  &permission_tuple_object::relation >
            >
         >,
         ordered_unique< tag<by_tenant>,
            composite_key< permission_tuple_object,
               member< permission_tuple_object, tenant_id_type, &permission_tuple_object::tenant_id >,
               member< permission_tuple_object, tuple_id_type,  &permission_tuple_object::id >
            >
         >,
         ordered_unique< tag<by_resource>,
            composite_key< permission_tuple_object,
               member< permission_tuple_object, resource_type,  &permission_tuple_object::resource >,
               member< permission_tuple_object, string,         &permission_tuple_object::resource_id >,
               member< permission_tuple_object, tuple_id_type,  &permission_tuple_object::id >
            >
         >,
         ordered_unique< tag<by_expiration>,
            composite_key< permission_tuple_object,
               const_mem_fun< permission_tuple_object, fc::time_point_sec, &permission_tuple_object::expiration_key >,
               member< permission_tuple_object, tuple_id_type, &permission_tuple_object::id >
            >
         >
      >
   > permission_tuple_index_type;

} } // rebac::store

FC_REFLECT( rebac::store::permission_tuple_object,
            (id)(tenant_id)(resource)(resource_id)(relation)(subject)(subject_id)
            (granted_by)(expires_at)(create_time) )
