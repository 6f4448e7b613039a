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

#include <rebac/protocol/operations.hpp>
#include <rebac/store/permission_tuple_object.hpp>

#include <fc/filesystem.hpp>

#include <shared_mutex>
#include <utility>

namespace rebac { namespace store {

   /// One page of the administrative listing plus the unpaged count
   struct tuple_page
   {
      vector<permission_tuple_object> tuples;
      uint64_t                        total = 0;
   };

   /**
    * @class tuple_store
    * @brief Owns every permission tuple row
    *
    * The rows live in a multi-index container guarded by a reader/writer
    * lock. Each mutation is a single critical section on the unique key and
    * is written through to a JSON snapshot in the data directory when
    * flush-on-write is set. A mutation whose snapshot cannot be written is
    * rolled back and reported as store_unavailable_exception.
    *
    * A store that was never opened keeps its rows in memory only.
    */
   class tuple_store
   {
   public:
      tuple_store();
      ~tuple_store();

      /// Load the snapshot from @p data_dir, creating the directory if needed
      void open( const fc::path& data_dir );
      /// Write the snapshot and detach from the data directory
      void close();
      void flush();

      void set_flush_on_write( bool flush ) { _flush_on_write = flush; }

      /// Resource types the store accepts; bookmark by default
      void set_resource_types( const flat_set<resource_type>& types );
      bool knows_resource_type( resource_type t )const;

      /**
       * Insert the tuple, or replace expires_at and granted_by of the tuple
       * already stored under the same key. id and create_time of an existing
       * tuple are kept.
       */
      permission_tuple_object upsert( const grant_operation& op, const fc::time_point_sec& now );

      /// @return number of tuples removed, zero when nothing matched
      uint64_t remove( const revoke_operation& op );
      uint64_t remove_resource( tenant_id_type tenant, resource_type resource, const string& resource_id );
      uint64_t remove_expired( tenant_id_type tenant, const fc::time_point_sec& now );

      /// Every tuple (expired included) on the resource held by one of @p subjects
      vector<permission_tuple_object> find_by_resource( tenant_id_type tenant, resource_type resource,
                                                        const string& resource_id,
                                                        const subject_set& subjects )const;

      /// Every tuple (expired included) of the given type held by one of @p subjects
      vector<permission_tuple_object> find_by_subjects( tenant_id_type tenant, resource_type resource,
                                                        const subject_set& subjects )const;

      /// Tenant of the earliest tuple stored for the resource
      optional<tenant_id_type> resource_tenant( resource_type resource, const string& resource_id )const;

      /// Ordered by create_time then id, newest first
      tuple_page list( tenant_id_type tenant, const tuple_filter& filter, const page_request& page )const;

      optional<permission_tuple_object> find( tuple_id_type id )const;
      size_t size()const;

   private:
      /// Snapshot when flush-on-write is set. Caller holds the write lock.
      void persist();
      void write_snapshot();

      mutable std::shared_timed_mutex _mutex;
      permission_tuple_index_type     _tuples;
      tuple_id_type                   _next_id = 1;
      flat_set<resource_type>         _resource_types;
      optional<fc::path>              _data_dir;
      bool                            _flush_on_write = true;
   };

} } // rebac::store
