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

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace rebac { namespace store { class tuple_store; } }

namespace rebac { namespace authz {

   using namespace rebac::protocol;

   /**
    * @brief Answers which tenant a resource belongs to
    *
    * An empty result means the resource has no tenant-of-record yet, which
    * never counts as a mismatch.
    */
   class resource_directory
   {
   public:
      virtual ~resource_directory() = default;

      virtual optional<tenant_id_type> resource_tenant( resource_type resource, const string& resource_id )const = 0;
   };

   /// The tenant under which the resource received its first tuple
   class tuple_resource_directory : public resource_directory
   {
   public:
      explicit tuple_resource_directory( const store::tuple_store& store ) : _store( store ) {}

      optional<tenant_id_type> resource_tenant( resource_type resource, const string& resource_id )const override;

   private:
      const store::tuple_store& _store;
   };

   /// Fixed table, typically mirrored from the resource owner's records
   class static_resource_directory : public resource_directory
   {
   public:
      /// Load {"resources":[{"resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b1","tenantId":1}]}
      static std::unique_ptr<static_resource_directory> from_file( const fc::path& file );

      void set_resource_tenant( resource_type resource, const string& resource_id, tenant_id_type tenant );

      optional<tenant_id_type> resource_tenant( resource_type resource, const string& resource_id )const override;

   private:
      mutable std::mutex                                         _mutex;
      std::map<std::pair<resource_type,string>, tenant_id_type>  _tenants;
   };

} } // rebac::authz
