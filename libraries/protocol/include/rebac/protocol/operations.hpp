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

namespace rebac { namespace protocol {

   /**
    * @brief Grant a relation on a resource to a subject
    *
    * Applying the operation twice with the same key leaves one tuple whose
    * expiration and grantor come from the latest application.
    */
   struct grant_operation
   {
      tenant_id_type          tenant_id = 0;
      resource_type           resource = resource_type::unspecified;
      string                  resource_id;
      relation_type           relation = relation_type::unspecified;
      subject_type            subject = subject_type::unspecified;
      string                  subject_id;
      optional<user_id_type>  granted_by;
      optional<fc::time_point_sec> expires_at;

      void validate()const;
   };

   /**
    * @brief Remove a relation (or every relation when none is given) held by
    * a subject on a resource
    */
   struct revoke_operation
   {
      tenant_id_type          tenant_id = 0;
      resource_type           resource = resource_type::unspecified;
      string                  resource_id;
      subject_type            subject = subject_type::unspecified;
      string                  subject_id;
      optional<relation_type> relation;

      void validate()const;
   };

   /// Optional filters of the administrative tuple listing
   struct tuple_filter
   {
      optional<resource_type> resource;
      optional<string>        resource_id;
      optional<subject_type>  subject;
      optional<string>        subject_id;

      void validate()const;
   };

   /// 1-based page; zero values fall back to the defaults
   struct page_request
   {
      uint32_t page = 1;
      uint32_t page_size = REBAC_DEFAULT_PAGE_SIZE;

      page_request() = default;
      page_request( uint32_t p, uint32_t s ) : page(p), page_size(s) {}

      uint32_t effective_page()const;
      uint32_t effective_page_size()const;
      uint64_t offset()const;
   };

} } // rebac::protocol

FC_REFLECT( rebac::protocol::grant_operation,
            (tenant_id)(resource)(resource_id)(relation)(subject)(subject_id)(granted_by)(expires_at) )
FC_REFLECT( rebac::protocol::revoke_operation,
            (tenant_id)(resource)(resource_id)(subject)(subject_id)(relation) )
FC_REFLECT( rebac::protocol::tuple_filter, (resource)(resource_id)(subject)(subject_id) )
FC_REFLECT( rebac::protocol::page_request, (page)(page_size) )
