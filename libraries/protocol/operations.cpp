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

#include <rebac/protocol/operations.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <algorithm>

namespace rebac { namespace protocol {

namespace {

void validate_resource( tenant_id_type tenant_id, resource_type resource, const string& resource_id )
{
   FC_ASSERT( tenant_id > 0, "Tenant id must be positive." );
   REBAC_ASSERT( resource != resource_type::unspecified, resource_type_not_found_exception,
                 "Resource type is not specified.", ("resource_id", resource_id) );
   REBAC_ASSERT( is_valid( resource ), invalid_enum_exception,
                 "Unknown resource type ${r}.", ("r", static_cast<int>(resource)) );
   FC_ASSERT( !resource_id.empty(), "Resource id can not be empty." );
   FC_ASSERT( resource_id.size() <= REBAC_MAX_RESOURCE_ID_LENGTH,
              "Resource id can not be longer than ${n} characters.", ("n", REBAC_MAX_RESOURCE_ID_LENGTH) );
}

void validate_subject( tenant_id_type tenant_id, subject_type subject, const string& subject_id )
{
   REBAC_ASSERT( is_valid( subject ), invalid_enum_exception,
                 "Invalid subject type ${s}.", ("s", static_cast<int>(subject)) );
   FC_ASSERT( !subject_id.empty(), "Subject id can not be empty." );
   FC_ASSERT( subject_id.size() <= REBAC_MAX_SUBJECT_ID_LENGTH,
              "Subject id can not be longer than ${n} characters.", ("n", REBAC_MAX_SUBJECT_ID_LENGTH) );
   REBAC_ASSERT( subject != subject_type::tenant || subject_id == tenant_subject_id( tenant_id ),
                 tenant_mismatch_exception,
                 "Tenant-wide grants may only reference tenant ${t}, got ${s}.",
                 ("t", tenant_id)("s", subject_id) );
}

} // anonymous namespace

void grant_operation::validate()const
{
   validate_resource( tenant_id, resource, resource_id );
   REBAC_ASSERT( is_valid( relation ), invalid_enum_exception,
                 "Invalid relation ${r}.", ("r", static_cast<int>(relation)) );
   validate_subject( tenant_id, subject, subject_id );
}

void revoke_operation::validate()const
{
   validate_resource( tenant_id, resource, resource_id );
   validate_subject( tenant_id, subject, subject_id );
   if( relation.valid() )
      REBAC_ASSERT( is_valid( *relation ), invalid_enum_exception,
                    "Invalid relation ${r}.", ("r", static_cast<int>(*relation)) );
}

void tuple_filter::validate()const
{
   if( resource.valid() )
      REBAC_ASSERT( is_valid( *resource ), invalid_enum_exception,
                    "Invalid resource type ${r}.", ("r", static_cast<int>(*resource)) );
   if( subject.valid() )
      REBAC_ASSERT( is_valid( *subject ), invalid_enum_exception,
                    "Invalid subject type ${s}.", ("s", static_cast<int>(*subject)) );
}

uint32_t page_request::effective_page()const
{
   return std::max<uint32_t>( page, 1 );
}

uint32_t page_request::effective_page_size()const
{
   if( page_size == 0 )
      return REBAC_DEFAULT_PAGE_SIZE;
   return std::min<uint32_t>( page_size, REBAC_MAX_PAGE_SIZE );
}

uint64_t page_request::offset()const
{
   return uint64_t( effective_page() - 1 ) * effective_page_size();
}

} } // rebac::protocol
