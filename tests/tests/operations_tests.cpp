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

#include <boost/test/unit_test.hpp>

#include <rebac/protocol/exceptions.hpp>
#include <rebac/protocol/operations.hpp>

#include "../common/authz_fixture.hpp"

using namespace rebac::protocol;

namespace {

grant_operation make_grant()
{
   grant_operation op;
   op.tenant_id   = 7;
   op.resource    = resource_type::bookmark;
   op.resource_id = "8a5c2f34-0d8e-4f5b-9e8a-2b7f3c1d4e5f";
   op.relation    = relation_type::editor;
   op.subject     = subject_type::user;
   op.subject_id  = "42";
   return op;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE( operations_tests )

BOOST_AUTO_TEST_CASE( grant_validation )
{ try {
   make_grant().validate();

   auto op = make_grant();
   op.tenant_id = 0;
   REBAC_REQUIRE_THROW( op.validate(), fc::assert_exception );

   op = make_grant();
   op.resource = resource_type::unspecified;
   REBAC_REQUIRE_THROW( op.validate(), resource_type_not_found_exception );

   op = make_grant();
   op.resource = static_cast<resource_type>( 17 );
   REBAC_REQUIRE_THROW( op.validate(), invalid_enum_exception );

   op = make_grant();
   op.relation = relation_type::unspecified;
   REBAC_REQUIRE_THROW( op.validate(), invalid_enum_exception );

   op = make_grant();
   op.subject = subject_type::unspecified;
   REBAC_REQUIRE_THROW( op.validate(), invalid_enum_exception );

   op = make_grant();
   op.resource_id.clear();
   REBAC_REQUIRE_THROW( op.validate(), fc::assert_exception );

   op = make_grant();
   op.resource_id = string( REBAC_MAX_RESOURCE_ID_LENGTH + 1, 'a' );
   REBAC_REQUIRE_THROW( op.validate(), fc::assert_exception );

   op = make_grant();
   op.subject_id = string( REBAC_MAX_SUBJECT_ID_LENGTH, 'u' );
   op.validate();
   op.subject_id.clear();
   REBAC_REQUIRE_THROW( op.validate(), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( tenant_subject_must_name_own_tenant )
{ try {
   auto op = make_grant();
   op.subject = subject_type::tenant;
   op.subject_id = "7";
   op.validate();

   op.subject_id = "8";
   REBAC_REQUIRE_THROW( op.validate(), tenant_mismatch_exception );

   revoke_operation rop;
   rop.tenant_id   = 7;
   rop.resource    = resource_type::bookmark;
   rop.resource_id = "b1";
   rop.subject     = subject_type::tenant;
   rop.subject_id  = "9";
   REBAC_REQUIRE_THROW( rop.validate(), tenant_mismatch_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( revoke_validation )
{ try {
   revoke_operation op;
   op.tenant_id   = 1;
   op.resource    = resource_type::bookmark;
   op.resource_id = "b1";
   op.subject     = subject_type::role;
   op.subject_id  = "team";
   op.validate();

   op.relation = relation_type::viewer;
   op.validate();

   op.relation = relation_type::unspecified;
   REBAC_REQUIRE_THROW( op.validate(), invalid_enum_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( paging_defaults_and_caps )
{ try {
   page_request page;
   BOOST_CHECK_EQUAL( page.effective_page(), 1u );
   BOOST_CHECK_EQUAL( page.effective_page_size(), REBAC_DEFAULT_PAGE_SIZE );
   BOOST_CHECK_EQUAL( page.offset(), 0u );

   page = page_request( 0, 0 );
   BOOST_CHECK_EQUAL( page.effective_page(), 1u );
   BOOST_CHECK_EQUAL( page.effective_page_size(), REBAC_DEFAULT_PAGE_SIZE );

   page = page_request( 3, 1000 );
   BOOST_CHECK_EQUAL( page.effective_page_size(), REBAC_MAX_PAGE_SIZE );
   BOOST_CHECK_EQUAL( page.offset(), 2u * REBAC_MAX_PAGE_SIZE );

   page = page_request( 2, 5 );
   BOOST_CHECK_EQUAL( page.offset(), 5u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( tuple_filter_validation )
{ try {
   tuple_filter filter;
   filter.validate();

   filter.resource = resource_type::bookmark;
   filter.subject = subject_type::user;
   filter.validate();

   filter.subject = subject_type::unspecified;
   REBAC_REQUIRE_THROW( filter.validate(), invalid_enum_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
