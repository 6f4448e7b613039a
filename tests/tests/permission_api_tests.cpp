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

#include <rebac/app/permission_api.hpp>
#include <rebac/app/request_context.hpp>
#include <rebac/app/wire_format.hpp>

#include "../common/authz_fixture.hpp"

#include <fc/io/json.hpp>

using namespace rebac::test;
using namespace rebac::app;

namespace {

struct api_fixture : public authz_fixture
{
   api_fixture() : api( engine ) {}

   http_request make_request( const string& method, const string& target, tenant_id_type tenant = 1,
                              const string& user_id = "u1", const string& body = string() )
   {
      http_request req;
      req.method = method;
      req.set_target( target );
      if( tenant > 0 )
         req.set_header( "X-MD-Global-Tenant-Id", std::to_string( tenant ) );
      if( !user_id.empty() )
         req.set_header( "X-MD-Global-User-Id", user_id );
      req.body = body;
      return req;
   }

   http_response call( const string& method, const string& target, tenant_id_type tenant = 1,
                       const string& user_id = "u1", const string& body = string() )
   {
      return api.handle( make_request( method, target, tenant, user_id, body ) );
   }

   static fc::variant_object json_of( const http_response& res )
   {
      return fc::json::from_string( res.body ).get_object();
   }

   permission_api api;
};

const string grant_editor_body =
   R"({"resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b1","relation":"RELATION_EDITOR",)"
   R"("subjectType":"SUBJECT_TYPE_USER","subjectId":"u2","expiresAt":"2030-01-01T00:00:00"})";

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE( permission_api_tests, api_fixture )

BOOST_AUTO_TEST_CASE( grant_returns_tuple_wire_shape )
{ try {
   const auto res = call( "POST", "/permissions", 1, "15", grant_editor_body );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( res.content_type, "application/json" );

   const auto tuple = json_of( res );
   BOOST_CHECK_EQUAL( tuple["id"].as_uint64(), 1u );
   BOOST_CHECK_EQUAL( tuple["tenantId"].as_int64(), 1 );
   BOOST_CHECK_EQUAL( tuple["resourceType"].as_string(), "RESOURCE_TYPE_BOOKMARK" );
   BOOST_CHECK_EQUAL( tuple["resourceId"].as_string(), "b1" );
   BOOST_CHECK_EQUAL( tuple["relation"].as_string(), "RELATION_EDITOR" );
   BOOST_CHECK_EQUAL( tuple["subjectType"].as_string(), "SUBJECT_TYPE_USER" );
   BOOST_CHECK_EQUAL( tuple["subjectId"].as_string(), "u2" );
   BOOST_CHECK_EQUAL( tuple["grantedBy"].as_int64(), 15 );
   BOOST_CHECK_EQUAL( tuple["expiresAt"].as_string(), "2030-01-01T00:00:00Z" );
   BOOST_CHECK_EQUAL( tuple["createTime"].as_string(), genesis_time.to_iso_string() + "Z" );

   // Non-numeric caller ids are not recorded as grantor
   const auto again = json_of( call( "POST", "/permissions", 1, "alice", grant_editor_body ) );
   BOOST_CHECK( !again.contains( "grantedBy" ) );
   BOOST_CHECK_EQUAL( again["id"].as_uint64(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( grant_accepts_utc_designated_expiry )
{ try {
   const string prefix =
      R"({"resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b1","relation":"RELATION_VIEWER",)"
      R"("subjectType":"SUBJECT_TYPE_USER","subjectId":")";
   const fc::time_point_sec expected = fc::time_point_sec::from_iso_string( "2030-01-01T00:00:00" );

   auto res = call( "POST", "/permissions", 1, "u1", prefix + R"(u2","expiresAt":"2030-01-01T00:00:00Z"})" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( json_of( res )["expiresAt"].as_string(), "2030-01-01T00:00:00Z" );

   res = call( "POST", "/permissions", 1, "u1", prefix + R"(u3","expiresAt":"2030-01-01T00:00:00.000Z"})" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( json_of( res )["expiresAt"].as_string(), "2030-01-01T00:00:00Z" );

   res = call( "POST", "/permissions", 1, "u1", prefix + R"(u4","expiresAt":"2030-01-01T00:00:00.750"})" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( json_of( res )["expiresAt"].as_string(), "2030-01-01T00:00:00Z" );

   const auto stored = tuples.find( json_of( res )["id"].as_uint64() );
   BOOST_REQUIRE( stored.valid() );
   BOOST_REQUIRE( stored->expires_at.valid() );
   BOOST_CHECK( *stored->expires_at == expected );

   res = call( "POST", "/permissions", 1, "u1", prefix + R"(u5","expiresAt":"2030-01-01T00:00:00.Z"})" );
   BOOST_CHECK_EQUAL( res.status, 400 );
   res = call( "POST", "/permissions", 1, "u1", prefix + R"(u5","expiresAt":"tomorrow"})" );
   BOOST_CHECK_EQUAL( res.status, 400 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( check_and_effective_endpoints )
{ try {
   BOOST_REQUIRE_EQUAL( call( "POST", "/permissions", 1, "u1", grant_editor_body ).status, 200 );

   const string check_delete =
      R"({"userId":"u2","resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b1","permission":"PERMISSION_DELETE"})";
   auto res = call( "POST", "/permissions/check", 1, "u1", check_delete );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK( !json_of( res )["allowed"].as_bool() );
   BOOST_CHECK_EQUAL( json_of( res )["reason"].as_string(), "InsufficientRelation" );

   // userId defaults to the caller
   const string check_write =
      R"({"resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b1","permission":"PERMISSION_WRITE"})";
   res = call( "POST", "/permissions/check", 1, "u2", check_write );
   BOOST_CHECK( json_of( res )["allowed"].as_bool() );
   BOOST_CHECK( !json_of( res ).contains( "reason" ) );

   res = call( "GET", "/permissions/effective?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1&userId=u2" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   const auto effective = json_of( res );
   BOOST_CHECK_EQUAL( effective["highestRelation"].as_string(), "RELATION_EDITOR" );
   const auto permissions = effective["permissions"].get_array();
   BOOST_REQUIRE_EQUAL( permissions.size(), 2u );
   BOOST_CHECK_EQUAL( permissions[0].as_string(), "PERMISSION_READ" );
   BOOST_CHECK_EQUAL( permissions[1].as_string(), "PERMISSION_WRITE" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accessible_and_list_endpoints )
{ try {
   grant_user( 1, "b2", relation_type::viewer, "u1" );
   grant_user( 1, "b1", relation_type::owner, "u1" );
   grant_user( 1, "b3", relation_type::viewer, "u9" );

   auto res = call( "GET", "/permissions/accessible?resourceType=RESOURCE_TYPE_BOOKMARK&permission=PERMISSION_READ"
                           "&pageSize=1&page=2" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   auto body = json_of( res );
   BOOST_CHECK_EQUAL( body["total"].as_uint64(), 2u );
   BOOST_REQUIRE_EQUAL( body["resourceIds"].get_array().size(), 1u );
   BOOST_CHECK_EQUAL( body["resourceIds"].get_array()[0].as_string(), "b2" );

   res = call( "GET", "/permissions?subjectType=SUBJECT_TYPE_USER&subjectId=u1" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   body = json_of( res );
   BOOST_CHECK_EQUAL( body["total"].as_uint64(), 2u );
   BOOST_CHECK_EQUAL( body["permissions"].get_array().size(), 2u );

   // Unspecified filters are treated as absent
   res = call( "GET", "/permissions?resourceType=RESOURCE_TYPE_UNSPECIFIED&subjectType=SUBJECT_TYPE_UNSPECIFIED" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( json_of( res )["total"].as_uint64(), 3u );

   res = call( "GET", "/permissions/?pageSize=abc" );
   BOOST_CHECK_EQUAL( res.status, 400 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( revoke_endpoints )
{ try {
   grant_user( 1, "b1", relation_type::viewer, "u2" );
   grant_user( 1, "b1", relation_type::sharer, "u2" );
   grant_user( 1, "b1", relation_type::owner, "u1" );

   auto res = call( "DELETE", "/permissions?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1"
                              "&subjectType=SUBJECT_TYPE_USER&subjectId=u2&relation=RELATION_SHARER" );
   BOOST_CHECK_EQUAL( res.status, 204 );
   BOOST_CHECK( res.body.empty() );
   BOOST_CHECK_EQUAL( tuples.size(), 2u );

   // Revoking what is not there is still a success
   res = call( "DELETE", "/permissions?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1"
                         "&subjectType=SUBJECT_TYPE_USER&subjectId=u2&relation=RELATION_SHARER" );
   BOOST_CHECK_EQUAL( res.status, 204 );

   // An unspecified relation revokes every relation of the subject
   grant_user( 1, "b1", relation_type::editor, "u2" );
   res = call( "DELETE", "/permissions?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1"
                         "&subjectType=SUBJECT_TYPE_USER&subjectId=u2&relation=RELATION_UNSPECIFIED" );
   BOOST_CHECK_EQUAL( res.status, 204 );
   BOOST_CHECK_EQUAL( tuples.size(), 1u );
   grant_user( 1, "b1", relation_type::viewer, "u2" );

   res = call( "DELETE", "/permissions/resource?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( json_of( res )["removed"].as_uint64(), 2u );

   grant( 1, "b5", relation_type::viewer, subject_type::user, "u2", now + 1 );
   advance_time( 1 );
   res = call( "POST", "/permissions/purge-expired" );
   BOOST_REQUIRE_EQUAL( res.status, 200 );
   BOOST_CHECK_EQUAL( json_of( res )["removed"].as_uint64(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( errors_map_to_statuses )
{ try {
   // Missing tenant header
   auto res = call( "GET", "/permissions", 0 );
   BOOST_CHECK_EQUAL( res.status, 400 );
   auto body = json_of( res );
   BOOST_CHECK_EQUAL( body["code"].as_int64(), fc::assert_exception::code_value );
   BOOST_CHECK( body.contains( "name" ) );
   BOOST_CHECK( body.contains( "message" ) );

   // Unknown enum token
   res = call( "GET", "/permissions/accessible?resourceType=RESOURCE_TYPE_BOOKMARK&permission=PERMISSION_ADMIN" );
   BOOST_CHECK_EQUAL( res.status, 400 );
   BOOST_CHECK_EQUAL( json_of( res )["code"].as_int64(), invalid_enum_exception::code_value );

   // Unspecified resource type
   res = call( "GET", "/permissions/effective?resourceType=RESOURCE_TYPE_UNSPECIFIED&resourceId=b1" );
   BOOST_CHECK_EQUAL( res.status, 404 );

   // Malformed body
   res = call( "POST", "/permissions", 1, "u1", "{not json" );
   BOOST_CHECK_EQUAL( res.status, 400 );
   res = call( "POST", "/permissions", 1, "u1", R"({"resourceType":"RESOURCE_TYPE_BOOKMARK"})" );
   BOOST_CHECK_EQUAL( res.status, 400 );

   // Cross-tenant access
   grant_user( 2, "b1", relation_type::owner, "u1" );
   res = call( "GET", "/permissions/effective?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1" );
   BOOST_CHECK_EQUAL( res.status, 403 );
   BOOST_CHECK_EQUAL( json_of( res )["code"].as_int64(), tenant_mismatch_exception::code_value );

   // Identity directory down
   resolver.set_available( false );
   res = call( "POST", "/permissions/check", 1, "u1",
               R"({"resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b7","permission":"PERMISSION_READ"})" );
   BOOST_CHECK_EQUAL( res.status, 503 );
   resolver.set_available( true );

   res = call( "GET", "/bookmarks" );
   BOOST_CHECK_EQUAL( res.status, 404 );
   res = call( "PUT", "/permissions" );
   BOOST_CHECK_EQUAL( res.status, 404 );

   BOOST_CHECK_EQUAL( http_status_for( store_unavailable_exception() ), 503 );
   BOOST_CHECK_EQUAL( http_status_for( permission_denied_exception() ), 403 );
   BOOST_CHECK_EQUAL( http_status_for( fc::exception() ), 500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( share_enforcement_guards_grant_and_revoke )
{ try {
   permission_api_options options;
   options.enforce_share_on_grant = true;
   permission_api guarded( engine, options );

   grant_user( 1, "b1", relation_type::sharer, "u1" );
   grant_user( 1, "b1", relation_type::editor, "u3" );

   auto res = guarded.handle( make_request( "POST", "/permissions", 1, "u1", grant_editor_body ) );
   BOOST_CHECK_EQUAL( res.status, 200 );

   res = guarded.handle( make_request( "POST", "/permissions", 1, "u3", grant_editor_body ) );
   BOOST_CHECK_EQUAL( res.status, 403 );
   BOOST_CHECK_EQUAL( json_of( res )["code"].as_int64(), permission_denied_exception::code_value );

   res = guarded.handle( make_request( "DELETE", "/permissions?resourceType=RESOURCE_TYPE_BOOKMARK&resourceId=b1"
                                                 "&subjectType=SUBJECT_TYPE_USER&subjectId=u2", 1, "u3" ) );
   BOOST_CHECK_EQUAL( res.status, 403 );

   // Mutations need a caller identity once enforcement is on
   res = guarded.handle( make_request( "POST", "/permissions", 1, "", grant_editor_body ) );
   BOOST_CHECK_EQUAL( res.status, 400 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( request_context_from_headers )
{ try {
   auto req = make_request( "GET", "/permissions", 4, "12" );
   req.set_header( "x-md-global-username", "alice" );
   req.set_header( "x-md-global-roles", " team, ops ,," );

   const auto ctx = extract_context( req );
   BOOST_CHECK_EQUAL( ctx.tenant_id, 4 );
   BOOST_CHECK_EQUAL( ctx.require_user(), "12" );
   BOOST_CHECK_EQUAL( *ctx.grantor(), 12 );
   BOOST_CHECK_EQUAL( ctx.username, "alice" );
   BOOST_CHECK( ctx.role_ids == std::vector<string>( { "team", "ops" } ) );

   // Informational headers ride along with mutations
   auto grant_req = make_request( "POST", "/permissions", 4, "12", grant_editor_body );
   grant_req.set_header( "x-md-global-username", "alice" );
   grant_req.set_header( "x-md-global-roles", "team" );
   BOOST_CHECK_EQUAL( api.handle( grant_req ).status, 200 );

   req.set_header( REBAC_HEADER_TENANT_ID, "-3" );
   REBAC_REQUIRE_THROW( extract_context( req ), fc::assert_exception );
   req.set_header( REBAC_HEADER_TENANT_ID, "abc" );
   REBAC_REQUIRE_THROW( extract_context( req ), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( target_parsing_decodes_query )
{ try {
   http_request req;
   req.set_target( "/permissions?subjectId=a%20b&resourceId=x+y&empty=&flag" );
   BOOST_CHECK_EQUAL( req.path, "/permissions" );
   BOOST_CHECK_EQUAL( *req.get_query( "subjectId" ), "a b" );
   BOOST_CHECK_EQUAL( *req.get_query( "resourceId" ), "x y" );
   BOOST_CHECK( !req.get_query( "empty" ).valid() );
   BOOST_CHECK( !req.get_query( "flag" ).valid() );
   BOOST_CHECK( !req.get_query( "missing" ).valid() );
   BOOST_CHECK_EQUAL( url_decode( "100%" ), "100%" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
