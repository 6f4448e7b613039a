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

#include <rebac/authz/identity_subject_resolver.hpp>
#include <rebac/authz/resource_directory.hpp>
#include <rebac/authz/subject_resolver.hpp>

#include "../common/authz_fixture.hpp"

#include <fc/network/http/server.hpp>
#include <fc/network/ip.hpp>
#include <fc/thread/thread.hpp>

#include <fstream>
#include <functional>
#include <memory>

using namespace rebac::test;
using namespace rebac::authz;

namespace {

bool contains( const subject_set& subjects, subject_type type, const string& id )
{
   return subjects.find( subject_ref( type, id ) ) != subjects.end();
}

void write_file( const fc::path& file, const string& content )
{
   std::ofstream out( file.preferred_string() );
   out << content;
}

typedef std::function<void( const fc::http::request&, const fc::http::server::response& )> request_handler;

/// Identity directory served from its own fc thread, so that the blocking curl client can reach it
class identity_directory_stub
{
public:
   explicit identity_directory_stub( request_handler handler )
      : _thread( "identity_directory_stub" )
   {
      _thread.async( [this, handler]() {
         _server.reset( new fc::http::server() );
         _server->on_request( handler );
         _server->listen( fc::ip::endpoint::from_string( "127.0.0.1:0" ) );
         _port = _server->get_local_endpoint().port();
      } ).wait();
   }

   ~identity_directory_stub()
   {
      try
      {
         _thread.async( [this]() { _server.reset(); } ).wait();
         _thread.quit();
      }
      catch( const fc::exception& e )
      {
         wlog( "Stopping identity directory stub failed: ${e}", ("e", e.to_detail_string()) );
      }
   }

   string url()const { return "http://127.0.0.1:" + std::to_string( _port ); }

private:
   fc::thread                        _thread;
   std::unique_ptr<fc::http::server> _server;
   uint16_t                          _port = 0;
};

void send_reply( const fc::http::server::response& res, int status, const string& body )
{
   res.set_status( static_cast<fc::http::reply::status_code>( status ) );
   res.add_header( "Content-Type", "application/json" );
   res.set_length( body.size() );
   res.write( body.data(), body.size() );
}

/// Answers @p status and @p body on @p path, and 500 on any other path
request_handler reply_with( int status, const string& body, const string& path )
{
   return [status, body, path]( const fc::http::request& req, const fc::http::server::response& res ) {
      if( req.path == path )
         send_reply( res, status, body );
      else
         send_reply( res, 500, "{\"unexpected\":\"" + req.path + "\"}" );
   };
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE( subject_resolver_tests )

BOOST_AUTO_TEST_CASE( static_resolver_expands_user_roles_and_tenant )
{ try {
   static_subject_resolver resolver;
   resolver.set_membership( "u1", 1, { "team", "editors", "" } );

   const auto subjects = resolver.resolve_subjects( 1, "u1" );
   BOOST_CHECK_EQUAL( subjects.size(), 4u );
   BOOST_CHECK( contains( subjects, subject_type::user, "u1" ) );
   BOOST_CHECK( contains( subjects, subject_type::role, "team" ) );
   BOOST_CHECK( contains( subjects, subject_type::role, "editors" ) );
   BOOST_CHECK( contains( subjects, subject_type::tenant, "1" ) );

   // Unknown users carry no roles but still belong to the asking tenant
   const auto stranger = resolver.resolve_subjects( 5, "u9" );
   BOOST_CHECK_EQUAL( stranger.size(), 2u );
   BOOST_CHECK( contains( stranger, subject_type::user, "u9" ) );
   BOOST_CHECK( contains( stranger, subject_type::tenant, "5" ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( static_resolver_failures_are_errors )
{ try {
   static_subject_resolver resolver;
   resolver.set_membership( "u1", 1, {} );
   REBAC_REQUIRE_THROW( resolver.resolve_subjects( 2, "u1" ), tenant_mismatch_exception );

   resolver.set_available( false );
   REBAC_REQUIRE_THROW( resolver.resolve_subjects( 1, "u1" ), identity_unavailable_exception );
   resolver.set_available( true );

   resolver.remove_user( "u1" );
   BOOST_CHECK_EQUAL( resolver.resolve_subjects( 2, "u1" ).size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( static_resolver_from_file )
{ try {
   fc::temp_directory dir;
   const fc::path file = dir.path() / "members.json";
   write_file( file, R"({"users":[{"userId":"u1","tenantId":3,"roles":["team"]},{"userId":"u2","tenantId":4}]})" );

   auto resolver = static_subject_resolver::from_file( file );
   BOOST_CHECK( contains( resolver->resolve_subjects( 3, "u1" ), subject_type::role, "team" ) );
   BOOST_CHECK_EQUAL( resolver->resolve_subjects( 4, "u2" ).size(), 2u );
   REBAC_REQUIRE_THROW( resolver->resolve_subjects( 3, "u2" ), tenant_mismatch_exception );

   REBAC_REQUIRE_THROW( static_subject_resolver::from_file( dir.path() / "missing.json" ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( identity_resolver_outage_is_reported )
{ try {
   // Nothing listens on port 1
   identity_subject_resolver resolver( "http://127.0.0.1:1/", 500 );
   BOOST_CHECK_EQUAL( resolver.base_url(), "http://127.0.0.1:1" );
   BOOST_CHECK_EQUAL( resolver.timeout_ms(), 500u );
   REBAC_REQUIRE_THROW( resolver.resolve_subjects( 1, "u1" ), identity_unavailable_exception );

   REBAC_REQUIRE_THROW( identity_subject_resolver( "", 500 ), fc::assert_exception );
   REBAC_REQUIRE_THROW( identity_subject_resolver( "http://127.0.0.1:1", 0 ), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( identity_resolver_expands_directory_roles )
{ try {
   identity_directory_stub directory( reply_with( 200, R"({"tenantId":7,"roles":["team","ops",""]})",
                                                  "/v1/tenants/7/users/u%201/roles" ) );
   identity_subject_resolver resolver( directory.url() + "/", 2000 );

   const auto subjects = resolver.resolve_subjects( 7, "u 1" );
   BOOST_CHECK_EQUAL( subjects.size(), 4u );
   BOOST_CHECK( contains( subjects, subject_type::user, "u 1" ) );
   BOOST_CHECK( contains( subjects, subject_type::role, "team" ) );
   BOOST_CHECK( contains( subjects, subject_type::role, "ops" ) );
   BOOST_CHECK( contains( subjects, subject_type::tenant, "7" ) );

   // A user without roles still resolves to itself and its tenant
   identity_directory_stub bare( reply_with( 200, R"({"tenantId":7})", "/v1/tenants/7/users/u2/roles" ) );
   BOOST_CHECK_EQUAL( identity_subject_resolver( bare.url(), 2000 ).resolve_subjects( 7, "u2" ).size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( identity_resolver_membership_failures_are_mismatches )
{ try {
   identity_directory_stub not_member( reply_with( 404, R"({"error":"not found"})",
                                                   "/v1/tenants/3/users/u1/roles" ) );
   REBAC_REQUIRE_THROW( identity_subject_resolver( not_member.url(), 2000 ).resolve_subjects( 3, "u1" ),
                        tenant_mismatch_exception );

   identity_directory_stub foreign( reply_with( 200, R"({"tenantId":4,"roles":["team"]})",
                                                "/v1/tenants/3/users/u1/roles" ) );
   REBAC_REQUIRE_THROW( identity_subject_resolver( foreign.url(), 2000 ).resolve_subjects( 3, "u1" ),
                        tenant_mismatch_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( identity_resolver_bad_answers_are_outages )
{ try {
   const string path = "/v1/tenants/1/users/u1/roles";

   identity_directory_stub not_json( reply_with( 200, "roles: team", path ) );
   REBAC_REQUIRE_THROW( identity_subject_resolver( not_json.url(), 2000 ).resolve_subjects( 1, "u1" ),
                        identity_unavailable_exception );

   identity_directory_stub wrong_shape( reply_with( 200, R"({"tenantId":1,"roles":"team"})", path ) );
   REBAC_REQUIRE_THROW( identity_subject_resolver( wrong_shape.url(), 2000 ).resolve_subjects( 1, "u1" ),
                        identity_unavailable_exception );

   identity_directory_stub failing( reply_with( 503, R"({"error":"maintenance"})", path ) );
   REBAC_REQUIRE_THROW( identity_subject_resolver( failing.url(), 2000 ).resolve_subjects( 1, "u1" ),
                        identity_unavailable_exception );

   identity_directory_stub server_error( reply_with( 500, R"({"error":"boom"})", path ) );
   REBAC_REQUIRE_THROW( identity_subject_resolver( server_error.url(), 2000 ).resolve_subjects( 1, "u1" ),
                        identity_unavailable_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( identity_resolver_times_out_on_stalled_directory )
{ try {
   fc::promise<void>::ptr answered = fc::promise<void>::create( "stalled identity answer" );
   identity_directory_stub stalled( [answered]( const fc::http::request&, const fc::http::server::response& res ) {
      fc::usleep( fc::milliseconds( 1500 ) );
      try
      {
         send_reply( res, 200, R"({"tenantId":1,"roles":["team"]})" );
      }
      catch( const fc::exception& e )
      {
         dlog( "Client left before the answer: ${e}", ("e", e.to_string()) );
      }
      answered->set_value();
   } );

   identity_subject_resolver resolver( stalled.url(), 200 );
   const fc::time_point start = fc::time_point::now();
   REBAC_REQUIRE_THROW( resolver.resolve_subjects( 1, "u1" ), identity_unavailable_exception );
   BOOST_CHECK( fc::time_point::now() - start < fc::milliseconds( 1200 ) );

   answered->wait( fc::seconds( 10 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( static_resource_directory_from_file )
{ try {
   fc::temp_directory dir;
   const fc::path file = dir.path() / "resources.json";
   write_file( file, R"({"resources":[{"resourceType":"RESOURCE_TYPE_BOOKMARK","resourceId":"b1","tenantId":2}]})" );

   auto directory = static_resource_directory::from_file( file );
   const auto tenant = directory->resource_tenant( resource_type::bookmark, "b1" );
   BOOST_REQUIRE( tenant.valid() );
   BOOST_CHECK_EQUAL( *tenant, 2 );
   BOOST_CHECK( !directory->resource_tenant( resource_type::bookmark, "b2" ).valid() );

   directory->set_resource_tenant( resource_type::bookmark, "b2", 5 );
   BOOST_CHECK_EQUAL( *directory->resource_tenant( resource_type::bookmark, "b2" ), 5 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
