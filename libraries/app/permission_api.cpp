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

#include <rebac/app/permission_api.hpp>
#include <rebac/app/request_context.hpp>
#include <rebac/app/wire_format.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/lexical_cast.hpp>

namespace rebac { namespace app {

namespace detail {

class permission_api_impl
{
public:
   permission_api_impl( authz::authorization_engine& engine, const permission_api_options& options )
      : _engine( engine ), _options( options )
   {
   }

   http_response dispatch( const http_request& req )
   {
      string path = req.path;
      while( path.size() > 1 && path.back() == '/' )
         path.pop_back();

      if( path == "/permissions" )
      {
         if( req.method == "POST" )   return grant( req );
         if( req.method == "DELETE" ) return revoke( req );
         if( req.method == "GET" )    return list_tuples( req );
      }
      else if( path == "/permissions/check" && req.method == "POST" )
         return check( req );
      else if( path == "/permissions/accessible" && req.method == "GET" )
         return list_accessible( req );
      else if( path == "/permissions/effective" && req.method == "GET" )
         return effective( req );
      else if( path == "/permissions/resource" && req.method == "DELETE" )
         return revoke_all( req );
      else if( path == "/permissions/purge-expired" && req.method == "POST" )
         return purge_expired( req );

      return error_response( 404, 0, "route_not_found", "No route for " + req.method + " " + req.path );
   }

   static http_response json_response( const fc::variant& v, uint16_t status = 200 )
   {
      http_response res;
      res.status = status;
      res.body = fc::json::to_string( v, fc::json::legacy_generator, REBAC_MAX_NESTED_OBJECTS );
      return res;
   }

   static http_response error_response( uint16_t status, int64_t code, const string& name, const string& message )
   {
      return json_response( fc::variant( fc::mutable_variant_object( "code", code )
                                                                   ( "name", name )
                                                                   ( "message", message ) ),
                            status );
   }

private:
   http_response grant( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      const grant_operation op = grant_from_wire( parse_body( req.body ), ctx.tenant_id, ctx.grantor() );
      if( _options.enforce_share_on_grant )
         _engine.require_permission( ctx.tenant_id, ctx.require_user(), op.resource, op.resource_id,
                                     permission_type::share );
      const auto tuple = _engine.grant( op );
      audit( ctx, "grant", op.resource_id );
      return json_response( to_wire( tuple ) );
   }

   http_response revoke( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      revoke_operation op;
      op.tenant_id   = ctx.tenant_id;
      op.resource    = resource_type_from_token( required_query( req, "resourceType" ) );
      op.resource_id = required_query( req, "resourceId" );
      op.subject     = subject_type_from_token( required_query( req, "subjectType" ) );
      op.subject_id  = required_query( req, "subjectId" );
      const auto relation = req.get_query( "relation" );
      if( relation.valid() && relation_from_token( *relation ) != relation_type::unspecified )
         op.relation = relation_from_token( *relation );

      if( _options.enforce_share_on_grant )
         _engine.require_permission( ctx.tenant_id, ctx.require_user(), op.resource, op.resource_id,
                                     permission_type::share );
      _engine.revoke( op );
      audit( ctx, "revoke", op.resource_id );

      http_response res;
      res.status = 204;
      res.content_type.clear();
      return res;
   }

   http_response list_tuples( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      tuple_filter filter;
      const auto resource = req.get_query( "resourceType" );
      if( resource.valid() && resource_type_from_token( *resource ) != resource_type::unspecified )
         filter.resource = resource_type_from_token( *resource );
      filter.resource_id = req.get_query( "resourceId" );
      const auto subject = req.get_query( "subjectType" );
      if( subject.valid() && subject_type_from_token( *subject ) != subject_type::unspecified )
         filter.subject = subject_type_from_token( *subject );
      filter.subject_id = req.get_query( "subjectId" );

      return json_response( to_wire( _engine.list_tuples( ctx.tenant_id, filter, paging( req ) ) ) );
   }

   http_response check( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      const check_request body = check_from_wire( parse_body( req.body ) );
      const string user_id = body.user_id.valid() ? *body.user_id : ctx.require_user();
      return json_response( to_wire( _engine.check( ctx.tenant_id, user_id, body.resource, body.resource_id,
                                                    body.permission ) ) );
   }

   http_response list_accessible( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      const auto resource   = resource_type_from_token( required_query( req, "resourceType" ) );
      const auto permission = permission_from_token( required_query( req, "permission" ) );
      return json_response( to_wire( _engine.list_accessible_resources( ctx.tenant_id, target_user( req, ctx ),
                                                                        resource, permission, paging( req ) ) ) );
   }

   http_response effective( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      const auto resource = resource_type_from_token( required_query( req, "resourceType" ) );
      const string resource_id = required_query( req, "resourceId" );
      return json_response( to_wire( _engine.get_effective_permissions( ctx.tenant_id, target_user( req, ctx ),
                                                                        resource, resource_id ) ) );
   }

   http_response revoke_all( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      const auto resource = resource_type_from_token( required_query( req, "resourceType" ) );
      const string resource_id = required_query( req, "resourceId" );
      const uint64_t removed = _engine.revoke_all_for_resource( ctx.tenant_id, resource, resource_id );
      audit( ctx, "revoke_all", resource_id );
      return json_response( fc::variant( fc::mutable_variant_object( "removed", removed ) ) );
   }

   http_response purge_expired( const http_request& req )
   {
      const request_context ctx = extract_context( req );
      const uint64_t removed = _engine.purge_expired( ctx.tenant_id );
      audit( ctx, "purge_expired", string() );
      return json_response( fc::variant( fc::mutable_variant_object( "removed", removed ) ) );
   }

   static void audit( const request_context& ctx, const char* action, const string& resource_id )
   {
      ilog( "${a} on '${r}' in tenant ${t} by ${u} (${n}, roles ${roles})",
            ("a", action)("r", resource_id)("t", ctx.tenant_id)
            ("u", ctx.user_id.valid() ? *ctx.user_id : string( "anonymous" ))
            ("n", ctx.username)("roles", ctx.role_ids) );
   }

   static string required_query( const http_request& req, const char* name )
   {
      const auto value = req.get_query( name );
      FC_ASSERT( value.valid(), "Missing query parameter ${p}.", ("p", name) );
      return *value;
   }

   static uint32_t numeric_query( const http_request& req, const char* name, uint32_t default_value )
   {
      const auto value = req.get_query( name );
      if( !value.valid() )
         return default_value;
      try
      {
         return boost::lexical_cast<uint32_t>( *value );
      }
      catch( const boost::bad_lexical_cast& )
      {
         FC_THROW_EXCEPTION( fc::assert_exception, "Query parameter ${p} must be a non-negative integer, got '${v}'.",
                             ("p", name)("v", *value) );
      }
   }

   static page_request paging( const http_request& req )
   {
      return page_request( numeric_query( req, "page", 1 ),
                           numeric_query( req, "pageSize", REBAC_DEFAULT_PAGE_SIZE ) );
   }

   /// userId query parameter, or the caller
   static string target_user( const http_request& req, const request_context& ctx )
   {
      const auto user = req.get_query( "userId" );
      return user.valid() ? *user : ctx.require_user();
   }

   authz::authorization_engine& _engine;
   permission_api_options       _options;
};

} // detail

uint16_t http_status_for( const fc::exception& e )
{
   switch( e.code() )
   {
      case fc::assert_exception::code_value:
      case fc::parse_error_exception::code_value:
      case fc::bad_cast_exception::code_value:
      case fc::key_not_found_exception::code_value:
      case fc::out_of_range_exception::code_value:
      case invalid_enum_exception::code_value:
         return 400;
      case tenant_mismatch_exception::code_value:
      case permission_denied_exception::code_value:
         return 403;
      case resource_type_not_found_exception::code_value:
         return 404;
      case identity_unavailable_exception::code_value:
      case store_unavailable_exception::code_value:
         return 503;
      default:
         return 500;
   }
}

permission_api::permission_api( authz::authorization_engine& engine, const permission_api_options& options )
   : my( std::make_shared<detail::permission_api_impl>( engine, options ) )
{
}

permission_api::~permission_api()
{
}

http_response permission_api::handle( const http_request& req )const
{
   try
   {
      return my->dispatch( req );
   }
   catch( const fc::exception& e )
   {
      const uint16_t status = http_status_for( e );
      if( status >= 500 )
         elog( "${m} ${p} failed: ${e}", ("m", req.method)("p", req.path)("e", e.to_detail_string()) );
      else
         dlog( "${m} ${p} rejected: ${e}", ("m", req.method)("p", req.path)("e", e.to_string()) );
      return detail::permission_api_impl::error_response( status, e.code(), e.name(), e.top_message() );
   }
   catch( const std::exception& e )
   {
      elog( "${m} ${p} failed: ${e}", ("m", req.method)("p", req.path)("e", e.what()) );
      return detail::permission_api_impl::error_response( 500, fc::std_exception_code, "std_exception", e.what() );
   }
}

} } // rebac::app
