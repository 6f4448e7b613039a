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

#include <rebac/app/wire_format.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <fc/io/json.hpp>

namespace rebac { namespace app {

namespace {

   const fc::variant& required_field( const fc::variant_object& obj, const char* name )
   {
      auto itr = obj.find( name );
      FC_ASSERT( itr != obj.end() && !itr->value().is_null(), "Missing field ${f}.", ("f", name) );
      return itr->value();
   }

   optional<string> optional_string( const fc::variant_object& obj, const char* name )
   {
      auto itr = obj.find( name );
      if( itr == obj.end() || itr->value().is_null() )
         return optional<string>();
      FC_ASSERT( itr->value().is_string(), "Field ${f} must be a string.", ("f", name) );
      return itr->value().get_string();
   }

   string string_field( const fc::variant_object& obj, const char* name )
   {
      const fc::variant& value = required_field( obj, name );
      FC_ASSERT( value.is_string(), "Field ${f} must be a string.", ("f", name) );
      return value.get_string();
   }

   /// Accepts YYYY-MM-DDTHH:MM:SS with an optional fraction and an optional Z designator
   fc::time_point_sec parse_time( const string& iso )
   {
      string trimmed = iso;
      if( !trimmed.empty() && ( trimmed.back() == 'Z' || trimmed.back() == 'z' ) )
         trimmed.pop_back();
      const auto dot = trimmed.find( '.' );
      if( dot != string::npos )
      {
         FC_ASSERT( dot + 1 < trimmed.size()
                    && trimmed.find_first_not_of( "0123456789", dot + 1 ) == string::npos,
                    "Invalid timestamp '${t}'", ("t", iso) );
         trimmed.erase( dot );
      }
      try
      {
         return fc::time_point_sec::from_iso_string( trimmed );
      }
      catch( const fc::exception& e )
      {
         FC_THROW_EXCEPTION( fc::assert_exception, "Invalid timestamp '${t}': ${e}", ("t", iso)("e", e.to_string()) );
      }
      catch( const std::exception& e )
      {
         FC_THROW_EXCEPTION( fc::assert_exception, "Invalid timestamp '${t}': ${e}", ("t", iso)("e", e.what()) );
      }
   }

   string format_time( const fc::time_point_sec& t )
   {
      return t.to_iso_string() + "Z";
   }

} // anonymous namespace

fc::variant to_wire( const permission_tuple_object& tuple )
{
   fc::mutable_variant_object result;
   result( "id", tuple.id )
         ( "tenantId", tuple.tenant_id )
         ( "resourceType", to_token( tuple.resource ) )
         ( "resourceId", tuple.resource_id )
         ( "relation", to_token( tuple.relation ) )
         ( "subjectType", to_token( tuple.subject ) )
         ( "subjectId", tuple.subject_id );
   if( tuple.granted_by.valid() )
      result( "grantedBy", *tuple.granted_by );
   if( tuple.expires_at.valid() )
      result( "expiresAt", format_time( *tuple.expires_at ) );
   result( "createTime", format_time( tuple.create_time ) );
   return fc::variant( result );
}

fc::variant to_wire( const rebac::store::tuple_page& page )
{
   fc::variants tuples;
   tuples.reserve( page.tuples.size() );
   for( const auto& tuple : page.tuples )
      tuples.push_back( to_wire( tuple ) );
   return fc::variant( fc::mutable_variant_object( "permissions", tuples )( "total", page.total ) );
}

fc::variant to_wire( const rebac::authz::check_result& result )
{
   fc::mutable_variant_object obj( "allowed", result.allowed );
   if( result.reason.valid() )
      obj( "reason", to_token( *result.reason ) );
   return fc::variant( obj );
}

fc::variant to_wire( const rebac::authz::accessible_resources& result )
{
   fc::variants ids( result.resource_ids.begin(), result.resource_ids.end() );
   return fc::variant( fc::mutable_variant_object( "resourceIds", ids )( "total", result.total ) );
}

fc::variant to_wire( const rebac::authz::effective_permissions& result )
{
   fc::variants permissions;
   for( const auto permission : result.permissions )
      permissions.push_back( fc::variant( to_token( permission ) ) );
   return fc::variant( fc::mutable_variant_object( "permissions", permissions )
                                                 ( "highestRelation", to_token( result.highest_relation ) ) );
}

grant_operation grant_from_wire( const fc::variant_object& body, tenant_id_type tenant,
                                 const optional<user_id_type>& granted_by )
{ try {
   grant_operation op;
   op.tenant_id   = tenant;
   op.resource    = resource_type_from_token( string_field( body, "resourceType" ) );
   op.resource_id = string_field( body, "resourceId" );
   op.relation    = relation_from_token( string_field( body, "relation" ) );
   op.subject     = subject_type_from_token( string_field( body, "subjectType" ) );
   op.subject_id  = string_field( body, "subjectId" );
   op.granted_by  = granted_by;

   const auto expires_at = optional_string( body, "expiresAt" );
   if( expires_at.valid() && !expires_at->empty() )
      op.expires_at = parse_time( *expires_at );
   return op;
} FC_CAPTURE_AND_RETHROW( (body)(tenant) ) }

check_request check_from_wire( const fc::variant_object& body )
{ try {
   check_request request;
   request.user_id     = optional_string( body, "userId" );
   if( request.user_id.valid() && request.user_id->empty() )
      request.user_id.reset();
   request.resource    = resource_type_from_token( string_field( body, "resourceType" ) );
   request.resource_id = string_field( body, "resourceId" );
   request.permission  = permission_from_token( string_field( body, "permission" ) );
   return request;
} FC_CAPTURE_AND_RETHROW( (body) ) }

fc::variant_object parse_body( const string& body )
{
   FC_ASSERT( !body.empty(), "Request body is empty." );
   fc::variant doc;
   try
   {
      doc = fc::json::from_string( body, fc::json::legacy_parser, REBAC_MAX_NESTED_OBJECTS );
   }
   catch( const fc::exception& e )
   {
      FC_THROW_EXCEPTION( fc::parse_error_exception, "Request body is not valid JSON: ${e}", ("e", e.to_string()) );
   }
   FC_ASSERT( doc.is_object(), "Request body must be a JSON object." );
   return doc.get_object();
}

} } // rebac::app
