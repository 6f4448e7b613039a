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

#include <rebac/protocol/types.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <fc/variant.hpp>

namespace rebac { namespace protocol {

string tenant_subject_id( tenant_id_type tenant )
{
   return std::to_string( tenant );
}

bool is_valid( resource_type t )
{
   switch( t )
   {
      case resource_type::bookmark:
         return true;
      case resource_type::unspecified:
         return false;
   }
   return false;
}

bool is_valid( relation_type r )
{
   switch( r )
   {
      case relation_type::owner:
      case relation_type::editor:
      case relation_type::viewer:
      case relation_type::sharer:
         return true;
      case relation_type::unspecified:
         return false;
   }
   return false;
}

bool is_valid( subject_type t )
{
   switch( t )
   {
      case subject_type::user:
      case subject_type::role:
      case subject_type::tenant:
         return true;
      case subject_type::unspecified:
         return false;
   }
   return false;
}

bool is_valid( permission_type p )
{
   switch( p )
   {
      case permission_type::read:
      case permission_type::write:
      case permission_type::delete_:
      case permission_type::share:
         return true;
      case permission_type::unspecified:
         return false;
   }
   return false;
}

string to_token( resource_type t )
{
   switch( t )
   {
      case resource_type::unspecified: return "RESOURCE_TYPE_UNSPECIFIED";
      case resource_type::bookmark:    return "RESOURCE_TYPE_BOOKMARK";
   }
   FC_THROW_EXCEPTION( invalid_enum_exception, "Unknown resource type ${t}", ("t", static_cast<int>(t)) );
}

string to_token( relation_type r )
{
   switch( r )
   {
      case relation_type::unspecified: return "RELATION_UNSPECIFIED";
      case relation_type::owner:       return "RELATION_OWNER";
      case relation_type::editor:      return "RELATION_EDITOR";
      case relation_type::viewer:      return "RELATION_VIEWER";
      case relation_type::sharer:      return "RELATION_SHARER";
   }
   FC_THROW_EXCEPTION( invalid_enum_exception, "Unknown relation ${r}", ("r", static_cast<int>(r)) );
}

string to_token( subject_type t )
{
   switch( t )
   {
      case subject_type::unspecified: return "SUBJECT_TYPE_UNSPECIFIED";
      case subject_type::user:        return "SUBJECT_TYPE_USER";
      case subject_type::role:        return "SUBJECT_TYPE_ROLE";
      case subject_type::tenant:      return "SUBJECT_TYPE_TENANT";
   }
   FC_THROW_EXCEPTION( invalid_enum_exception, "Unknown subject type ${t}", ("t", static_cast<int>(t)) );
}

string to_token( permission_type p )
{
   switch( p )
   {
      case permission_type::unspecified: return "PERMISSION_UNSPECIFIED";
      case permission_type::read:        return "PERMISSION_READ";
      case permission_type::write:       return "PERMISSION_WRITE";
      case permission_type::delete_:     return "PERMISSION_DELETE";
      case permission_type::share:       return "PERMISSION_SHARE";
   }
   FC_THROW_EXCEPTION( invalid_enum_exception, "Unknown permission ${p}", ("p", static_cast<int>(p)) );
}

string to_token( denial_reason r )
{
   switch( r )
   {
      case denial_reason::tenant_mismatch:       return "TenantMismatch";
      case denial_reason::no_grant:              return "NoGrant";
      case denial_reason::expired:               return "Expired";
      case denial_reason::insufficient_relation: return "InsufficientRelation";
   }
   FC_THROW_EXCEPTION( invalid_enum_exception, "Unknown denial reason ${r}", ("r", static_cast<int>(r)) );
}

resource_type resource_type_from_token( const string& token )
{
   if( token == "RESOURCE_TYPE_UNSPECIFIED" ) return resource_type::unspecified;
   if( token == "RESOURCE_TYPE_BOOKMARK" )    return resource_type::bookmark;
   FC_THROW_EXCEPTION( invalid_enum_exception, "Invalid resourceType '${t}'", ("t", token) );
}

relation_type relation_from_token( const string& token )
{
   if( token == "RELATION_UNSPECIFIED" ) return relation_type::unspecified;
   if( token == "RELATION_OWNER" )       return relation_type::owner;
   if( token == "RELATION_EDITOR" )      return relation_type::editor;
   if( token == "RELATION_VIEWER" )      return relation_type::viewer;
   if( token == "RELATION_SHARER" )      return relation_type::sharer;
   FC_THROW_EXCEPTION( invalid_enum_exception, "Invalid relation '${t}'", ("t", token) );
}

subject_type subject_type_from_token( const string& token )
{
   if( token == "SUBJECT_TYPE_UNSPECIFIED" ) return subject_type::unspecified;
   if( token == "SUBJECT_TYPE_USER" )        return subject_type::user;
   if( token == "SUBJECT_TYPE_ROLE" )        return subject_type::role;
   if( token == "SUBJECT_TYPE_TENANT" )      return subject_type::tenant;
   FC_THROW_EXCEPTION( invalid_enum_exception, "Invalid subjectType '${t}'", ("t", token) );
}

permission_type permission_from_token( const string& token )
{
   if( token == "PERMISSION_UNSPECIFIED" ) return permission_type::unspecified;
   if( token == "PERMISSION_READ" )        return permission_type::read;
   if( token == "PERMISSION_WRITE" )       return permission_type::write;
   if( token == "PERMISSION_DELETE" )      return permission_type::delete_;
   if( token == "PERMISSION_SHARE" )       return permission_type::share;
   FC_THROW_EXCEPTION( invalid_enum_exception, "Invalid permission '${t}'", ("t", token) );
}

} } // rebac::protocol
