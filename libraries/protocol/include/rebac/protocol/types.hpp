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

#include <rebac/protocol/config.hpp>

#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/time.hpp>

#include <boost/container/flat_set.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace rebac { namespace protocol {

   using std::string;
   using std::vector;
   using fc::optional;
   using boost::container::flat_set;

   typedef int32_t tenant_id_type;
   typedef int32_t user_id_type;

   /// Kinds of resources governed by permission tuples
   enum class resource_type : uint8_t
   {
      unspecified = 0,
      bookmark    = 1
   };

   /// Nature of a subject's link to a resource
   enum class relation_type : uint8_t
   {
      unspecified = 0,
      owner       = 1,
      editor      = 2,
      viewer      = 3,
      sharer      = 4
   };

   /// Kind of principal holding a relation
   enum class subject_type : uint8_t
   {
      unspecified = 0,
      user        = 1,
      role        = 2,
      tenant      = 3
   };

   enum class permission_type : uint8_t
   {
      unspecified = 0,
      read        = 1,
      write       = 2,
      delete_     = 3, // trailing underscore avoids the keyword
      share       = 4
   };

   /// Why a check was denied, in the order the reasons are evaluated
   enum class denial_reason : uint8_t
   {
      tenant_mismatch       = 0,
      no_grant              = 1,
      expired               = 2,
      insufficient_relation = 3
   };

   typedef flat_set<permission_type> permission_set;

   /**
    * @brief A principal that may hold a relation on a resource
    *
    * Tenant subjects carry the decimal tenant id as their id.
    */
   struct subject_ref
   {
      subject_ref() = default;
      subject_ref( subject_type t, const string& i ) : type(t), id(i) {}

      subject_type type = subject_type::unspecified;
      string       id;

      friend bool operator < ( const subject_ref& a, const subject_ref& b )
      {
         if( a.type != b.type )
            return a.type < b.type;
         return a.id < b.id;
      }
      friend bool operator == ( const subject_ref& a, const subject_ref& b )
      {
         return a.type == b.type && a.id == b.id;
      }
   };

   typedef flat_set<subject_ref> subject_set;

   string tenant_subject_id( tenant_id_type tenant );

   bool is_valid( resource_type t );
   bool is_valid( relation_type r );
   bool is_valid( subject_type t );
   bool is_valid( permission_type p );

   /**
    * Wire tokens (RESOURCE_TYPE_BOOKMARK, RELATION_OWNER, ...). The parsers
    * throw invalid_enum_exception on anything outside the closed set; the
    * UNSPECIFIED tokens parse to the unspecified values.
    */
   /// @{
   string to_token( resource_type t );
   string to_token( relation_type r );
   string to_token( subject_type t );
   string to_token( permission_type p );
   string to_token( denial_reason r );

   resource_type   resource_type_from_token( const string& token );
   relation_type   relation_from_token( const string& token );
   subject_type    subject_type_from_token( const string& token );
   permission_type permission_from_token( const string& token );
   /// @}

} } // rebac::protocol

FC_REFLECT_ENUM( rebac::protocol::resource_type, (unspecified)(bookmark) )
FC_REFLECT_ENUM( rebac::protocol::relation_type, (unspecified)(owner)(editor)(viewer)(sharer) )
FC_REFLECT_ENUM( rebac::protocol::subject_type, (unspecified)(user)(role)(tenant) )
FC_REFLECT_ENUM( rebac::protocol::permission_type, (unspecified)(read)(write)(delete_)(share) )
FC_REFLECT_ENUM( rebac::protocol::denial_reason, (tenant_mismatch)(no_grant)(expired)(insufficient_relation) )
FC_REFLECT( rebac::protocol::subject_ref, (type)(id) )
