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
    * @defgroup relation_model Relation model
    *
    * Static mapping from relation to the permissions it grants, and the fixed
    * priority used to pick the highest relation:
    *
    *   owner  -> read, write, delete, share
    *   editor -> read, write
    *   viewer -> read
    *   sharer -> read, share
    *
    * Priority is owner > editor > sharer > viewer. Relations do not imply one
    * another beyond their permission sets.
    * @{
    */

   /// Every concrete permission, in enum order
   const permission_set& all_permissions();

   /// Permissions granted by @p r; empty for relation_type::unspecified
   permission_set relation_permissions( relation_type r );

   bool relation_grants( relation_type r, permission_type p );

   /// Higher wins; unspecified is 0
   uint8_t relation_priority( relation_type r );

   /// Highest-priority member of @p relations, or unspecified when empty
   template<typename Range>
   relation_type highest_relation( const Range& relations )
   {
      relation_type best = relation_type::unspecified;
      for( relation_type r : relations )
         if( relation_priority( r ) > relation_priority( best ) )
            best = r;
      return best;
   }

   /// @}

} } // rebac::protocol
