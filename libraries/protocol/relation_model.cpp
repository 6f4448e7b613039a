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

#include <rebac/protocol/relation_model.hpp>

namespace rebac { namespace protocol {

const permission_set& all_permissions()
{
   static const permission_set all{ permission_type::read, permission_type::write,
                                    permission_type::delete_, permission_type::share };
   return all;
}

permission_set relation_permissions( relation_type r )
{
   switch( r )
   {
      case relation_type::owner:
         return all_permissions();
      case relation_type::editor:
         return { permission_type::read, permission_type::write };
      case relation_type::viewer:
         return { permission_type::read };
      case relation_type::sharer:
         return { permission_type::read, permission_type::share };
      case relation_type::unspecified:
         return {};
   }
   return {};
}

bool relation_grants( relation_type r, permission_type p )
{
   const auto perms = relation_permissions( r );
   return perms.find( p ) != perms.end();
}

uint8_t relation_priority( relation_type r )
{
   switch( r )
   {
      case relation_type::owner:       return 4;
      case relation_type::editor:      return 3;
      case relation_type::sharer:      return 2;
      case relation_type::viewer:      return 1;
      case relation_type::unspecified: return 0;
   }
   return 0;
}

} } // rebac::protocol
