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

#include <rebac/app/http_message.hpp>

#include <boost/algorithm/string.hpp>

#include <vector>

namespace rebac { namespace app {

static int hex_value( char c )
{
   if( c >= '0' && c <= '9' ) return c - '0';
   if( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
   if( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
   return -1;
}

std::string url_decode( const std::string& s )
{
   std::string result;
   result.reserve( s.size() );
   for( size_t i = 0; i < s.size(); ++i )
   {
      if( s[i] == '+' )
         result += ' ';
      else if( s[i] == '%' && i + 2 < s.size() && hex_value( s[i+1] ) >= 0 && hex_value( s[i+2] ) >= 0 )
      {
         result += static_cast<char>( hex_value( s[i+1] ) * 16 + hex_value( s[i+2] ) );
         i += 2;
      }
      else
         result += s[i];
   }
   return result;
}

void http_request::set_target( const std::string& target )
{
   const auto pos = target.find( '?' );
   path = target.substr( 0, pos );
   query.clear();
   if( pos == std::string::npos )
      return;

   std::vector<std::string> pairs;
   const std::string query_string = target.substr( pos + 1 );
   boost::split( pairs, query_string, boost::is_any_of( "&" ) );
   for( const auto& pair : pairs )
   {
      if( pair.empty() )
         continue;
      const auto eq = pair.find( '=' );
      if( eq == std::string::npos )
         query[url_decode( pair )] = std::string();
      else
         query[url_decode( pair.substr( 0, eq ) )] = url_decode( pair.substr( eq + 1 ) );
   }
}

void http_request::set_header( const std::string& key, const std::string& value )
{
   headers[boost::algorithm::to_lower_copy( key )] = value;
}

fc::optional<std::string> http_request::get_header( const std::string& key )const
{
   auto itr = headers.find( boost::algorithm::to_lower_copy( key ) );
   if( itr == headers.end() )
      return fc::optional<std::string>();
   return itr->second;
}

fc::optional<std::string> http_request::get_query( const std::string& key )const
{
   auto itr = query.find( key );
   if( itr == query.end() || itr->second.empty() )
      return fc::optional<std::string>();
   return itr->second;
}

} } // rebac::app
