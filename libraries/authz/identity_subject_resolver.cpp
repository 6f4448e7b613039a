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

#include <rebac/authz/identity_subject_resolver.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <curl/curl.h>

#include <memory>

namespace rebac { namespace authz {

namespace {

   struct curl_handle_deleter
   {
      void operator()( CURL* handle )const { curl_easy_cleanup( handle ); }
   };
   typedef std::unique_ptr<CURL, curl_handle_deleter> curl_handle;

   size_t append_response( void* contents, size_t size, size_t nmemb, void* userp )
   {
      static_cast<std::string*>( userp )->append( static_cast<char*>( contents ), size * nmemb );
      return size * nmemb;
   }

   std::string escape( CURL* handle, const std::string& s )
   {
      char* escaped = curl_easy_escape( handle, s.c_str(), static_cast<int>( s.size() ) );
      FC_ASSERT( escaped != nullptr, "Unable to escape ${s}", ("s", s) );
      std::string result( escaped );
      curl_free( escaped );
      return result;
   }

} // anonymous namespace

identity_subject_resolver::identity_subject_resolver( const std::string& base_url, uint32_t timeout_ms )
   : _base_url( base_url ), _timeout_ms( timeout_ms )
{
   while( !_base_url.empty() && _base_url.back() == '/' )
      _base_url.pop_back();
   FC_ASSERT( !_base_url.empty(), "Identity directory URL can not be empty." );
   FC_ASSERT( _timeout_ms > 0, "Identity directory timeout must be positive." );
}

identity_subject_resolver::~identity_subject_resolver()
{
}

subject_set identity_subject_resolver::resolve_subjects( tenant_id_type tenant, const string& user_id )
{
   curl_handle handle( curl_easy_init() );
   REBAC_ASSERT( handle != nullptr, identity_unavailable_exception,
                 "Unable to initialize HTTP client for ${u}", ("u", user_id) );

   const std::string url = _base_url + "/v1/tenants/" + std::to_string( tenant ) + "/users/"
                           + escape( handle.get(), user_id ) + "/roles";
   std::string response_body;
   char error_buffer[CURL_ERROR_SIZE] = { 0 };

   curl_easy_setopt( handle.get(), CURLOPT_URL, url.c_str() );
   curl_easy_setopt( handle.get(), CURLOPT_HTTPGET, 1L );
   curl_easy_setopt( handle.get(), CURLOPT_NOSIGNAL, 1L );
   curl_easy_setopt( handle.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>( _timeout_ms ) );
   curl_easy_setopt( handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>( _timeout_ms ) );
   curl_easy_setopt( handle.get(), CURLOPT_ERRORBUFFER, error_buffer );
   curl_easy_setopt( handle.get(), CURLOPT_WRITEFUNCTION, append_response );
   curl_easy_setopt( handle.get(), CURLOPT_WRITEDATA, static_cast<void*>( &response_body ) );

   const CURLcode rc = curl_easy_perform( handle.get() );
   if( rc != CURLE_OK )
   {
      const std::string reason = error_buffer[0] ? std::string( error_buffer ) : std::string( curl_easy_strerror( rc ) );
      wlog( "Identity lookup for ${u} in tenant ${t} failed: ${e}", ("u", user_id)("t", tenant)("e", reason) );
      if( rc == CURLE_OPERATION_TIMEDOUT )
         FC_THROW_EXCEPTION( identity_unavailable_exception, "Identity lookup timed out after ${ms} ms",
                             ("ms", _timeout_ms)("url", url) );
      FC_THROW_EXCEPTION( identity_unavailable_exception, "Identity lookup failed: ${e}",
                          ("e", reason)("url", url) );
   }

   long status = 0;
   curl_easy_getinfo( handle.get(), CURLINFO_RESPONSE_CODE, &status );
   if( status == 404 )
      FC_THROW_EXCEPTION( tenant_mismatch_exception, "User ${u} is not a member of tenant ${t}.",
                          ("u", user_id)("t", tenant) );
   REBAC_ASSERT( status == 200, identity_unavailable_exception,
                 "Identity directory answered with status ${s}", ("s", status)("url", url) );

   vector<string> roles;
   tenant_id_type home_tenant = tenant;
   try
   {
      const fc::variant doc = fc::json::from_string( response_body );
      const fc::variant_object& obj = doc.get_object();
      if( obj.contains( "tenantId" ) )
         home_tenant = static_cast<tenant_id_type>( obj["tenantId"].as_int64() );
      if( obj.contains( "roles" ) )
      {
         for( const fc::variant& role : obj["roles"].get_array() )
            roles.push_back( role.as_string() );
      }
   }
   catch( const fc::exception& e )
   {
      FC_THROW_EXCEPTION( identity_unavailable_exception, "Malformed identity directory response: ${e}",
                          ("e", e.to_string())("body", response_body) );
   }

   REBAC_ASSERT( home_tenant == tenant, tenant_mismatch_exception,
                 "User ${u} belongs to tenant ${h}, not ${t}.", ("u", user_id)("h", home_tenant)("t", tenant) );

   dlog( "Resolved ${n} roles for ${u} in tenant ${t}", ("n", roles.size())("u", user_id)("t", tenant) );
   return make_subject_set( tenant, user_id, roles );
}

} } // rebac::authz
