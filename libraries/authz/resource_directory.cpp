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

#include <rebac/authz/resource_directory.hpp>
#include <rebac/store/tuple_store.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

namespace rebac { namespace authz {

optional<tenant_id_type> tuple_resource_directory::resource_tenant( resource_type resource,
                                                                    const string& resource_id )const
{
   return _store.resource_tenant( resource, resource_id );
}

std::unique_ptr<static_resource_directory> static_resource_directory::from_file( const fc::path& file )
{ try {
   FC_ASSERT( fc::exists( file ), "Resource directory file ${f} does not exist.", ("f", file.string()) );

   auto directory = std::make_unique<static_resource_directory>();
   const fc::variant doc = fc::json::from_file( file );
   FC_ASSERT( doc.is_object(), "Resource directory file must contain a JSON object." );
   const fc::variant_object& obj = doc.get_object();
   if( !obj.contains( "resources" ) )
      return directory;

   for( const fc::variant& entry : obj["resources"].get_array() )
   {
      const fc::variant_object& res = entry.get_object();
      FC_ASSERT( res.contains( "resourceType" ) && res.contains( "resourceId" ) && res.contains( "tenantId" ),
                 "Resource entries need resourceType, resourceId and tenantId: ${e}", ("e", entry) );
      directory->set_resource_tenant( resource_type_from_token( res["resourceType"].as_string() ),
                                      res["resourceId"].as_string(),
                                      static_cast<tenant_id_type>( res["tenantId"].as_int64() ) );
   }
   ilog( "Loaded ${n} resource tenants from ${f}", ("n", directory->_tenants.size())("f", file.string()) );
   return directory;
} FC_CAPTURE_AND_RETHROW( (file) ) }

void static_resource_directory::set_resource_tenant( resource_type resource, const string& resource_id,
                                                     tenant_id_type tenant )
{
   std::lock_guard<std::mutex> guard( _mutex );
   _tenants[std::make_pair( resource, resource_id )] = tenant;
}

optional<tenant_id_type> static_resource_directory::resource_tenant( resource_type resource,
                                                                     const string& resource_id )const
{
   std::lock_guard<std::mutex> guard( _mutex );
   auto itr = _tenants.find( std::make_pair( resource, resource_id ) );
   if( itr == _tenants.end() )
      return optional<tenant_id_type>();
   return itr->second;
}

} } // rebac::authz
