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

#include <rebac/store/tuple_store.hpp>
#include <rebac/protocol/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <algorithm>
#include <mutex>

namespace rebac { namespace store {

namespace detail {

   /// On-disk layout of the data directory snapshot
   struct tuple_snapshot
   {
      tuple_id_type                   next_id = 1;
      vector<permission_tuple_object> tuples;
   };

} // detail

} } // rebac::store

FC_REFLECT( rebac::store::detail::tuple_snapshot, (next_id)(tuples) )

namespace rebac { namespace store {

typedef std::unique_lock<std::shared_timed_mutex> write_lock;
typedef std::shared_lock<std::shared_timed_mutex> read_lock;

tuple_store::tuple_store()
   : _resource_types{ resource_type::bookmark }
{
}

tuple_store::~tuple_store()
{
   try
   {
      close();
   }
   catch( const fc::exception& e )
   {
      elog( "Failed to close tuple store: ${e}", ("e", e.to_detail_string()) );
   }
}

void tuple_store::open( const fc::path& data_dir )
{ try {
   write_lock lock( _mutex );

   if( !fc::exists( data_dir ) )
      fc::create_directories( data_dir );

   _tuples.clear();
   _next_id = 1;

   const fc::path snapshot_file = data_dir / REBAC_TUPLE_SNAPSHOT_FILENAME;
   if( fc::exists( snapshot_file ) )
   {
      ilog( "Loading permission tuples from ${f}", ("f", snapshot_file.string()) );
      const auto snapshot = fc::json::from_file( snapshot_file )
                               .as<detail::tuple_snapshot>( REBAC_MAX_NESTED_OBJECTS );
      for( const auto& tuple : snapshot.tuples )
      {
         const auto result = _tuples.insert( tuple );
         FC_ASSERT( result.second, "Duplicate permission tuple ${id} in snapshot.", ("id", tuple.id) );
         _next_id = std::max( _next_id, tuple.id + 1 );
      }
      _next_id = std::max( _next_id, snapshot.next_id );
      ilog( "Loaded ${n} permission tuples", ("n", _tuples.size()) );
   }

   _data_dir = data_dir;
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

void tuple_store::close()
{
   write_lock lock( _mutex );
   if( !_data_dir.valid() )
      return;
   write_snapshot();
   _data_dir.reset();
}

void tuple_store::flush()
{
   write_lock lock( _mutex );
   write_snapshot();
}

void tuple_store::persist()
{
   if( _flush_on_write )
      write_snapshot();
}

void tuple_store::write_snapshot()
{
   if( !_data_dir.valid() )
      return;

   detail::tuple_snapshot snapshot;
   snapshot.next_id = _next_id;
   const auto& idx = _tuples.get<by_id>();
   snapshot.tuples.assign( idx.begin(), idx.end() );

   const fc::path target = *_data_dir / REBAC_TUPLE_SNAPSHOT_FILENAME;
   const fc::path temp = *_data_dir / ( std::string( REBAC_TUPLE_SNAPSHOT_FILENAME ) + ".tmp" );
   try
   {
      fc::json::save_to_file( fc::variant( snapshot, REBAC_MAX_NESTED_OBJECTS ), temp, false );
      fc::rename( temp, target );
   }
   catch( const fc::exception& e )
   {
      elog( "Unable to write tuple snapshot ${f}: ${e}", ("f", target.string())("e", e.to_detail_string()) );
      FC_THROW_EXCEPTION( store_unavailable_exception, "Unable to write tuple snapshot ${f}: ${e}",
                          ("f", target.string())("e", e.to_string()) );
   }
   catch( const std::exception& e )
   {
      elog( "Unable to write tuple snapshot ${f}: ${e}", ("f", target.string())("e", e.what()) );
      FC_THROW_EXCEPTION( store_unavailable_exception, "Unable to write tuple snapshot ${f}: ${e}",
                          ("f", target.string())("e", e.what()) );
   }
}

void tuple_store::set_resource_types( const flat_set<resource_type>& types )
{
   write_lock lock( _mutex );
   _resource_types = types;
}

bool tuple_store::knows_resource_type( resource_type t )const
{
   read_lock lock( _mutex );
   return _resource_types.find( t ) != _resource_types.end();
}

permission_tuple_object tuple_store::upsert( const grant_operation& op, const fc::time_point_sec& now )
{ try {
   write_lock lock( _mutex );
   REBAC_ASSERT( _resource_types.find( op.resource ) != _resource_types.end(), resource_type_not_found_exception,
                 "Resource type ${r} is not managed by this store.", ("r", op.resource) );

   auto& idx = _tuples.get<by_tuple_key>();
   auto itr = idx.find( boost::make_tuple( op.tenant_id, op.resource, op.resource_id,
                                           op.relation, op.subject, op.subject_id ) );
   if( itr != idx.end() )
   {
      const permission_tuple_object previous = *itr;
      idx.modify( itr, [&op]( permission_tuple_object& obj ) {
         obj.granted_by = op.granted_by;
         obj.expires_at = op.expires_at;
      });
      try
      {
         persist();
      }
      catch( const store_unavailable_exception& )
      {
         idx.modify( itr, [&previous]( permission_tuple_object& obj ) { obj = previous; } );
         throw;
      }
      dlog( "Updated permission tuple ${id}", ("id", itr->id) );
      return *itr;
   }

   permission_tuple_object obj;
   obj.id          = _next_id;
   obj.tenant_id   = op.tenant_id;
   obj.resource    = op.resource;
   obj.resource_id = op.resource_id;
   obj.relation    = op.relation;
   obj.subject     = op.subject;
   obj.subject_id  = op.subject_id;
   obj.granted_by  = op.granted_by;
   obj.expires_at  = op.expires_at;
   obj.create_time = now;

   const auto result = _tuples.insert( obj );
   FC_ASSERT( result.second, "Permission tuple ${id} collides with a stored tuple.", ("id", obj.id) );
   ++_next_id;
   try
   {
      persist();
   }
   catch( const store_unavailable_exception& )
   {
      _tuples.erase( result.first );
      --_next_id;
      throw;
   }
   dlog( "Created permission tuple ${id}", ("id", obj.id) );
   return obj;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint64_t tuple_store::remove( const revoke_operation& op )
{ try {
   write_lock lock( _mutex );

   vector<permission_tuple_object> removed;
   if( op.relation.valid() )
   {
      auto& idx = _tuples.get<by_tuple_key>();
      auto itr = idx.find( boost::make_tuple( op.tenant_id, op.resource, op.resource_id,
                                              *op.relation, op.subject, op.subject_id ) );
      if( itr != idx.end() )
      {
         removed.push_back( *itr );
         idx.erase( itr );
      }
   }
   else
   {
      auto& idx = _tuples.get<by_subject>();
      auto range = idx.equal_range( boost::make_tuple( op.subject, op.subject_id,
                                                       op.tenant_id, op.resource, op.resource_id ) );
      removed.assign( range.first, range.second );
      idx.erase( range.first, range.second );
   }

   if( removed.empty() )
      return 0;

   try
   {
      persist();
   }
   catch( const store_unavailable_exception& )
   {
      _tuples.insert( removed.begin(), removed.end() );
      throw;
   }
   return removed.size();
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint64_t tuple_store::remove_resource( tenant_id_type tenant, resource_type resource, const string& resource_id )
{ try {
   write_lock lock( _mutex );

   auto& idx = _tuples.get<by_tuple_key>();
   auto range = idx.equal_range( boost::make_tuple( tenant, resource, resource_id ) );
   vector<permission_tuple_object> removed( range.first, range.second );
   if( removed.empty() )
      return 0;
   idx.erase( range.first, range.second );

   try
   {
      persist();
   }
   catch( const store_unavailable_exception& )
   {
      _tuples.insert( removed.begin(), removed.end() );
      throw;
   }
   return removed.size();
} FC_CAPTURE_AND_RETHROW( (tenant)(resource)(resource_id) ) }

uint64_t tuple_store::remove_expired( tenant_id_type tenant, const fc::time_point_sec& now )
{ try {
   write_lock lock( _mutex );

   auto& idx = _tuples.get<by_expiration>();
   vector<permission_tuple_object> removed;
   auto itr = idx.begin();
   while( itr != idx.end() && itr->expiration_key() <= now )
   {
      if( itr->tenant_id == tenant )
      {
         removed.push_back( *itr );
         itr = idx.erase( itr );
      }
      else
         ++itr;
   }
   if( removed.empty() )
      return 0;

   try
   {
      persist();
   }
   catch( const store_unavailable_exception& )
   {
      _tuples.insert( removed.begin(), removed.end() );
      throw;
   }
   ilog( "Purged ${n} expired permission tuples of tenant ${t}", ("n", removed.size())("t", tenant) );
   return removed.size();
} FC_CAPTURE_AND_RETHROW( (tenant)(now) ) }

vector<permission_tuple_object> tuple_store::find_by_resource( tenant_id_type tenant, resource_type resource,
                                                               const string& resource_id,
                                                               const subject_set& subjects )const
{
   read_lock lock( _mutex );

   vector<permission_tuple_object> result;
   const auto& idx = _tuples.get<by_tuple_key>();
   auto range = idx.equal_range( boost::make_tuple( tenant, resource, resource_id ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( subjects.find( itr->get_subject() ) != subjects.end() )
         result.push_back( *itr );
   }
   return result;
}

vector<permission_tuple_object> tuple_store::find_by_subjects( tenant_id_type tenant, resource_type resource,
                                                               const subject_set& subjects )const
{
   read_lock lock( _mutex );

   vector<permission_tuple_object> result;
   const auto& idx = _tuples.get<by_subject>();
   for( const auto& subject : subjects )
   {
      auto range = idx.equal_range( boost::make_tuple( subject.type, subject.id, tenant, resource ) );
      result.insert( result.end(), range.first, range.second );
   }
   return result;
}

optional<tenant_id_type> tuple_store::resource_tenant( resource_type resource, const string& resource_id )const
{
   read_lock lock( _mutex );

   const auto& idx = _tuples.get<by_resource>();
   auto itr = idx.lower_bound( boost::make_tuple( resource, resource_id ) );
   if( itr == idx.end() || itr->resource != resource || itr->resource_id != resource_id )
      return optional<tenant_id_type>();
   return itr->tenant_id;
}

tuple_page tuple_store::list( tenant_id_type tenant, const tuple_filter& filter, const page_request& page )const
{
   read_lock lock( _mutex );

   vector<const permission_tuple_object*> matches;
   const auto& idx = _tuples.get<by_tenant>();
   auto range = idx.equal_range( boost::make_tuple( tenant ) );
   for( auto itr = range.first; itr != range.second; ++itr )
   {
      if( filter.resource.valid() && itr->resource != *filter.resource )
         continue;
      if( filter.resource_id.valid() && itr->resource_id != *filter.resource_id )
         continue;
      if( filter.subject.valid() && itr->subject != *filter.subject )
         continue;
      if( filter.subject_id.valid() && itr->subject_id != *filter.subject_id )
         continue;
      matches.push_back( &*itr );
   }

   std::sort( matches.begin(), matches.end(),
              []( const permission_tuple_object* a, const permission_tuple_object* b ) {
                 if( a->create_time != b->create_time )
                    return a->create_time > b->create_time;
                 return a->id > b->id;
              });

   tuple_page result;
   result.total = matches.size();
   const uint64_t offset = page.offset();
   for( uint64_t i = offset; i < matches.size() && result.tuples.size() < page.effective_page_size(); ++i )
      result.tuples.push_back( *matches[i] );
   return result;
}

optional<permission_tuple_object> tuple_store::find( tuple_id_type id )const
{
   read_lock lock( _mutex );

   const auto& idx = _tuples.get<by_id>();
   auto itr = idx.find( id );
   if( itr == idx.end() )
      return optional<permission_tuple_object>();
   return *itr;
}

size_t tuple_store::size()const
{
   read_lock lock( _mutex );
   return _tuples.size();
}

} } // rebac::store
