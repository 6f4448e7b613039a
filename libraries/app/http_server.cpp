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

#include <rebac/app/http_server.hpp>

#include <fc/log/logger.hpp>

namespace rebac { namespace app {

http_server::http_server( const permission_api& api )
   : _api( api ), _server( new fc::http::server() )
{
   _server->on_request( [this]( const fc::http::request& req, const fc::http::server::response& res ) {
      on_request( req, res );
   } );
}

http_server::~http_server()
{
}

void http_server::listen( const std::string& endpoint )
{ try {
   _server->listen( fc::ip::endpoint::from_string( endpoint ) );
   ilog( "Listening for permission requests on ${ep}", ("ep", local_endpoint()) );
} FC_CAPTURE_AND_RETHROW( (endpoint) ) }

fc::ip::endpoint http_server::local_endpoint()const
{
   return _server->get_local_endpoint();
}

void http_server::on_request( const fc::http::request& req, const fc::http::server::response& res )const
{
   http_request request;
   request.method = req.method;
   request.set_target( req.path );
   for( const auto& header : req.headers )
      request.set_header( header.key, header.val );
   request.body.assign( req.body.begin(), req.body.end() );

   const http_response response = _api.handle( request );

   res.set_status( static_cast<fc::http::reply::status_code>( response.status ) );
   if( !response.content_type.empty() )
      res.add_header( "Content-Type", response.content_type );
   res.set_length( response.body.size() );
   // The status line and headers go out with the first write, so an empty body is still written
   res.write( response.body.data(), response.body.size() );
}

} } // rebac::app
