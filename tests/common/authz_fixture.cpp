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

#include "authz_fixture.hpp"

namespace rebac { namespace test {

authz_fixture::authz_fixture()
   : engine( tuples, resolver, directory )
{
   tuples.open( data_dir.path() );
   engine.set_clock( [this]() { return now; } );
}

authz_fixture::~authz_fixture()
{
   try
   {
      tuples.close();
   }
   catch( const fc::exception& e )
   {
      elog( "Unable to close test tuple store: ${e}", ("e", e.to_detail_string()) );
   }
}

void authz_fixture::advance_time( uint32_t seconds )
{
   now += seconds;
}

permission_tuple_object authz_fixture::grant( tenant_id_type tenant, const string& resource_id,
                                              relation_type relation, subject_type subject,
                                              const string& subject_id,
                                              const optional<fc::time_point_sec>& expires_at )
{
   grant_operation op;
   op.tenant_id   = tenant;
   op.resource    = resource_type::bookmark;
   op.resource_id = resource_id;
   op.relation    = relation;
   op.subject     = subject;
   op.subject_id  = subject_id;
   op.expires_at  = expires_at;
   return engine.grant( op );
}

permission_tuple_object authz_fixture::grant_user( tenant_id_type tenant, const string& resource_id,
                                                   relation_type relation, const string& user_id )
{
   return grant( tenant, resource_id, relation, subject_type::user, user_id );
}

uint64_t authz_fixture::revoke( tenant_id_type tenant, const string& resource_id, subject_type subject,
                                const string& subject_id, const optional<relation_type>& relation )
{
   revoke_operation op;
   op.tenant_id   = tenant;
   op.resource    = resource_type::bookmark;
   op.resource_id = resource_id;
   op.subject     = subject;
   op.subject_id  = subject_id;
   op.relation    = relation;
   return engine.revoke( op );
}

check_result authz_fixture::check( tenant_id_type tenant, const string& user_id, const string& resource_id,
                                   permission_type permission )
{
   return engine.check( tenant, user_id, resource_type::bookmark, resource_id, permission );
}

bool authz_fixture::allowed( tenant_id_type tenant, const string& user_id, const string& resource_id,
                             permission_type permission )
{
   return check( tenant, user_id, resource_id, permission ).allowed;
}

} } // rebac::test
