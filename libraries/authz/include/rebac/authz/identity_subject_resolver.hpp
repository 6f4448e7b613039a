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

#include <rebac/authz/subject_resolver.hpp>

#include <string>

namespace rebac { namespace authz {

   /**
    * @brief Subject resolver asking the identity directory over HTTP
    *
    * GET <base_url>/v1/tenants/<tenant>/users/<user>/roles is expected to
    * answer 200 with {"tenantId": <int>, "roles": ["..."]}. 404 means the user
    * is not a member of the tenant. Any transport failure, other status,
    * malformed body or timeout is reported as identity_unavailable_exception.
    */
   class identity_subject_resolver : public subject_resolver
   {
   public:
      identity_subject_resolver( const std::string& base_url, uint32_t timeout_ms );
      virtual ~identity_subject_resolver();

      subject_set resolve_subjects( tenant_id_type tenant, const string& user_id ) override;

      const std::string& base_url()const { return _base_url; }
      uint32_t timeout_ms()const { return _timeout_ms; }

   private:
      std::string _base_url;
      uint32_t    _timeout_ms;
   };

} } // rebac::authz
