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

#define REBAC_MAX_NESTED_OBJECTS (200)

#define REBAC_DEFAULT_PAGE_SIZE                 20
#define REBAC_MAX_PAGE_SIZE                     100

/// Identifier width limits, sized for UUIDs
#define REBAC_MAX_RESOURCE_ID_LENGTH            36
#define REBAC_MAX_SUBJECT_ID_LENGTH             36

#define REBAC_DEFAULT_IDENTITY_TIMEOUT_MS       2000
#define REBAC_DEFAULT_HTTP_ENDPOINT             "127.0.0.1:8090"
#define REBAC_TUPLE_SNAPSHOT_FILENAME           "permission_tuples.json"

#define REBAC_HEADER_TENANT_ID                  "x-md-global-tenant-id"
#define REBAC_HEADER_USER_ID                    "x-md-global-user-id"
#define REBAC_HEADER_USERNAME                   "x-md-global-username"
#define REBAC_HEADER_ROLES                      "x-md-global-roles"
