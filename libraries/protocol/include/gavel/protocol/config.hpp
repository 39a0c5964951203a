/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
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

#define GAVEL_MAX_NESTED_OBJECTS (200)

/** number of item units an exhibitor places into custody */
#define GAVEL_ITEM_QUANTITY uint64_t(1)

#define GAVEL_DEFAULT_AUTHORITY_LABEL "escrow"
#define GAVEL_DERIVED_AUTHORITY_DOMAIN "GavelDerivedAuthority"
#define GAVEL_MAX_DERIVATION_BUMP 255

/** identities whose first byte has this bit set belong to the derived (keyless) space */
#define GAVEL_DERIVED_IDENTITY_FLAG 0x80

#define GAVEL_DEFAULT_LAMPORTS_PER_BYTE_YEAR     uint64_t(3480)
#define GAVEL_DEFAULT_EXEMPTION_THRESHOLD_YEARS  uint64_t(2)
#define GAVEL_DEFAULT_ACCOUNT_STORAGE_OVERHEAD   uint64_t(128)

#define GAVEL_MAX_ACCOUNT_DATA_SIZE (10*1024*1024)
