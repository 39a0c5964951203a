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

#include <memory>
#include <vector>
#include <map>
#include <set>
#include <cstdint>

#include <fc/container/flat.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/io/raw.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <gavel/protocol/config.hpp>

namespace gavel { namespace protocol {

using std::map;
using std::vector;
using std::string;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;
using std::make_pair;

using fc::variant;
using fc::optional;
using fc::time_point_sec;
using fc::static_variant;
using fc::flat_set;
using fc::flat_map;

typedef fc::ecc::private_key        private_key_type;
typedef fc::ecc::public_key         public_key_type;
typedef fc::ecc::compact_signature  signature_type;
typedef fc::sha256                  digest_type;
typedef fc::sha256                  chain_id_type;

} } // gavel::protocol
