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

#include <gavel/protocol/identity.hpp>

namespace gavel { namespace protocol {

   /**
    *  @brief a keyless identity the auction protocol signs for
    *
    *  The identity is computed from the protocol identity, a fixed label and a scope (the
    *  auction record) together with a bump byte.  Bumps are tried from 255 down to 0 and the
    *  first hash that lands in the derived identity space wins, so the result is deterministic
    *  and never collides with a keyed identity.
    */
   struct derived_authority
   {
      identity key;
      uint8_t  bump = 0;
   };

   /**
    *  Hash the seeds with the given bump.
    *  @return the identity if the hash is in the derived space, an empty optional otherwise
    */
   optional<identity> create_derived_identity( const string& label, const identity& scope, uint8_t bump,
                                               const identity& protocol_id );

   derived_authority find_derived_authority( const string& label, const identity& scope,
                                             const identity& protocol_id );

} } // gavel::protocol

FC_REFLECT( gavel::protocol::derived_authority, (key)(bump) )
