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

#include <gavel/protocol/types.hpp>

namespace gavel { namespace protocol {

   /**
    *  @brief a 256 bit name for anything that can hold value or sign on the ledger
    *
    *  A keyed identity is sha256( compressed_ecc_public_key ) with the top bit of the first
    *  byte cleared.  Derived identities (see derived_authority.hpp) always have that bit set,
    *  so no private key can ever sign for a derived identity.
    *
    *  The default constructed identity is null and stands for "nobody", e.g. an auction
    *  that has not received a bid yet or an account owned by the system.
    *
    *  When converted to a string the identity is rendered as 64 hex digits.
    */
   class identity
   {
      public:
         identity(){} ///< constructs the null identity
         explicit identity( const fc::sha256& v ):value(v){}
         explicit identity( const std::string& hex );
         explicit identity( const public_key_type& pub );

         bool is_null()const;
         bool is_keyed()const;
         bool is_derived()const;

         explicit operator std::string()const;

         fc::sha256 value;
   };
   inline bool operator == ( const identity& a, const identity& b ) { return a.value == b.value; }
   inline bool operator != ( const identity& a, const identity& b ) { return a.value != b.value; }
   inline bool operator <  ( const identity& a, const identity& b ) { return a.value <  b.value; }

   /** true if the hash can name a derived identity */
   bool in_derived_space( const fc::sha256& h );

} } // gavel::protocol

namespace fc
{
   void to_variant( const gavel::protocol::identity& var,  fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var,  gavel::protocol::identity& vo, uint32_t max_depth = 1 );
}

FC_REFLECT( gavel::protocol::identity, (value) )
