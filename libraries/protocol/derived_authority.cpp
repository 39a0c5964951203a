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
#include <gavel/protocol/derived_authority.hpp>
#include <gavel/protocol/exceptions.hpp>

namespace gavel { namespace protocol {

   optional<identity> create_derived_identity( const string& label, const identity& scope, uint8_t bump,
                                               const identity& protocol_id )
   {
      fc::sha256::encoder enc;
      fc::raw::pack( enc, label );
      fc::raw::pack( enc, scope );
      fc::raw::pack( enc, bump );
      fc::raw::pack( enc, protocol_id );
      fc::raw::pack( enc, string( GAVEL_DERIVED_AUTHORITY_DOMAIN ) );
      auto h = enc.result();
      if( !in_derived_space( h ) )
         return optional<identity>();
      return identity( h );
   }

   derived_authority find_derived_authority( const string& label, const identity& scope,
                                             const identity& protocol_id )
   {
      for( int bump = GAVEL_MAX_DERIVATION_BUMP; bump >= 0; --bump )
      {
         auto key = create_derived_identity( label, scope, uint8_t(bump), protocol_id );
         if( key.valid() )
         {
            derived_authority result;
            result.key  = *key;
            result.bump = uint8_t(bump);
            return result;
         }
      }
      FC_THROW_EXCEPTION( arithmetic_failure, "no bump yields a derived identity for ${label}",
                          ("label",label)("scope",scope) );
   }

} } // gavel::protocol
