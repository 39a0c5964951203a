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
#include <gavel/protocol/identity.hpp>

namespace gavel { namespace protocol {

   identity::identity( const std::string& hex )
   {
      FC_ASSERT( hex.size() == 2 * sizeof( value ), "identity must be ${n} hex digits", ("n",2*sizeof(value))("str",hex) );
      value = fc::sha256( hex );
   }

   identity::identity( const public_key_type& pub )
   {
      auto dat = pub.serialize();
      value = fc::sha256::hash( (char*) dat.data(), dat.size() );
      value.data()[0] &= ~char(GAVEL_DERIVED_IDENTITY_FLAG);
   }

   bool identity::is_null()const
   {
      return value == fc::sha256();
   }

   bool identity::is_keyed()const
   {
      return !is_null() && !in_derived_space( value );
   }

   bool identity::is_derived()const
   {
      return in_derived_space( value );
   }

   identity::operator std::string()const
   {
      return value.str();
   }

   bool in_derived_space( const fc::sha256& h )
   {
      return ( uint8_t( h.data()[0] ) & GAVEL_DERIVED_IDENTITY_FLAG ) != 0;
   }

} } // gavel::protocol

namespace fc
{
    void to_variant( const gavel::protocol::identity& var,  variant& vo, uint32_t max_depth )
    {
        vo = std::string(var);
    }
    void from_variant( const variant& var,  gavel::protocol::identity& vo, uint32_t max_depth )
    {
        vo = gavel::protocol::identity( var.as_string() );
    }
}
