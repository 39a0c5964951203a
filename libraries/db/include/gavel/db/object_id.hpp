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
#include <fc/exception/exception.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/string.hpp>

#include <functional>

namespace gavel { namespace db {

   /**
    *  Identifies an object inside the object_database.  The upper byte selects the
    *  id space, the next byte the object type within that space and the remaining
    *  48 bits are the instance number handed out by the index.
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 48;
      static constexpr uint8_t  type_and_instance_bits = 56;
      static constexpr uint64_t one_byte_mask = 0x00ff;
      static constexpr uint64_t max_instance = 0x0000ffffffffffff;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i ){ reset( s, t, i ); }

      void reset( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i >> instance_bits == 0, "instance overflow", ("instance",i) );
         number = ( (uint64_t(s) << type_and_instance_bits) | (uint64_t(t) << instance_bits) ) | i;
      }

      uint8_t  space()const      { return number >> type_and_instance_bits; }
      uint8_t  type()const       { return (number >> instance_bits) & one_byte_mask; }
      uint64_t instance()const   { return number & max_instance; }
      bool     is_null()const    { return 0 == number; }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }

      object_id_type next()const { return object_id_type( space(), type(), instance() + 1 ); }

      explicit operator std::string()const
      {
         return fc::to_string(space()) + "." + fc::to_string(type()) + "." + fc::to_string(instance());
      }

      uint64_t number = 0;
   };

} } // gavel::db

namespace std {
   template<> struct hash< gavel::db::object_id_type >
   {
      size_t operator()( const gavel::db::object_id_type& id )const
      {
         return std::hash<uint64_t>()( id.number );
      }
   };
}

FC_REFLECT( gavel::db::object_id_type, (number) )
