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
#include <gavel/chain/auction_record.hpp>
#include <gavel/protocol/exceptions.hpp>

namespace gavel { namespace chain {

const size_t auction_record::packed_size;

auction_record auction_record::unpack( const vector<char>& data )
{ try {
   GAVEL_ASSERT( data.size() == packed_size, record_size_mismatch,
                 "record slot holds ${n} bytes, expected ${e}", ("n",data.size())("e",packed_size) );
   return fc::raw::unpack<auction_record>( data );
} FC_CAPTURE_AND_RETHROW() }

vector<char> auction_record::pack()const
{
   auto data = fc::raw::pack( *this );
   FC_ASSERT( data.size() == packed_size, "auction record packed to ${n} bytes", ("n",data.size()) );
   return data;
}

} } // gavel::chain
