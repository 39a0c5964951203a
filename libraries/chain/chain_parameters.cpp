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
#include <gavel/chain/chain_parameters.hpp>
#include <gavel/protocol/exceptions.hpp>

#include <limits>

namespace gavel { namespace chain {

   uint64_t rent_parameters::minimum_balance( size_t data_size )const
   {
      const uint64_t max = std::numeric_limits<uint64_t>::max();
      GAVEL_ASSERT( data_size <= max - account_storage_overhead, amount_overflow,
                    "data size ${n} overflows the rent computation", ("n",data_size) );
      uint64_t bytes = account_storage_overhead + data_size;
      GAVEL_ASSERT( lamports_per_byte_year == 0 || bytes <= max / lamports_per_byte_year, amount_overflow,
                    "rent for ${n} bytes overflows", ("n",bytes) );
      uint64_t per_year = bytes * lamports_per_byte_year;
      GAVEL_ASSERT( exemption_threshold_years == 0 || per_year <= max / exemption_threshold_years, amount_overflow,
                    "rent for ${n} bytes overflows", ("n",bytes) );
      return per_year * exemption_threshold_years;
   }

   void chain_parameters::validate()const
   {
      FC_ASSERT( !protocol_id.is_null(), "protocol identity must be set" );
      FC_ASSERT( !authority_label.empty(), "authority label must not be empty" );
   }

} } // gavel::chain
