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
#include <gavel/chain/types.hpp>

namespace gavel { namespace chain {

   /**
    *  Storage rent.  An account is persistently funded when its balance covers
    *  minimum_balance() for the size of its data.
    */
   struct rent_parameters
   {
      uint64_t lamports_per_byte_year    = GAVEL_DEFAULT_LAMPORTS_PER_BYTE_YEAR;
      uint64_t exemption_threshold_years = GAVEL_DEFAULT_EXEMPTION_THRESHOLD_YEARS;
      uint64_t account_storage_overhead  = GAVEL_DEFAULT_ACCOUNT_STORAGE_OVERHEAD;

      uint64_t minimum_balance( size_t data_size )const;
   };

   struct chain_parameters
   {
      /// owner of every record slot, also the root of all derived authorities
      identity        protocol_id;
      string          authority_label = GAVEL_DEFAULT_AUTHORITY_LABEL;
      chain_id_type   chain_id;
      rent_parameters rent;

      void validate()const;
   };

} } // gavel::chain

FC_REFLECT( gavel::chain::rent_parameters,
            (lamports_per_byte_year)
            (exemption_threshold_years)
            (account_storage_overhead) )
FC_REFLECT( gavel::chain::chain_parameters,
            (protocol_id)
            (authority_label)
            (chain_id)
            (rent) )
