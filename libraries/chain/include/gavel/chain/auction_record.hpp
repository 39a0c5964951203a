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

   enum class auction_status
   {
      nonexistent,
      open
   };

   /**
    *  @brief persisted state of one auction
    *
    *  Stored with fc::raw inside the data of the record slot account.  The packed width is
    *  fixed and an all-zero buffer of that width unpacks to an uninitialized record, which is
    *  how a freshly created record slot reads before Create.
    */
   struct auction_record
   {
      bool           is_initialized = false;
      identity       exhibitor;
      identity       item_custody;
      identity       proceeds_receiving;
      uint64_t       current_price = 0;
      /// null until the first bid
      identity       highest_bidder;
      identity       highest_bidder_custody;
      identity       highest_bidder_refund;
      time_point_sec end_at;

      static const size_t packed_size = 1 + 3 * sizeof(fc::sha256) + 8 + 3 * sizeof(fc::sha256) + 4;

      bool has_bidder()const { return !highest_bidder.is_null(); }

      /** @throws record_size_mismatch when data is not exactly packed_size bytes */
      static auction_record unpack( const vector<char>& data );
      vector<char>          pack()const;
   };

} } // gavel::chain

FC_REFLECT_ENUM( gavel::chain::auction_status, (nonexistent)(open) )
FC_REFLECT( gavel::chain::auction_record,
            (is_initialized)
            (exhibitor)
            (item_custody)
            (proceeds_receiving)
            (current_price)
            (highest_bidder)
            (highest_bidder_custody)
            (highest_bidder_refund)
            (end_at) )
