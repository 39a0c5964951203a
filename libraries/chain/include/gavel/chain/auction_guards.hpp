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
#include <gavel/chain/auction_record.hpp>
#include <gavel/chain/transaction_evaluation_state.hpp>

namespace gavel { namespace chain { namespace guard {

   /**
    *  @defgroup auction_guards Auction guards
    *
    *  Checks shared by every auction transition.  Each require_* function returns when the
    *  condition holds and throws the matching gavel exception otherwise.  The predicates
    *  behind them have no side effects.
    *  @{
    */

   bool is_signed_by( const transaction_evaluation_state& eval_state, const identity& who );
   bool matches( const identity& supplied, const identity& expected );
   /// an auction ending at end_at is over from that instant on
   bool is_expired( time_point_sec now, time_point_sec end_at );
   bool is_initialized( const auction_record& record );
   bool has_bidder( const auction_record& record );
   bool outbids( uint64_t amount, const auction_record& record );
   bool is_leader( const identity& bidder, const auction_record& record );

   /** @throws missing_signature */
   void require_signer( const transaction_evaluation_state& eval_state, const identity& who );
   /** @throws identity_mismatch naming @p role */
   void require_match( const identity& supplied, const identity& expected, const char* role );
   /** @throws auction_expired unless now < boundary */
   void require_before( time_point_sec now, time_point_sec boundary );
   /** @throws auction_still_open unless now >= boundary */
   void require_not_before( time_point_sec now, time_point_sec boundary );
   void require_uninitialized( const auction_record& record );
   void require_initialized( const auction_record& record );
   /** @throws auction_has_bids */
   void require_no_bidder( const auction_record& record );
   /** @throws auction_no_winner */
   void require_bidder( const auction_record& record );
   /** @throws auction_bid_too_low */
   void require_outbids( uint64_t amount, const auction_record& record );
   /** @throws auction_already_leader */
   void require_not_leader( const identity& bidder, const auction_record& record );

   /// @}

} } } // gavel::chain::guard
