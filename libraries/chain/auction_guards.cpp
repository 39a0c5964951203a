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
#include <gavel/chain/auction_guards.hpp>
#include <gavel/protocol/exceptions.hpp>

namespace gavel { namespace chain { namespace guard {

bool is_signed_by( const transaction_evaluation_state& eval_state, const identity& who )
{
   return !who.is_null() && eval_state.signed_by( who );
}

bool matches( const identity& supplied, const identity& expected )
{
   return supplied == expected;
}

bool is_expired( time_point_sec now, time_point_sec end_at )
{
   return now >= end_at;
}

bool is_initialized( const auction_record& record )
{
   return record.is_initialized;
}

bool has_bidder( const auction_record& record )
{
   return record.has_bidder();
}

bool outbids( uint64_t amount, const auction_record& record )
{
   return amount > record.current_price;
}

bool is_leader( const identity& bidder, const auction_record& record )
{
   return has_bidder( record ) && record.highest_bidder == bidder;
}

void require_signer( const transaction_evaluation_state& eval_state, const identity& who )
{
   GAVEL_ASSERT( is_signed_by( eval_state, who ), missing_signature,
                 "${who} did not sign the transaction", ("who",who) );
}

void require_match( const identity& supplied, const identity& expected, const char* role )
{
   GAVEL_ASSERT( matches( supplied, expected ), identity_mismatch,
                 "${role} ${supplied} does not match ${expected}",
                 ("role",role)("supplied",supplied)("expected",expected) );
}

void require_before( time_point_sec now, time_point_sec boundary )
{
   GAVEL_ASSERT( !is_expired( now, boundary ), auction_expired,
                 "auction ended at ${end}, now is ${now}", ("end",boundary)("now",now) );
}

void require_not_before( time_point_sec now, time_point_sec boundary )
{
   GAVEL_ASSERT( is_expired( now, boundary ), auction_still_open,
                 "auction ends in ${s} seconds", ("s",boundary.sec_since_epoch() - now.sec_since_epoch())
                 ("end",boundary)("now",now) );
}

void require_uninitialized( const auction_record& record )
{
   GAVEL_ASSERT( !is_initialized( record ), auction_already_initialized,
                 "auction by ${e} is already running", ("e",record.exhibitor) );
}

void require_initialized( const auction_record& record )
{
   GAVEL_ASSERT( is_initialized( record ), auction_not_initialized, "auction record is not initialized" );
}

void require_no_bidder( const auction_record& record )
{
   GAVEL_ASSERT( !has_bidder( record ), auction_has_bids,
                 "auction already has a bid of ${p} by ${b}",
                 ("p",record.current_price)("b",record.highest_bidder) );
}

void require_bidder( const auction_record& record )
{
   GAVEL_ASSERT( has_bidder( record ), auction_no_winner, "nobody bid on this auction" );
}

void require_outbids( uint64_t amount, const auction_record& record )
{
   GAVEL_ASSERT( outbids( amount, record ), auction_bid_too_low,
                 "bid of ${a} does not exceed the current price ${p}",
                 ("a",amount)("p",record.current_price) );
}

void require_not_leader( const identity& bidder, const auction_record& record )
{
   GAVEL_ASSERT( !is_leader( bidder, record ), auction_already_leader,
                 "${b} already holds the highest bid", ("b",bidder) );
}

} } } // gavel::chain::guard
