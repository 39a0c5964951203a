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
#include <gavel/protocol/base.hpp>

namespace gavel { namespace protocol {

   /**
    * @ingroup operations
    * @brief Open an auction for one unit of an item
    *
    * The exhibitor moves the item from @ref item_source into the empty @ref item_custody account
    * and hands control of that account to the derived authority of @ref record.  The auction
    * runs for @ref duration_seconds from the time the operation is applied.
    */
   struct auction_create_operation : public base_operation
   {
      identity exhibitor;
      identity item_source;
      identity item_custody;
      identity proceeds_receiving;
      identity record;
      uint64_t initial_price    = 0;
      uint64_t duration_seconds = 0;

      void validate()const;
   };

   /**
    * @ingroup operations
    * @brief Outbid the current leader
    *
    * The leader fields must repeat what the record holds.  They are null while nobody has bid.
    * On success the previous leader is refunded from @ref leader_custody into
    * @ref leader_refund and that custody account is closed.
    */
   struct auction_bid_operation : public base_operation
   {
      identity bidder;
      identity leader;
      identity leader_custody;
      identity leader_refund;
      identity bid_custody;
      identity bid_source;
      identity record;
      uint64_t amount = 0;

      void validate()const;
   };

   /**
    * @ingroup operations
    * @brief Withdraw an auction that has not received any bid
    */
   struct auction_cancel_operation : public base_operation
   {
      identity exhibitor;
      identity item_custody;
      identity item_return;
      identity record;

      void validate()const;
   };

   /**
    * @ingroup operations
    * @brief Settle an expired auction, signed by the winner
    *
    * Swaps the item for the winning funds and closes both custody accounts together with the
    * record slot.
    */
   struct auction_close_operation : public base_operation
   {
      identity winner;
      identity exhibitor;
      identity item_custody;
      identity proceeds_receiving;
      identity winner_custody;
      identity item_receiving;
      identity record;

      void validate()const;
   };

} } // gavel::protocol

FC_REFLECT( gavel::protocol::auction_create_operation,
            (exhibitor)(item_source)(item_custody)(proceeds_receiving)(record)(initial_price)(duration_seconds) )
FC_REFLECT( gavel::protocol::auction_bid_operation,
            (bidder)(leader)(leader_custody)(leader_refund)(bid_custody)(bid_source)(record)(amount) )
FC_REFLECT( gavel::protocol::auction_cancel_operation,
            (exhibitor)(item_custody)(item_return)(record) )
FC_REFLECT( gavel::protocol::auction_close_operation,
            (winner)(exhibitor)(item_custody)(proceeds_receiving)(winner_custody)(item_receiving)(record) )
