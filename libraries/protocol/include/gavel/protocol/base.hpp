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

#include <gavel/protocol/identity.hpp>

namespace gavel { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @ingroup transactions Transactions
    *  @brief A set of valid commands for mutating the ledger.
    *
    *  An operation is a request to perform a state transition.  Every operation names the
    *  identities it touches as plain fields, in a fixed order, and carries a validate() method
    *  for the checks that do not depend on ledger state.
    *
    *  An operation may succeed or fail.  A failed operation leaves the ledger untouched, and
    *  so does every other operation of the same transaction.
    *  @{
    */

   struct void_result{};

   /** returned by a successful auction close */
   struct auction_settlement
   {
      identity winner;
      uint64_t item_quantity          = 0;
      uint64_t proceeds               = 0;
      uint64_t reclaimed_to_winner    = 0;
      uint64_t reclaimed_to_exhibitor = 0;
   };

   typedef fc::static_variant<void_result,identity,auction_settlement> operation_result;

   struct base_operation
   {
      void validate()const{}
   };

   ///@}

} } // gavel::protocol

FC_REFLECT( gavel::protocol::void_result, )
FC_REFLECT( gavel::protocol::auction_settlement,
            (winner)(item_quantity)(proceeds)(reclaimed_to_winner)(reclaimed_to_exhibitor) )
