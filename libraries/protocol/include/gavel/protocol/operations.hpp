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
#include <gavel/protocol/account.hpp>
#include <gavel/protocol/auction.hpp>
#include <gavel/protocol/custody.hpp>

namespace gavel { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.  New operations are
    * appended; the tag of an existing operation never changes.
    */
   typedef fc::static_variant<
            account_create_operation,
            custody_account_create_operation,
            auction_create_operation,
            auction_bid_operation,
            auction_cancel_operation,
            auction_close_operation
         > operation;

   /// @} // operations group

   /**
    *  Performs all stateless validation of the operation.
    */
   void operation_validate( const operation& op );

} } // gavel::protocol

FC_REFLECT_TYPENAME( gavel::protocol::operation )
FC_REFLECT_TYPENAME( gavel::protocol::operation_result )
