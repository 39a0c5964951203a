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
#include <gavel/protocol/auction.hpp>

namespace gavel { namespace protocol {

void auction_create_operation::validate()const
{
   FC_ASSERT( !exhibitor.is_null() );
   FC_ASSERT( !item_source.is_null() && !item_custody.is_null() );
   FC_ASSERT( !proceeds_receiving.is_null() );
   FC_ASSERT( !record.is_null() );
   FC_ASSERT( item_source != item_custody, "item must move into a separate custody account" );
   FC_ASSERT( record != item_custody && record != item_source );
   FC_ASSERT( record != exhibitor, "record slot ${r} is the exhibitor's own account, it could never be released",
              ("r",record) );
}

void auction_bid_operation::validate()const
{
   FC_ASSERT( !bidder.is_null() );
   FC_ASSERT( !bid_custody.is_null() && !bid_source.is_null() );
   FC_ASSERT( !record.is_null() );
   FC_ASSERT( amount > 0, "bid amount must be positive" );
   FC_ASSERT( bid_custody != bid_source, "bid must move into a separate custody account" );
   FC_ASSERT( leader.is_null() == leader_custody.is_null() && leader.is_null() == leader_refund.is_null(),
              "leader fields must be all set or all empty" );
}

void auction_cancel_operation::validate()const
{
   FC_ASSERT( !exhibitor.is_null() );
   FC_ASSERT( !item_custody.is_null() && !item_return.is_null() );
   FC_ASSERT( !record.is_null() );
   FC_ASSERT( item_custody != item_return );
}

void auction_close_operation::validate()const
{
   FC_ASSERT( !winner.is_null() && !exhibitor.is_null() );
   FC_ASSERT( !item_custody.is_null() && !item_receiving.is_null() );
   FC_ASSERT( !proceeds_receiving.is_null() && !winner_custody.is_null() );
   FC_ASSERT( !record.is_null() );
   FC_ASSERT( item_custody != item_receiving );
   FC_ASSERT( winner_custody != proceeds_receiving );
}

} } // gavel::protocol
