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
    * @brief Create a storage account funded from the funder's native balance
    *
    * The new account starts with @ref data_size zero bytes of data which only @ref owner
    * may write.  Auction record slots are storage accounts owned by the auction protocol.
    */
   struct account_create_operation : public base_operation
   {
      identity funder;
      identity new_account;
      uint64_t balance   = 0;
      uint32_t data_size = 0;
      identity owner;

      void validate()const;
   };

} } // gavel::protocol

FC_REFLECT( gavel::protocol::account_create_operation, (funder)(new_account)(balance)(data_size)(owner) )
