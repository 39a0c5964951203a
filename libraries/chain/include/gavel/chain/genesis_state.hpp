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
#include <gavel/chain/chain_parameters.hpp>

namespace gavel { namespace chain {

   /**
    *  Initial ledger contents.  Accounts and custody balances listed here exist before the
    *  first transaction is applied and need no funder.
    */
   struct genesis_state_type
   {
      struct initial_account_type
      {
         identity key;
         uint64_t balance = 0;
      };
      struct initial_custody_account_type
      {
         identity key;
         identity mint;
         identity authority;
         uint64_t amount  = 0;
         uint64_t deposit = 0;
      };

      chain_parameters                     initial_parameters;
      vector<initial_account_type>         initial_accounts;
      vector<initial_custody_account_type> initial_custody_accounts;
   };

} } // gavel::chain

FC_REFLECT( gavel::chain::genesis_state_type::initial_account_type, (key)(balance) )
FC_REFLECT( gavel::chain::genesis_state_type::initial_custody_account_type,
            (key)(mint)(authority)(amount)(deposit) )
FC_REFLECT( gavel::chain::genesis_state_type,
            (initial_parameters)(initial_accounts)(initial_custody_accounts) )
