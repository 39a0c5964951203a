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
#include <gavel/chain/account_evaluator.hpp>
#include <gavel/chain/auction_guards.hpp>
#include <gavel/chain/database.hpp>
#include <gavel/chain/transaction_evaluation_state.hpp>

#include <gavel/protocol/exceptions.hpp>

namespace gavel { namespace chain {

void_result account_create_evaluator::do_evaluate( const account_create_operation& o )
{ try {
   const database& d = db();

   guard::require_signer( *trx_state, o.funder );
   FC_ASSERT( d.find_account( o.new_account ) == nullptr, "account ${a} already exists", ("a",o.new_account) );
   GAVEL_ASSERT( d.get_balance( o.funder ) >= o.balance, insufficient_balance,
                 "${f} has ${b}, cannot fund ${n}",
                 ("f",o.funder)("b",d.get_balance( o.funder ))("n",o.balance) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

identity account_create_evaluator::do_apply( const account_create_operation& o )
{ try {
   database& d = db();

   d.reduce_balance( o.funder, o.balance );
   d.create<account_object>( [&o]( account_object& a ) {
      a.key     = o.new_account;
      a.balance = o.balance;
      a.owner   = o.owner;
      a.data.resize( o.data_size, 0 );
   });

   return o.new_account;
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // gavel::chain
