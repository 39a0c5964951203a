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
#include <gavel/chain/database.hpp>
#include <gavel/chain/transaction_evaluation_state.hpp>

#include <gavel/protocol/exceptions.hpp>

namespace gavel { namespace chain {

database::database()
:_time_source( std::make_shared<system_time_source>() ),
 _custody( std::make_unique<ledger_custody_service>( *this ) )
{
   initialize_indexes();
   initialize_evaluators();
}

database::~database()
{
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   genesis_state.initial_parameters.validate();
   FC_ASSERT( _undo_db.active_sessions() == 0, "genesis must be loaded before any transaction" );

   _parameters = genesis_state.initial_parameters;

   for( const auto& acct : genesis_state.initial_accounts )
      add_balance( acct.key, acct.balance );

   for( const auto& custody_acct : genesis_state.initial_custody_accounts )
   {
      GAVEL_ASSERT( find_custody_account( custody_acct.key ) == nullptr, custody_account_exists,
                    "custody account ${k} listed twice in genesis", ("k",custody_acct.key) );
      create<custody_account_object>( [&]( custody_account_object& c ) {
         c.key       = custody_acct.key;
         c.mint      = custody_acct.mint;
         c.authority = custody_acct.authority;
         c.amount    = custody_acct.amount;
         c.deposit   = custody_acct.deposit;
      });
   }

   ilog( "genesis loaded: ${a} accounts, ${c} custody accounts, protocol ${p}",
         ("a",genesis_state.initial_accounts.size())
         ("c",genesis_state.initial_custody_accounts.size())
         ("p",_parameters.protocol_id) );
} FC_CAPTURE_AND_RETHROW() }

time_point_sec database::now()const
{
   return _time_source->now();
}

void database::set_time_source( shared_ptr<time_source> source )
{
   FC_ASSERT( source, "time source must not be null" );
   _time_source = std::move( source );
}

void database::set_custody_service( unique_ptr<custody_service> service )
{
   FC_ASSERT( service, "custody service must not be null" );
   FC_ASSERT( _current_trx_state == nullptr, "cannot replace the custody service while applying a transaction" );
   _custody = std::move( service );
}

} }
