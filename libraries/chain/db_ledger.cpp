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

#include <gavel/protocol/exceptions.hpp>

#include <limits>

namespace gavel { namespace chain {

const account_object* database::find_account( const identity& key )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_key>();
   auto itr = idx.find( key );
   if( itr == idx.end() ) return nullptr;
   return &*itr;
}

const account_object& database::get_account( const identity& key )const
{
   auto acct = find_account( key );
   FC_ASSERT( acct != nullptr, "Unable to find account ${k}", ("k",key) );
   return *acct;
}

const custody_account_object* database::find_custody_account( const identity& key )const
{
   const auto& idx = get_index_type<custody_account_index>().indices().get<by_key>();
   auto itr = idx.find( key );
   if( itr == idx.end() ) return nullptr;
   return &*itr;
}

uint64_t database::get_balance( const identity& key )const
{
   auto acct = find_account( key );
   if( acct == nullptr ) return 0;
   return acct->balance;
}

void database::add_balance( const identity& key, uint64_t amount )
{ try {
   FC_ASSERT( !key.is_null(), "cannot credit the null identity" );
   auto acct = find_account( key );
   if( acct == nullptr )
   {
      create<account_object>( [&]( account_object& a ) {
         a.key     = key;
         a.balance = amount;
      });
      return;
   }
   GAVEL_ASSERT( acct->balance <= std::numeric_limits<uint64_t>::max() - amount, amount_overflow,
                 "crediting ${a} to ${k} overflows its balance of ${b}",
                 ("a",amount)("k",key)("b",acct->balance) );
   modify( *acct, [amount]( account_object& a ) {
      a.balance += amount;
   });
} FC_CAPTURE_AND_RETHROW( (key)(amount) ) }

void database::reduce_balance( const identity& key, uint64_t amount )
{ try {
   if( amount == 0 ) return;
   auto acct = find_account( key );
   GAVEL_ASSERT( acct != nullptr && acct->balance >= amount, insufficient_balance,
                 "${k} has ${b}, needs ${a}", ("k",key)("b",get_balance(key))("a",amount) );
   modify( *acct, [amount]( account_object& a ) {
      a.balance -= amount;
   });
} FC_CAPTURE_AND_RETHROW( (key)(amount) ) }

uint64_t database::reclaim_account( const identity& key, const identity& destination )
{ try {
   FC_ASSERT( key != destination, "an account cannot be reclaimed into itself" );
   const account_object& acct = get_account( key );
   uint64_t amount = acct.balance;
   add_balance( destination, amount );
   remove( acct );
   return amount;
} FC_CAPTURE_AND_RETHROW( (key)(destination) ) }

bool database::is_persistently_funded( const account_object& account )const
{
   return account.balance >= _parameters.rent.minimum_balance( account.data.size() );
}

} }
