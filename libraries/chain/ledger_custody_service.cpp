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
#include <gavel/chain/custody_service.hpp>
#include <gavel/chain/database.hpp>

#include <gavel/protocol/derived_authority.hpp>
#include <gavel/protocol/exceptions.hpp>

#include <limits>

namespace gavel { namespace chain {

const custody_account_object* ledger_custody_service::find( const identity& account )const
{
   return _db.find_custody_account( account );
}

const custody_account_object& ledger_custody_service::get( const identity& account )const
{
   auto obj = find( account );
   GAVEL_ASSERT( obj != nullptr, custody_account_not_found, "custody account ${a} does not exist", ("a",account) );
   return *obj;
}

void ledger_custody_service::verify_authorizer( const custody_account_object& account,
                                                const custody_authorizer& authorizer )const
{
   if( authorizer.is_proof() )
   {
      const auto& proof = authorizer.proof();
      auto derived = create_derived_identity( proof.label(), proof.scope(), proof.bump(),
                                              _db.get_chain_parameters().protocol_id );
      GAVEL_ASSERT( derived.valid() && *derived == account.authority, custody_unproven_authority,
                    "proof for scope ${s} does not control ${a}",
                    ("s",proof.scope())("a",account.key)("authority",account.authority) );
      return;
   }

   GAVEL_ASSERT( _db.is_signer( authorizer.signer() ), missing_signature,
                 "${s} did not sign the transaction", ("s",authorizer.signer()) );
   GAVEL_ASSERT( authorizer.signer() == account.authority, custody_wrong_authority,
                 "${s} does not control ${a}",
                 ("s",authorizer.signer())("a",account.key)("authority",account.authority) );
}

void ledger_custody_service::transfer( const identity& from, const identity& to,
                                       const custody_authorizer& authorizer, uint64_t amount )
{ try {
   const auto& source      = get( from );
   const auto& destination = get( to );

   GAVEL_ASSERT( source.mint == destination.mint, custody_mint_mismatch,
                 "cannot move ${m1} into an account holding ${m2}",
                 ("m1",source.mint)("m2",destination.mint) );
   verify_authorizer( source, authorizer );
   GAVEL_ASSERT( source.amount >= amount, custody_insufficient_amount,
                 "${a} holds ${h}, transfer needs ${n}", ("a",from)("h",source.amount)("n",amount) );

   if( from == to || amount == 0 ) return;

   GAVEL_ASSERT( destination.amount <= std::numeric_limits<uint64_t>::max() - amount, amount_overflow,
                 "crediting ${n} to ${a} overflows", ("n",amount)("a",to) );

   _db.modify( source, [amount]( custody_account_object& c ) {
      c.amount -= amount;
   });
   _db.modify( destination, [amount]( custody_account_object& c ) {
      c.amount += amount;
   });
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void ledger_custody_service::set_authority( const identity& account, const identity& new_authority,
                                            const custody_authorizer& authorizer )
{ try {
   FC_ASSERT( !new_authority.is_null(), "custody account needs an authority" );
   const auto& obj = get( account );
   verify_authorizer( obj, authorizer );
   _db.modify( obj, [&new_authority]( custody_account_object& c ) {
      c.authority = new_authority;
   });
} FC_CAPTURE_AND_RETHROW( (account)(new_authority) ) }

uint64_t ledger_custody_service::close( const identity& account, const identity& destination,
                                        const custody_authorizer& authorizer )
{ try {
   const auto& obj = get( account );
   verify_authorizer( obj, authorizer );
   GAVEL_ASSERT( obj.amount == 0, custody_account_not_empty,
                 "${a} still holds ${n}", ("a",account)("n",obj.amount) );

   uint64_t deposit = obj.deposit;
   _db.add_balance( destination, deposit );
   _db.remove( obj );
   return deposit;
} FC_CAPTURE_AND_RETHROW( (account)(destination) ) }

} } // gavel::chain
