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
#include <gavel/chain/auction_evaluator.hpp>
#include <gavel/chain/auction_guards.hpp>
#include <gavel/chain/database.hpp>
#include <gavel/chain/transaction_evaluation_state.hpp>

#include <gavel/protocol/exceptions.hpp>

#include <limits>

namespace gavel { namespace chain {

void auction_evaluator_base::load_record( const database& d, const identity& record )
{
   _slot = d.find_account( record );
   GAVEL_ASSERT( _slot != nullptr, record_size_mismatch, "record slot ${r} does not exist", ("r",record) );
   GAVEL_ASSERT( _slot->owner == d.get_chain_parameters().protocol_id, record_owner_mismatch,
                 "record slot ${r} is owned by ${o}", ("r",record)("o",_slot->owner) );
   _record = auction_record::unpack( _slot->data );
}

derived_authority auction_evaluator_base::auction_authority( const database& d, const identity& record )
{
   const auto& params = d.get_chain_parameters();
   return find_derived_authority( params.authority_label, record, params.protocol_id );
}

authority_proof auction_evaluator_base::make_authority_proof( const database& d, const derived_authority& authority,
                                                              const identity& record )
{
   return authority_proof( d.get_chain_parameters().authority_label, record, authority.bump );
}

void auction_evaluator_base::store_record( database& d, const auction_record& rec )
{
   auto data = rec.pack();
   d.modify( *_slot, [&data]( account_object& a ) {
      a.data = std::move( data );
   });
   _record = rec;
}

uint64_t auction_evaluator_base::destroy_record( database& d, const identity& beneficiary )
{
   ilog( "closing record slot ${r}, balance ${b} to ${e}",
         ("r",_slot->key)("b",_slot->balance)("e",beneficiary) );
   auto amount = d.reclaim_account( _slot->key, beneficiary );
   _slot = nullptr;
   return amount;
}

void_result auction_create_evaluator::do_evaluate( const auction_create_operation& o )
{ try {
   const database& d = db();

   guard::require_signer( *trx_state, o.exhibitor );
   load_record( d, o.record );
   guard::require_uninitialized( _record );
   GAVEL_ASSERT( d.is_persistently_funded( *_slot ), record_not_rent_exempt,
                 "record slot holds ${b}, rent exemption needs ${m}",
                 ("b",_slot->balance)("m",d.get_chain_parameters().rent.minimum_balance( _slot->data.size() )) );

   auto now = d.now();
   GAVEL_ASSERT( o.duration_seconds <= uint64_t( std::numeric_limits<uint32_t>::max() - now.sec_since_epoch() ),
                 timestamp_overflow, "auction of ${s} seconds starting at ${now} ends out of range",
                 ("s",o.duration_seconds)("now",now) );
   _end_at = now + uint32_t( o.duration_seconds );

   const auto& source  = d.custody().get( o.item_source );
   const auto& custody = d.custody().get( o.item_custody );
   GAVEL_ASSERT( custody.amount == 0, custody_account_not_empty,
                 "item custody ${c} already holds ${n}", ("c",o.item_custody)("n",custody.amount) );
   GAVEL_ASSERT( custody.mint == source.mint, custody_mint_mismatch,
                 "item custody ${c} holds ${m1}, the item is ${m2}",
                 ("c",o.item_custody)("m1",custody.mint)("m2",source.mint) );
   d.custody().get( o.proceeds_receiving );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

identity auction_create_evaluator::do_apply( const auction_create_operation& o )
{ try {
   database& d = db();
   auto authority = auction_authority( d, o.record );

   ilog( "moving item from ${s} into custody ${c}", ("s",o.item_source)("c",o.item_custody) );
   d.custody().transfer( o.item_source, o.item_custody, o.exhibitor, GAVEL_ITEM_QUANTITY );

   ilog( "handing ${c} to auction authority ${a}", ("c",o.item_custody)("a",authority.key) );
   d.custody().set_authority( o.item_custody, authority.key, o.exhibitor );

   auction_record rec;
   rec.is_initialized     = true;
   rec.exhibitor          = o.exhibitor;
   rec.item_custody       = o.item_custody;
   rec.proceeds_receiving = o.proceeds_receiving;
   rec.current_price      = o.initial_price;
   rec.end_at             = _end_at;
   store_record( d, rec );

   ilog( "auction ${r} open at ${p} until ${t}", ("r",o.record)("p",o.initial_price)("t",_end_at) );
   return o.record;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_bid_evaluator::do_evaluate( const auction_bid_operation& o )
{ try {
   const database& d = db();

   guard::require_signer( *trx_state, o.bidder );
   load_record( d, o.record );
   guard::require_initialized( _record );
   guard::require_before( d.now(), _record.end_at );
   guard::require_outbids( o.amount, _record );
   guard::require_match( o.leader,         _record.highest_bidder,         "leader" );
   guard::require_match( o.leader_custody, _record.highest_bidder_custody, "leader custody" );
   guard::require_match( o.leader_refund,  _record.highest_bidder_refund,  "leader refund account" );
   guard::require_not_leader( o.bidder, _record );

   const auto& bid_custody = d.custody().get( o.bid_custody );
   GAVEL_ASSERT( bid_custody.amount == 0, custody_account_not_empty,
                 "bid custody ${c} already holds ${n}", ("c",o.bid_custody)("n",bid_custody.amount) );
   const auto& proceeds = d.custody().get( _record.proceeds_receiving );
   GAVEL_ASSERT( bid_custody.mint == proceeds.mint, auction_currency_mismatch,
                 "bid in ${m1}, auction is priced in ${m2}", ("m1",bid_custody.mint)("m2",proceeds.mint) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_bid_evaluator::do_apply( const auction_bid_operation& o )
{ try {
   database& d = db();
   auto authority = auction_authority( d, o.record );
   auto proof = make_authority_proof( d, authority, o.record );

   ilog( "escrowing bid of ${a} by ${b} in ${c}", ("a",o.amount)("b",o.bidder)("c",o.bid_custody) );
   d.custody().transfer( o.bid_source, o.bid_custody, o.bidder, o.amount );
   d.custody().set_authority( o.bid_custody, authority.key, o.bidder );

   if( _record.has_bidder() )
   {
      uint64_t refund = d.custody().get( _record.highest_bidder_custody ).amount;
      if( refund != _record.current_price )
         wlog( "leader custody ${c} holds ${n}, the leading bid was ${p}",
               ("c",_record.highest_bidder_custody)("n",refund)("p",_record.current_price) );
      ilog( "refunding ${n} to outbid leader ${l}", ("n",refund)("l",_record.highest_bidder) );
      d.custody().transfer( _record.highest_bidder_custody, _record.highest_bidder_refund, proof, refund );
      d.custody().close( _record.highest_bidder_custody, _record.highest_bidder, proof );
   }

   auction_record rec = _record;
   rec.current_price          = o.amount;
   rec.highest_bidder         = o.bidder;
   rec.highest_bidder_custody = o.bid_custody;
   rec.highest_bidder_refund  = o.bid_source;
   store_record( d, rec );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_cancel_evaluator::do_evaluate( const auction_cancel_operation& o )
{ try {
   const database& d = db();

   guard::require_signer( *trx_state, o.exhibitor );
   load_record( d, o.record );
   guard::require_initialized( _record );
   guard::require_match( o.exhibitor,    _record.exhibitor,    "exhibitor" );
   guard::require_match( o.item_custody, _record.item_custody, "item custody" );
   guard::require_no_bidder( _record );

   const auto& item_return = d.custody().get( o.item_return );
   GAVEL_ASSERT( item_return.authority == _record.exhibitor, custody_wrong_authority,
                 "item return account ${a} is controlled by ${c}, not by the exhibitor",
                 ("a",o.item_return)("c",item_return.authority) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_cancel_evaluator::do_apply( const auction_cancel_operation& o )
{ try {
   database& d = db();
   auto proof = make_authority_proof( d, auction_authority( d, o.record ), o.record );
   uint64_t quantity = d.custody().get( o.item_custody ).amount;

   ilog( "returning ${n} item units from ${c} to ${r}", ("n",quantity)("c",o.item_custody)("r",o.item_return) );
   d.custody().transfer( o.item_custody, o.item_return, proof, quantity );
   d.custody().close( o.item_custody, _record.exhibitor, proof );
   destroy_record( d, _record.exhibitor );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result auction_close_evaluator::do_evaluate( const auction_close_operation& o )
{ try {
   const database& d = db();

   guard::require_signer( *trx_state, o.winner );
   load_record( d, o.record );
   guard::require_initialized( _record );
   guard::require_not_before( d.now(), _record.end_at );
   guard::require_bidder( _record );
   guard::require_match( o.winner,             _record.highest_bidder,         "winner" );
   guard::require_match( o.exhibitor,          _record.exhibitor,              "exhibitor" );
   guard::require_match( o.item_custody,       _record.item_custody,           "item custody" );
   guard::require_match( o.proceeds_receiving, _record.proceeds_receiving,     "proceeds account" );
   guard::require_match( o.winner_custody,     _record.highest_bidder_custody, "winner custody" );

   const auto& item_receiving = d.custody().get( o.item_receiving );
   GAVEL_ASSERT( item_receiving.authority == o.winner, custody_wrong_authority,
                 "item receiving account ${a} is controlled by ${c}, not by the winner",
                 ("a",o.item_receiving)("c",item_receiving.authority) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

auction_settlement auction_close_evaluator::do_apply( const auction_close_operation& o )
{ try {
   database& d = db();
   auto proof = make_authority_proof( d, auction_authority( d, o.record ), o.record );

   auction_settlement result;
   result.winner = o.winner;

   result.item_quantity = d.custody().get( o.item_custody ).amount;
   ilog( "settling: ${n} item units from ${c} to ${r}",
         ("n",result.item_quantity)("c",o.item_custody)("r",o.item_receiving) );
   d.custody().transfer( o.item_custody, o.item_receiving, proof, result.item_quantity );

   result.proceeds = d.custody().get( o.winner_custody ).amount;
   if( result.proceeds != _record.current_price )
      wlog( "winner custody ${c} holds ${n}, the winning bid was ${p}",
            ("c",o.winner_custody)("n",result.proceeds)("p",_record.current_price) );
   ilog( "settling: ${n} to ${r}", ("n",result.proceeds)("r",o.proceeds_receiving) );
   d.custody().transfer( o.winner_custody, o.proceeds_receiving, proof, result.proceeds );

   result.reclaimed_to_winner = d.custody().close( o.winner_custody, o.winner, proof );

   uint64_t item_deposit = d.custody().close( o.item_custody, _record.exhibitor, proof );
   uint64_t slot_balance = destroy_record( d, _record.exhibitor );
   GAVEL_ASSERT( item_deposit <= std::numeric_limits<uint64_t>::max() - slot_balance, amount_overflow,
                 "reclaimed amounts ${a} and ${b} overflow", ("a",item_deposit)("b",slot_balance) );
   result.reclaimed_to_exhibitor = item_deposit + slot_balance;

   return result;
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // gavel::chain
