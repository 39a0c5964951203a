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
#include <boost/test/unit_test.hpp>

#include <fc/crypto/digest.hpp>
#include <fc/io/raw.hpp>

#include "database_fixture.hpp"

uint32_t GAVEL_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace gavel { namespace chain {

namespace buf = boost::unit_test::framework;

database_fixture::database_fixture( const fc::time_point_sec& initial_timestamp )
   : clock( std::make_shared<manual_time_source>( initial_timestamp ) )
{ try {
   int argc = buf::master_test_suite().argc;
   char** argv = buf::master_test_suite().argv;
   for( int i=1; i<argc; i++ )
   {
      const std::string arg = argv[i];
      if( arg == "--record-assert-trip" )
         fc::enable_record_assert_trip = true;
      if( arg == "--show-test-names" )
         std::cout << "running test " << buf::current_test_case().p_name << std::endl;
   }

   genesis_state.initial_parameters.protocol_id = protocol_id;
   genesis_state.initial_parameters.chain_id = fc::sha256::hash( string( "gavel test chain" ) );

   db.set_time_source( clock );
   db.init_genesis( genesis_state );
} catch ( const fc::exception& e ) {
   edump( (e.to_detail_string()) );
   throw;
} }

database_fixture::~database_fixture()
{ try {
   // If we're unwinding due to an exception, don't do any more checks.
   // This way, boost test's last checkpoint tells us approximately where the error was.
   if( !std::uncaught_exception() )
   {
      BOOST_CHECK_EQUAL( db._undo_db.active_sessions(), 0u );

      // custody never creates or destroys units, only issue() does
      std::map<identity,uint64_t> supply;
      for( const custody_account_object& c : db.get_index_type<custody_account_index>().indices() )
         supply[c.mint] += c.amount;
      for( const auto& issued : _issued )
         BOOST_CHECK_EQUAL( supply[issued.first], issued.second );
   }
} FC_CAPTURE_LOG_AND_RETHROW( (_identity_counter) ) }

fc::ecc::private_key database_fixture::generate_private_key( string seed )
{
   return fc::ecc::private_key::regenerate( fc::sha256::hash( seed ) );
}

identity database_fixture::next_identity( const string& prefix )
{
   return identity( generate_private_key( prefix + std::to_string( ++_identity_counter ) ).get_public_key() );
}

void database_fixture::fund( const identity& who, uint64_t amount )
{
   db.add_balance( who, amount );
}

void database_fixture::generate_time( uint32_t seconds )
{
   clock->advance( seconds );
}

processed_transaction database_fixture::push( const operation& op, const vector<fc::ecc::private_key>& keys )
{
   signed_transaction trx;
   trx.operations.push_back( op );
   for( const auto& key : keys )
      trx.sign( key, db.get_chain_id() );
   return db.push_transaction( trx );
}

processed_transaction database_fixture::push( const operation& op, const fc::ecc::private_key& key )
{
   return push( op, vector<fc::ecc::private_key>( 1, key ) );
}

const custody_account_object& database_fixture::create_custody_account( const identity& key, const identity& mint,
                                                                        const identity& authority,
                                                                        const fc::ecc::private_key& funder_key,
                                                                        uint64_t deposit )
{ try {
   custody_account_create_operation op;
   op.funder      = identity( funder_key.get_public_key() );
   op.new_account = key;
   op.mint        = mint;
   op.authority   = authority;
   op.deposit     = deposit;
   push( op, funder_key );
   return get_custody( key );
} FC_CAPTURE_AND_RETHROW( (key)(mint)(authority)(deposit) ) }

void database_fixture::issue( const identity& custody, uint64_t amount )
{
   const auto& c = get_custody( custody );
   _issued[c.mint] += amount;
   db.modify( c, [amount]( custody_account_object& obj ) {
      obj.amount += amount;
   });
}

identity database_fixture::create_wallet( const fc::ecc::private_key& key, uint64_t amount )
{
   auto wallet = next_identity( "wallet" );
   create_custody_account( wallet, currency_mint, identity( key.get_public_key() ), key );
   issue( wallet, amount );
   return wallet;
}

const account_object& database_fixture::create_record_slot( const identity& key, const fc::ecc::private_key& funder_key )
{
   return create_record_slot( key, funder_key,
                              db.get_chain_parameters().rent.minimum_balance( auction_record::packed_size ) );
}

const account_object& database_fixture::create_record_slot( const identity& key, const fc::ecc::private_key& funder_key,
                                                            uint64_t balance )
{ try {
   account_create_operation op;
   op.funder      = identity( funder_key.get_public_key() );
   op.new_account = key;
   op.balance     = balance;
   op.data_size   = auction_record::packed_size;
   op.owner       = db.get_chain_parameters().protocol_id;
   push( op, funder_key );
   return db.get_account( key );
} FC_CAPTURE_AND_RETHROW( (key)(balance) ) }

test_auction database_fixture::prepare_auction( const fc::ecc::private_key& exhibitor_key )
{ try {
   test_auction a;
   a.exhibitor     = identity( exhibitor_key.get_public_key() );
   a.exhibitor_key = exhibitor_key;
   a.record        = next_identity( "record" );
   a.item_source   = next_identity( "item_source" );
   a.item_custody  = next_identity( "item_custody" );
   a.proceeds      = next_identity( "proceeds" );

   create_record_slot( a.record, exhibitor_key );
   create_custody_account( a.item_source, item_mint, a.exhibitor, exhibitor_key );
   issue( a.item_source, GAVEL_ITEM_QUANTITY );
   create_custody_account( a.item_custody, item_mint, a.exhibitor, exhibitor_key );
   create_custody_account( a.proceeds, currency_mint, a.exhibitor, exhibitor_key );
   return a;
} FC_CAPTURE_AND_RETHROW() }

auction_create_operation database_fixture::make_create( const test_auction& a, uint64_t initial_price,
                                                        uint64_t duration_seconds )const
{
   auction_create_operation op;
   op.exhibitor          = a.exhibitor;
   op.item_source        = a.item_source;
   op.item_custody       = a.item_custody;
   op.proceeds_receiving = a.proceeds;
   op.record             = a.record;
   op.initial_price      = initial_price;
   op.duration_seconds   = duration_seconds;
   return op;
}

test_auction database_fixture::open_auction( const fc::ecc::private_key& exhibitor_key, uint64_t initial_price,
                                             uint64_t duration_seconds )
{ try {
   auto a = prepare_auction( exhibitor_key );
   push( make_create( a, initial_price, duration_seconds ), exhibitor_key );
   return a;
} FC_CAPTURE_AND_RETHROW( (initial_price)(duration_seconds) ) }

auction_bid_operation database_fixture::make_bid( const test_auction& a, const fc::ecc::private_key& bidder_key,
                                                  const identity& bid_source, uint64_t amount )
{ try {
   auto rec = get_record( a.record );

   auction_bid_operation op;
   op.bidder         = identity( bidder_key.get_public_key() );
   op.leader         = rec.highest_bidder;
   op.leader_custody = rec.highest_bidder_custody;
   op.leader_refund  = rec.highest_bidder_refund;
   op.bid_custody    = next_identity( "bid_custody" );
   op.bid_source     = bid_source;
   op.record         = a.record;
   op.amount         = amount;

   create_custody_account( op.bid_custody, currency_mint, op.bidder, bidder_key );
   return op;
} FC_CAPTURE_AND_RETHROW( (amount) ) }

auction_bid_operation database_fixture::place_bid( const test_auction& a, const fc::ecc::private_key& bidder_key,
                                                   const identity& bid_source, uint64_t amount )
{
   auto op = make_bid( a, bidder_key, bid_source, amount );
   push( op, bidder_key );
   return op;
}

auction_cancel_operation database_fixture::make_cancel( const test_auction& a, const identity& item_return )const
{
   auction_cancel_operation op;
   op.exhibitor    = a.exhibitor;
   op.item_custody = a.item_custody;
   op.item_return  = item_return;
   op.record       = a.record;
   return op;
}

auction_close_operation database_fixture::make_close( const test_auction& a, const identity& item_receiving )const
{
   auto rec = get_record( a.record );

   auction_close_operation op;
   op.winner             = rec.highest_bidder;
   op.exhibitor          = a.exhibitor;
   op.item_custody       = a.item_custody;
   op.proceeds_receiving = a.proceeds;
   op.winner_custody     = rec.highest_bidder_custody;
   op.item_receiving     = item_receiving;
   op.record             = a.record;
   return op;
}

auction_record database_fixture::get_record( const identity& record )const
{
   return auction_record::unpack( db.get_account( record ).data );
}

const custody_account_object& database_fixture::get_custody( const identity& custody )const
{
   return db.custody().get( custody );
}

uint64_t database_fixture::custody_amount( const identity& custody )const
{
   return get_custody( custody ).amount;
}

vector<char> database_fixture::ledger_snapshot()const
{
   vector<char> result;
   for( const account_object& a : db.get_index_type<account_index>().indices() )
   {
      auto packed = fc::raw::pack( a );
      result.insert( result.end(), packed.begin(), packed.end() );
   }
   for( const custody_account_object& c : db.get_index_type<custody_account_index>().indices() )
   {
      auto packed = fc::raw::pack( c );
      result.insert( result.end(), packed.begin(), packed.end() );
   }
   return result;
}

} } // gavel::chain
