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

#include <gavel/chain/database.hpp>
#include <gavel/protocol/derived_authority.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace gavel::chain;

BOOST_FIXTURE_TEST_SUITE( auction_tests, database_fixture )

BOOST_AUTO_TEST_CASE( full_auction_scenario )
{ try {
   ACTORS( (exhibitor)(alice)(bob) );

   const uint64_t deposit = GAVEL_TESTING_CUSTODY_DEPOSIT;
   const uint64_t slot_rent = db.get_chain_parameters().rent.minimum_balance( auction_record::packed_size );

   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto bob_wallet   = create_wallet( bob_private_key, 1000 );

   BOOST_TEST_MESSAGE( "Opening the auction at 100 for 60 seconds" );
   auto start = db.now();
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   auto authority = find_derived_authority( GAVEL_DEFAULT_AUTHORITY_LABEL, a.record, protocol_id );

   BOOST_CHECK( db.get_auction_status( a.record ) == auction_status::open );
   {
      auto rec = get_record( a.record );
      BOOST_CHECK( rec.is_initialized );
      BOOST_CHECK( rec.exhibitor == exhibitor );
      BOOST_CHECK( rec.item_custody == a.item_custody );
      BOOST_CHECK( rec.proceeds_receiving == a.proceeds );
      BOOST_CHECK_EQUAL( rec.current_price, 100u );
      BOOST_CHECK( !rec.has_bidder() );
      BOOST_CHECK( rec.end_at == start + 60 );
   }
   BOOST_CHECK_EQUAL( custody_amount( a.item_source ), 0u );
   BOOST_CHECK_EQUAL( custody_amount( a.item_custody ), 1u );
   BOOST_CHECK( get_custody( a.item_custody ).authority == authority.key );

   BOOST_TEST_MESSAGE( "alice bids 150" );
   auto alice_bid = place_bid( a, alice_private_key, alice_wallet, 150 );
   BOOST_CHECK_EQUAL( custody_amount( alice_wallet ), 850u );
   BOOST_CHECK_EQUAL( custody_amount( alice_bid.bid_custody ), 150u );
   BOOST_CHECK( get_custody( alice_bid.bid_custody ).authority == authority.key );
   {
      auto rec = get_record( a.record );
      BOOST_CHECK_EQUAL( rec.current_price, 150u );
      BOOST_CHECK( rec.highest_bidder == alice );
      BOOST_CHECK( rec.highest_bidder_custody == alice_bid.bid_custody );
      BOOST_CHECK( rec.highest_bidder_refund == alice_wallet );
   }

   BOOST_TEST_MESSAGE( "bob bids 200, alice is refunded" );
   auto bob_bid = make_bid( a, bob_private_key, bob_wallet, 200 );
   BOOST_CHECK( bob_bid.leader == alice );
   uint64_t alice_balance = db.get_balance( alice );
   push( bob_bid, bob_private_key );

   BOOST_CHECK_EQUAL( custody_amount( alice_wallet ), 1000u );
   BOOST_CHECK( db.custody().find( alice_bid.bid_custody ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_balance( alice ), alice_balance + deposit );
   BOOST_CHECK_EQUAL( custody_amount( bob_wallet ), 800u );
   BOOST_CHECK_EQUAL( custody_amount( bob_bid.bid_custody ), 200u );
   BOOST_CHECK_EQUAL( get_record( a.record ).current_price, 200u );
   BOOST_CHECK( get_record( a.record ).highest_bidder == bob );

   generate_time( 60 );

   BOOST_TEST_MESSAGE( "bob closes the auction" );
   auto bob_item = next_identity( "bob_item" );
   create_custody_account( bob_item, item_mint, bob, bob_private_key );
   uint64_t bob_balance = db.get_balance( bob );
   uint64_t exhibitor_balance = db.get_balance( exhibitor );

   auto ptrx = push( make_close( a, bob_item ), bob_private_key );
   const auto& settlement = ptrx.operation_results[0].get<auction_settlement>();
   BOOST_CHECK( settlement.winner == bob );
   BOOST_CHECK_EQUAL( settlement.item_quantity, 1u );
   BOOST_CHECK_EQUAL( settlement.proceeds, 200u );
   BOOST_CHECK_EQUAL( settlement.reclaimed_to_winner, deposit );
   BOOST_CHECK_EQUAL( settlement.reclaimed_to_exhibitor, deposit + slot_rent );

   BOOST_CHECK_EQUAL( custody_amount( bob_item ), 1u );
   BOOST_CHECK_EQUAL( custody_amount( a.proceeds ), 200u );
   BOOST_CHECK( db.custody().find( a.item_custody ) == nullptr );
   BOOST_CHECK( db.custody().find( bob_bid.bid_custody ) == nullptr );
   BOOST_CHECK( db.find_account( a.record ) == nullptr );
   BOOST_CHECK( db.get_auction_status( a.record ) == auction_status::nonexistent );
   BOOST_CHECK_EQUAL( db.get_balance( bob ), bob_balance + deposit );
   BOOST_CHECK_EQUAL( db.get_balance( exhibitor ), exhibitor_balance + deposit + slot_rent );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_returns_record )
{ try {
   ACTOR( exhibitor );
   auto a = prepare_auction( exhibitor_private_key );
   BOOST_CHECK( db.get_auction_status( a.record ) == auction_status::nonexistent );
   BOOST_CHECK( !db.find_auction( a.record ).valid() );

   auto ptrx = push( make_create( a, 100, 3600 ), exhibitor_private_key );
   BOOST_CHECK( ptrx.operation_results[0].get<identity>() == a.record );
   BOOST_REQUIRE( db.find_auction( a.record ).valid() );
   BOOST_CHECK( db.find_auction( a.record )->end_at == db.now() + 3600 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( prices_strictly_increase )
{ try {
   ACTORS( (exhibitor)(alice)(bob) );
   auto alice_wallet = create_wallet( alice_private_key, 10000 );
   auto bob_wallet   = create_wallet( bob_private_key, 10000 );
   auto a = open_auction( exhibitor_private_key, 100, 3600 );

   uint64_t last_price = get_record( a.record ).current_price;
   uint64_t amount = 101;
   for( int i = 0; i < 6; ++i )
   {
      bool alice_turn = ( i % 2 == 0 );
      place_bid( a, alice_turn ? alice_private_key : bob_private_key,
                 alice_turn ? alice_wallet : bob_wallet, amount );
      generate_time( 10 );

      auto price = get_record( a.record ).current_price;
      BOOST_CHECK_GT( price, last_price );
      BOOST_CHECK_EQUAL( price, amount );
      last_price = price;

      // the outbid party always gets its whole bid back
      BOOST_CHECK_EQUAL( custody_amount( alice_turn ? bob_wallet : alice_wallet ), 10000u );
      BOOST_CHECK_EQUAL( custody_amount( alice_turn ? alice_wallet : bob_wallet ), 10000u - amount );
      amount += 7 * ( i + 1 );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( low_bid_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   auto op = make_bid( a, alice_private_key, alice_wallet, 90 );
   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), auction_bid_too_low );
   BOOST_CHECK( ledger_snapshot() == before );

   op.amount = 100;
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), economic_failure );
   BOOST_CHECK( ledger_snapshot() == before );
   BOOST_CHECK( !get_record( a.record ).has_bidder() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( bid_after_end_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   generate_time( 59 );
   auto op = make_bid( a, alice_private_key, alice_wallet, 150 );
   generate_time( 1 );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), auction_expired );

   generate_time( 1000 );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), temporal_failure );
   BOOST_CHECK_EQUAL( custody_amount( alice_wallet ), 1000u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( bid_requires_bidder_signature )
{ try {
   ACTORS( (exhibitor)(alice)(bob) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   auto op = make_bid( a, alice_private_key, alice_wallet, 150 );
   GAVEL_REQUIRE_THROW( push( op, bob_private_key ), missing_signature );
   GAVEL_REQUIRE_THROW( push( op, vector<fc::ecc::private_key>() ), missing_signature );
   push( op, alice_private_key );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( leader_cannot_outbid_itself )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   place_bid( a, alice_private_key, alice_wallet, 150 );
   auto op = make_bid( a, alice_private_key, alice_wallet, 200 );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), auction_already_leader );
   BOOST_CHECK_EQUAL( get_record( a.record ).current_price, 150u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( stale_leader_rejected )
{ try {
   ACTORS( (exhibitor)(alice)(bob)(carol) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto bob_wallet   = create_wallet( bob_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   // bob prepares his bid while nobody leads
   auto stale = make_bid( a, bob_private_key, bob_wallet, 300 );
   place_bid( a, alice_private_key, alice_wallet, 150 );
   GAVEL_REQUIRE_THROW( push( stale, bob_private_key ), identity_mismatch );

   auto op = make_bid( a, bob_private_key, bob_wallet, 300 );
   op.leader_refund = bob_wallet;
   GAVEL_REQUIRE_THROW( push( op, bob_private_key ), identity_mismatch );

   op = make_bid( a, bob_private_key, bob_wallet, 300 );
   op.leader_custody = next_identity( "fake_custody" );
   GAVEL_REQUIRE_THROW( push( op, bob_private_key ), authorization_failure );

   op = make_bid( a, bob_private_key, bob_wallet, 300 );
   op.leader = carol;
   GAVEL_REQUIRE_THROW( push( op, bob_private_key ), identity_mismatch );

   BOOST_CHECK( get_record( a.record ).highest_bidder == alice );
   BOOST_CHECK_EQUAL( custody_amount( bob_wallet ), 1000u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( bid_currency_mismatch_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   auto op = make_bid( a, alice_private_key, alice_wallet, 150 );
   op.bid_custody = next_identity( "item_bid" );
   create_custody_account( op.bid_custody, item_mint, alice, alice_private_key );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), auction_currency_mismatch );

   op.bid_custody = next_identity( "missing" );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), custody_account_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( bid_custody_must_be_empty )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   auto op = make_bid( a, alice_private_key, alice_wallet, 150 );
   issue( op.bid_custody, 5 );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), custody_account_not_empty );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( bid_exceeding_funds_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 120 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   auto op = make_bid( a, alice_private_key, alice_wallet, 150 );
   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), custody_insufficient_amount );
   BOOST_CHECK( ledger_snapshot() == before );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_rejections )
{ try {
   ACTORS( (exhibitor)(mallory) );

   BOOST_TEST_MESSAGE( "Creating twice on the same record" );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   GAVEL_REQUIRE_THROW( push( make_create( a, 100, 60 ), exhibitor_private_key ), auction_already_initialized );

   BOOST_TEST_MESSAGE( "Creating without the exhibitor's signature" );
   auto b = prepare_auction( exhibitor_private_key );
   GAVEL_REQUIRE_THROW( push( make_create( b, 100, 60 ), mallory_private_key ), missing_signature );

   BOOST_TEST_MESSAGE( "Creating on a missing record slot" );
   auto op = make_create( b, 100, 60 );
   op.record = next_identity( "no_slot" );
   GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), record_size_mismatch );

   BOOST_TEST_MESSAGE( "Creating on a slot the auction protocol does not own" );
   {
      account_create_operation slot;
      slot.funder      = exhibitor;
      slot.new_account = next_identity( "foreign_slot" );
      slot.balance     = db.get_chain_parameters().rent.minimum_balance( auction_record::packed_size );
      slot.data_size   = auction_record::packed_size;
      slot.owner       = mallory;
      push( slot, exhibitor_private_key );
      op.record = slot.new_account;
      GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), record_owner_mismatch );
   }

   BOOST_TEST_MESSAGE( "Creating on a slot of the wrong size" );
   {
      account_create_operation slot;
      slot.funder      = exhibitor;
      slot.new_account = next_identity( "short_slot" );
      slot.balance     = db.get_chain_parameters().rent.minimum_balance( auction_record::packed_size );
      slot.data_size   = auction_record::packed_size - 1;
      slot.owner       = protocol_id;
      push( slot, exhibitor_private_key );
      op.record = slot.new_account;
      GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), state_failure );
   }

   BOOST_TEST_MESSAGE( "Creating on a slot below the rent exemption" );
   db.modify( db.get_account( b.record ), []( account_object& acct ) {
      acct.balance -= 1;
   });
   GAVEL_REQUIRE_THROW( push( make_create( b, 100, 60 ), exhibitor_private_key ), record_not_rent_exempt );
   db.modify( db.get_account( b.record ), []( account_object& acct ) {
      acct.balance += 1;
   });

   BOOST_TEST_MESSAGE( "Creating an auction that ends past the timestamp range" );
   GAVEL_REQUIRE_THROW( push( make_create( b, 100, std::numeric_limits<uint32_t>::max() ), exhibitor_private_key ),
                        timestamp_overflow );
   GAVEL_REQUIRE_THROW( push( make_create( b, 100, std::numeric_limits<uint64_t>::max() ), exhibitor_private_key ),
                        arithmetic_failure );

   BOOST_TEST_MESSAGE( "Creating into a custody account of another mint" );
   op = make_create( b, 100, 60 );
   op.item_custody = next_identity( "currency_custody" );
   create_custody_account( op.item_custody, currency_mint, exhibitor, exhibitor_private_key );
   GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), custody_mint_mismatch );

   BOOST_TEST_MESSAGE( "Creating into a custody account that is not empty" );
   issue( b.item_custody, 1 );
   GAVEL_REQUIRE_THROW( push( make_create( b, 100, 60 ), exhibitor_private_key ), custody_account_not_empty );

   BOOST_CHECK( db.get_auction_status( b.record ) == auction_status::nonexistent );
   BOOST_CHECK_EQUAL( custody_amount( b.item_source ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_without_item_rejected )
{ try {
   ACTOR( exhibitor );
   auto a = prepare_auction( exhibitor_private_key );
   auto op = make_create( a, 100, 60 );
   op.item_source = next_identity( "empty_source" );
   create_custody_account( op.item_source, item_mint, exhibitor, exhibitor_private_key );

   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), custody_insufficient_amount );
   BOOST_CHECK( ledger_snapshot() == before );
   BOOST_CHECK( !get_record( a.record ).is_initialized );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_without_bids )
{ try {
   ACTOR( exhibitor );
   const uint64_t slot_rent = db.get_chain_parameters().rent.minimum_balance( auction_record::packed_size );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   uint64_t exhibitor_balance = db.get_balance( exhibitor );
   push( make_cancel( a, a.item_source ), exhibitor_private_key );

   BOOST_CHECK_EQUAL( custody_amount( a.item_source ), 1u );
   BOOST_CHECK( db.custody().find( a.item_custody ) == nullptr );
   BOOST_CHECK( db.find_account( a.record ) == nullptr );
   BOOST_CHECK( db.get_auction_status( a.record ) == auction_status::nonexistent );
   BOOST_CHECK_EQUAL( db.get_balance( exhibitor ), exhibitor_balance + GAVEL_TESTING_CUSTODY_DEPOSIT + slot_rent );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_after_expiry_without_bids )
{ try {
   ACTOR( exhibitor );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   generate_time( 3600 );
   push( make_cancel( a, a.item_source ), exhibitor_private_key );
   BOOST_CHECK_EQUAL( custody_amount( a.item_source ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_after_bid_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   place_bid( a, alice_private_key, alice_wallet, 150 );

   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( make_cancel( a, a.item_source ), exhibitor_private_key ), auction_has_bids );
   BOOST_CHECK( ledger_snapshot() == before );
   BOOST_CHECK( db.get_auction_status( a.record ) == auction_status::open );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_by_stranger_rejected )
{ try {
   ACTORS( (exhibitor)(mallory) );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   auto mallory_item = next_identity( "mallory_item" );
   create_custody_account( mallory_item, item_mint, mallory, mallory_private_key );

   auto op = make_cancel( a, mallory_item );
   GAVEL_REQUIRE_THROW( push( op, mallory_private_key ), missing_signature );

   op.exhibitor = mallory;
   GAVEL_REQUIRE_THROW( push( op, mallory_private_key ), identity_mismatch );

   op = make_cancel( a, mallory_item );
   op.item_custody = a.item_source;
   GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), identity_mismatch );

   BOOST_CHECK_EQUAL( custody_amount( mallory_item ), 0u );
   BOOST_CHECK_EQUAL( custody_amount( a.item_custody ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( close_before_end_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto alice_item = next_identity( "alice_item" );
   create_custody_account( alice_item, item_mint, alice, alice_private_key );
   auto a = open_auction( exhibitor_private_key, 100, 3600 );

   auction_close_operation op;
   op.winner             = alice;
   op.exhibitor          = exhibitor;
   op.item_custody       = a.item_custody;
   op.proceeds_receiving = a.proceeds;
   op.winner_custody     = next_identity( "no_custody" );
   op.item_receiving     = alice_item;
   op.record             = a.record;
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), auction_still_open );

   place_bid( a, alice_private_key, alice_wallet, 150 );
   generate_time( 3599 );
   GAVEL_REQUIRE_THROW( push( make_close( a, alice_item ), alice_private_key ), temporal_failure );

   // the exhibitor gets the same answer as the leader
   op = make_close( a, alice_item );
   op.winner = exhibitor;
   GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), auction_still_open );

   generate_time( 1 );
   push( make_close( a, alice_item ), alice_private_key );
   BOOST_CHECK_EQUAL( custody_amount( alice_item ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( close_without_bidder_rejected )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_item = next_identity( "alice_item" );
   create_custody_account( alice_item, item_mint, alice, alice_private_key );
   auto a = open_auction( exhibitor_private_key, 100, 0 );
   generate_time( 10 );

   auction_close_operation op;
   op.winner             = alice;
   op.exhibitor          = exhibitor;
   op.item_custody       = a.item_custody;
   op.proceeds_receiving = a.proceeds;
   op.winner_custody     = next_identity( "no_custody" );
   op.item_receiving     = alice_item;
   op.record             = a.record;
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), auction_no_winner );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), state_failure );

   // with nobody bidding the exhibitor can still take the item back
   push( make_cancel( a, a.item_source ), exhibitor_private_key );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( close_by_loser_rejected )
{ try {
   ACTORS( (exhibitor)(alice)(bob) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto bob_wallet   = create_wallet( bob_private_key, 1000 );
   auto alice_item = next_identity( "alice_item" );
   create_custody_account( alice_item, item_mint, alice, alice_private_key );
   auto a = open_auction( exhibitor_private_key, 100, 60 );

   auto alice_bid = place_bid( a, alice_private_key, alice_wallet, 150 );
   place_bid( a, bob_private_key, bob_wallet, 200 );
   generate_time( 60 );

   auto op = make_close( a, alice_item );
   op.winner = alice;
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), identity_mismatch );

   op = make_close( a, alice_item );
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), missing_signature );

   op.winner_custody = alice_bid.bid_custody;
   GAVEL_REQUIRE_THROW( push( op, bob_private_key ), identity_mismatch );

   op = make_close( a, alice_item );
   op.proceeds_receiving = alice_wallet;
   GAVEL_REQUIRE_THROW( push( op, bob_private_key ), identity_mismatch );

   BOOST_CHECK_EQUAL( custody_amount( a.item_custody ), 1u );
   BOOST_CHECK( db.get_auction_status( a.record ) == auction_status::open );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( close_settles_live_custody_amounts )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto alice_item = next_identity( "alice_item" );
   create_custody_account( alice_item, item_mint, alice, alice_private_key );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   auto bid = place_bid( a, alice_private_key, alice_wallet, 150 );

   // somebody tops up the escrowed bid after the fact
   issue( bid.bid_custody, 25 );
   generate_time( 60 );

   auto ptrx = push( make_close( a, alice_item ), alice_private_key );
   const auto& settlement = ptrx.operation_results[0].get<auction_settlement>();
   BOOST_CHECK_EQUAL( settlement.proceeds, 175u );
   BOOST_CHECK_EQUAL( custody_amount( a.proceeds ), 175u );
   BOOST_CHECK_EQUAL( custody_amount( alice_item ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( record_slot_cannot_be_the_exhibitor )
{ try {
   ACTOR( exhibitor );
   auto a = prepare_auction( exhibitor_private_key );
   auto op = make_create( a, 100, 60 );
   op.record = exhibitor;

   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( op, exhibitor_private_key ), fc::assert_exception );
   BOOST_CHECK( ledger_snapshot() == before );
   BOOST_CHECK_EQUAL( custody_amount( a.item_source ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( outbid_refunds_topped_up_leader_custody )
{ try {
   ACTORS( (exhibitor)(alice)(bob) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto bob_wallet   = create_wallet( bob_private_key, 1000 );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   auto alice_bid = place_bid( a, alice_private_key, alice_wallet, 150 );

   // the escrowed bid grows behind the auction's back
   issue( alice_bid.bid_custody, 1 );

   auto bob_bid = place_bid( a, bob_private_key, bob_wallet, 200 );
   BOOST_CHECK( db.custody().find( alice_bid.bid_custody ) == nullptr );
   BOOST_CHECK_EQUAL( custody_amount( alice_wallet ), 1001u );

   auto rec = get_record( a.record );
   BOOST_CHECK( rec.highest_bidder == bob );
   BOOST_CHECK( rec.highest_bidder_custody == bob_bid.bid_custody );
   BOOST_CHECK_EQUAL( rec.current_price, 200u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_returns_item_only_to_the_exhibitor )
{ try {
   ACTORS( (exhibitor)(mallory) );
   auto a     = open_auction( exhibitor_private_key, 100, 60 );
   auto other = open_auction( exhibitor_private_key, 100, 60 );
   auto mallory_item = next_identity( "mallory_item" );
   create_custody_account( mallory_item, item_mint, mallory, mallory_private_key );

   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( make_cancel( a, mallory_item ), exhibitor_private_key ), custody_wrong_authority );
   // the item custody of another auction is held by that auction's authority
   GAVEL_REQUIRE_THROW( push( make_cancel( a, other.item_custody ), exhibitor_private_key ), custody_wrong_authority );
   BOOST_CHECK( ledger_snapshot() == before );

   push( make_cancel( a, a.item_source ), exhibitor_private_key );
   BOOST_CHECK_EQUAL( custody_amount( a.item_source ), 1u );
   BOOST_CHECK_EQUAL( custody_amount( other.item_custody ), 1u );
   BOOST_CHECK_EQUAL( custody_amount( mallory_item ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( close_delivers_item_only_to_the_winner )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto alice_item = next_identity( "alice_item" );
   create_custody_account( alice_item, item_mint, alice, alice_private_key );
   auto exhibitor_item = next_identity( "exhibitor_item" );
   create_custody_account( exhibitor_item, item_mint, exhibitor, exhibitor_private_key );

   auto a     = open_auction( exhibitor_private_key, 100, 60 );
   auto other = open_auction( exhibitor_private_key, 100, 3600 );
   place_bid( a, alice_private_key, alice_wallet, 150 );
   generate_time( 60 );

   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( make_close( a, exhibitor_item ), alice_private_key ), custody_wrong_authority );
   GAVEL_REQUIRE_THROW( push( make_close( a, other.item_custody ), alice_private_key ), custody_wrong_authority );
   BOOST_CHECK( ledger_snapshot() == before );

   push( make_close( a, alice_item ), alice_private_key );
   BOOST_CHECK_EQUAL( custody_amount( alice_item ), 1u );
   BOOST_CHECK_EQUAL( custody_amount( exhibitor_item ), 0u );
   BOOST_CHECK_EQUAL( custody_amount( other.item_custody ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( bid_cannot_reuse_escrow_of_another_auction )
{ try {
   ACTORS( (exhibitor)(alice) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto a     = open_auction( exhibitor_private_key, 100, 60 );
   auto other = open_auction( exhibitor_private_key, 100, 60 );
   auto escrowed = place_bid( other, alice_private_key, alice_wallet, 150 );

   auto op = make_bid( a, alice_private_key, escrowed.bid_custody, 150 );
   auto before = ledger_snapshot();
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), custody_wrong_authority );

   op.bid_source  = alice_wallet;
   op.bid_custody = escrowed.bid_custody;
   GAVEL_REQUIRE_THROW( push( op, alice_private_key ), custody_account_not_empty );
   BOOST_CHECK( ledger_snapshot() == before );

   BOOST_CHECK_EQUAL( custody_amount( escrowed.bid_custody ), 150u );
   BOOST_CHECK( get_record( other.record ).highest_bidder == alice );
   BOOST_CHECK( !get_record( a.record ).has_bidder() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( independent_auctions )
{ try {
   ACTORS( (exhibitor)(alice)(bob) );
   auto alice_wallet = create_wallet( alice_private_key, 1000 );
   auto bob_wallet   = create_wallet( bob_private_key, 1000 );
   auto first  = open_auction( exhibitor_private_key, 100, 60 );
   auto second = open_auction( exhibitor_private_key, 10, 120 );

   BOOST_CHECK( get_custody( first.item_custody ).authority != get_custody( second.item_custody ).authority );

   place_bid( second, bob_private_key, bob_wallet, 20 );
   GAVEL_REQUIRE_THROW( push( make_cancel( second, second.item_source ), exhibitor_private_key ), auction_has_bids );

   // a bid on one auction does not block cancelling another
   push( make_cancel( first, first.item_source ), exhibitor_private_key );
   BOOST_CHECK( db.get_auction_status( first.record ) == auction_status::nonexistent );
   BOOST_CHECK( db.get_auction_status( second.record ) == auction_status::open );
   BOOST_CHECK_EQUAL( custody_amount( alice_wallet ), 1000u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
