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

using namespace gavel::chain;

BOOST_FIXTURE_TEST_SUITE( derived_authority_tests, database_fixture )

BOOST_AUTO_TEST_CASE( derivation_is_deterministic )
{
   auto scope = next_identity( "scope" );
   auto first  = find_derived_authority( "escrow", scope, protocol_id );
   auto second = find_derived_authority( "escrow", scope, protocol_id );
   BOOST_CHECK( first.key == second.key );
   BOOST_CHECK_EQUAL( first.bump, second.bump );

   auto direct = create_derived_identity( "escrow", scope, first.bump, protocol_id );
   BOOST_REQUIRE( direct.valid() );
   BOOST_CHECK( *direct == first.key );

   // every higher bump missed the derived space
   for( int bump = GAVEL_MAX_DERIVATION_BUMP; bump > first.bump; --bump )
      BOOST_CHECK( !create_derived_identity( "escrow", scope, uint8_t(bump), protocol_id ).valid() );
}

BOOST_AUTO_TEST_CASE( derived_space_is_keyless )
{
   for( int i = 0; i < 32; ++i )
   {
      auto scope = next_identity( "scope" );
      auto authority = find_derived_authority( GAVEL_DEFAULT_AUTHORITY_LABEL, scope, protocol_id );
      BOOST_CHECK( authority.key.is_derived() );
      BOOST_CHECK( !authority.key.is_keyed() );
      BOOST_CHECK( in_derived_space( authority.key.value ) );

      auto keyed = identity( generate_private_key( "key" + std::to_string( i ) ).get_public_key() );
      BOOST_CHECK( keyed.is_keyed() );
      BOOST_CHECK( !keyed.is_derived() );
   }
   BOOST_CHECK( identity().is_null() );
   BOOST_CHECK( !identity().is_keyed() );
   BOOST_CHECK( !identity().is_derived() );
}

BOOST_AUTO_TEST_CASE( derivation_depends_on_every_seed )
{
   auto scope = next_identity( "scope" );
   auto other_scope = next_identity( "scope" );
   auto other_protocol = next_identity( "protocol" );

   auto base = find_derived_authority( "escrow", scope, protocol_id ).key;
   BOOST_CHECK( find_derived_authority( "escrow", other_scope, protocol_id ).key != base );
   BOOST_CHECK( find_derived_authority( "vault", scope, protocol_id ).key != base );
   BOOST_CHECK( find_derived_authority( "escrow", scope, other_protocol ).key != base );
}

BOOST_AUTO_TEST_CASE( identity_strings )
{ try {
   auto id = next_identity( "printable" );
   auto str = std::string( id );
   BOOST_CHECK_EQUAL( str.size(), 64u );
   BOOST_CHECK( identity( str ) == id );

   fc::variant v( id, GAVEL_MAX_NESTED_OBJECTS );
   BOOST_CHECK_EQUAL( v.as_string(), str );
   BOOST_CHECK( v.as<identity>( GAVEL_MAX_NESTED_OBJECTS ) == id );

   GAVEL_REQUIRE_THROW( identity( std::string( "abcd" ) ), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( auction_custody_uses_record_scope )
{ try {
   ACTOR( exhibitor );
   auto a = open_auction( exhibitor_private_key, 100, 60 );
   auto expected = find_derived_authority( db.get_chain_parameters().authority_label, a.record,
                                           db.get_chain_parameters().protocol_id );
   BOOST_CHECK( get_custody( a.item_custody ).authority == expected.key );
   BOOST_CHECK( authority_minter::auction_authority( db, a.record ).key == expected.key );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( wrong_scope_proof_rejected )
{ try {
   ACTORS( (exhibitor)(mallory) );
   auto first  = open_auction( exhibitor_private_key, 100, 60 );
   auto second = open_auction( exhibitor_private_key, 100, 60 );
   auto loot = next_identity( "loot" );
   create_custody_account( loot, item_mint, mallory, mallory_private_key );

   auto first_proof = authority_minter::make_authority_proof(
         db, authority_minter::auction_authority( db, first.record ), first.record );
   GAVEL_REQUIRE_THROW( db.custody().transfer( second.item_custody, loot, first_proof, 1 ), custody_unproven_authority );
   GAVEL_REQUIRE_THROW( db.custody().set_authority( second.item_custody, mallory, first_proof ),
                        custody_unproven_authority );

   // a proof for the right scope with a forged bump fails too
   auto second_authority = authority_minter::auction_authority( db, second.record );
   derived_authority forged = second_authority;
   forged.bump = uint8_t( forged.bump + 1 );
   auto forged_proof = authority_minter::make_authority_proof( db, forged, second.record );
   GAVEL_REQUIRE_THROW( db.custody().transfer( second.item_custody, loot, forged_proof, 1 ), custody_unproven_authority );

   BOOST_CHECK_EQUAL( custody_amount( second.item_custody ), 1u );
   BOOST_CHECK_EQUAL( custody_amount( loot ), 0u );

   // the matching proof opens the account
   auto second_proof = authority_minter::make_authority_proof( db, second_authority, second.record );
   db.custody().transfer( second.item_custody, loot, second_proof, 1 );
   BOOST_CHECK_EQUAL( custody_amount( loot ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( authority_label_is_configurable )
{ try {
   database other;
   genesis_state_type genesis;
   genesis.initial_parameters.protocol_id = protocol_id;
   genesis.initial_parameters.authority_label = "vault";
   other.init_genesis( genesis );

   auto scope = next_identity( "scope" );
   BOOST_CHECK( authority_minter::auction_authority( other, scope ).key ==
                find_derived_authority( "vault", scope, protocol_id ).key );
   BOOST_CHECK( authority_minter::auction_authority( other, scope ).key !=
                authority_minter::auction_authority( db, scope ).key );

   genesis.initial_parameters.authority_label = "";
   database broken;
   GAVEL_REQUIRE_THROW( broken.init_genesis( genesis ), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
