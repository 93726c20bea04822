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

#include <custodian/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace custodian::chain;
using namespace custodian::chain::test;

namespace {

   order_intent_create_operation make_intent_op( const principal_type& seller, const string& order_id,
                                                 const principal_type& receiver, const asset& amount )
   {
      order_intent_create_operation op;
      op.seller        = seller;
      op.order_id      = order_id;
      op.receiver      = receiver;
      op.amount        = amount;
      op.metadata      = "ipfs://catalog/" + order_id;
      op.release_delay = 7200;
      return op;
   }

}

BOOST_FIXTURE_TEST_SUITE( order_intent_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_order_intent )
{ try {
   ACTORS( (shop)(alice) );

   db.apply_operation( make_intent_op( shop, "ORD-1", shop, usd_amount( 2500 ) ) );

   const order_intent_object* intent = db.find_order_intent( "ORD-1" );
   BOOST_REQUIRE( intent != nullptr );
   BOOST_CHECK( intent->seller == shop );
   BOOST_CHECK( intent->receiver == shop );
   BOOST_CHECK( intent->buyer.is_null() );
   BOOST_CHECK( intent->amount == usd_amount( 2500 ) );
   BOOST_CHECK_EQUAL( intent->metadata, "ipfs://catalog/ORD-1" );
   BOOST_CHECK_EQUAL( intent->release_delay, 7200u );
   BOOST_CHECK( intent->status == order_intent_status::pending );
   BOOST_CHECK( !intent->escrow.valid() );
   BOOST_CHECK( intent->created_at == db.head_time() );

   const auto created = published<order_intent_created_event>();
   BOOST_REQUIRE_EQUAL( created.size(), 1u );
   BOOST_CHECK_EQUAL( created[0].order_id, "ORD-1" );
   BOOST_CHECK( created[0].seller == shop );
   BOOST_CHECK_EQUAL( created[0].release_delay, 7200u );
   BOOST_CHECK( published_events.back().source == intent->id );

   CUSTODIAN_REQUIRE_THROW( db.apply_operation( make_intent_op( alice, "ORD-1", alice, usd_amount( 1 ) ) ),
                            duplicate_order_id );
   // an intent never moves funds
   BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_escrows_created, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( order_intent_validation )
{ try {
   ACTORS( (shop) );
   order_intent_create_operation op = make_intent_op( shop, "ORD-1", shop, usd_amount( 10 ) );
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, seller, principal_type(), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, receiver, principal_type(), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, order_id, "", empty_order_id_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, usd_amount( 0 ), zero_amount_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( 10, asset_id_type() ), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, metadata, "", empty_metadata_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, release_delay, CUSTODIAN_MAX_RELEASE_DELAY + 1, release_delay_out_of_range_exception );

   order_intent_cancel_operation cancel;
   cancel.seller = shop;
   cancel.order_id = "ORD-1";
   cancel.validate();
   REQUIRE_OP_VALIDATION_FAILURE( cancel, order_id, "", empty_order_id_exception );

   order_intent_settle_operation settle;
   settle.buyer = shop;
   settle.order_id = "ORD-1";
   settle.validate();
   REQUIRE_OP_VALIDATION_FAILURE( settle, buyer, principal_type(), null_principal_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_order_intent )
{ try {
   ACTORS( (shop)(alice) );

   db.apply_operation( make_intent_op( shop, "ORD-1", shop, usd_amount( 2500 ) ) );

   order_intent_cancel_operation op;
   op.seller = alice;
   op.order_id = "ORD-2";
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), unknown_order_intent );

   op.order_id = "ORD-1";
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), caller_not_seller );

   op.seller = shop;
   db.apply_operation( op );
   BOOST_CHECK( db.find_order_intent( "ORD-1" )->status == order_intent_status::cancelled );

   const auto updated = published<order_intent_updated_event>();
   BOOST_REQUIRE_EQUAL( updated.size(), 1u );
   BOOST_CHECK( updated[0].status == order_intent_status::cancelled );
   BOOST_CHECK( !updated[0].escrow.valid() );

   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), order_intent_not_pending );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( settle_order_intent )
{ try {
   ACTORS( (shop)(alice)(bob) );

   db.apply_operation( make_intent_op( shop, "ORD-1", shop, usd_amount( 2500 ) ) );
   db.apply_operation( make_intent_op( shop, "ORD-2", shop, usd_amount( 2500 ) ) );

   // the buyer funds the escrow with the parameters the intent published
   const order_intent_object& intent = *db.find_order_intent( "ORD-1" );
   fund( alice, intent.amount.amount );
   escrow_create_operation create = make_escrow_create_op( alice, intent.order_id, intent.receiver,
                                                           intent.amount.amount, intent.release_delay );
   create.metadata = intent.metadata;
   const escrow_id_type id = escrow_id_type( db.apply_operation( create ).get<object_id_type>() );

   order_intent_settle_operation op;
   op.buyer = alice;
   op.order_id = "ORD-3";
   op.escrow = id;
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), unknown_order_intent );

   op.order_id = "ORD-1";
   op.escrow = escrow_id_type( 99 );
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), unknown_escrow );

   op.order_id = "ORD-2";
   op.escrow = id;
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), escrow_order_mismatch );

   op.order_id = "ORD-1";
   op.buyer = bob;
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), caller_not_payer );
   BOOST_CHECK( intent.is_pending() );

   op.buyer = alice;
   db.apply_operation( op );

   BOOST_CHECK( intent.status == order_intent_status::paid );
   BOOST_CHECK( intent.buyer == alice );
   BOOST_REQUIRE( intent.escrow.valid() );
   BOOST_CHECK( *intent.escrow == id );

   const auto updated = published<order_intent_updated_event>();
   BOOST_REQUIRE_EQUAL( updated.size(), 1u );
   BOOST_CHECK( updated[0].status == order_intent_status::paid );
   BOOST_REQUIRE( updated[0].escrow.valid() );
   BOOST_CHECK( *updated[0].escrow == id );

   // paid intents cannot be paid again or cancelled
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), order_intent_not_pending );
   order_intent_cancel_operation cancel;
   cancel.seller = shop;
   cancel.order_id = "ORD-1";
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( cancel ), order_intent_not_pending );

   // the escrow itself is unaffected by the intent
   release( alice, id );
   BOOST_CHECK_EQUAL( get_balance( shop ).value, 2500 - 62 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
