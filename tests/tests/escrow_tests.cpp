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

BOOST_FIXTURE_TEST_SUITE( escrow_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_escrow )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 100000000 );

   const time_point_sec now = db.head_time();
   const escrow_object& escrow = create_escrow( alice, "ORD-1", bob, 100000000, 86400 );

   BOOST_CHECK( escrow.factory == db.get_factory().get_id() );
   BOOST_CHECK_EQUAL( escrow.order_id, "ORD-1" );
   BOOST_CHECK( escrow.payer == alice );
   BOOST_CHECK( escrow.payee == bob );
   BOOST_CHECK( escrow.amount == usd_amount( 100000000 ) );
   BOOST_CHECK_EQUAL( escrow.metadata, "ipfs://order/ORD-1" );
   BOOST_CHECK( escrow.created_at == now );
   BOOST_CHECK( escrow.release_after == now + 86400 );
   BOOST_CHECK_EQUAL( escrow.fee_bips, 250 );
   BOOST_CHECK( escrow.fee_collector == fee_collector );
   BOOST_CHECK( escrow.status == escrow_status::funded );
   BOOST_CHECK( !escrow.has_dispute() );

   // the funds are held by the escrow itself, not by the factory
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( escrow ).value, 100000000 );
   BOOST_CHECK_EQUAL( get_balance( principal_type( CUSTODIAN_FACTORY_PRINCIPAL ) ).value, 0 );
   BOOST_CHECK_EQUAL( escrow.custody_principal().name, string( object_id_type( escrow.id ) ) );

   BOOST_CHECK( db.find_escrow_by_order_id( "ORD-1" ) == &escrow );

   const dynamic_factory_object& dyn = db.get_dynamic_factory();
   BOOST_CHECK_EQUAL( dyn.total_escrows_created, 1u );
   BOOST_CHECK_EQUAL( dyn.total_volume.value, 100000000 );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::funded ), 1u );

   BOOST_REQUIRE( db.find_participant_statistics( alice ) != nullptr );
   BOOST_REQUIRE( db.find_participant_statistics( bob ) != nullptr );
   BOOST_CHECK_EQUAL( db.find_participant_statistics( alice )->escrow_count, 1u );
   BOOST_CHECK_EQUAL( db.find_participant_statistics( bob )->escrow_count, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_escrow_events )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_object& escrow = create_funded_escrow( alice, "ORD-1", bob, 5000 );

   BOOST_REQUIRE_EQUAL( published_events.size(), 2u );
   BOOST_CHECK_EQUAL( published_events[0].event.which(), domain_event::tag<escrow_initialized_event>::value );
   BOOST_CHECK_EQUAL( published_events[1].event.which(), domain_event::tag<escrow_created_event>::value );
   BOOST_CHECK( published_events[0].source == escrow.id );
   BOOST_CHECK( published_events[1].source == object_id_type( db.get_factory().id ) );
   BOOST_CHECK( published_events[0].sequence < published_events[1].sequence );
   BOOST_CHECK( published_events[0].time == db.head_time() );

   const auto init = published<escrow_initialized_event>().front();
   BOOST_CHECK( init.payer == alice );
   BOOST_CHECK( init.payee == bob );
   BOOST_CHECK( init.amount == usd_amount( 5000 ) );
   BOOST_CHECK_EQUAL( init.metadata, "ipfs://order/ORD-1" );

   const auto created = published<escrow_created_event>().front();
   BOOST_CHECK( created.escrow == escrow.get_id() );
   BOOST_CHECK_EQUAL( created.order_id, "ORD-1" );
   BOOST_CHECK( created.payer == alice );
   BOOST_CHECK( created.payee == bob );
   BOOST_CHECK( created.amount == usd_amount( 5000 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( duplicate_order_id_is_rejected )
{ try {
   ACTORS( (alice)(bob)(carol) );

   create_funded_escrow( alice, "ORD-1", bob, 1000 );
   fund( carol, 1000 );
   published_events.clear();

   CUSTODIAN_REQUIRE_THROW( create_escrow( carol, "ORD-1", bob, 1000 ), duplicate_order_id );

   BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_escrows_created, 1u );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 1000 );
   BOOST_CHECK( published_events.empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_requires_allowance_and_balance )
{ try {
   ACTORS( (alice)(bob) );

   issue( alice, 1000 );
   CUSTODIAN_REQUIRE_THROW( create_escrow( alice, "ORD-1", bob, 1000 ), insufficient_allowance );

   approve_factory( alice, 999 );
   CUSTODIAN_REQUIRE_THROW( create_escrow( alice, "ORD-1", bob, 1000 ), insufficient_allowance );

   approve_factory( alice, 5000 );
   CUSTODIAN_REQUIRE_THROW( create_escrow( alice, "ORD-1", bob, 1001 ), insufficient_balance );

   BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_escrows_created, 0u );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 1000 );

   create_escrow( alice, "ORD-1", bob, 1000 );
   // the allowance is consumed by the amount moved
   BOOST_CHECK_EQUAL( db.ledger().allowance( alice, CUSTODIAN_FACTORY_PRINCIPAL, usd ).value, 4000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_validation )
{ try {
   ACTORS( (alice)(bob) );
   escrow_create_operation op = make_escrow_create_op( alice, "ORD-1", bob, 1000 );
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, payer, principal_type(), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, payee, principal_type(), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, order_id, "", empty_order_id_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, order_id, string( CUSTODIAN_MAX_ORDER_ID_LENGTH + 1, 'x' ), field_too_long_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( 0, usd ), zero_amount_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( -1, usd ), zero_amount_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, amount, asset( 1000, asset_id_type() ), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, release_delay, CUSTODIAN_MAX_RELEASE_DELAY + 1, release_delay_out_of_range_exception );

   // every validation failure is also a validation_exception
   op.payer = principal_type();
   CUSTODIAN_REQUIRE_THROW( op.validate(), validation_exception );
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), null_principal_exception );

   BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_escrows_created, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( custody_accounts_are_reserved )
{ try {
   ACTORS( (alice)(bob)(carol) );

   BOOST_CHECK( principal_type( "1.2.0" ).is_custody_name() );
   BOOST_CHECK( principal_type( CUSTODIAN_FACTORY_PRINCIPAL ).is_custody_name() );
   BOOST_CHECK( !principal_type( "1.2" ).is_custody_name() );
   BOOST_CHECK( !principal_type( "1..0" ).is_custody_name() );
   BOOST_CHECK( !principal_type( "1.2.0.4" ).is_custody_name() );
   BOOST_CHECK( !principal_type( "v1.2.0" ).is_custody_name() );

   const escrow_object& first = create_funded_escrow( alice, "ORD-1", bob, 1000 );
   const principal_type custody = first.custody_principal();
   BOOST_REQUIRE_EQUAL( custody.name, "1.2.0" );

   // an escrow's custody cannot act as a payer and hand its funds to a new escrow
   CUSTODIAN_REQUIRE_THROW( ledger.approve( custody, CUSTODIAN_FACTORY_PRINCIPAL, usd_amount( 1000 ) ),
                            reserved_principal_exception );
   escrow_create_operation op = make_escrow_create_op( custody, "ORD-2", carol, 1000 );
   CUSTODIAN_REQUIRE_THROW( db.apply_operation( op ), reserved_principal_exception );
   op.payer = carol;
   op.validate();
   REQUIRE_OP_VALIDATION_FAILURE( op, payee, CUSTODIAN_FACTORY_PRINCIPAL, reserved_principal_exception );

   // the balance of an escrow that does not exist yet cannot be inflated
   CUSTODIAN_REQUIRE_THROW( ledger.issue( "1.2.5", usd_amount( 500 ) ), reserved_principal_exception );
   BOOST_CHECK_EQUAL( db.ledger().balance_of( "1.2.5", usd ).value, 0 );

   BOOST_CHECK_EQUAL( get_balance( first ).value, 1000 );
   BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_escrows_created, 1u );
   release( alice, first.get_id() );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 975 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( release_escrow )
{ try {
   ACTORS( (alice)(bob)(mallory) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100000000 ).get_id();

   CUSTODIAN_REQUIRE_THROW( release( bob, id ), caller_not_payer );
   CUSTODIAN_REQUIRE_THROW( release( mallory, id ), caller_not_payer );
   BOOST_CHECK( db.get( id ).status == escrow_status::funded );

   release( alice, id );

   const escrow_object& escrow = db.get( id );
   BOOST_CHECK( escrow.status == escrow_status::released );
   BOOST_CHECK( escrow.is_terminal() );
   BOOST_CHECK( !escrow.is_active() );
   BOOST_CHECK_EQUAL( escrow.amount.amount.value, 100000000 );

   const dynamic_factory_object& dyn = db.get_dynamic_factory();
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::funded ), 0u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::released ), 1u );
   BOOST_CHECK_EQUAL( tally_sum(), dyn.total_escrows_created );

   // terminal states are never left
   CUSTODIAN_REQUIRE_THROW( release( alice, id ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( refund( bob, id ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( raise_dispute( alice, id ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( auto_release( mallory, id ), escrow_invalid_status );
   BOOST_CHECK( db.get( id ).status == escrow_status::released );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( refund_escrow )
{ try {
   ACTORS( (alice)(bob)(mallory) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 7777 ).get_id();

   CUSTODIAN_REQUIRE_THROW( refund( alice, id ), caller_not_payee );
   CUSTODIAN_REQUIRE_THROW( refund( mallory, id ), caller_not_payee );

   refund( bob, id );

   BOOST_CHECK( db.get( id ).status == escrow_status::refunded );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 7777 );
   BOOST_CHECK_EQUAL( db.get_dynamic_factory().status_count( escrow_status::refunded ), 1u );

   CUSTODIAN_REQUIRE_THROW( refund( bob, id ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( release( alice, id ), escrow_invalid_status );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( auto_release_boundary )
{ try {
   ACTORS( (alice)(bob)(anyone) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100000000, 3600 ).get_id();

   CUSTODIAN_REQUIRE_THROW( auto_release( anyone, id ), release_too_early );
   BOOST_CHECK( !db.get( id ).can_auto_release( db.head_time() ) );

   advance_time( 3599 );
   BOOST_CHECK_EQUAL( db.get( id ).time_remaining( db.head_time() ), 1u );
   CUSTODIAN_REQUIRE_THROW( auto_release( anyone, id ), release_too_early );
   BOOST_CHECK( db.get( id ).status == escrow_status::funded );

   advance_time( 1 );
   BOOST_CHECK( db.get( id ).can_auto_release( db.head_time() ) );
   BOOST_CHECK_EQUAL( db.get( id ).time_remaining( db.head_time() ), 0u );
   auto_release( anyone, id );

   BOOST_CHECK( db.get( id ).status == escrow_status::released );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 97500000 );
   BOOST_CHECK_EQUAL( get_balance( fee_collector ).value, 2500000 );
   BOOST_CHECK_EQUAL( get_balance( anyone ).value, 0 );

   const auto released = published<funds_released_event>();
   BOOST_REQUIRE_EQUAL( released.size(), 1u );
   BOOST_CHECK( released[0].recipient == bob );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( auto_release_with_zero_delay )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 1000, 0 ).get_id();
   auto_release( alice, id );
   BOOST_CHECK( db.get( id ).status == escrow_status::released );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( auto_release_of_disputed_escrow_fails )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 1000, 10 ).get_id();
   raise_dispute( bob, id );
   advance_time( 100 );

   CUSTODIAN_REQUIRE_THROW( auto_release( alice, id ), escrow_invalid_status );
   BOOST_CHECK_EQUAL( db.get( id ).time_remaining( db.head_time() ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unknown_escrow_is_rejected )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type missing( 42 );
   CUSTODIAN_REQUIRE_THROW( release( alice, missing ), unknown_escrow );
   CUSTODIAN_REQUIRE_THROW( refund( bob, missing ), unknown_escrow );
   CUSTODIAN_REQUIRE_THROW( auto_release( alice, missing ), unknown_escrow );
   CUSTODIAN_REQUIRE_THROW( raise_dispute( alice, missing ), unknown_escrow );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, missing, alice ), unknown_escrow );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( participant_counts )
{ try {
   ACTORS( (alice)(bob)(carol) );

   create_funded_escrow( alice, "ORD-1", bob, 100 );
   create_funded_escrow( alice, "ORD-2", carol, 100 );
   create_funded_escrow( carol, "ORD-3", bob, 100 );
   // a principal paying itself takes part in both roles
   create_funded_escrow( alice, "ORD-4", alice, 100 );

   BOOST_CHECK_EQUAL( db.find_participant_statistics( alice )->escrow_count, 4u );
   BOOST_CHECK_EQUAL( db.find_participant_statistics( bob )->escrow_count, 2u );
   BOOST_CHECK_EQUAL( db.find_participant_statistics( carol )->escrow_count, 2u );
   BOOST_CHECK( db.find_participant_statistics( "dave" ) == nullptr );

   const dynamic_factory_object& dyn = db.get_dynamic_factory();
   BOOST_CHECK_EQUAL( dyn.total_escrows_created, 4u );
   BOOST_CHECK_EQUAL( dyn.total_volume.value, 400 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( status_tallies_sum_to_total )
{ try {
   ACTORS( (alice)(bob) );

   vector<escrow_id_type> ids;
   for( int i = 0; i < 10; ++i )
   {
      ids.push_back( create_funded_escrow( alice, "ORD-" + std::to_string( i ), bob, 1000 + i, 60 ).get_id() );
      BOOST_CHECK_EQUAL( tally_sum(), db.get_dynamic_factory().total_escrows_created );
   }

   release( alice, ids[0] );
   release( alice, ids[1] );
   refund( bob, ids[2] );
   raise_dispute( alice, ids[3] );
   raise_dispute( bob, ids[4] );
   raise_dispute( bob, ids[5] );
   resolve_dispute( arbitrator, ids[3], alice );
   resolve_dispute( arbitrator, ids[4], bob );
   advance_time( 60 );
   auto_release( bob, ids[6] );

   const dynamic_factory_object& dyn = db.get_dynamic_factory();
   BOOST_CHECK_EQUAL( tally_sum(), 10u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::funded ), 3u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::released ), 3u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::refunded ), 1u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::disputed ), 1u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::resolved ), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( escrow_views )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100000000, 1000 ).get_id();
   const escrow_object& escrow = db.get( id );

   BOOST_CHECK_EQUAL( escrow.status_label(), "ACTIVE" );
   BOOST_CHECK_EQUAL( escrow.time_remaining( db.head_time() ), 1000u );
   advance_time( 400 );
   BOOST_CHECK_EQUAL( escrow.time_remaining( db.head_time() ), 600u );
   advance_time( 5000 );
   BOOST_CHECK_EQUAL( escrow.time_remaining( db.head_time() ), 0u );

   const fee_split breakdown = escrow.fee_breakdown();
   BOOST_CHECK_EQUAL( breakdown.fee.value, 2500000 );
   BOOST_CHECK_EQUAL( breakdown.net.value, 97500000 );

   raise_dispute( alice, id, "damaged" );
   BOOST_CHECK_EQUAL( db.get( id ).status_label(), "DISPUTED" );
   resolve_dispute( arbitrator, id, alice );
   BOOST_CHECK_EQUAL( db.get( id ).status_label(), "RESOLVED" );

   const escrow_id_type released = create_funded_escrow( alice, "ORD-2", bob, 10 ).get_id();
   release( alice, released );
   BOOST_CHECK_EQUAL( db.get( released ).status_label(), "RELEASED" );

   const escrow_id_type refunded = create_funded_escrow( alice, "ORD-3", bob, 10 ).get_id();
   refund( bob, refunded );
   BOOST_CHECK_EQUAL( db.get( refunded ).status_label(), "REFUNDED" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
