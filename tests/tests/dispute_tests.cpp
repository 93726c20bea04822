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

BOOST_FIXTURE_TEST_SUITE( dispute_tests, database_fixture )

BOOST_AUTO_TEST_CASE( raise_dispute_by_either_party )
{ try {
   ACTORS( (alice)(bob)(mallory) );

   const escrow_id_type first  = create_funded_escrow( alice, "ORD-1", bob, 1000 ).get_id();
   const escrow_id_type second = create_funded_escrow( alice, "ORD-2", bob, 1000 ).get_id();

   CUSTODIAN_REQUIRE_THROW( raise_dispute( mallory, first ), caller_not_party );
   CUSTODIAN_REQUIRE_THROW( raise_dispute( arbitrator, first ), caller_not_party );

   raise_dispute( alice, first, "item never shipped" );
   raise_dispute( bob, second, "buyer changed the order" );

   const escrow_object& a = db.get( first );
   BOOST_CHECK( a.status == escrow_status::disputed );
   BOOST_CHECK( a.has_dispute() );
   BOOST_CHECK( a.dispute_raised_by == alice );
   BOOST_CHECK_EQUAL( a.dispute_reason, "item never shipped" );
   BOOST_CHECK( db.get( second ).dispute_raised_by == bob );

   // no funds move when a dispute is raised
   BOOST_CHECK_EQUAL( get_balance( a ).value, 1000 );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );
   BOOST_CHECK_EQUAL( db.get_dynamic_factory().status_count( escrow_status::disputed ), 2u );
   BOOST_CHECK_EQUAL( db.get_dynamic_factory().status_count( escrow_status::funded ), 0u );

   const auto raised = published<dispute_raised_event>();
   BOOST_REQUIRE_EQUAL( raised.size(), 2u );
   BOOST_CHECK( raised[0].raiser == alice );
   BOOST_CHECK_EQUAL( raised[0].reason, "item never shipped" );

   // a disputed escrow can only be resolved
   CUSTODIAN_REQUIRE_THROW( raise_dispute( bob, first ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( release( alice, first ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( refund( bob, first ), escrow_invalid_status );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dispute_validation )
{ try {
   ACTORS( (alice) );

   escrow_dispute_operation op;
   op.raiser = alice;
   op.escrow = escrow_id_type( 0 );
   op.reason = "late";
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, reason, "", empty_dispute_reason_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, reason, string( CUSTODIAN_MAX_DISPUTE_REASON_LENGTH + 1, 'r' ), field_too_long_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, raiser, principal_type(), null_principal_exception );

   escrow_resolve_operation resolve;
   resolve.arbitrator = arbitrator;
   resolve.escrow = escrow_id_type( 0 );
   resolve.winner = alice;
   resolve.validate();

   REQUIRE_OP_VALIDATION_FAILURE( resolve, winner, principal_type(), null_principal_exception );
   REQUIRE_OP_VALIDATION_FAILURE( resolve, arbitrator, principal_type(), null_principal_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolve_in_favor_of_payee )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100000000 ).get_id();
   raise_dispute( bob, id );

   resolve_dispute( arbitrator, id, bob );

   BOOST_CHECK( db.get( id ).status == escrow_status::resolved );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 97500000 );
   BOOST_CHECK_EQUAL( get_balance( fee_collector ).value, 2500000 );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );

   const dynamic_factory_object& dyn = db.get_dynamic_factory();
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::disputed ), 0u );
   BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::resolved ), 1u );

   const auto resolved = published<dispute_resolved_event>();
   BOOST_REQUIRE_EQUAL( resolved.size(), 1u );
   BOOST_CHECK( resolved[0].winner == bob );
   BOOST_CHECK_EQUAL( resolved[0].net_amount.value, 97500000 );
   BOOST_CHECK_EQUAL( resolved[0].fee_amount.value, 2500000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolve_in_favor_of_payer )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100000000 ).get_id();
   raise_dispute( alice, id );

   resolve_dispute( arbitrator, id, alice );

   BOOST_CHECK( db.get( id ).status == escrow_status::resolved );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 100000000 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( fee_collector ).value, 0 );

   const auto resolved = published<dispute_resolved_event>();
   BOOST_REQUIRE_EQUAL( resolved.size(), 1u );
   BOOST_CHECK( resolved[0].winner == alice );
   BOOST_CHECK_EQUAL( resolved[0].net_amount.value, 100000000 );
   BOOST_CHECK_EQUAL( resolved[0].fee_amount.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolve_escrow_paying_itself )
{ try {
   ACTORS( (alice) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", alice, 100000000 ).get_id();
   raise_dispute( alice, id );

   resolve_dispute( arbitrator, id, alice );

   BOOST_CHECK( db.get( id ).status == escrow_status::resolved );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 100000000 );
   BOOST_CHECK_EQUAL( get_balance( fee_collector ).value, 0 );

   const auto resolved = published<dispute_resolved_event>();
   BOOST_REQUIRE_EQUAL( resolved.size(), 1u );
   BOOST_CHECK_EQUAL( resolved[0].net_amount.value, 100000000 );
   BOOST_CHECK_EQUAL( resolved[0].fee_amount.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolve_requires_arbitrator_and_party )
{ try {
   ACTORS( (alice)(bob)(mallory) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 1000 ).get_id();
   raise_dispute( alice, id );

   CUSTODIAN_REQUIRE_THROW( resolve_dispute( alice, id, alice ), caller_not_arbitrator );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( owner, id, alice ), caller_not_arbitrator );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, id, mallory ), invalid_dispute_winner );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, id, arbitrator ), invalid_dispute_winner );

   BOOST_CHECK( db.get( id ).status == escrow_status::disputed );
   BOOST_CHECK_EQUAL( get_balance( db.get( id ) ).value, 1000 );
   BOOST_CHECK( published<dispute_resolved_event>().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolve_requires_dispute )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type funded   = create_funded_escrow( alice, "ORD-1", bob, 1000 ).get_id();
   const escrow_id_type released = create_funded_escrow( alice, "ORD-2", bob, 1000 ).get_id();
   const escrow_id_type refunded = create_funded_escrow( alice, "ORD-3", bob, 1000 ).get_id();
   const escrow_id_type resolved = create_funded_escrow( alice, "ORD-4", bob, 1000 ).get_id();
   release( alice, released );
   refund( bob, refunded );
   raise_dispute( bob, resolved );
   resolve_dispute( arbitrator, resolved, bob );

   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, funded, bob ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, released, alice ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, refunded, bob ), escrow_invalid_status );
   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, resolved, alice ), escrow_invalid_status );

   BOOST_CHECK( db.get( funded ).status == escrow_status::funded );
   BOOST_CHECK( db.get( released ).status == escrow_status::released );
   BOOST_CHECK( db.get( refunded ).status == escrow_status::refunded );
   BOOST_CHECK( db.get( resolved ).status == escrow_status::resolved );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( new_arbitrator_resolves_pending_disputes )
{ try {
   ACTORS( (alice)(bob)(judge) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 1000 ).get_id();
   raise_dispute( alice, id );

   factory_update_arbitrator_operation op;
   op.issuer = owner;
   op.new_arbitrator = judge;
   db.apply_operation( op );

   CUSTODIAN_REQUIRE_THROW( resolve_dispute( arbitrator, id, alice ), caller_not_arbitrator );
   resolve_dispute( judge, id, alice );
   BOOST_CHECK( db.get( id ).status == escrow_status::resolved );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
