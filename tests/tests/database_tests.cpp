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

#include <fc/filesystem.hpp>

#include "../common/database_fixture.hpp"

#include <stdexcept>

using namespace custodian::chain;
using namespace custodian::chain::test;

namespace {

   /** a ledger whose every transfer_from fails after it moved the funds */
   class failing_ledger : public database_ledger
   {
      public:
         explicit failing_ledger( database& db ) : database_ledger( db ) {}

         void transfer_from( const principal_type& spender, const principal_type& owner,
                             const principal_type& to, const asset& amount ) override
         {
            database_ledger::transfer_from( spender, owner, to, amount );
            FC_THROW( "Ledger rejected the transfer of ${a}", ("a", amount) );
         }
   };

   genesis_state_type make_persistence_genesis()
   {
      genesis_state_type genesis;
      genesis.initial_timestamp = fc::time_point_sec( CUSTODIAN_TESTING_GENESIS_TIMESTAMP );
      genesis.owner             = "owner";
      genesis.fee_collector     = "collector";
      genesis.arbitrator        = "arbitrator";
      genesis.default_fee_bips  = 100;
      genesis.initial_balances.push_back( { "alice", asset( 10000, "USD" ) } );
      genesis.initial_allowances.push_back( { "alice", CUSTODIAN_FACTORY_PRINCIPAL, asset( 10000, "USD" ) } );
      return genesis;
   }

}

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( clock_only_moves_forward )
{ try {
   const time_point_sec start = db.head_time();

   advance_time( 10 );
   BOOST_CHECK( db.head_time() == start + 10 );

   db.set_head_time( start + 10 );
   BOOST_CHECK( db.head_time() == start + 10 );

   CUSTODIAN_REQUIRE_THROW( db.set_head_time( start ), fc::exception );
   BOOST_CHECK( db.head_time() == start + 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_sequence_is_contiguous )
{ try {
   ACTORS( (alice)(bob) );

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100 ).get_id();
   CUSTODIAN_REQUIRE_THROW( release( bob, id ), caller_not_payer );
   raise_dispute( alice, id );
   resolve_dispute( arbitrator, id, alice );

   BOOST_REQUIRE_EQUAL( published_events.size(), 4u );
   for( size_t i = 0; i < published_events.size(); ++i )
      BOOST_CHECK_EQUAL( published_events[i].sequence, i + 1 );
   BOOST_CHECK_EQUAL( db.get_dynamic_factory().last_event_sequence, 4u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failing_observer_does_not_fail_operation )
{ try {
   ACTORS( (alice)(bob) );

   boost::signals2::scoped_connection c1 = db.published_event.connect( []( const applied_event& ) {
      throw std::runtime_error( "observer is broken" );
   });
   boost::signals2::scoped_connection c2 = db.published_event.connect( []( const applied_event& ) {
      FC_THROW( "observer is broken too" );
   });

   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100 ).get_id();
   release( alice, id );

   BOOST_CHECK( db.get( id ).status == escrow_status::released );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 98 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_session )
{ try {
   ACTORS( (alice)(bob) );
   const escrow_id_type id = create_funded_escrow( alice, "ORD-1", bob, 100 ).get_id();

   {
      auto session = db._undo_db.start_undo_session();
      db.modify( db.get( id ), []( escrow_object& e ) {
         e.status = escrow_status::refunded;
      });
      db.create<participant_statistics_object>( []( participant_statistics_object& s ) {
         s.participant = "carol";
      });
      BOOST_CHECK( db.get( id ).status == escrow_status::refunded );
      BOOST_CHECK( db.find_participant_statistics( "carol" ) != nullptr );
   }

   BOOST_CHECK( db.get( id ).status == escrow_status::funded );
   BOOST_CHECK( db.find_participant_statistics( "carol" ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( database_persistence_tests )

BOOST_AUTO_TEST_CASE( reopen_database )
{ try {
   fc::temp_directory data_dir;

   const genesis_state_type genesis = make_persistence_genesis();

   int genesis_loads = 0;
   auto loader = [&]() {
      ++genesis_loads;
      return genesis;
   };

   escrow_id_type released;
   escrow_id_type disputed;
   {
      database db;
      db.open( data_dir.path(), loader );
      BOOST_CHECK_EQUAL( genesis_loads, 1 );

      escrow_create_operation create;
      create.payer    = "alice";
      create.payee    = "bob";
      create.amount   = asset( 4000, "USD" );
      create.metadata = "first";
      create.order_id = "ORD-1";
      released = escrow_id_type( db.apply_operation( create ).get<object_id_type>() );
      create.order_id = "ORD-2";
      create.amount   = asset( 2000, "USD" );
      create.metadata = "second";
      disputed = escrow_id_type( db.apply_operation( create ).get<object_id_type>() );

      escrow_release_operation release;
      release.payer  = "alice";
      release.escrow = released;
      db.apply_operation( release );

      escrow_dispute_operation dispute;
      dispute.raiser = "bob";
      dispute.escrow = disputed;
      dispute.reason = "wrong color";
      db.apply_operation( dispute );

      db.advance_time( 500 );
      db.close();
   }
   {
      database db;
      db.open( data_dir.path(), loader );
      BOOST_CHECK_EQUAL( genesis_loads, 1 );

      BOOST_CHECK( db.head_time() == genesis.initial_timestamp + 500 );
      BOOST_CHECK_EQUAL( db.get_factory().default_fee_bips, 100 );

      const dynamic_factory_object& dyn = db.get_dynamic_factory();
      BOOST_CHECK_EQUAL( dyn.total_escrows_created, 2u );
      BOOST_CHECK_EQUAL( dyn.total_volume.value, 6000 );
      BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::released ), 1u );
      BOOST_CHECK_EQUAL( dyn.status_count( escrow_status::disputed ), 1u );
      BOOST_CHECK_EQUAL( dyn.last_event_sequence, 6u );

      BOOST_CHECK( db.get( released ).status == escrow_status::released );
      const escrow_object& e = db.get( disputed );
      BOOST_CHECK( e.status == escrow_status::disputed );
      BOOST_CHECK( e.dispute_raised_by == principal_type( "bob" ) );
      BOOST_CHECK_EQUAL( e.dispute_reason, "wrong color" );
      BOOST_CHECK_EQUAL( e.metadata, "second" );
      BOOST_CHECK( db.find_escrow_by_order_id( "ORD-1" ) != nullptr );
      BOOST_CHECK_EQUAL( db.find_participant_statistics( "bob" )->escrow_count, 2u );

      BOOST_CHECK_EQUAL( db.ledger().balance_of( "alice", "USD" ).value, 4000 );
      BOOST_CHECK_EQUAL( db.ledger().balance_of( "bob", "USD" ).value, 3960 );
      BOOST_CHECK_EQUAL( db.ledger().balance_of( "collector", "USD" ).value, 40 );
      BOOST_CHECK_EQUAL( db.ledger().balance_of( e.custody_principal(), "USD" ).value, 2000 );
      database_fixture::verify_escrow_invariants( db );

      // ids continue where the previous run stopped
      escrow_create_operation create;
      create.payer    = "alice";
      create.payee    = "carol";
      create.order_id = "ORD-3";
      create.amount   = asset( 1000, "USD" );
      create.metadata = "third";
      const object_id_type third = db.apply_operation( create ).get<object_id_type>();
      BOOST_CHECK_EQUAL( third.instance(), 2u );

      escrow_resolve_operation resolve;
      resolve.arbitrator = "arbitrator";
      resolve.escrow     = disputed;
      resolve.winner     = "bob";
      db.apply_operation( resolve );
      BOOST_CHECK_EQUAL( db.ledger().balance_of( "bob", "USD" ).value, 3960 + 1980 );

      db.close();
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operation_after_reopen_is_undone )
{ try {
   fc::temp_directory data_dir;
   const genesis_state_type genesis = make_persistence_genesis();
   auto loader = [&genesis]() { return genesis; };

   escrow_create_operation create;
   create.payer    = "alice";
   create.payee    = "bob";
   create.order_id = "ORD-1";
   create.amount   = asset( 4000, "USD" );
   create.metadata = "first";
   {
      database db;
      db.open( data_dir.path(), loader );
      db.apply_operation( create );
      db.close();
   }
   {
      database db;
      db.open( data_dir.path(), loader );
      db.set_asset_ledger( std::make_shared<failing_ledger>( db ) );

      create.order_id = "ORD-2";
      create.amount   = asset( 1000, "USD" );
      CUSTODIAN_REQUIRE_THROW( db.apply_operation( create ), fc::exception );

      BOOST_CHECK( db.find_escrow_by_order_id( "ORD-2" ) == nullptr );
      BOOST_CHECK_EQUAL( db.get_index_type<escrow_index>().indices().size(), 1u );
      BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_escrows_created, 1u );
      BOOST_CHECK_EQUAL( db.get_dynamic_factory().total_volume.value, 4000 );
      BOOST_CHECK_EQUAL( db.get_dynamic_factory().last_event_sequence, 2u );
      BOOST_CHECK_EQUAL( db.ledger().balance_of( "alice", "USD" ).value, 6000 );
      BOOST_CHECK_EQUAL( db.ledger().allowance( "alice", CUSTODIAN_FACTORY_PRINCIPAL, "USD" ).value, 6000 );
      BOOST_CHECK_EQUAL( db.ledger().balance_of( "1.2.1", "USD" ).value, 0 );
      database_fixture::verify_escrow_invariants( db );

      // the id of the undone escrow is handed out again
      db.set_asset_ledger( std::make_shared<database_ledger>( db ) );
      const object_id_type second = db.apply_operation( create ).get<object_id_type>();
      BOOST_CHECK_EQUAL( second.instance(), 1u );
      database_fixture::verify_escrow_invariants( db );
      db.close();
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
