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

#include <custodian/chain/ledger_object.hpp>

#include "database_fixture.hpp"

using namespace custodian::chain::test;

uint32_t CUSTODIAN_TESTING_GENESIS_TIMESTAMP = 1431700000;

namespace custodian { namespace chain { namespace test {

namespace buf = boost::unit_test::framework;

database_fixture::database_fixture( const fc::time_point_sec& initial_timestamp )
   : ledger( db )
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

   genesis_state.initial_timestamp = initial_timestamp;
   genesis_state.owner             = owner;
   genesis_state.fee_collector     = fee_collector;
   genesis_state.arbitrator        = arbitrator;
   genesis_state.default_fee_bips  = 250;

   db.init_genesis( genesis_state );

   _event_connection = db.published_event.connect( [this]( const applied_event& e ) {
      published_events.push_back( e );
   });
} catch ( const fc::exception& e ) {
   edump( (e.to_detail_string()) );
   throw;
} }

database_fixture::~database_fixture()
{
   try {
      // If we're unwinding due to an exception, don't do any more checks.
      // This way, boost test's last checkpoint tells us approximately where the error was.
      if( !std::uncaught_exception() )
      {
         verify_escrow_invariants( db );
         verify_ledger_supply();
      }
      return;
   } catch (fc::exception& ex) {
      BOOST_FAIL( std::string("fc::exception in ~database_fixture: ") + ex.to_detail_string() );
   } catch (std::exception& e) {
      BOOST_FAIL( std::string("std::exception in ~database_fixture:") + e.what() );
   }
}

void database_fixture::verify_escrow_invariants( const database& db )
{
   const dynamic_factory_object& dyn = db.get_dynamic_factory();
   const auto& escrows = db.get_index_type<escrow_index>().indices();

   uint64_t tallies = 0;
   for( const auto& item : dyn.status_counts )
      tallies += item.second;
   BOOST_CHECK_EQUAL( tallies, dyn.total_escrows_created );
   BOOST_CHECK_EQUAL( escrows.size(), dyn.total_escrows_created );

   share_type volume;
   map<escrow_status, uint64_t> counted;
   for( const escrow_object& e : escrows )
   {
      volume += e.amount.amount;
      ++counted[e.status];

      // an escrow holds its amount until it settles and nothing afterwards
      const share_type held = db.ledger().balance_of( e.custody_principal(), e.amount.asset_id );
      if( e.is_terminal() )
         BOOST_CHECK_EQUAL( held.value, 0 );
      else
         BOOST_CHECK_EQUAL( held.value, e.amount.amount.value );
   }
   BOOST_CHECK_EQUAL( volume.value, dyn.total_volume.value );
   for( const auto& item : counted )
      BOOST_CHECK_EQUAL( dyn.status_count( item.first ), item.second );
}

void database_fixture::verify_ledger_supply()const
{
   share_type total;
   for( const ledger_balance_object& b : db.get_index_type<ledger_balance_index>().indices() )
   {
      BOOST_CHECK( b.balance >= 0 );
      total += b.balance;
   }
   BOOST_CHECK_EQUAL( total.value, total_issued.value );
}

void database_fixture::issue( const principal_type& to, share_type amount )
{ try {
   ledger.issue( to, usd_amount( amount ) );
   total_issued += amount;
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

void database_fixture::approve_factory( const principal_type& payer, share_type amount )
{ try {
   ledger.approve( payer, CUSTODIAN_FACTORY_PRINCIPAL, usd_amount( amount ) );
} FC_CAPTURE_AND_RETHROW( (payer)(amount) ) }

void database_fixture::fund( const principal_type& payer, share_type amount )
{
   issue( payer, amount );
   approve_factory( payer, ledger.allowance( payer, CUSTODIAN_FACTORY_PRINCIPAL, usd ) + amount );
}

share_type database_fixture::get_balance( const principal_type& owner )const
{
   return db.ledger().balance_of( owner, usd );
}

share_type database_fixture::get_balance( const escrow_object& escrow )const
{
   return db.ledger().balance_of( escrow.custody_principal(), escrow.amount.asset_id );
}

escrow_create_operation database_fixture::make_escrow_create_op( const principal_type& payer, const string& order_id,
                                                                 const principal_type& payee, share_type amount,
                                                                 uint32_t release_delay )const
{
   escrow_create_operation op;
   op.payer         = payer;
   op.order_id      = order_id;
   op.payee         = payee;
   op.amount        = usd_amount( amount );
   op.metadata      = "ipfs://order/" + order_id;
   op.release_delay = release_delay;
   return op;
}

const escrow_object& database_fixture::create_escrow( const principal_type& payer, const string& order_id,
                                                      const principal_type& payee, share_type amount,
                                                      uint32_t release_delay )
{ try {
   const operation_result result = db.apply_operation(
         make_escrow_create_op( payer, order_id, payee, amount, release_delay ) );
   return db.get<escrow_object>( result.get<object_id_type>() );
} FC_CAPTURE_AND_RETHROW( (payer)(order_id)(payee)(amount)(release_delay) ) }

const escrow_object& database_fixture::create_funded_escrow( const principal_type& payer, const string& order_id,
                                                             const principal_type& payee, share_type amount,
                                                             uint32_t release_delay )
{
   fund( payer, amount );
   return create_escrow( payer, order_id, payee, amount, release_delay );
}

void database_fixture::release( const principal_type& payer, escrow_id_type escrow )
{
   escrow_release_operation op;
   op.payer  = payer;
   op.escrow = escrow;
   db.apply_operation( op );
}

void database_fixture::refund( const principal_type& payee, escrow_id_type escrow )
{
   escrow_refund_operation op;
   op.payee  = payee;
   op.escrow = escrow;
   db.apply_operation( op );
}

void database_fixture::auto_release( const principal_type& caller, escrow_id_type escrow )
{
   escrow_auto_release_operation op;
   op.caller = caller;
   op.escrow = escrow;
   db.apply_operation( op );
}

void database_fixture::raise_dispute( const principal_type& raiser, escrow_id_type escrow, const string& reason )
{
   escrow_dispute_operation op;
   op.raiser = raiser;
   op.escrow = escrow;
   op.reason = reason;
   db.apply_operation( op );
}

void database_fixture::resolve_dispute( const principal_type& by, escrow_id_type escrow, const principal_type& winner )
{
   escrow_resolve_operation op;
   op.arbitrator = by;
   op.escrow     = escrow;
   op.winner     = winner;
   db.apply_operation( op );
}

uint64_t database_fixture::tally_sum()const
{
   uint64_t sum = 0;
   for( const auto& item : db.get_dynamic_factory().status_counts )
      sum += item.second;
   return sum;
}

} } } // custodian::chain::test
