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

#include <custodian/chain/database.hpp>
#include <custodian/chain/database_ledger.hpp>
#include <custodian/chain/factory_object.hpp>

namespace custodian { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   genesis_state.validate();
   FC_ASSERT( find( escrow_factory_id_type() ) == nullptr, "The database has already been initialized" );

   _undo_db.disable();

   const escrow_factory_object& factory = create<escrow_factory_object>( [&genesis_state]( escrow_factory_object& f ) {
      f.escrow_template  = genesis_state.escrow_template;
      f.owner            = genesis_state.owner;
      f.fee_collector    = genesis_state.fee_collector;
      f.arbitrator       = genesis_state.arbitrator;
      f.default_fee_bips = genesis_state.default_fee_bips;
   });
   FC_ASSERT( factory.get_id() == escrow_factory_id_type() );
   FC_ASSERT( string( object_id_type( factory.id ) ) == CUSTODIAN_FACTORY_PRINCIPAL );

   create<dynamic_factory_object>( [&genesis_state]( dynamic_factory_object& d ) {
      d.time = genesis_state.initial_timestamp;
      for( uint8_t s = 0; s < escrow_status_count; ++s )
         d.status_counts[static_cast<escrow_status>( s )] = 0;
   });

   // the genesis balances always live in the database, whichever ledger is installed later
   database_ledger genesis_ledger( *this );
   for( const auto& balance : genesis_state.initial_balances )
      genesis_ledger.issue( balance.owner, balance.amount );
   for( const auto& allowance : genesis_state.initial_allowances )
      genesis_ledger.approve( allowance.owner, allowance.spender, allowance.amount );

   _undo_db.enable();

   ilog( "Initialized escrow factory ${f}: fee ${bips} bips to ${c}, arbitrator ${a}, ${b} balances, ${n} allowances",
         ("f", factory.id)("bips", factory.default_fee_bips)("c", factory.fee_collector)("a", factory.arbitrator)
         ("b", genesis_state.initial_balances.size())("n", genesis_state.initial_allowances.size()) );
} FC_CAPTURE_AND_RETHROW() }

} } // custodian::chain
