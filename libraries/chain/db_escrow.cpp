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
#include <custodian/chain/exceptions.hpp>
#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>

namespace custodian { namespace chain {

escrow_settlement_guard::escrow_settlement_guard( database& db, escrow_id_type escrow )
:_db(db),_escrow(escrow)
{
   CUSTODIAN_ASSERT( _db._locked_escrows.insert( escrow ).second, escrow_reentrancy,
                     "Escrow ${id} is already being settled", ("id", escrow) );
}

escrow_settlement_guard::~escrow_settlement_guard()
{
   _db._locked_escrows.erase( _escrow );
}

bool database::is_escrow_locked( escrow_id_type escrow )const
{
   return _locked_escrows.find( escrow ) != _locked_escrows.end();
}

fee_split database::settle_escrow( const escrow_object& escrow, escrow_status outcome,
                                   const principal_type& beneficiary, bool charge_fee )
{ try {
   FC_ASSERT( outcome == escrow_status::released || outcome == escrow_status::refunded
              || outcome == escrow_status::resolved, "Not a settlement outcome", ("outcome", outcome) );

   escrow_settlement_guard guard( *this, escrow.get_id() );

   // the escrow may change while the ledger calls back, copy what the payout needs
   const asset          amount        = escrow.amount;
   const principal_type custody       = escrow.custody_principal();
   const principal_type fee_collector = escrow.fee_collector;

   fee_split paid;
   if( charge_fee )
      paid = calculate_fee_split( amount.amount, escrow.fee_bips );
   else
      paid.net = amount.amount;
   FC_ASSERT( paid.fee + paid.net == amount.amount, "Settlement does not add up",
              ("fee", paid.fee)("net", paid.net)("amount", amount) );

   modify( escrow, [outcome]( escrow_object& e ) {
      e.status = outcome;
   });

   if( paid.fee > 0 )
      ledger().transfer( custody, fee_collector, asset( paid.fee, amount.asset_id ) );
   if( paid.net > 0 )
      ledger().transfer( custody, beneficiary, asset( paid.net, amount.asset_id ) );

   return paid;
} FC_CAPTURE_AND_RETHROW( (escrow.id)(outcome)(beneficiary)(charge_fee) ) }

void database::record_escrow_created( const escrow_object& escrow )
{
   modify( get_dynamic_factory(), [&escrow]( dynamic_factory_object& d ) {
      ++d.total_escrows_created;
      d.total_volume += escrow.amount.amount;
      ++d.status_counts[escrow_status::funded];
   });

   // a principal that is both payer and payee is counted once for each role
   for( const principal_type& participant : { escrow.payer, escrow.payee } )
   {
      const participant_statistics_object* stats = find_participant_statistics( participant );
      if( stats == nullptr )
         create<participant_statistics_object>( [&participant]( participant_statistics_object& s ) {
            s.participant  = participant;
            s.escrow_count = 1;
         });
      else
         modify( *stats, []( participant_statistics_object& s ) {
            ++s.escrow_count;
         });
   }
}

void database::adjust_escrow_status_tally( escrow_status from, escrow_status to )
{
   modify( get_dynamic_factory(), [from,to]( dynamic_factory_object& d ) {
      uint64_t& prior = d.status_counts[from];
      if( prior == 0 )
         elog( "Escrow status tally of ${s} would underflow, leaving it at zero", ("s", from) );
      else
         --prior;
      ++d.status_counts[to];
   });
}

} } // custodian::chain
