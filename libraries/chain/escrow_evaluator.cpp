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
#include <custodian/chain/escrow_evaluator.hpp>
#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>

namespace custodian { namespace chain {

   namespace detail
   {
      /// @throws unknown_escrow if the escrow does not exist or belongs to another factory
      const escrow_object& get_factory_escrow( const database& d, escrow_id_type id )
      {
         const escrow_object* escrow = d.find( id );
         CUSTODIAN_ASSERT( escrow != nullptr && escrow->factory == d.get_factory().get_id(), unknown_escrow,
                           "Escrow ${id} was not created by this factory", ("id", id) );
         return *escrow;
      }

      void require_status( const escrow_object& escrow, escrow_status required )
      {
         CUSTODIAN_ASSERT( escrow.status == required, escrow_invalid_status,
                           "Escrow ${id} is ${s}, the operation requires ${r}",
                           ("id", escrow.id)("s", escrow.status)("r", required) );
      }
   } // detail

   void_result escrow_create_evaluator::do_evaluate( const escrow_create_operation& o )
   { try {
      const database& d = db();
      _factory = &d.get_factory();

      CUSTODIAN_ASSERT( d.find_escrow_by_order_id( o.order_id ) == nullptr, duplicate_order_id,
                        "Order ${o} already has an escrow", ("o", o.order_id) );

      const share_type allowed = d.ledger().allowance( o.payer, _factory->custody_principal(), o.amount.asset_id );
      CUSTODIAN_ASSERT( allowed >= o.amount.amount, insufficient_allowance,
                        "${payer} allowed the factory to move ${a} of ${asset}, the escrow needs ${n}",
                        ("payer", o.payer)("a", allowed)("asset", o.amount.asset_id)("n", o.amount.amount) );

      const share_type balance = d.ledger().balance_of( o.payer, o.amount.asset_id );
      CUSTODIAN_ASSERT( balance >= o.amount.amount, insufficient_balance,
                        "Insufficient Balance: ${payer}'s balance of ${b} is less than required ${r}",
                        ("payer", o.payer)("b", balance)("r", o.amount) );

      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   object_id_type escrow_create_evaluator::do_apply( const escrow_create_operation& o )
   { try {
      database& d = db();
      const time_point_sec now = d.head_time();
      const escrow_factory_object& factory = *_factory;

      const escrow_object& escrow = d.create<escrow_object>( [&o,&factory,now]( escrow_object& e ) {
         e.factory       = factory.get_id();
         e.order_id      = o.order_id;
         e.payer         = o.payer;
         e.payee         = o.payee;
         e.amount        = o.amount;
         e.metadata      = o.metadata;
         e.created_at    = now;
         e.release_after = now + o.release_delay;
         e.fee_bips      = factory.default_fee_bips;
         e.fee_collector = factory.fee_collector;
         e.status        = escrow_status::funded;
      });

      // the funds go straight from the payer into the custody of the new escrow
      d.ledger().transfer_from( factory.custody_principal(), o.payer, escrow.custody_principal(), o.amount );

      d.record_escrow_created( escrow );

      d.push_event( escrow.id, escrow_initialized_event{ o.payer, o.payee, o.amount, o.metadata } );
      d.push_event( factory.id, escrow_created_event{ escrow.get_id(), o.order_id, o.payer, o.payee, o.amount } );

      return escrow.id;
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_release_evaluator::do_evaluate( const escrow_release_operation& o )
   { try {
      _escrow = &detail::get_factory_escrow( db(), o.escrow );

      CUSTODIAN_ASSERT( o.payer == _escrow->payer, caller_not_payer,
                        "Only the payer ${p} may release escrow ${id}", ("p", _escrow->payer)("id", o.escrow) );
      detail::require_status( *_escrow, escrow_status::funded );

      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_release_evaluator::do_apply( const escrow_release_operation& o )
   { try {
      database& d = db();
      const escrow_object& escrow = *_escrow;
      const escrow_status prior = escrow.status;

      const fee_split paid = d.settle_escrow( escrow, escrow_status::released, escrow.payee, true );
      d.adjust_escrow_status_tally( prior, escrow_status::released );

      d.push_event( escrow.id, funds_released_event{ escrow.payee, paid.net, paid.fee } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_refund_evaluator::do_evaluate( const escrow_refund_operation& o )
   { try {
      _escrow = &detail::get_factory_escrow( db(), o.escrow );

      CUSTODIAN_ASSERT( o.payee == _escrow->payee, caller_not_payee,
                        "Only the payee ${p} may refund escrow ${id}", ("p", _escrow->payee)("id", o.escrow) );
      detail::require_status( *_escrow, escrow_status::funded );

      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_refund_evaluator::do_apply( const escrow_refund_operation& o )
   { try {
      database& d = db();
      const escrow_object& escrow = *_escrow;
      const escrow_status prior = escrow.status;

      const fee_split paid = d.settle_escrow( escrow, escrow_status::refunded, escrow.payer, false );
      d.adjust_escrow_status_tally( prior, escrow_status::refunded );

      d.push_event( escrow.id, funds_refunded_event{ escrow.payer, paid.net } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_auto_release_evaluator::do_evaluate( const escrow_auto_release_operation& o )
   { try {
      const database& d = db();
      _escrow = &detail::get_factory_escrow( d, o.escrow );

      detail::require_status( *_escrow, escrow_status::funded );
      CUSTODIAN_ASSERT( d.head_time() >= _escrow->release_after, release_too_early,
                        "Escrow ${id} may not be released before ${t}, it is ${now}",
                        ("id", o.escrow)("t", _escrow->release_after)("now", d.head_time()) );

      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_auto_release_evaluator::do_apply( const escrow_auto_release_operation& o )
   { try {
      database& d = db();
      const escrow_object& escrow = *_escrow;
      const escrow_status prior = escrow.status;

      const fee_split paid = d.settle_escrow( escrow, escrow_status::released, escrow.payee, true );
      d.adjust_escrow_status_tally( prior, escrow_status::released );

      d.push_event( escrow.id, funds_released_event{ escrow.payee, paid.net, paid.fee } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_dispute_evaluator::do_evaluate( const escrow_dispute_operation& o )
   { try {
      _escrow = &detail::get_factory_escrow( db(), o.escrow );

      CUSTODIAN_ASSERT( _escrow->is_party( o.raiser ), caller_not_party,
                        "${r} is neither payer nor payee of escrow ${id}", ("r", o.raiser)("id", o.escrow) );
      detail::require_status( *_escrow, escrow_status::funded );

      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_dispute_evaluator::do_apply( const escrow_dispute_operation& o )
   { try {
      database& d = db();
      const escrow_object& escrow = *_escrow;
      const escrow_status prior = escrow.status;

      d.modify( escrow, [&o]( escrow_object& e ) {
         e.status            = escrow_status::disputed;
         e.dispute_reason    = o.reason;
         e.dispute_raised_by = o.raiser;
      });
      d.adjust_escrow_status_tally( prior, escrow_status::disputed );

      d.push_event( escrow.id, dispute_raised_event{ o.raiser, o.reason } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_resolve_evaluator::do_evaluate( const escrow_resolve_operation& o )
   { try {
      const database& d = db();
      const escrow_factory_object& factory = d.get_factory();

      CUSTODIAN_ASSERT( o.arbitrator == factory.arbitrator, caller_not_arbitrator,
                        "Only the arbitrator ${a} may resolve disputes", ("a", factory.arbitrator) );
      _escrow = &detail::get_factory_escrow( d, o.escrow );

      detail::require_status( *_escrow, escrow_status::disputed );
      CUSTODIAN_ASSERT( _escrow->is_party( o.winner ), invalid_dispute_winner,
                        "Winner ${w} is neither payer nor payee of escrow ${id}", ("w", o.winner)("id", o.escrow) );

      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result escrow_resolve_evaluator::do_apply( const escrow_resolve_operation& o )
   { try {
      database& d = db();
      const escrow_object& escrow = *_escrow;
      // the tally to decrement is the status the escrow had before it settles
      const escrow_status prior = escrow.status;

      // the payee is paid like on release, the payer gets everything back
      // a principal on both sides is refunded like a winning payer
      const bool charge_fee = ( o.winner == escrow.payee && o.winner != escrow.payer );
      const fee_split paid = d.settle_escrow( escrow, escrow_status::resolved, o.winner, charge_fee );
      d.adjust_escrow_status_tally( prior, escrow_status::resolved );

      d.push_event( escrow.id, dispute_resolved_event{ o.winner, paid.net, paid.fee } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

} } // custodian::chain
