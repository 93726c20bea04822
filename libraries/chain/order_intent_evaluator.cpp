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
#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/order_intent_evaluator.hpp>
#include <custodian/chain/order_intent_object.hpp>

namespace custodian { namespace chain {

   namespace detail
   {
      /// @throws unknown_order_intent, order_intent_not_pending
      const order_intent_object& get_pending_intent( const database& d, const string& order_id )
      {
         const order_intent_object* intent = d.find_order_intent( order_id );
         CUSTODIAN_ASSERT( intent != nullptr, unknown_order_intent,
                           "No order intent for order ${o}", ("o", order_id) );
         CUSTODIAN_ASSERT( intent->is_pending(), order_intent_not_pending,
                           "Order intent ${o} is ${s}", ("o", order_id)("s", intent->status) );
         return *intent;
      }
   }

   void_result order_intent_create_evaluator::do_evaluate( const order_intent_create_operation& o )
   { try {
      CUSTODIAN_ASSERT( db().find_order_intent( o.order_id ) == nullptr, duplicate_order_id,
                        "Order ${o} already has an intent", ("o", o.order_id) );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   object_id_type order_intent_create_evaluator::do_apply( const order_intent_create_operation& o )
   { try {
      database& d = db();
      const time_point_sec now = d.head_time();

      const order_intent_object& intent = d.create<order_intent_object>( [&o,now]( order_intent_object& i ) {
         i.order_id      = o.order_id;
         i.seller        = o.seller;
         i.receiver      = o.receiver;
         i.amount        = o.amount;
         i.metadata      = o.metadata;
         i.release_delay = o.release_delay;
         i.status        = order_intent_status::pending;
         i.created_at    = now;
      });

      d.push_event( intent.id, order_intent_created_event{ o.order_id, o.seller, o.receiver, o.amount,
                                                           o.metadata, o.release_delay } );
      return intent.id;
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result order_intent_cancel_evaluator::do_evaluate( const order_intent_cancel_operation& o )
   { try {
      const database& d = db();
      const order_intent_object* intent = d.find_order_intent( o.order_id );
      CUSTODIAN_ASSERT( intent != nullptr, unknown_order_intent,
                        "No order intent for order ${o}", ("o", o.order_id) );
      CUSTODIAN_ASSERT( o.seller == intent->seller, caller_not_seller,
                        "Only the seller ${s} may cancel order ${o}", ("s", intent->seller)("o", o.order_id) );
      _intent = &detail::get_pending_intent( d, o.order_id );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result order_intent_cancel_evaluator::do_apply( const order_intent_cancel_operation& o )
   { try {
      database& d = db();
      d.modify( *_intent, []( order_intent_object& i ) {
         i.status = order_intent_status::cancelled;
      });
      d.push_event( _intent->id, order_intent_updated_event{ o.order_id, order_intent_status::cancelled, {} } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result order_intent_settle_evaluator::do_evaluate( const order_intent_settle_operation& o )
   { try {
      const database& d = db();
      _intent = &detail::get_pending_intent( d, o.order_id );

      const escrow_object* escrow = d.find( o.escrow );
      CUSTODIAN_ASSERT( escrow != nullptr, unknown_escrow, "Escrow ${e} does not exist", ("e", o.escrow) );
      CUSTODIAN_ASSERT( escrow->order_id == o.order_id, escrow_order_mismatch,
                        "Escrow ${e} funds order ${eo}, not ${o}", ("e", o.escrow)("eo", escrow->order_id)("o", o.order_id) );
      CUSTODIAN_ASSERT( escrow->payer == o.buyer, caller_not_payer,
                        "Escrow ${e} was funded by ${p}", ("e", o.escrow)("p", escrow->payer) );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result order_intent_settle_evaluator::do_apply( const order_intent_settle_operation& o )
   { try {
      database& d = db();
      d.modify( *_intent, [&o]( order_intent_object& i ) {
         i.status = order_intent_status::paid;
         i.buyer  = o.buyer;
         i.escrow = o.escrow;
      });
      d.push_event( _intent->id, order_intent_updated_event{ o.order_id, order_intent_status::paid, o.escrow } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

} } // custodian::chain
