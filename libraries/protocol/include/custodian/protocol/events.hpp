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

#pragma once
#include <custodian/protocol/asset.hpp>
#include <custodian/protocol/escrow.hpp>
#include <custodian/protocol/order_intent.hpp>

namespace custodian { namespace protocol {

   /**
    *  @defgroup events Domain Events
    *
    *  Records published to external observers after an operation commits.
    *  An event is never published for an operation that failed.
    */
   /// @{

   /// raised by a new escrow instance once it holds its funds
   struct escrow_initialized_event
   {
      principal_type payer;
      principal_type payee;
      asset          amount;
      string         metadata;
   };

   /// raised by the factory for every escrow it creates
   struct escrow_created_event
   {
      escrow_id_type escrow;
      string         order_id;
      principal_type payer;
      principal_type payee;
      asset          amount;
   };

   struct funds_released_event
   {
      principal_type recipient;
      share_type     net_amount;
      share_type     fee_amount;
   };

   struct funds_refunded_event
   {
      principal_type recipient;
      share_type     amount;
   };

   struct dispute_raised_event
   {
      principal_type raiser;
      string         reason;
   };

   struct dispute_resolved_event
   {
      principal_type winner;
      share_type     net_amount;
      share_type     fee_amount;
   };

   struct fee_collector_updated_event
   {
      principal_type new_collector;
   };

   struct arbitrator_updated_event
   {
      principal_type new_arbitrator;
   };

   struct platform_fee_updated_event
   {
      uint16_t new_fee_bips = 0;
   };

   struct order_intent_created_event
   {
      string         order_id;
      principal_type seller;
      principal_type receiver;
      asset          amount;
      string         metadata;
      uint32_t       release_delay = 0;
   };

   /// raised when an intent is paid or cancelled
   struct order_intent_updated_event
   {
      string                   order_id;
      order_intent_status      status = order_intent_status::pending;
      optional<escrow_id_type> escrow;
   };

   typedef fc::static_variant<
            /*  0 */ escrow_initialized_event,
            /*  1 */ escrow_created_event,
            /*  2 */ funds_released_event,
            /*  3 */ funds_refunded_event,
            /*  4 */ dispute_raised_event,
            /*  5 */ dispute_resolved_event,
            /*  6 */ fee_collector_updated_event,
            /*  7 */ arbitrator_updated_event,
            /*  8 */ platform_fee_updated_event,
            /*  9 */ order_intent_created_event,
            /* 10 */ order_intent_updated_event
         > domain_event;

   /**
    *  A published event together with the object that raised it: an escrow
    *  instance, the factory (2.0.0) or an order intent.
    */
   struct applied_event
   {
      applied_event() = default;
      applied_event( uint64_t seq, object_id_type src, time_point_sec t, const domain_event& e )
      :sequence(seq),source(src),time(t),event(e){}

      uint64_t       sequence = 0;
      object_id_type source;
      time_point_sec time;
      domain_event   event;
   };

   /// @}

} } // custodian::protocol

FC_REFLECT( custodian::protocol::escrow_initialized_event, (payer)(payee)(amount)(metadata) )
FC_REFLECT( custodian::protocol::escrow_created_event, (escrow)(order_id)(payer)(payee)(amount) )
FC_REFLECT( custodian::protocol::funds_released_event, (recipient)(net_amount)(fee_amount) )
FC_REFLECT( custodian::protocol::funds_refunded_event, (recipient)(amount) )
FC_REFLECT( custodian::protocol::dispute_raised_event, (raiser)(reason) )
FC_REFLECT( custodian::protocol::dispute_resolved_event, (winner)(net_amount)(fee_amount) )
FC_REFLECT( custodian::protocol::fee_collector_updated_event, (new_collector) )
FC_REFLECT( custodian::protocol::arbitrator_updated_event, (new_arbitrator) )
FC_REFLECT( custodian::protocol::platform_fee_updated_event, (new_fee_bips) )
FC_REFLECT( custodian::protocol::order_intent_created_event,
            (order_id)(seller)(receiver)(amount)(metadata)(release_delay) )
FC_REFLECT( custodian::protocol::order_intent_updated_event, (order_id)(status)(escrow) )
FC_REFLECT_TYPENAME( custodian::protocol::domain_event )
FC_REFLECT( custodian::protocol::applied_event, (sequence)(source)(time)(event) )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::applied_event )
