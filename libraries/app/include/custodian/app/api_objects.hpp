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

#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>
#include <custodian/chain/order_intent_object.hpp>

#include <fc/optional.hpp>

namespace custodian { namespace app {
   using namespace custodian::chain;

   /// who pays whom, how much, and where the escrow stands
   struct escrow_basic_info
   {
      principal_type payer;
      principal_type payee;
      asset_id_type  asset_id;
      share_type     amount;
      escrow_status  status = escrow_status::funded;
   };

   /// what a settlement in favour of the payee pays to the fee collector and to the payee
   struct escrow_fee_info
   {
      uint16_t       fee_bips = 0;
      principal_type fee_collector;
      share_type     fee;
      share_type     net;
   };

   struct escrow_dispute_info
   {
      bool           has_dispute = false;
      principal_type raised_by;
      string         reason;
   };

   struct escrow_timestamps
   {
      time_point_sec created_at;
      time_point_sec release_after;
      uint32_t       time_remaining = 0;
   };

   struct factory_stats
   {
      uint64_t       total_escrows_created = 0;
      share_type     total_volume;
      uint16_t       default_fee_bips = 0;
      principal_type fee_collector;
      principal_type arbitrator;
   };

   /// the terms a seller published for the escrow funding an order
   struct escrow_parameters
   {
      principal_type receiver;
      asset          amount;
      string         metadata;
      uint32_t       release_delay = 0;
   };

} } // custodian::app

FC_REFLECT( custodian::app::escrow_basic_info, (payer)(payee)(asset_id)(amount)(status) )
FC_REFLECT( custodian::app::escrow_fee_info, (fee_bips)(fee_collector)(fee)(net) )
FC_REFLECT( custodian::app::escrow_dispute_info, (has_dispute)(raised_by)(reason) )
FC_REFLECT( custodian::app::escrow_timestamps, (created_at)(release_after)(time_remaining) )
FC_REFLECT( custodian::app::factory_stats,
            (total_escrows_created)(total_volume)(default_fee_bips)(fee_collector)(arbitrator) )
FC_REFLECT( custodian::app::escrow_parameters, (receiver)(amount)(metadata)(release_delay) )
