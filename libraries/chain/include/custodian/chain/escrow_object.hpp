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

#include <custodian/chain/types.hpp>
#include <custodian/protocol/escrow.hpp>
#include <custodian/protocol/fee.hpp>
#include <custodian/db/generic_index.hpp>

namespace custodian { namespace chain {
   using namespace protocol;

   /**
    * @brief The custody record of one order
    *
    * An escrow holds exactly one funded amount from its creation until one of its
    * settlements pays it out. Its parties, amount and fee terms are fixed when it is
    * created; only the status and the dispute record change afterwards, and once the
    * escrow reached a terminal status it stays as a permanent record.
    *
    * On the asset ledger the funds are held under the escrow's own principal, see
    * custody_principal().
    */
   class escrow_object : public custodian::db::abstract_object<escrow_object, protocol_ids, escrow_object_type>
   {
      public:
         escrow_factory_id_type factory;
         string                 order_id;
         principal_type         payer;
         principal_type         payee;
         asset                  amount;
         string                 metadata;
         time_point_sec         created_at;
         time_point_sec         release_after;
         /// fee terms in force when the escrow was created
         uint16_t               fee_bips = 0;
         principal_type         fee_collector;
         escrow_status          status = escrow_status::funded;
         string                 dispute_reason;
         principal_type         dispute_raised_by;

         principal_type custody_principal()const { return principal_type( string( object_id_type( id ) ) ); }

         bool is_active()const { return status == escrow_status::funded; }
         bool is_terminal()const
         {
            return status == escrow_status::released || status == escrow_status::refunded
                || status == escrow_status::resolved;
         }
         bool has_dispute()const { return !dispute_raised_by.is_null(); }
         bool is_party( const principal_type& p )const { return p == payer || p == payee; }

         /// fee and net the payee side would receive
         fee_split fee_breakdown()const { return calculate_fee_split( amount.amount, fee_bips ); }

         /// seconds until anyone may release the escrow, zero once due or no longer funded
         uint32_t time_remaining( time_point_sec now )const;

         bool can_auto_release( time_point_sec now )const
         {
            return status == escrow_status::funded && now >= release_after;
         }

         /// human readable status, a funded escrow is reported as ACTIVE
         string status_label()const;
   };

   struct by_order_id;
   struct by_payer;
   struct by_payee;
   struct by_status;
   typedef multi_index_container<
      escrow_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_order_id>, member< escrow_object, string, &escrow_object::order_id > >,
         ordered_unique< tag<by_payer>,
            composite_key< escrow_object,
               member< escrow_object, principal_type, &escrow_object::payer >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_payee>,
            composite_key< escrow_object,
               member< escrow_object, principal_type, &escrow_object::payee >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_status>,
            composite_key< escrow_object,
               member< escrow_object, escrow_status, &escrow_object::status >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > escrow_object_multi_index_type;

   typedef generic_index<escrow_object, escrow_object_multi_index_type> escrow_index;

} } // custodian::chain

MAP_OBJECT_ID_TO_TYPE(custodian::chain::escrow_object)

FC_REFLECT_TYPENAME( custodian::chain::escrow_object )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::escrow_object )
