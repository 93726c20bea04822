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
#include <custodian/protocol/order_intent.hpp>
#include <custodian/db/generic_index.hpp>

namespace custodian { namespace chain {
   using namespace protocol;

   /**
    * @brief A sale announced by a seller before any funds move
    *
    * The intent only coordinates: it records the terms the buyer is expected to fund
    * and, once paid, which escrow holds the funds. It never holds custody.
    */
   class order_intent_object : public custodian::db::abstract_object<order_intent_object,
                                                                      protocol_ids, order_intent_object_type>
   {
      public:
         string                   order_id;
         principal_type           seller;
         principal_type           receiver;
         /// set once the intent is paid
         principal_type           buyer;
         asset                    amount;
         string                   metadata;
         uint32_t                 release_delay = 0;
         order_intent_status      status = order_intent_status::pending;
         optional<escrow_id_type> escrow;
         time_point_sec           created_at;

         bool is_pending()const { return status == order_intent_status::pending; }
   };

   struct by_order_id;
   struct by_seller;
   struct by_buyer;
   typedef multi_index_container<
      order_intent_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_order_id>, member< order_intent_object, string, &order_intent_object::order_id > >,
         ordered_unique< tag<by_seller>,
            composite_key< order_intent_object,
               member< order_intent_object, principal_type, &order_intent_object::seller >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag<by_buyer>,
            composite_key< order_intent_object,
               member< order_intent_object, principal_type, &order_intent_object::buyer >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > order_intent_multi_index_type;

   typedef generic_index<order_intent_object, order_intent_multi_index_type> order_intent_index;

} } // custodian::chain

MAP_OBJECT_ID_TO_TYPE(custodian::chain::order_intent_object)

FC_REFLECT_TYPENAME( custodian::chain::order_intent_object )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::order_intent_object )
