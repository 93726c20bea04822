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
#include <custodian/db/generic_index.hpp>

namespace custodian { namespace chain {
   using namespace protocol;

   /**
    * @brief The configuration of the escrow factory
    *
    * There is exactly one factory, 2.0.0. Changes to the fee terms only apply to escrows
    * created afterwards, every escrow keeps a copy of the terms it was created with.
    */
   class escrow_factory_object : public custodian::db::abstract_object<escrow_factory_object,
                                                                        implementation_ids, impl_escrow_factory_object_type>
   {
      public:
         /// the behavior every escrow created by this factory shares
         string         escrow_template;
         /// the only principal allowed to reconfigure the factory
         principal_type owner;
         principal_type fee_collector;
         principal_type arbitrator;
         uint16_t       default_fee_bips = 0;

         principal_type custody_principal()const { return principal_type( string( object_id_type( id ) ) ); }
   };

   /**
    * @brief The aggregates the factory maintains over all escrows, and the clock
    *
    * This is an implementation detail. The values here are updated every time an escrow
    * is created or changes status, which is why they are kept apart from the
    * rarely changing escrow_factory_object.
    */
   class dynamic_factory_object : public custodian::db::abstract_object<dynamic_factory_object,
                                                                         implementation_ids, impl_dynamic_factory_object_type>
   {
      public:
         time_point_sec time;
         uint64_t       total_escrows_created = 0;
         share_type     total_volume;
         /// escrows currently in each status, sums to total_escrows_created
         flat_map<escrow_status, uint64_t> status_counts;
         /// sequence number of the last published event
         uint64_t       last_event_sequence = 0;

         uint64_t status_count( escrow_status s )const
         {
            auto itr = status_counts.find( s );
            return itr == status_counts.end() ? 0 : itr->second;
         }
   };

   /**
    * @brief How many escrows a principal takes part in, as payer or as payee
    */
   class participant_statistics_object : public custodian::db::abstract_object<participant_statistics_object,
                                                        implementation_ids, impl_participant_statistics_object_type>
   {
      public:
         principal_type participant;
         uint64_t       escrow_count = 0;
   };

   struct by_participant;
   typedef multi_index_container<
      participant_statistics_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_participant>,
            member< participant_statistics_object, principal_type, &participant_statistics_object::participant > >
      >
   > participant_statistics_multi_index_type;

   typedef generic_index<participant_statistics_object, participant_statistics_multi_index_type> participant_statistics_index;

   typedef generic_index<escrow_factory_object, multi_index_container<
      escrow_factory_object,
      indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
   > > escrow_factory_index;

   typedef generic_index<dynamic_factory_object, multi_index_container<
      dynamic_factory_object,
      indexed_by< ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > > >
   > > dynamic_factory_index;

} } // custodian::chain

MAP_OBJECT_ID_TO_TYPE(custodian::chain::escrow_factory_object)
MAP_OBJECT_ID_TO_TYPE(custodian::chain::dynamic_factory_object)
MAP_OBJECT_ID_TO_TYPE(custodian::chain::participant_statistics_object)

FC_REFLECT_TYPENAME( custodian::chain::escrow_factory_object )
FC_REFLECT_TYPENAME( custodian::chain::dynamic_factory_object )
FC_REFLECT_TYPENAME( custodian::chain::participant_statistics_object )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::escrow_factory_object )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::dynamic_factory_object )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::participant_statistics_object )
