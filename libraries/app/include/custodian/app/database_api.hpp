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

#include <custodian/app/api_objects.hpp>

#include <custodian/chain/database.hpp>

#include <fc/api.hpp>
#include <fc/optional.hpp>

#include <memory>
#include <vector>

namespace custodian { namespace app {

using namespace custodian::chain;
using std::string;
using std::vector;

class database_api_impl;

/**
 * @brief The database_api class exposes the read views of the custody state.
 *
 * This API is read-only; all modifications to the database must be performed by applying operations.
 * Queries about a particular escrow fail with unknown_escrow if the escrow was not created by the factory.
 */
class database_api
{
   public:
      explicit database_api( const custodian::chain::database& db );
      ~database_api();

      /////////////
      // Globals //
      /////////////

      fc::time_point_sec get_head_time()const;

      /////////////
      // Factory //
      /////////////

      escrow_factory_object get_factory()const;

      /**
       * @brief Get the aggregate counters of the factory and its current fee terms
       */
      factory_stats get_factory_stats()const;

      /**
       * @brief Get the number of escrows currently in each status
       *
       * Every status is present; the counts sum to the number of escrows ever created.
       */
      flat_map<escrow_status, uint64_t> get_status_counts()const;

      /////////////
      // Escrows //
      /////////////

      /**
       * @brief Get an escrow
       * @param id ID of the escrow
       * @return The escrow, or null if it does not exist
       */
      fc::optional<escrow_object> get_escrow( escrow_id_type id )const;

      /**
       * @brief Get the escrow funding an order
       * @param order_id the order
       * @return ID of the escrow, or null if no escrow was created for the order
       */
      fc::optional<escrow_id_type> get_escrow_by_order_id( const string& order_id )const;

      /// @return whether the escrow was created by the factory
      bool is_known_escrow( escrow_id_type id )const;

      /// @return whether the escrow still holds its funds undisputed
      bool is_escrow_active( escrow_id_type id )const;

      /**
       * @brief Get what the escrow holds on the asset ledger
       *
       * The full amount while funded or disputed, zero once settled.
       */
      asset get_escrow_balance( escrow_id_type id )const;

      escrow_basic_info   get_escrow_basic_info( escrow_id_type id )const;
      escrow_fee_info     get_escrow_fee_info( escrow_id_type id )const;
      escrow_dispute_info get_escrow_dispute_info( escrow_id_type id )const;
      escrow_timestamps   get_escrow_timestamps( escrow_id_type id )const;

      /// @return seconds until anyone may release the escrow, zero if due or no longer funded
      uint32_t get_escrow_time_remaining( escrow_id_type id )const;
      bool     can_auto_release( escrow_id_type id )const;

      /// @return ACTIVE, RELEASED, REFUNDED, DISPUTED or RESOLVED
      string   get_escrow_status_label( escrow_id_type id )const;

      /**
       * @brief Get the escrows a principal takes part in, as payer or payee, in creation order
       */
      vector<escrow_id_type> get_escrows_by_participant( const principal_type& participant )const;

      /// @return the escrows currently in status, in creation order
      vector<escrow_id_type> get_escrows_by_status( escrow_status status )const;

      uint64_t get_participant_escrow_count( const principal_type& participant )const;

      /// @return all escrows in creation order
      vector<escrow_id_type> get_all_escrows()const;

      uint64_t get_escrow_count()const;

      ///////////////////
      // Order intents //
      ///////////////////

      fc::optional<order_intent_object> get_order_intent( const string& order_id )const;

      /**
       * @brief Get the intents a principal sold or paid, in creation order
       */
      vector<order_intent_object> get_order_intents_by_participant( const principal_type& participant )const;

      vector<order_intent_object> get_order_intents_by_participant_and_status( const principal_type& participant,
                                                                              order_intent_status status )const;

      /// @return whether an intent exists for the order and awaits payment
      bool is_order_pending( const string& order_id )const;

      uint64_t get_order_intent_count()const;

      /**
       * @brief Get the terms a buyer should fund the escrow of an order with
       * @return The terms, or null if no intent exists for the order
       */
      fc::optional<escrow_parameters> get_escrow_parameters( const string& order_id )const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} } // custodian::app

FC_API(custodian::app::database_api,
   // Globals
   (get_head_time)

   // Factory
   (get_factory)
   (get_factory_stats)
   (get_status_counts)

   // Escrows
   (get_escrow)
   (get_escrow_by_order_id)
   (is_known_escrow)
   (is_escrow_active)
   (get_escrow_balance)
   (get_escrow_basic_info)
   (get_escrow_fee_info)
   (get_escrow_dispute_info)
   (get_escrow_timestamps)
   (get_escrow_time_remaining)
   (can_auto_release)
   (get_escrow_status_label)
   (get_escrows_by_participant)
   (get_escrows_by_status)
   (get_participant_escrow_count)
   (get_all_escrows)
   (get_escrow_count)

   // Order intents
   (get_order_intent)
   (get_order_intents_by_participant)
   (get_order_intents_by_participant_and_status)
   (is_order_pending)
   (get_order_intent_count)
   (get_escrow_parameters)
)
