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
#include <custodian/chain/asset_ledger.hpp>
#include <custodian/chain/evaluator.hpp>
#include <custodian/chain/genesis_state.hpp>
#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>
#include <custodian/chain/order_intent_object.hpp>

#include <custodian/db/object_database.hpp>

#include <custodian/protocol/events.hpp>
#include <custodian/protocol/operations.hpp>

#include <fc/container/flat.hpp>
#include <fc/signals.hpp>

#include <functional>
#include <map>

namespace custodian { namespace chain {
   using custodian::db::object;

   /**
    *   @class database
    *   @brief tracks the custody state: the escrow factory, its escrows and the order intents
    *
    *   Every change is made by applying an operation. An operation either completes or
    *   leaves no trace: it runs inside an undo session, and the events it raises are
    *   published only once the outermost operation committed.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Open a database, creating a new one if necessary
          *
          * Opens a database in the specified directory. If no initialized database is found, genesis_loader is called
          * and its return value is used as the genesis state when initializing the new database
          *
          * genesis_loader will not be called if an existing database is found.
          *
          * @param data_dir Path to open or create database in
          * @param genesis_loader A callable object which returns the genesis state to initialize new databases on
          */
         void open( const fc::path& data_dir, std::function<genesis_state_type()> genesis_loader );

         /**
          * @brief Writes the state to the data directory given to open(), if any
          */
         void close();

         //////////////////// db_genesis.cpp ////////////////////

         /// creates the factory and the initial ledger state, the database must be empty
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         //////////////////// db_apply.cpp ////////////////////

         /**
          *  Validates and applies op as one all-or-nothing unit.
          *
          *  May be called again while an operation is being applied, e.g. by an asset
          *  ledger calling back during a transfer. The nested operation is undone alone
          *  if it fails, and becomes part of the enclosing operation if it succeeds.
          *
          *  @return the id of the object created by op, or void_result
          */
         operation_result apply_operation( const operation& op );

         /**
          *  Emitted once for every domain event raised by a committed operation, in the
          *  order the events were raised.
          */
         fc::signal<void(const applied_event&)> published_event;

         /// records an event raised by source, to be published when the operation commits
         void push_event( object_id_type source, const domain_event& event );

         //////////////////// db_getter.cpp ////////////////////

         const escrow_factory_object&  get_factory()const;
         const dynamic_factory_object& get_dynamic_factory()const;

         time_point_sec head_time()const;

         /// @return the escrow bound to order_id, or nullptr
         const escrow_object*       find_escrow_by_order_id( const string& order_id )const;
         const order_intent_object* find_order_intent( const string& order_id )const;
         const participant_statistics_object* find_participant_statistics( const principal_type& participant )const;

         asset_ledger&       ledger();
         const asset_ledger& ledger()const;

         /// replaces the ledger funds are moved against, the database_ledger is used by default
         void set_asset_ledger( std::shared_ptr<asset_ledger> new_ledger );

         //////////////////// db_time.cpp ////////////////////

         /// moves the clock forward to t; the clock never moves backwards
         void set_head_time( time_point_sec t );
         void advance_time( uint32_t seconds );

         //////////////////// db_escrow.cpp ////////////////////

         /**
          *  Pays out the whole amount of escrow and puts it into its terminal status.
          *
          *  The status is written before any funds move, and the escrow stays locked
          *  against another settlement until the payout finished.
          *
          *  @param outcome     released, refunded or resolved
          *  @param beneficiary the party receiving the net amount
          *  @param charge_fee  whether the fee is deducted and paid to the escrow's fee collector
          *  @return the fee and net amounts paid
          */
         fee_split settle_escrow( const escrow_object& escrow, escrow_status outcome,
                                  const principal_type& beneficiary, bool charge_fee );

         /// whether a settlement of the escrow is in progress
         bool is_escrow_locked( escrow_id_type escrow )const;

         /// @{ the only writers of the factory's aggregate counters
         void record_escrow_created( const escrow_object& escrow );
         void adjust_escrow_status_tally( escrow_status from, escrow_status to );
         /// @}

         //////////////////// db_init.cpp ////////////////////

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset(
                  new op_evaluator_impl<EvaluatorType>() );
         }

      private:
         friend class escrow_settlement_guard;

         void initialize_evaluators();
         void initialize_indexes();
         void publish_pending_events();

         vector< unique_ptr<op_evaluator> > _operation_evaluators;

         std::shared_ptr<asset_ledger>      _ledger;

         /// events raised by the operations being applied, not yet committed
         vector<applied_event>              _pending_events;
         uint32_t                           _apply_depth = 0;

         flat_set<escrow_id_type>           _locked_escrows;

         bool                               _opened = false;
   };

   /**
    *  Holds the settlement lock of one escrow for its lifetime.
    *
    *  @throws escrow_reentrancy if the escrow is already locked
    */
   class escrow_settlement_guard
   {
      public:
         escrow_settlement_guard( database& db, escrow_id_type escrow );
         ~escrow_settlement_guard();

         escrow_settlement_guard( const escrow_settlement_guard& ) = delete;
         escrow_settlement_guard& operator=( const escrow_settlement_guard& ) = delete;

      private:
         database&      _db;
         escrow_id_type _escrow;
   };

} }
