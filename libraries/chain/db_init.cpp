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
#include <custodian/chain/factory_evaluator.hpp>
#include <custodian/chain/order_intent_evaluator.hpp>

#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>
#include <custodian/chain/ledger_object.hpp>
#include <custodian/chain/order_intent_object.hpp>

namespace custodian { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<escrow_create_evaluator>();
   register_evaluator<escrow_release_evaluator>();
   register_evaluator<escrow_refund_evaluator>();
   register_evaluator<escrow_auto_release_evaluator>();
   register_evaluator<escrow_dispute_evaluator>();
   register_evaluator<escrow_resolve_evaluator>();
   register_evaluator<factory_update_fee_collector_evaluator>();
   register_evaluator<factory_update_arbitrator_evaluator>();
   register_evaluator<factory_update_fee_bips_evaluator>();
   register_evaluator<order_intent_create_evaluator>();
   register_evaluator<order_intent_cancel_evaluator>();
   register_evaluator<order_intent_settle_evaluator>();
}

void database::initialize_indexes()
{
   //Protocol object indexes
   add_index< primary_index<escrow_index> >();
   add_index< primary_index<order_intent_index> >();

   //Implementation object indexes
   add_index< primary_index<escrow_factory_index> >();
   add_index< primary_index<dynamic_factory_index> >();
   add_index< primary_index<participant_statistics_index> >();
   add_index< primary_index<ledger_balance_index> >();
   add_index< primary_index<ledger_allowance_index> >();
}

} } // custodian::chain
