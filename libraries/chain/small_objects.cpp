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

#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>
#include <custodian/chain/ledger_object.hpp>
#include <custodian/chain/order_intent_object.hpp>

#include <fc/container/flat.hpp>
#include <fc/io/raw.hpp>

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::escrow_object, (custodian::db::object),
                    (factory)
                    (order_id)
                    (payer)
                    (payee)
                    (amount)
                    (metadata)
                    (created_at)
                    (release_after)
                    (fee_bips)
                    (fee_collector)
                    (status)
                    (dispute_reason)
                    (dispute_raised_by)
                  )

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::escrow_factory_object, (custodian::db::object),
                    (escrow_template)(owner)(fee_collector)(arbitrator)(default_fee_bips) )

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::dynamic_factory_object, (custodian::db::object),
                    (time)(total_escrows_created)(total_volume)(status_counts)(last_event_sequence) )

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::participant_statistics_object, (custodian::db::object),
                    (participant)(escrow_count) )

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::order_intent_object, (custodian::db::object),
                    (order_id)
                    (seller)
                    (receiver)
                    (buyer)
                    (amount)
                    (metadata)
                    (release_delay)
                    (status)
                    (escrow)
                    (created_at)
                  )

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::ledger_balance_object, (custodian::db::object),
                    (owner)(asset_id)(balance) )

FC_REFLECT_DERIVED_NO_TYPENAME( custodian::chain::ledger_allowance_object, (custodian::db::object),
                    (owner)(spender)(asset_id)(amount) )

CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::escrow_object )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::escrow_factory_object )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::dynamic_factory_object )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::participant_statistics_object )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::order_intent_object )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::ledger_balance_object )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::chain::ledger_allowance_object )
