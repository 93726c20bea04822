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
#include <custodian/protocol/config.hpp>

#include <vector>

namespace custodian { namespace chain {
using namespace custodian::protocol;

/**
 *  The configuration a database is created from: the factory's initial terms and
 *  the balances and allowances the database_ledger starts with.
 */
struct genesis_state_type {
   struct initial_balance_type {
      principal_type owner;
      asset          amount;
   };
   struct initial_allowance_type {
      principal_type owner;
      principal_type spender;
      asset          amount;
   };

   time_point_sec                      initial_timestamp;
   string                              escrow_template = CUSTODIAN_DEFAULT_ESCROW_TEMPLATE;
   principal_type                      owner;
   principal_type                      fee_collector;
   principal_type                      arbitrator;
   uint16_t                            default_fee_bips = CUSTODIAN_DEFAULT_FEE_BIPS;
   std::vector<initial_balance_type>   initial_balances;
   std::vector<initial_allowance_type> initial_allowances;

   /// @throws validation_exception if the factory terms are incomplete or out of range
   void validate()const;
};

} } // namespace custodian::chain

FC_REFLECT( custodian::chain::genesis_state_type::initial_balance_type, (owner)(amount) )
FC_REFLECT( custodian::chain::genesis_state_type::initial_allowance_type, (owner)(spender)(amount) )
FC_REFLECT( custodian::chain::genesis_state_type,
            (initial_timestamp)(escrow_template)(owner)(fee_collector)(arbitrator)(default_fee_bips)
            (initial_balances)(initial_allowances) )
