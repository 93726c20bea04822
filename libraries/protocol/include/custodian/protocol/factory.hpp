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

#include <custodian/protocol/base.hpp>

namespace custodian { namespace protocol {

   /**
    *  @brief The factory owner names the principal that receives settlement fees
    *  @ingroup operations
    *
    *  Only escrows created afterwards pay fees to the new collector, existing escrows
    *  keep the collector they were created with.
    */
   struct factory_update_fee_collector_operation : public base_operation
   {
      principal_type issuer;
      principal_type new_fee_collector;

      void validate()const;
   };

   /**
    *  @brief The factory owner names the principal that resolves disputes
    *  @ingroup operations
    */
   struct factory_update_arbitrator_operation : public base_operation
   {
      principal_type issuer;
      principal_type new_arbitrator;

      void validate()const;
   };

   /**
    *  @brief The factory owner changes the fee rate applied to escrows created afterwards
    *  @ingroup operations
    */
   struct factory_update_fee_bips_operation : public base_operation
   {
      principal_type issuer;
      uint16_t       new_fee_bips = 0;

      void validate()const;
   };

} } // custodian::protocol

FC_REFLECT( custodian::protocol::factory_update_fee_collector_operation, (issuer)(new_fee_collector) )
FC_REFLECT( custodian::protocol::factory_update_arbitrator_operation, (issuer)(new_arbitrator) )
FC_REFLECT( custodian::protocol::factory_update_fee_bips_operation, (issuer)(new_fee_bips) )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::factory_update_fee_collector_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::factory_update_arbitrator_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::factory_update_fee_bips_operation )
