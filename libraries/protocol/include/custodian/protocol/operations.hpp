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
#include <custodian/protocol/escrow.hpp>
#include <custodian/protocol/factory.hpp>
#include <custodian/protocol/order_intent.hpp>

namespace custodian { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    * New operations must be appended, the position of an operation is part of
    * its serialized form.
    */
   typedef fc::static_variant<
            /*  0 */ escrow_create_operation,
            /*  1 */ escrow_release_operation,
            /*  2 */ escrow_refund_operation,
            /*  3 */ escrow_auto_release_operation,
            /*  4 */ escrow_dispute_operation,
            /*  5 */ escrow_resolve_operation,
            /*  6 */ factory_update_fee_collector_operation,
            /*  7 */ factory_update_arbitrator_operation,
            /*  8 */ factory_update_fee_bips_operation,
            /*  9 */ order_intent_create_operation,
            /* 10 */ order_intent_cancel_operation,
            /* 11 */ order_intent_settle_operation
         > operation;

   /// @} // operations group

   /**
    *  Performs the stateless validation of whichever operation op holds.
    */
   void operation_validate( const operation& op );

} } // custodian::protocol

FC_REFLECT_TYPENAME( custodian::protocol::operation )
FC_REFLECT_TYPENAME( custodian::protocol::operation_result )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::operation )
