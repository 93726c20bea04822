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

#include <custodian/protocol/order_intent.hpp>

#include <fc/io/raw.hpp>

namespace custodian { namespace protocol {

   void order_intent_create_operation::validate()const
   {
      validate_principal( seller, "seller" );
      validate_order_id( order_id );
      validate_principal( receiver, "receiver" );
      validate_principal( amount.asset_id, "asset" );
      CUSTODIAN_ASSERT( amount.amount > 0, zero_amount_exception, "Order amount should be greater than zero", );
      CUSTODIAN_ASSERT( !metadata.empty(), empty_metadata_exception, "An order intent needs a metadata reference", );
      CUSTODIAN_ASSERT( metadata.size() <= CUSTODIAN_MAX_METADATA_LENGTH, field_too_long_exception,
                        "Metadata is too long", ("size",metadata.size()) );
      validate_release_delay( release_delay );
   }

   void order_intent_cancel_operation::validate()const
   {
      validate_principal( seller, "seller" );
      validate_order_id( order_id );
   }

   void order_intent_settle_operation::validate()const
   {
      validate_principal( buyer, "buyer" );
      validate_order_id( order_id );
   }

} }

CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::order_intent_create_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::order_intent_cancel_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::order_intent_settle_operation )
