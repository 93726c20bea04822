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

#include <custodian/protocol/escrow.hpp>

#include <fc/io/raw.hpp>

namespace custodian { namespace protocol {

   void escrow_create_operation::validate()const
   {
      validate_principal( payer, "payer" );
      validate_order_id( order_id );
      validate_principal( payee, "payee" );
      validate_principal( amount.asset_id, "asset" );
      CUSTODIAN_ASSERT( amount.amount > 0, zero_amount_exception, "Escrow amount should be greater than zero", );
      CUSTODIAN_ASSERT( amount.amount <= CUSTODIAN_MAX_SHARE_SUPPLY, validation_exception,
                        "Escrow amount exceeds the maximum supply", ("amount",amount) );
      CUSTODIAN_ASSERT( metadata.size() <= CUSTODIAN_MAX_METADATA_LENGTH, field_too_long_exception,
                        "Metadata is too long", ("size",metadata.size()) );
      validate_release_delay( release_delay );
   }

   void escrow_release_operation::validate()const
   {
      validate_principal( payer, "payer" );
   }

   void escrow_refund_operation::validate()const
   {
      validate_principal( payee, "payee" );
   }

   void escrow_auto_release_operation::validate()const
   {
      validate_principal( caller, "caller" );
   }

   void escrow_dispute_operation::validate()const
   {
      validate_principal( raiser, "raiser" );
      CUSTODIAN_ASSERT( !reason.empty(), empty_dispute_reason_exception, "A dispute needs a reason", );
      CUSTODIAN_ASSERT( reason.size() <= CUSTODIAN_MAX_DISPUTE_REASON_LENGTH, field_too_long_exception,
                        "Dispute reason is too long", ("size",reason.size()) );
   }

   void escrow_resolve_operation::validate()const
   {
      validate_principal( arbitrator, "arbitrator" );
      validate_principal( winner, "winner" );
   }

} }

CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_create_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_release_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_refund_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_auto_release_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_dispute_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_resolve_operation )
