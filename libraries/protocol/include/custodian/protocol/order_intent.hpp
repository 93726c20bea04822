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
#include <custodian/protocol/asset.hpp>

namespace custodian { namespace protocol {

   enum class order_intent_status : uint8_t
   {
      pending   = 0,
      paid      = 1,
      cancelled = 2
   };

   /**
    *  @brief A seller announces a sale; the buyer later funds an escrow for it
    *  @ingroup operations
    *
    *  No funds move. The intent publishes the parameters the buyer is expected to
    *  use when creating the escrow for the same order id.
    */
   struct order_intent_create_operation : public base_operation
   {
      principal_type seller;
      string         order_id;
      /// who is paid when the escrow settles
      principal_type receiver;
      asset          amount;
      string         metadata;
      uint32_t       release_delay = 0;

      void validate()const;
   };

   /**
    *  @brief The seller withdraws a pending intent
    *  @ingroup operations
    */
   struct order_intent_cancel_operation : public base_operation
   {
      principal_type seller;
      string         order_id;

      void validate()const;
   };

   /**
    *  @brief The buyer links the escrow funding an order to its pending intent
    *  @ingroup operations
    */
   struct order_intent_settle_operation : public base_operation
   {
      principal_type buyer;
      string         order_id;
      escrow_id_type escrow;

      void validate()const;
   };

} } // custodian::protocol

FC_REFLECT_ENUM( custodian::protocol::order_intent_status, (pending)(paid)(cancelled) )

FC_REFLECT( custodian::protocol::order_intent_create_operation,
            (seller)(order_id)(receiver)(amount)(metadata)(release_delay) )
FC_REFLECT( custodian::protocol::order_intent_cancel_operation, (seller)(order_id) )
FC_REFLECT( custodian::protocol::order_intent_settle_operation, (buyer)(order_id)(escrow) )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::order_intent_create_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::order_intent_cancel_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::order_intent_settle_operation )
