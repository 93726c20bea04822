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

   /**
    *  The life cycle of an escrow instance. It starts funded and moves to exactly
    *  one of released, refunded or disputed; a disputed escrow can only become
    *  resolved. Released, refunded and resolved are terminal.
    */
   enum class escrow_status : uint8_t
   {
      funded   = 0,
      released = 1,
      refunded = 2,
      disputed = 3,
      resolved = 4
   };
   constexpr uint8_t escrow_status_count = 5;

   /**
    *  @brief Locks amount of an asset in a new escrow instance for one order
    *  @ingroup operations
    *
    *  The payer must have allowed the factory to move at least amount of the asset.
    *  Funds move from the payer straight into the custody of the new instance.
    */
   struct escrow_create_operation : public base_operation
   {
      principal_type payer;
      string         order_id;
      principal_type payee;
      asset          amount;
      /// opaque description of the order, e.g. a document URI
      string         metadata;
      /// seconds after creation from which anyone may release the escrow
      uint32_t       release_delay = 0;

      void validate()const;
   };

   /**
    *  @brief The payer releases the funds to the payee, less the platform fee
    *  @ingroup operations
    */
   struct escrow_release_operation : public base_operation
   {
      principal_type payer;
      escrow_id_type escrow;

      void validate()const;
   };

   /**
    *  @brief The payee returns the full amount to the payer
    *  @ingroup operations
    */
   struct escrow_refund_operation : public base_operation
   {
      principal_type payee;
      escrow_id_type escrow;

      void validate()const;
   };

   /**
    *  @brief Anyone may release an escrow to the payee once its release time has passed
    *  @ingroup operations
    */
   struct escrow_auto_release_operation : public base_operation
   {
      principal_type caller;
      escrow_id_type escrow;

      void validate()const;
   };

   /**
    *  @brief Either party freezes the escrow until the arbitrator decides
    *  @ingroup operations
    */
   struct escrow_dispute_operation : public base_operation
   {
      principal_type raiser;
      escrow_id_type escrow;
      string         reason;

      void validate()const;
   };

   /**
    *  @brief The arbitrator awards a disputed escrow to one of its parties
    *  @ingroup operations
    *
    *  When the payee wins the platform fee is charged as on release; when the payer
    *  wins the full amount is returned without fee.
    */
   struct escrow_resolve_operation : public base_operation
   {
      principal_type arbitrator;
      escrow_id_type escrow;
      principal_type winner;

      void validate()const;
   };

} } // custodian::protocol

FC_REFLECT_ENUM( custodian::protocol::escrow_status, (funded)(released)(refunded)(disputed)(resolved) )

FC_REFLECT( custodian::protocol::escrow_create_operation,
            (payer)(order_id)(payee)(amount)(metadata)(release_delay) )
FC_REFLECT( custodian::protocol::escrow_release_operation, (payer)(escrow) )
FC_REFLECT( custodian::protocol::escrow_refund_operation, (payee)(escrow) )
FC_REFLECT( custodian::protocol::escrow_auto_release_operation, (caller)(escrow) )
FC_REFLECT( custodian::protocol::escrow_dispute_operation, (raiser)(escrow)(reason) )
FC_REFLECT( custodian::protocol::escrow_resolve_operation, (arbitrator)(escrow)(winner) )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_create_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_release_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_refund_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_auto_release_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_dispute_operation )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::protocol::escrow_resolve_operation )
