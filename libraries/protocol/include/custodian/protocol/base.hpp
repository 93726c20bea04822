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

#include <custodian/protocol/types.hpp>
#include <custodian/protocol/exceptions.hpp>

namespace custodian { namespace protocol {

   /**
    *  @defgroup operations Custody Operations
    *
    *  An operation is a request by one principal to change the custody state:
    *  create an escrow, settle it, raise or resolve a dispute, reconfigure the
    *  factory, or record an order intent.
    *
    *  Every operation has a validate() method that performs the stateless checks
    *  of its own fields. Checks that depend on the current state (roles, status,
    *  balances) are performed by the matching evaluator.
    */

   struct void_result{};
   typedef fc::static_variant<void_result,object_id_type> operation_result;

   struct base_operation
   {
      void validate()const {}
   };

   /**
    *  @throws null_principal_exception naming field if p is the null principal
    *  @throws reserved_principal_exception if p names a custody account of the engine
    */
   inline void validate_principal( const principal_type& p, const char* field )
   {
      CUSTODIAN_ASSERT( !p.is_null(), null_principal_exception, "${f} must not be null", ("f",field) );
      CUSTODIAN_ASSERT( p.name.size() <= CUSTODIAN_MAX_PRINCIPAL_LENGTH, field_too_long_exception,
                        "${f} is too long", ("f",field) );
      CUSTODIAN_ASSERT( !p.is_custody_name(), reserved_principal_exception,
                        "${f} ${p} is reserved for custody", ("f",field)("p",p.name) );
   }

   /// @throws empty_order_id_exception if order_id is empty
   inline void validate_order_id( const string& order_id )
   {
      CUSTODIAN_ASSERT( !order_id.empty(), empty_order_id_exception, "Order id must not be empty", );
      CUSTODIAN_ASSERT( order_id.size() <= CUSTODIAN_MAX_ORDER_ID_LENGTH, field_too_long_exception,
                        "Order id is too long", ("size",order_id.size()) );
   }

   /// @throws release_delay_out_of_range_exception if the escrow would be locked for too long
   inline void validate_release_delay( uint32_t release_delay )
   {
      CUSTODIAN_ASSERT( release_delay <= CUSTODIAN_MAX_RELEASE_DELAY, release_delay_out_of_range_exception,
                        "Release delay of ${d} seconds exceeds ${max}",
                        ("d",release_delay)("max",CUSTODIAN_MAX_RELEASE_DELAY) );
   }

} } // custodian::protocol

FC_REFLECT( custodian::protocol::void_result, )
