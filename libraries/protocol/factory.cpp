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

#include <custodian/protocol/factory.hpp>
#include <custodian/protocol/fee.hpp>

#include <fc/io/raw.hpp>

namespace custodian { namespace protocol {

   void factory_update_fee_collector_operation::validate()const
   {
      validate_principal( issuer, "issuer" );
      validate_principal( new_fee_collector, "fee collector" );
   }

   void factory_update_arbitrator_operation::validate()const
   {
      validate_principal( issuer, "issuer" );
      validate_principal( new_arbitrator, "arbitrator" );
   }

   void factory_update_fee_bips_operation::validate()const
   {
      validate_principal( issuer, "issuer" );
      CUSTODIAN_ASSERT( is_valid_fee_bips( new_fee_bips ), fee_bips_out_of_range_exception,
                        "Fee rate ${b} is not below ${max} basis points",
                        ("b",new_fee_bips)("max",CUSTODIAN_100_PERCENT) );
   }

} }

CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::factory_update_fee_collector_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::factory_update_arbitrator_operation )
CUSTODIAN_IMPLEMENT_EXTERNAL_SERIALIZATION( custodian::protocol::factory_update_fee_bips_operation )
