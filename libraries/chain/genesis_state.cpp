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

#include <custodian/chain/genesis_state.hpp>
#include <custodian/protocol/fee.hpp>
#include <custodian/protocol/base.hpp>

namespace custodian { namespace chain {

void genesis_state_type::validate()const
{ try {
   validate_principal( owner, "owner" );
   validate_principal( fee_collector, "fee_collector" );
   validate_principal( arbitrator, "arbitrator" );
   CUSTODIAN_ASSERT( is_valid_fee_bips( default_fee_bips ), fee_bips_out_of_range_exception,
                     "Default fee of ${f} bips is out of range", ("f", default_fee_bips) );
   FC_ASSERT( !escrow_template.empty(), "An escrow template is required" );

   for( const auto& b : initial_balances )
   {
      validate_principal( b.owner, "initial balance owner" );
      FC_ASSERT( b.amount.amount > 0, "Initial balances must be positive", ("balance", b) );
   }
   for( const auto& a : initial_allowances )
   {
      validate_principal( a.owner, "initial allowance owner" );
      if( a.spender != principal_type( CUSTODIAN_FACTORY_PRINCIPAL ) )
         validate_principal( a.spender, "initial allowance spender" );
      FC_ASSERT( a.amount.amount >= 0, "Initial allowances must not be negative", ("allowance", a) );
   }
} FC_CAPTURE_AND_RETHROW() }

} } // custodian::chain
