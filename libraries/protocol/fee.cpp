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

#include <custodian/protocol/fee.hpp>
#include <custodian/protocol/exceptions.hpp>

namespace custodian { namespace protocol {

share_type calculate_percent( const share_type& value, uint16_t percent )
{
   fc::uint128_t a(value.value);
   a *= percent;
   a /= CUSTODIAN_100_PERCENT;
   FC_ASSERT( a <= CUSTODIAN_MAX_SHARE_SUPPLY, "overflow when calculating percent" );
   return static_cast<int64_t>(a);
}

fee_split calculate_fee_split( const share_type& amount, uint16_t fee_bips )
{ try {
   CUSTODIAN_ASSERT( is_valid_fee_bips( fee_bips ), fee_bips_out_of_range_exception,
                     "Fee rate ${b} is not below ${max} basis points",
                     ("b",fee_bips)("max",CUSTODIAN_100_PERCENT) );
   FC_ASSERT( amount >= 0, "Cannot split a negative amount" );

   fee_split result;
   result.fee = calculate_percent( amount, fee_bips );
   result.net = amount - result.fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (amount)(fee_bips) ) }

} } // custodian::protocol
