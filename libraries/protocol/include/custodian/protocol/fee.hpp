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

namespace custodian { namespace protocol {

   /**
    *  How a settled amount is divided. fee + net always equals the amount that
    *  was split; the remainder of the division stays in net.
    */
   struct fee_split
   {
      share_type fee;
      share_type net;
   };

   /**
    *  @return value * percent / CUSTODIAN_100_PERCENT, rounded down
    */
   share_type calculate_percent( const share_type& value, uint16_t percent );

   /**
    *  Splits amount into the platform fee, floor(amount * fee_bips / 10000), and the
    *  net amount paid to the beneficiary, amount - fee.
    *
    *  @throws fee_bips_out_of_range_exception if fee_bips is not in [0, CUSTODIAN_100_PERCENT)
    */
   fee_split calculate_fee_split( const share_type& amount, uint16_t fee_bips );

   /// @return true if fee_bips is a valid fee rate
   inline bool is_valid_fee_bips( uint16_t fee_bips ) { return fee_bips < CUSTODIAN_100_PERCENT; }

} }

FC_REFLECT( custodian::protocol::fee_split, (fee)(net) )
