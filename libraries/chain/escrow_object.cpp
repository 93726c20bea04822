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

#include <custodian/chain/escrow_object.hpp>

namespace custodian { namespace chain {

uint32_t escrow_object::time_remaining( time_point_sec now )const
{
   if( status != escrow_status::funded || now >= release_after )
      return 0;
   return release_after.sec_since_epoch() - now.sec_since_epoch();
}

string escrow_object::status_label()const
{
   switch( status )
   {
      case escrow_status::funded:   return "ACTIVE";
      case escrow_status::released: return "RELEASED";
      case escrow_status::refunded: return "REFUNDED";
      case escrow_status::disputed: return "DISPUTED";
      case escrow_status::resolved: return "RESOLVED";
   }
   FC_THROW( "Unknown escrow status ${s}", ("s", static_cast<uint32_t>( status )) );
}

} } // custodian::chain
