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

#include <custodian/protocol/asset.hpp>

namespace custodian { namespace chain {
   using namespace protocol;

   /**
    *  @brief The capabilities the custody engine needs from the ledger that records asset ownership
    *
    *  The engine never mints or burns; it only moves balances an owner authorized
    *  it to move (transfer_from) or balances it already holds (transfer).
    *
    *  Implementations report a shortfall with insufficient_balance or
    *  insufficient_allowance and must not change anything when they throw.
    *
    *  A failed operation is undone through the database's undo session. Ledger
    *  movements are undone with it only when the ledger keeps its state in the
    *  same database, as database_ledger does. A ledger keeping its state elsewhere
    *  must roll back the movements of a failed operation itself, otherwise e.g. a
    *  fee paid before the net transfer failed stays with the fee collector.
    *  A transfer may call back into the database, e.g. to apply another operation;
    *  the engine is prepared for such re-entrant calls.
    */
   class asset_ledger
   {
      public:
         virtual ~asset_ledger() = default;

         virtual share_type balance_of( const principal_type& account, const asset_id_type& asset_id )const = 0;
         virtual share_type allowance( const principal_type& owner, const principal_type& spender,
                                       const asset_id_type& asset_id )const = 0;

         /// moves amount from `from` to `to`
         virtual void transfer( const principal_type& from, const principal_type& to, const asset& amount ) = 0;

         /// spender moves amount from owner to `to`, consuming owner's allowance for spender
         virtual void transfer_from( const principal_type& spender, const principal_type& owner,
                                     const principal_type& to, const asset& amount ) = 0;
   };

} } // custodian::chain
