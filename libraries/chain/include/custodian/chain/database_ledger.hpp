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

#include <custodian/chain/asset_ledger.hpp>

namespace custodian { namespace chain {

   class database;
   class ledger_balance_object;
   class ledger_allowance_object;

   /**
    *  @brief An asset_ledger kept in the database itself
    *
    *  Balances and allowances are database objects, so every movement is undone
    *  together with the operation that caused it.
    */
   class database_ledger : public asset_ledger
   {
      public:
         explicit database_ledger( database& db ) : _db( db ) {}

         share_type balance_of( const principal_type& account, const asset_id_type& asset_id )const override;
         share_type allowance( const principal_type& owner, const principal_type& spender,
                               const asset_id_type& asset_id )const override;

         void transfer( const principal_type& from, const principal_type& to, const asset& amount ) override;
         void transfer_from( const principal_type& spender, const principal_type& owner,
                             const principal_type& to, const asset& amount ) override;

         /// credits amount to `to` out of nothing, used to set up initial balances
         void issue( const principal_type& to, const asset& amount );

         /// sets the amount spender may move out of owner's balance
         void approve( const principal_type& owner, const principal_type& spender, const asset& amount );

      private:
         const ledger_balance_object*   find_balance( const principal_type& owner, const asset_id_type& asset_id )const;
         const ledger_allowance_object* find_allowance( const principal_type& owner, const principal_type& spender,
                                                        const asset_id_type& asset_id )const;
         void adjust_balance( const principal_type& owner, const asset& delta );

         database& _db;
   };

} } // custodian::chain
