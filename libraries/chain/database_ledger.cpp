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

#include <custodian/chain/database.hpp>
#include <custodian/chain/database_ledger.hpp>
#include <custodian/chain/exceptions.hpp>
#include <custodian/chain/ledger_object.hpp>
#include <custodian/protocol/base.hpp>

namespace custodian { namespace chain {

const ledger_balance_object* database_ledger::find_balance( const principal_type& owner,
                                                            const asset_id_type& asset_id )const
{
   const auto& idx = _db.get_index_type<ledger_balance_index>().indices().get<by_owner_asset>();
   auto itr = idx.find( boost::make_tuple( owner, asset_id ) );
   return itr == idx.end() ? nullptr : &*itr;
}

const ledger_allowance_object* database_ledger::find_allowance( const principal_type& owner,
                                                                const principal_type& spender,
                                                                const asset_id_type& asset_id )const
{
   const auto& idx = _db.get_index_type<ledger_allowance_index>().indices().get<by_owner_spender_asset>();
   auto itr = idx.find( boost::make_tuple( owner, spender, asset_id ) );
   return itr == idx.end() ? nullptr : &*itr;
}

share_type database_ledger::balance_of( const principal_type& account, const asset_id_type& asset_id )const
{
   const ledger_balance_object* b = find_balance( account, asset_id );
   return b == nullptr ? share_type(0) : b->balance;
}

share_type database_ledger::allowance( const principal_type& owner, const principal_type& spender,
                                       const asset_id_type& asset_id )const
{
   const ledger_allowance_object* a = find_allowance( owner, spender, asset_id );
   return a == nullptr ? share_type(0) : a->amount;
}

void database_ledger::adjust_balance( const principal_type& owner, const asset& delta )
{ try {
   if( delta.amount == 0 )
      return;

   const ledger_balance_object* b = find_balance( owner, delta.asset_id );
   if( b == nullptr )
   {
      CUSTODIAN_ASSERT( delta.amount > 0, insufficient_balance,
                        "Insufficient Balance: ${o} holds no ${a}", ("o", owner)("a", delta.asset_id) );
      _db.create<ledger_balance_object>( [&owner,&delta]( ledger_balance_object& obj ) {
         obj.owner    = owner;
         obj.asset_id = delta.asset_id;
         obj.balance  = delta.amount;
      });
   }
   else
   {
      CUSTODIAN_ASSERT( b->balance + delta.amount >= 0, insufficient_balance,
                        "Insufficient Balance: ${o}'s balance of ${b} is less than required ${r}",
                        ("o", owner)("b", b->get_balance())("r", -delta) );
      _db.modify( *b, [&delta]( ledger_balance_object& obj ) {
         obj.balance += delta.amount;
      });
   }
} FC_CAPTURE_AND_RETHROW( (owner)(delta) ) }

void database_ledger::transfer( const principal_type& from, const principal_type& to, const asset& amount )
{ try {
   FC_ASSERT( amount.amount >= 0, "Cannot transfer a negative amount" );
   adjust_balance( from, -amount );
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void database_ledger::transfer_from( const principal_type& spender, const principal_type& owner,
                                     const principal_type& to, const asset& amount )
{ try {
   FC_ASSERT( amount.amount >= 0, "Cannot transfer a negative amount" );

   const ledger_allowance_object* a = find_allowance( owner, spender, amount.asset_id );
   const share_type allowed = ( a == nullptr ? share_type(0) : a->amount );
   CUSTODIAN_ASSERT( allowed >= amount.amount, insufficient_allowance,
                     "${s} may move ${allowed} of ${o}'s ${asset}, ${r} requested",
                     ("s", spender)("allowed", allowed)("o", owner)("asset", amount.asset_id)("r", amount.amount) );

   const share_type balance = balance_of( owner, amount.asset_id );
   CUSTODIAN_ASSERT( balance >= amount.amount, insufficient_balance,
                     "Insufficient Balance: ${o}'s balance of ${b} is less than required ${r}",
                     ("o", owner)("b", balance)("r", amount) );

   if( a != nullptr && amount.amount > 0 )
      _db.modify( *a, [&amount]( ledger_allowance_object& obj ) {
         obj.amount -= amount.amount;
      });

   transfer( owner, to, amount );
} FC_CAPTURE_AND_RETHROW( (spender)(owner)(to)(amount) ) }

void database_ledger::issue( const principal_type& to, const asset& amount )
{ try {
   FC_ASSERT( amount.amount > 0, "Can only issue a positive amount" );
   validate_principal( to, "issue recipient" );
   adjust_balance( to, amount );
} FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

void database_ledger::approve( const principal_type& owner, const principal_type& spender, const asset& amount )
{ try {
   FC_ASSERT( amount.amount >= 0, "Cannot approve a negative amount" );
   validate_principal( owner, "allowance owner" );
   CUSTODIAN_ASSERT( !spender.is_null(), null_principal_exception, "allowance spender must not be null", );

   const ledger_allowance_object* a = find_allowance( owner, spender, amount.asset_id );
   if( a == nullptr )
      _db.create<ledger_allowance_object>( [&]( ledger_allowance_object& obj ) {
         obj.owner    = owner;
         obj.spender  = spender;
         obj.asset_id = amount.asset_id;
         obj.amount   = amount.amount;
      });
   else
      _db.modify( *a, [&amount]( ledger_allowance_object& obj ) {
         obj.amount = amount.amount;
      });
} FC_CAPTURE_AND_RETHROW( (owner)(spender)(amount) ) }

} } // custodian::chain
