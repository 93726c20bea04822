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

#include <custodian/chain/types.hpp>
#include <custodian/protocol/asset.hpp>
#include <custodian/db/generic_index.hpp>

namespace custodian { namespace chain {
   using namespace protocol;

   /**
    * @brief What one principal holds of one asset in the database_ledger
    */
   class ledger_balance_object : public custodian::db::abstract_object<ledger_balance_object,
                                                                        implementation_ids, impl_ledger_balance_object_type>
   {
      public:
         principal_type owner;
         asset_id_type  asset_id;
         share_type     balance;

         asset get_balance()const { return asset( balance, asset_id ); }
   };

   /**
    * @brief How much of one asset a spender may move out of an owner's balance
    */
   class ledger_allowance_object : public custodian::db::abstract_object<ledger_allowance_object,
                                                                          implementation_ids, impl_ledger_allowance_object_type>
   {
      public:
         principal_type owner;
         principal_type spender;
         asset_id_type  asset_id;
         share_type     amount;
   };

   struct by_owner_asset;
   struct by_owner_spender_asset;

   typedef multi_index_container<
      ledger_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner_asset>,
            composite_key< ledger_balance_object,
               member< ledger_balance_object, principal_type, &ledger_balance_object::owner >,
               member< ledger_balance_object, asset_id_type, &ledger_balance_object::asset_id >
            >
         >
      >
   > ledger_balance_multi_index_type;

   typedef multi_index_container<
      ledger_allowance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner_spender_asset>,
            composite_key< ledger_allowance_object,
               member< ledger_allowance_object, principal_type, &ledger_allowance_object::owner >,
               member< ledger_allowance_object, principal_type, &ledger_allowance_object::spender >,
               member< ledger_allowance_object, asset_id_type, &ledger_allowance_object::asset_id >
            >
         >
      >
   > ledger_allowance_multi_index_type;

   typedef generic_index<ledger_balance_object, ledger_balance_multi_index_type>     ledger_balance_index;
   typedef generic_index<ledger_allowance_object, ledger_allowance_multi_index_type> ledger_allowance_index;

} } // custodian::chain

MAP_OBJECT_ID_TO_TYPE(custodian::chain::ledger_balance_object)
MAP_OBJECT_ID_TO_TYPE(custodian::chain::ledger_allowance_object)

FC_REFLECT_TYPENAME( custodian::chain::ledger_balance_object )
FC_REFLECT_TYPENAME( custodian::chain::ledger_allowance_object )

CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::ledger_balance_object )
CUSTODIAN_DECLARE_EXTERNAL_SERIALIZATION( custodian::chain::ledger_allowance_object )
