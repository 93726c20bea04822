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
#include <custodian/chain/escrow_object.hpp>
#include <custodian/chain/factory_object.hpp>
#include <custodian/chain/order_intent_object.hpp>

namespace custodian { namespace chain {

const escrow_factory_object& database::get_factory()const
{
   return get( escrow_factory_id_type() );
}

const dynamic_factory_object& database::get_dynamic_factory()const
{
   return get( dynamic_factory_id_type() );
}

time_point_sec database::head_time()const
{
   return get_dynamic_factory().time;
}

const escrow_object* database::find_escrow_by_order_id( const string& order_id )const
{
   const auto& idx = get_index_type<escrow_index>().indices().get<by_order_id>();
   auto itr = idx.find( order_id );
   return itr == idx.end() ? nullptr : &*itr;
}

const order_intent_object* database::find_order_intent( const string& order_id )const
{
   const auto& idx = get_index_type<order_intent_index>().indices().get<by_order_id>();
   auto itr = idx.find( order_id );
   return itr == idx.end() ? nullptr : &*itr;
}

const participant_statistics_object* database::find_participant_statistics( const principal_type& participant )const
{
   const auto& idx = get_index_type<participant_statistics_index>().indices().get<by_participant>();
   auto itr = idx.find( participant );
   return itr == idx.end() ? nullptr : &*itr;
}

asset_ledger& database::ledger()
{
   return *_ledger;
}

const asset_ledger& database::ledger()const
{
   return *_ledger;
}

void database::set_asset_ledger( std::shared_ptr<asset_ledger> new_ledger )
{
   FC_ASSERT( new_ledger != nullptr, "An asset ledger is required" );
   FC_ASSERT( _apply_depth == 0, "The asset ledger cannot be replaced while an operation is being applied" );
   _ledger = std::move( new_ledger );
}

} } // custodian::chain
