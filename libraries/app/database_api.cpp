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

#include <custodian/app/database_api.hpp>

#include <custodian/chain/exceptions.hpp>

#include <boost/range/iterator_range.hpp>

#include <algorithm>

namespace custodian { namespace app {

class database_api_impl : public std::enable_shared_from_this<database_api_impl>
{
   public:
      explicit database_api_impl( const custodian::chain::database& db );
      ~database_api_impl();

      // Globals
      fc::time_point_sec get_head_time()const;

      // Factory
      escrow_factory_object get_factory()const;
      factory_stats get_factory_stats()const;
      flat_map<escrow_status, uint64_t> get_status_counts()const;

      // Escrows
      fc::optional<escrow_object> get_escrow( escrow_id_type id )const;
      fc::optional<escrow_id_type> get_escrow_by_order_id( const string& order_id )const;
      bool is_known_escrow( escrow_id_type id )const;
      bool is_escrow_active( escrow_id_type id )const;
      asset get_escrow_balance( escrow_id_type id )const;
      escrow_basic_info get_escrow_basic_info( escrow_id_type id )const;
      escrow_fee_info get_escrow_fee_info( escrow_id_type id )const;
      escrow_dispute_info get_escrow_dispute_info( escrow_id_type id )const;
      escrow_timestamps get_escrow_timestamps( escrow_id_type id )const;
      uint32_t get_escrow_time_remaining( escrow_id_type id )const;
      bool can_auto_release( escrow_id_type id )const;
      string get_escrow_status_label( escrow_id_type id )const;
      vector<escrow_id_type> get_escrows_by_participant( const principal_type& participant )const;
      vector<escrow_id_type> get_escrows_by_status( escrow_status status )const;
      uint64_t get_participant_escrow_count( const principal_type& participant )const;
      vector<escrow_id_type> get_all_escrows()const;
      uint64_t get_escrow_count()const;

      // Order intents
      fc::optional<order_intent_object> get_order_intent( const string& order_id )const;
      vector<order_intent_object> get_order_intents_by_participant( const principal_type& participant )const;
      vector<order_intent_object> get_order_intents_by_participant_and_status( const principal_type& participant,
                                                                              order_intent_status status )const;
      bool is_order_pending( const string& order_id )const;
      uint64_t get_order_intent_count()const;
      fc::optional<escrow_parameters> get_escrow_parameters( const string& order_id )const;

   private:
      const escrow_object* find_escrow( escrow_id_type id )const;
      const escrow_object& get_known_escrow( escrow_id_type id )const;

      const custodian::chain::database& _db;
};

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( const custodian::chain::database& db )
   : my( new database_api_impl( db ) ) {}

database_api::~database_api() {}

database_api_impl::database_api_impl( const custodian::chain::database& db )
:_db(db)
{
   dlog( "creating database api ${x}", ("x",int64_t(this)) );
}

database_api_impl::~database_api_impl()
{
   dlog( "freeing database api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Globals                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::time_point_sec database_api::get_head_time()const
{
   return my->get_head_time();
}

fc::time_point_sec database_api_impl::get_head_time()const
{
   return _db.head_time();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Factory                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

escrow_factory_object database_api::get_factory()const
{
   return my->get_factory();
}

escrow_factory_object database_api_impl::get_factory()const
{
   return _db.get_factory();
}

factory_stats database_api::get_factory_stats()const
{
   return my->get_factory_stats();
}

factory_stats database_api_impl::get_factory_stats()const
{
   const escrow_factory_object& factory = _db.get_factory();
   const dynamic_factory_object& dyn = _db.get_dynamic_factory();

   factory_stats result;
   result.total_escrows_created = dyn.total_escrows_created;
   result.total_volume          = dyn.total_volume;
   result.default_fee_bips      = factory.default_fee_bips;
   result.fee_collector         = factory.fee_collector;
   result.arbitrator            = factory.arbitrator;
   return result;
}

flat_map<escrow_status, uint64_t> database_api::get_status_counts()const
{
   return my->get_status_counts();
}

flat_map<escrow_status, uint64_t> database_api_impl::get_status_counts()const
{
   const dynamic_factory_object& dyn = _db.get_dynamic_factory();
   flat_map<escrow_status, uint64_t> result;
   for( uint8_t s = 0; s < escrow_status_count; ++s )
   {
      const auto status = static_cast<escrow_status>( s );
      result[status] = dyn.status_count( status );
   }
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Escrows                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

const escrow_object* database_api_impl::find_escrow( escrow_id_type id )const
{
   const escrow_object* escrow = _db.find( id );
   if( escrow == nullptr || escrow->factory != _db.get_factory().get_id() )
      return nullptr;
   return escrow;
}

const escrow_object& database_api_impl::get_known_escrow( escrow_id_type id )const
{
   const escrow_object* escrow = find_escrow( id );
   CUSTODIAN_ASSERT( escrow != nullptr, unknown_escrow, "Escrow ${id} was not created by this factory", ("id", id) );
   return *escrow;
}

fc::optional<escrow_object> database_api::get_escrow( escrow_id_type id )const
{
   return my->get_escrow( id );
}

fc::optional<escrow_object> database_api_impl::get_escrow( escrow_id_type id )const
{
   const escrow_object* escrow = find_escrow( id );
   if( escrow == nullptr )
      return {};
   return *escrow;
}

fc::optional<escrow_id_type> database_api::get_escrow_by_order_id( const string& order_id )const
{
   return my->get_escrow_by_order_id( order_id );
}

fc::optional<escrow_id_type> database_api_impl::get_escrow_by_order_id( const string& order_id )const
{
   const escrow_object* escrow = _db.find_escrow_by_order_id( order_id );
   if( escrow == nullptr )
      return {};
   return escrow->get_id();
}

bool database_api::is_known_escrow( escrow_id_type id )const
{
   return my->is_known_escrow( id );
}

bool database_api_impl::is_known_escrow( escrow_id_type id )const
{
   return find_escrow( id ) != nullptr;
}

bool database_api::is_escrow_active( escrow_id_type id )const
{
   return my->is_escrow_active( id );
}

bool database_api_impl::is_escrow_active( escrow_id_type id )const
{
   return get_known_escrow( id ).is_active();
}

asset database_api::get_escrow_balance( escrow_id_type id )const
{
   return my->get_escrow_balance( id );
}

asset database_api_impl::get_escrow_balance( escrow_id_type id )const
{
   const escrow_object& escrow = get_known_escrow( id );
   const asset_id_type& asset_id = escrow.amount.asset_id;
   return asset( _db.ledger().balance_of( escrow.custody_principal(), asset_id ), asset_id );
}

escrow_basic_info database_api::get_escrow_basic_info( escrow_id_type id )const
{
   return my->get_escrow_basic_info( id );
}

escrow_basic_info database_api_impl::get_escrow_basic_info( escrow_id_type id )const
{
   const escrow_object& escrow = get_known_escrow( id );
   escrow_basic_info result;
   result.payer    = escrow.payer;
   result.payee    = escrow.payee;
   result.asset_id = escrow.amount.asset_id;
   result.amount   = escrow.amount.amount;
   result.status   = escrow.status;
   return result;
}

escrow_fee_info database_api::get_escrow_fee_info( escrow_id_type id )const
{
   return my->get_escrow_fee_info( id );
}

escrow_fee_info database_api_impl::get_escrow_fee_info( escrow_id_type id )const
{
   const escrow_object& escrow = get_known_escrow( id );
   const fee_split split = escrow.fee_breakdown();
   escrow_fee_info result;
   result.fee_bips      = escrow.fee_bips;
   result.fee_collector = escrow.fee_collector;
   result.fee           = split.fee;
   result.net           = split.net;
   return result;
}

escrow_dispute_info database_api::get_escrow_dispute_info( escrow_id_type id )const
{
   return my->get_escrow_dispute_info( id );
}

escrow_dispute_info database_api_impl::get_escrow_dispute_info( escrow_id_type id )const
{
   const escrow_object& escrow = get_known_escrow( id );
   escrow_dispute_info result;
   result.has_dispute = escrow.has_dispute();
   result.raised_by   = escrow.dispute_raised_by;
   result.reason      = escrow.dispute_reason;
   return result;
}

escrow_timestamps database_api::get_escrow_timestamps( escrow_id_type id )const
{
   return my->get_escrow_timestamps( id );
}

escrow_timestamps database_api_impl::get_escrow_timestamps( escrow_id_type id )const
{
   const escrow_object& escrow = get_known_escrow( id );
   escrow_timestamps result;
   result.created_at     = escrow.created_at;
   result.release_after  = escrow.release_after;
   result.time_remaining = escrow.time_remaining( _db.head_time() );
   return result;
}

uint32_t database_api::get_escrow_time_remaining( escrow_id_type id )const
{
   return my->get_escrow_time_remaining( id );
}

uint32_t database_api_impl::get_escrow_time_remaining( escrow_id_type id )const
{
   return get_known_escrow( id ).time_remaining( _db.head_time() );
}

bool database_api::can_auto_release( escrow_id_type id )const
{
   return my->can_auto_release( id );
}

bool database_api_impl::can_auto_release( escrow_id_type id )const
{
   return get_known_escrow( id ).can_auto_release( _db.head_time() );
}

string database_api::get_escrow_status_label( escrow_id_type id )const
{
   return my->get_escrow_status_label( id );
}

string database_api_impl::get_escrow_status_label( escrow_id_type id )const
{
   return get_known_escrow( id ).status_label();
}

vector<escrow_id_type> database_api::get_escrows_by_participant( const principal_type& participant )const
{
   return my->get_escrows_by_participant( participant );
}

vector<escrow_id_type> database_api_impl::get_escrows_by_participant( const principal_type& participant )const
{
   const auto& idx = _db.get_index_type<escrow_index>().indices();
   vector<escrow_id_type> result;

   for( const escrow_object& e : boost::make_iterator_range( idx.get<by_payer>().equal_range(
                                                                boost::make_tuple( participant ) ) ) )
      result.push_back( e.get_id() );
   for( const escrow_object& e : boost::make_iterator_range( idx.get<by_payee>().equal_range(
                                                                boost::make_tuple( participant ) ) ) )
      if( e.payer != participant )
         result.push_back( e.get_id() );

   std::sort( result.begin(), result.end() );
   return result;
}

vector<escrow_id_type> database_api::get_escrows_by_status( escrow_status status )const
{
   return my->get_escrows_by_status( status );
}

vector<escrow_id_type> database_api_impl::get_escrows_by_status( escrow_status status )const
{
   const auto& idx = _db.get_index_type<escrow_index>().indices().get<by_status>();
   vector<escrow_id_type> result;
   for( const escrow_object& e : boost::make_iterator_range( idx.equal_range( boost::make_tuple( status ) ) ) )
      result.push_back( e.get_id() );
   return result;
}

uint64_t database_api::get_participant_escrow_count( const principal_type& participant )const
{
   return my->get_participant_escrow_count( participant );
}

uint64_t database_api_impl::get_participant_escrow_count( const principal_type& participant )const
{
   const participant_statistics_object* stats = _db.find_participant_statistics( participant );
   return stats == nullptr ? 0 : stats->escrow_count;
}

vector<escrow_id_type> database_api::get_all_escrows()const
{
   return my->get_all_escrows();
}

vector<escrow_id_type> database_api_impl::get_all_escrows()const
{
   const auto& idx = _db.get_index_type<escrow_index>().indices().get<by_id>();
   vector<escrow_id_type> result;
   result.reserve( idx.size() );
   for( const escrow_object& e : idx )
      result.push_back( e.get_id() );
   return result;
}

uint64_t database_api::get_escrow_count()const
{
   return my->get_escrow_count();
}

uint64_t database_api_impl::get_escrow_count()const
{
   return _db.get_dynamic_factory().total_escrows_created;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Order intents                                                    //
//                                                                  //
//////////////////////////////////////////////////////////////////////

fc::optional<order_intent_object> database_api::get_order_intent( const string& order_id )const
{
   return my->get_order_intent( order_id );
}

fc::optional<order_intent_object> database_api_impl::get_order_intent( const string& order_id )const
{
   const order_intent_object* intent = _db.find_order_intent( order_id );
   if( intent == nullptr )
      return {};
   return *intent;
}

vector<order_intent_object> database_api::get_order_intents_by_participant( const principal_type& participant )const
{
   return my->get_order_intents_by_participant( participant );
}

vector<order_intent_object> database_api_impl::get_order_intents_by_participant( const principal_type& participant )const
{
   const auto& idx = _db.get_index_type<order_intent_index>().indices();
   vector<order_intent_object> result;

   for( const order_intent_object& i : boost::make_iterator_range( idx.get<by_seller>().equal_range(
                                                                      boost::make_tuple( participant ) ) ) )
      result.push_back( i );
   for( const order_intent_object& i : boost::make_iterator_range( idx.get<by_buyer>().equal_range(
                                                                      boost::make_tuple( participant ) ) ) )
      if( i.seller != participant )
         result.push_back( i );

   std::sort( result.begin(), result.end(), []( const order_intent_object& a, const order_intent_object& b ) {
      return a.id < b.id;
   });
   return result;
}

vector<order_intent_object> database_api::get_order_intents_by_participant_and_status(
      const principal_type& participant, order_intent_status status )const
{
   return my->get_order_intents_by_participant_and_status( participant, status );
}

vector<order_intent_object> database_api_impl::get_order_intents_by_participant_and_status(
      const principal_type& participant, order_intent_status status )const
{
   vector<order_intent_object> result = get_order_intents_by_participant( participant );
   result.erase( std::remove_if( result.begin(), result.end(), [status]( const order_intent_object& i ) {
                    return i.status != status;
                 }), result.end() );
   return result;
}

bool database_api::is_order_pending( const string& order_id )const
{
   return my->is_order_pending( order_id );
}

bool database_api_impl::is_order_pending( const string& order_id )const
{
   const order_intent_object* intent = _db.find_order_intent( order_id );
   return intent != nullptr && intent->is_pending();
}

uint64_t database_api::get_order_intent_count()const
{
   return my->get_order_intent_count();
}

uint64_t database_api_impl::get_order_intent_count()const
{
   return _db.get_index_type<order_intent_index>().indices().size();
}

fc::optional<escrow_parameters> database_api::get_escrow_parameters( const string& order_id )const
{
   return my->get_escrow_parameters( order_id );
}

fc::optional<escrow_parameters> database_api_impl::get_escrow_parameters( const string& order_id )const
{
   const order_intent_object* intent = _db.find_order_intent( order_id );
   if( intent == nullptr )
      return {};

   escrow_parameters result;
   result.receiver      = intent->receiver;
   result.amount        = intent->amount;
   result.metadata      = intent->metadata;
   result.release_delay = intent->release_delay;
   return result;
}

} } // custodian::app
