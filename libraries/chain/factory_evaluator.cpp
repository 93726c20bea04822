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
#include <custodian/chain/factory_evaluator.hpp>
#include <custodian/chain/factory_object.hpp>

namespace custodian { namespace chain {

   namespace detail
   {
      void require_factory_owner( const database& d, const principal_type& issuer )
      {
         const escrow_factory_object& factory = d.get_factory();
         CUSTODIAN_ASSERT( issuer == factory.owner, caller_not_owner,
                           "Only the factory owner ${o} may change the factory", ("o", factory.owner) );
      }
   }

   void_result factory_update_fee_collector_evaluator::do_evaluate( const factory_update_fee_collector_operation& o )
   { try {
      detail::require_factory_owner( db(), o.issuer );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result factory_update_fee_collector_evaluator::do_apply( const factory_update_fee_collector_operation& o )
   { try {
      database& d = db();
      const escrow_factory_object& factory = d.get_factory();
      d.modify( factory, [&o]( escrow_factory_object& f ) {
         f.fee_collector = o.new_fee_collector;
      });
      d.push_event( factory.id, fee_collector_updated_event{ o.new_fee_collector } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result factory_update_arbitrator_evaluator::do_evaluate( const factory_update_arbitrator_operation& o )
   { try {
      detail::require_factory_owner( db(), o.issuer );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result factory_update_arbitrator_evaluator::do_apply( const factory_update_arbitrator_operation& o )
   { try {
      database& d = db();
      const escrow_factory_object& factory = d.get_factory();
      d.modify( factory, [&o]( escrow_factory_object& f ) {
         f.arbitrator = o.new_arbitrator;
      });
      d.push_event( factory.id, arbitrator_updated_event{ o.new_arbitrator } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result factory_update_fee_bips_evaluator::do_evaluate( const factory_update_fee_bips_operation& o )
   { try {
      detail::require_factory_owner( db(), o.issuer );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

   void_result factory_update_fee_bips_evaluator::do_apply( const factory_update_fee_bips_operation& o )
   { try {
      database& d = db();
      const escrow_factory_object& factory = d.get_factory();
      d.modify( factory, [&o]( escrow_factory_object& f ) {
         f.default_fee_bips = o.new_fee_bips;
      });
      d.push_event( factory.id, platform_fee_updated_event{ o.new_fee_bips } );
      return void_result();
   } FC_CAPTURE_AND_RETHROW( (o) ) }

} } // custodian::chain
