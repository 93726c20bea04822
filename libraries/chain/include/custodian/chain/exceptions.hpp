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

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>
#include <custodian/protocol/exceptions.hpp>
#include <custodian/chain/types.hpp>

#define CUSTODIAN_TRY_NOTIFY( signal, ... )                                   \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in observer: ${e}", ("e", e.to_detail_string() ) ); \
   }                                                                          \
   catch( const std::exception& e )                                           \
   {                                                                          \
      elog( "Caught exception in observer: ${e}", ("e", e.what()) );          \
   }

namespace custodian { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000 )
   FC_DECLARE_DERIVED_EXCEPTION( undo_database_exception,      chain_exception, 3070000 )

   /// the object is not in the status the operation requires
   FC_DECLARE_DERIVED_EXCEPTION( invalid_state_exception,      operation_evaluate_exception, 3050100 )
   /// the caller is not the principal the operation must come from
   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,       operation_evaluate_exception, 3050200 )
   /// the asset ledger cannot cover the requested movement
   FC_DECLARE_DERIVED_EXCEPTION( funding_exception,            operation_evaluate_exception, 3050300 )
   /// the request conflicts with a business rule
   FC_DECLARE_DERIVED_EXCEPTION( business_rule_exception,      operation_evaluate_exception, 3050400 )

   FC_DECLARE_DERIVED_EXCEPTION( escrow_invalid_status,        invalid_state_exception, 3050101 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_reentrancy,            invalid_state_exception, 3050102 )
   FC_DECLARE_DERIVED_EXCEPTION( order_intent_not_pending,     invalid_state_exception, 3050103 )

   FC_DECLARE_DERIVED_EXCEPTION( caller_not_payer,             unauthorized_exception, 3050201 )
   FC_DECLARE_DERIVED_EXCEPTION( caller_not_payee,             unauthorized_exception, 3050202 )
   FC_DECLARE_DERIVED_EXCEPTION( caller_not_party,             unauthorized_exception, 3050203 )
   FC_DECLARE_DERIVED_EXCEPTION( caller_not_arbitrator,        unauthorized_exception, 3050204 )
   FC_DECLARE_DERIVED_EXCEPTION( caller_not_owner,             unauthorized_exception, 3050205 )
   FC_DECLARE_DERIVED_EXCEPTION( caller_not_seller,            unauthorized_exception, 3050206 )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_allowance,       funding_exception, 3050301 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,         funding_exception, 3050302 )

   FC_DECLARE_DERIVED_EXCEPTION( duplicate_order_id,           business_rule_exception, 3050401 )
   FC_DECLARE_DERIVED_EXCEPTION( invalid_dispute_winner,       business_rule_exception, 3050402 )
   FC_DECLARE_DERIVED_EXCEPTION( release_too_early,            business_rule_exception, 3050403 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_escrow,               business_rule_exception, 3050404 )
   FC_DECLARE_DERIVED_EXCEPTION( unknown_order_intent,         business_rule_exception, 3050405 )
   FC_DECLARE_DERIVED_EXCEPTION( escrow_order_mismatch,        business_rule_exception, 3050406 )

} } // custodian::chain
