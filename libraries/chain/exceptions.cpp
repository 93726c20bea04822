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

#include <custodian/chain/exceptions.hpp>

namespace custodian { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "custody engine exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( database_query_exception,     chain_exception, 3010000, "database query exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_evaluate_exception, chain_exception, 3050000, "operation evaluation exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( undo_database_exception,      chain_exception, 3070000, "undo database exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_state_exception,      operation_evaluate_exception, 3050100, "invalid state" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,       operation_evaluate_exception, 3050200, "unauthorized caller" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( funding_exception,            operation_evaluate_exception, 3050300, "insufficient funding" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( business_rule_exception,      operation_evaluate_exception, 3050400, "business rule violated" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_invalid_status,        invalid_state_exception, 3050101, "escrow is not in the required status" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_reentrancy,            invalid_state_exception, 3050102, "escrow is already being settled" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( order_intent_not_pending,     invalid_state_exception, 3050103, "order intent already processed" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( caller_not_payer,             unauthorized_exception, 3050201, "caller is not the payer" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( caller_not_payee,             unauthorized_exception, 3050202, "caller is not the payee" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( caller_not_party,             unauthorized_exception, 3050203, "caller is not a party of the escrow" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( caller_not_arbitrator,        unauthorized_exception, 3050204, "caller is not the arbitrator" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( caller_not_owner,             unauthorized_exception, 3050205, "caller is not the factory owner" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( caller_not_seller,            unauthorized_exception, 3050206, "caller is not the seller" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_allowance,       funding_exception, 3050301, "insufficient allowance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,         funding_exception, 3050302, "insufficient balance" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_order_id,           business_rule_exception, 3050401, "order id already used" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_dispute_winner,       business_rule_exception, 3050402, "winner is not a party of the escrow" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( release_too_early,            business_rule_exception, 3050403, "release of funds is too early" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_escrow,               business_rule_exception, 3050404, "escrow was not created by this factory" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( unknown_order_intent,         business_rule_exception, 3050405, "order intent does not exist" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( escrow_order_mismatch,        business_rule_exception, 3050406, "escrow does not fund this order" )

} } // custodian::chain
