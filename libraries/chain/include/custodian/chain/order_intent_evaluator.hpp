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
#include <custodian/chain/evaluator.hpp>

namespace custodian { namespace chain {

   class order_intent_object;

   class order_intent_create_evaluator : public evaluator<order_intent_create_evaluator>
   {
      public:
         typedef order_intent_create_operation operation_type;

         void_result do_evaluate( const order_intent_create_operation& o );
         object_id_type do_apply( const order_intent_create_operation& o );
   };

   class order_intent_cancel_evaluator : public evaluator<order_intent_cancel_evaluator>
   {
      public:
         typedef order_intent_cancel_operation operation_type;

         void_result do_evaluate( const order_intent_cancel_operation& o );
         void_result do_apply( const order_intent_cancel_operation& o );

      private:
         const order_intent_object* _intent = nullptr;
   };

   class order_intent_settle_evaluator : public evaluator<order_intent_settle_evaluator>
   {
      public:
         typedef order_intent_settle_operation operation_type;

         void_result do_evaluate( const order_intent_settle_operation& o );
         void_result do_apply( const order_intent_settle_operation& o );

      private:
         const order_intent_object* _intent = nullptr;
   };

} } // custodian::chain
