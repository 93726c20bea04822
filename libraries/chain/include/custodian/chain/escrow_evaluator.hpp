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

   class escrow_object;
   class escrow_factory_object;

   class escrow_create_evaluator : public evaluator<escrow_create_evaluator>
   {
      public:
         typedef escrow_create_operation operation_type;

         void_result do_evaluate( const escrow_create_operation& o );
         object_id_type do_apply( const escrow_create_operation& o );

      private:
         const escrow_factory_object* _factory = nullptr;
   };

   class escrow_release_evaluator : public evaluator<escrow_release_evaluator>
   {
      public:
         typedef escrow_release_operation operation_type;

         void_result do_evaluate( const escrow_release_operation& o );
         void_result do_apply( const escrow_release_operation& o );

      private:
         const escrow_object* _escrow = nullptr;
   };

   class escrow_refund_evaluator : public evaluator<escrow_refund_evaluator>
   {
      public:
         typedef escrow_refund_operation operation_type;

         void_result do_evaluate( const escrow_refund_operation& o );
         void_result do_apply( const escrow_refund_operation& o );

      private:
         const escrow_object* _escrow = nullptr;
   };

   class escrow_auto_release_evaluator : public evaluator<escrow_auto_release_evaluator>
   {
      public:
         typedef escrow_auto_release_operation operation_type;

         void_result do_evaluate( const escrow_auto_release_operation& o );
         void_result do_apply( const escrow_auto_release_operation& o );

      private:
         const escrow_object* _escrow = nullptr;
   };

   class escrow_dispute_evaluator : public evaluator<escrow_dispute_evaluator>
   {
      public:
         typedef escrow_dispute_operation operation_type;

         void_result do_evaluate( const escrow_dispute_operation& o );
         void_result do_apply( const escrow_dispute_operation& o );

      private:
         const escrow_object* _escrow = nullptr;
   };

   /**
    *  The factory's arbitrator gated entry point to the resolution of a disputed escrow.
    */
   class escrow_resolve_evaluator : public evaluator<escrow_resolve_evaluator>
   {
      public:
         typedef escrow_resolve_operation operation_type;

         void_result do_evaluate( const escrow_resolve_operation& o );
         void_result do_apply( const escrow_resolve_operation& o );

      private:
         const escrow_object* _escrow = nullptr;
   };

} } // custodian::chain
