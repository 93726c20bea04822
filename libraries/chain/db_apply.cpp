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
#include <custodian/chain/exceptions.hpp>
#include <custodian/chain/factory_object.hpp>

namespace custodian { namespace chain {

namespace detail {

   /**
    *  Counts the nesting of apply_operation and drops the events raised inside the
    *  scope unless the operation completed.
    */
   class apply_scope
   {
      public:
         apply_scope( uint32_t& depth, vector<applied_event>& events )
         :_depth(depth),_events(events),_first_event(events.size())
         {
            ++_depth;
         }
         ~apply_scope()
         {
            --_depth;
            if( !_completed )
               _events.resize( _first_event );
         }

         void complete() { _completed = true; }

      private:
         uint32_t&              _depth;
         vector<applied_event>& _events;
         const size_t           _first_event;
         bool                   _completed = false;
   };

} // detail

operation_result database::apply_operation( const operation& op )
{ try {
   operation_validate( op );

   const int64_t tag = op.which();
   FC_ASSERT( tag >= 0 && static_cast<size_t>(tag) < _operation_evaluators.size() && _operation_evaluators[tag],
              "No evaluator registered for operation ${op}", ("op", op) );

   const bool outermost = ( _apply_depth == 0 );
   auto session = _undo_db.start_undo_session();

   operation_result result;
   {
      detail::apply_scope scope( _apply_depth, _pending_events );
      result = _operation_evaluators[tag]->evaluate( *this, op, true );
      scope.complete();
   }

   if( outermost )
   {
      session.commit();
      publish_pending_events();
   }
   else
      session.merge();

   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::push_event( object_id_type source, const domain_event& event )
{
   uint64_t sequence = 0;
   modify( get_dynamic_factory(), [&sequence]( dynamic_factory_object& d ) {
      sequence = ++d.last_event_sequence;
   });
   _pending_events.emplace_back( sequence, source, head_time(), event );
}

void database::publish_pending_events()
{
   vector<applied_event> events;
   events.swap( _pending_events );
   for( const applied_event& e : events )
      CUSTODIAN_TRY_NOTIFY( published_event, e )
}

} } // custodian::chain
