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
#include <custodian/chain/factory_object.hpp>

#include <functional>

namespace custodian { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
   _ledger = std::make_shared<database_ledger>( *this );
}

database::~database() = default;

void database::open( const fc::path& data_dir, std::function<genesis_state_type()> genesis_loader )
{ try {
   object_database::open( data_dir );

   if( find( escrow_factory_id_type() ) == nullptr )
   {
      ilog( "No factory state found in ${d}, initializing from genesis", ("d", data_dir) );
      init_genesis( genesis_loader() );
   }
   else
      ilog( "Opened factory state, ${n} escrows created so far",
            ("n", get_dynamic_factory().total_escrows_created) );

   _undo_db.enable();
   _opened = true;
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

void database::close()
{ try {
   FC_ASSERT( _apply_depth == 0, "Cannot close the database while an operation is being applied" );
   if( !_opened )
      return;

   object_database::close();
   _opened = false;
} FC_CAPTURE_AND_RETHROW() }

} } // custodian::chain
