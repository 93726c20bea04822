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
#include <custodian/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>

#include <fstream>
#include <functional>
#include <iterator>

namespace custodian { namespace db {

   class object_database;

   /**
    * @class index
    * @brief abstract base class for accessing objects indexed in various ways.
    *
    * All indexes assume that there exists an object ID space that will grow
    * forever in a sequential manner. These IDs are used to identify the
    * index, type, and instance of the object.
    *
    * Items in an index can only be modified via a call to modify and
    * all references to objects outside of that callback are const references.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /** restores an object previously written by save() */
         virtual const object&  load( const std::vector<char>& data ) = 0;

         /**
          * Polymorphically insert by moving an object into the index.
          * this should throw if the ID is already in use.
          */
         virtual const object&  insert( object&& obj ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object&  create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Opens the index loading objects from a file
          */
         virtual void open( const fc::path& db ) = 0;
         virtual void save( const fc::path& db ) = 0;

         /** @return the object with id or nullptr if not found */
         virtual const object*  find( object_id_type id )const = 0;

         /**
          * This version will automatically check for nullptr and throw an exception if the
          * object ID could not be found.
          */
         const object&          get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object ${id}", ("id",id) );
            return *maybe_found;
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& ) = 0;
         virtual void remove( const object& obj ) = 0;

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& l )
         {
            modify( static_cast<const object&>(obj),
                    std::function<void(object&)>( [&l]( object& o ){ l( static_cast<T&>(o) ); } ) );
         }

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
   };

   /**
    *  Connects an index to the undo history of the object_database that owns it.
    */
   class base_primary_index
   {
      public:
         base_primary_index( object_database& db ) : _db(db) {}

         /** called just before obj is modified */
         void save_undo( const object& obj );

         /** called just after the object is added */
         void on_add( const object& obj );

         /** called just before obj is removed */
         void on_remove( const object& obj );

      protected:
         object_database& _db;
   };

   /**
    * @class primary_index
    * @brief wraps a derived index to intercept calls to create, modify, and remove so that
    * changes can be tracked by the undo history, and takes care of ID assignment and
    * persistence.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex, public base_primary_index
   {
      public:
         using object_type = typename DerivedIndex::object_type;

         primary_index( object_database& db )
         :base_primary_index(db),_next_id(object_type::space_id,object_type::type_id,0) {}

         virtual uint8_t object_space_id()const override
         { return object_type::space_id; }

         virtual uint8_t object_type_id()const override
         { return object_type::type_id; }

         virtual object_id_type get_next_id()const override              { return _next_id;    }
         virtual void           use_next_id()override                    { ++_next_id.number;  }
         virtual void           set_next_id( object_id_type id )override { _next_id = id;      }

         virtual void open( const fc::path& db )override
         {
            if( !fc::exists( db ) ) return;
            std::ifstream in( db.generic_string(), std::ios::binary );
            FC_ASSERT( in, "Unable to read ${db}", ("db",db) );
            std::vector<char> content( (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>() );
            fc::datastream<const char*> ds( content.data(), content.size() );

            object_id_type next_id;
            std::string open_ver;
            fc::raw::unpack( ds, next_id );
            fc::raw::unpack( ds, open_ver );
            FC_ASSERT( open_ver == get_object_version(),
                       "Incompatible Version, the serialization of objects in this index has changed" );
            std::vector<char> tmp;
            while( ds.remaining() > 0 )
            {
               fc::raw::unpack( ds, tmp );
               load( tmp );
            }
            _next_id = next_id;
         }

         virtual void save( const fc::path& db )override
         {
            std::ofstream out( db.generic_string(),
                               std::ofstream::binary | std::ofstream::out | std::ofstream::trunc );
            FC_ASSERT( out, "Unable to write ${db}", ("db",db) );
            const auto ver = get_object_version();
            auto header = fc::raw::pack( _next_id );
            out.write( header.data(), header.size() );
            header = fc::raw::pack( ver );
            out.write( header.data(), header.size() );
            this->inspect_all_objects( [&out]( const object& o ) {
                auto packed_vec = fc::raw::pack( o.pack() );
                out.write( packed_vec.data(), packed_vec.size() );
            });
         }

         virtual const object& load( const std::vector<char>& data )override
         {
            object_type obj;
            fc::datastream<const char*> ds( data.data(), data.size() );
            fc::raw::unpack( ds, obj );
            const auto& result = DerivedIndex::insert( std::move(obj) );
            if( result.id.instance() >= _next_id.instance() )
               _next_id = result.id + 1;
            return result;
         }

         virtual const object& create( const std::function<void(object&)>& constructor )override
         {
            const auto& result = DerivedIndex::create( [&]( object& o ) {
               o.id = _next_id;
               constructor( o );
            });
            use_next_id();
            on_add( result );
            return result;
         }

         virtual const object& insert( object&& obj )override
         {
            const auto& result = DerivedIndex::insert( std::move( obj ) );
            on_add( result );
            return result;
         }

         virtual void remove( const object& obj )override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

         virtual void modify( const object& obj, const std::function<void(object&)>& m )override
         {
            save_undo( obj );
            DerivedIndex::modify( obj, m );
         }

      private:
         /// identifies the layout of the serialized objects
         std::string get_object_version()const
         {
            return fc::get_typename<object_type>::name();
         }

         object_id_type _next_id;
   };

} } // custodian::db
