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
#include <custodian/db/object_id.hpp>

#include <fc/io/raw.hpp>
#include <fc/variant.hpp>

#include <memory>
#include <vector>

#define CUSTODIAN_DB_MAX_NESTING 200

namespace custodian { namespace db {

   /**
    *  @brief base for all database objects
    *
    *  The object is the fundamental building block of the database and
    *  is the level upon which undo operations are performed. Objects are
    *  assigned a unique and sequential object ID by the database within
    *  the space and type defined by the object class.
    *
    *  All objects must be serializable via FC_REFLECT() and their content must be
    *  faithfully restored. Objects should refer to other objects by ID only, since
    *  they are copied into the undo history every time they are modified.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object() = default;
         object( uint8_t space_id, uint8_t type_id ) : id( space_id, type_id, 0 ) {}
         virtual ~object() = default;

         // serialized
         object_id_type          id;

         /// these methods are implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual std::unique_ptr<object> clone()const = 0;
         virtual void                    move_from( object& obj ) = 0;
         virtual fc::variant             to_variant()const  = 0;
         virtual std::vector<char>       pack()const = 0;
   };

   /**
    * @class abstract_object
    * @brief   Use the Curiously Recurring Template Pattern to automatically add the ability to
    *  clone, serialize, and move objects polymorphically.
    */
   template<typename DerivedClass, uint8_t SpaceID, uint8_t TypeID>
   class abstract_object : public object
   {
      public:
         using id_type = object_id<SpaceID, TypeID>;
         static constexpr uint8_t space_id = SpaceID;
         static constexpr uint8_t type_id = TypeID;

         abstract_object() : object( SpaceID, TypeID ) {}

         id_type get_id()const { return id_type( this->id.instance() ); }

         virtual std::unique_ptr<object> clone()const
         {
            return std::make_unique<DerivedClass>( *static_cast<const DerivedClass*>(this) );
         }

         virtual void    move_from( object& obj )
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         virtual fc::variant to_variant()const
         {
            return fc::variant( static_cast<const DerivedClass&>(*this), CUSTODIAN_DB_MAX_NESTING );
         }
         virtual std::vector<char> pack()const { return fc::raw::pack( static_cast<const DerivedClass&>(*this) ); }
   };

} } // custodian::db

FC_REFLECT( custodian::db::object, (id) )
