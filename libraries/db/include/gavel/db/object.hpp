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
#include <gavel/db/object_id.hpp>

#include <fc/io/raw.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant.hpp>

#include <memory>
#include <vector>

#define MAX_NESTING (200)

namespace gavel { namespace db {

   using std::unique_ptr;
   using std::vector;
   using fc::variant;

   /**
    *  @brief base for all database objects
    *
    *  Objects are the unit the undo_database tracks: a modified object is cloned before the
    *  change so that the previous value can be moved back in if the enclosing session is
    *  undone.  Objects should be cheap to copy and refer to each other by id or key only.
    *
    *  @note Do not use multiple inheritance with object because the code assumes
    *  a static_cast will work between object and derived types.
    */
   class object
   {
      public:
         object(){}
         virtual ~object(){}

         static const uint8_t space_id = 0;
         static const uint8_t type_id  = 0;

         object_id_type id;

         /// implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual variant            to_variant()const = 0;
         virtual vector<char>       pack()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Use the Curiously Recurring Template Pattern to add polymorphic clone, move and
    * serialization to a concrete object type.
    */
   template<typename DerivedClass, uint8_t SpaceID, uint8_t TypeID>
   class abstract_object : public object
   {
      public:
         static const uint8_t space_id = SpaceID;
         static const uint8_t type_id  = TypeID;

         unique_ptr<object> clone()const override
         {
            return unique_ptr<object>( new DerivedClass( *static_cast<const DerivedClass*>(this) ) );
         }

         void move_from( object& obj ) override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         variant      to_variant()const override { return variant( static_cast<const DerivedClass&>(*this), MAX_NESTING ); }
         vector<char> pack()const override       { return fc::raw::pack( static_cast<const DerivedClass&>(*this) ); }
   };

} } // gavel::db

FC_REFLECT( gavel::db::object, (id) )
