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
#include <gavel/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace gavel { namespace db {

   using std::unordered_map;
   class object_database;

   struct undo_state
   {
      unordered_map<object_id_type, unique_ptr<object> > old_values;
      unordered_map<object_id_type, object_id_type>      old_index_next_ids;
      std::unordered_set<object_id_type>                 new_ids;
      unordered_map<object_id_type, unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Every transaction applied to the ledger runs inside a session.  Destroying a session that was
    * neither committed nor merged restores every object it touched, which is what gives a transition
    * its all-or-nothing behaviour.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session()
               {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;
               session( const session& ) = delete;

            private:
               friend class undo_database;
               explicit session( undo_database& db ): _db(db) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         void disable() { _disabled = true; }
         void enable()  { _disabled = false; }
         bool enabled()const { return !_disabled; }

         session start_undo_session();

         /** called just after an object is created */
         void on_create( const object& obj );
         /**
          * Called just before an object is modified.  Objects created within the current state keep
          * no old value since undoing simply removes them.
          */
         void on_modify( const object& obj );
         /**
          * Called just before an object is removed.  An object created within the current state is
          * forgotten instead, as nothing needs to be restored for it.
          */
         void on_remove( const object& obj );

         size_t active_sessions()const { return _active_sessions; }
         size_t size()const { return _stack.size(); }

      private:
         void undo();
         void merge();
         void commit();

         undo_state& current_state();

         uint32_t                _active_sessions = 0;
         bool                    _disabled = true;
         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // gavel::db
