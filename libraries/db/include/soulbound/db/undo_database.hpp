/*
 * Copyright (c) 2023 Michel Santos and contributors.
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

#include <soulbound/db/index.hpp>

#include <map>
#include <set>

namespace soulbound {
   namespace db {

      class object_database;

      /**
       * @class undo_database
       * @brief tracks changes to the object database so that a failed operation leaves no trace
       *
       * Every object created or modified while a session is active is recorded.  When the
       * session is destroyed without being committed the previous state of every index is
       * restored, including the ID that each index will hand out next.
       */
      class undo_database {
      public:
         explicit undo_database(object_database &db) : _db(db) {}

         class session {
         public:
            session(session &&mv)
               : _db(mv._db), _apply_undo(mv._apply_undo) {
               mv._apply_undo = false;
            }

            ~session();

            /// Keep every change made since the session started
            void commit();

            /// Revert every change made since the session started
            void undo();

         private:
            friend class undo_database;

            explicit session(undo_database &db) : _db(db) {}

            undo_database &_db;
            bool _apply_undo = true;
         };

         session start_undo_session();

         bool is_active() const { return _active; }

         /// Records the next ID of an index before its first creation within the session
         void on_next_id(index &idx);

         void on_create(const object &obj);

         void on_modify(const object &obj);

      private:
         struct undo_state {
            std::map<object_id_type, std::unique_ptr<object>> old_values;
            std::map<index *, object_id_type> old_index_next_ids;
            std::set<object_id_type> new_ids;
         };

         void undo();

         void commit();

         object_database &_db;
         undo_state _state;
         bool _active = false;
      };

   }
} // soulbound::db
