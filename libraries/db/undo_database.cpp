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

#include <soulbound/db/undo_database.hpp>
#include <soulbound/db/object_database.hpp>

#include <fc/log/logger.hpp>

#include <exception>

namespace soulbound {
   namespace db {

      undo_database::session::~session() {
         try {
            if (_apply_undo) {
               _db.undo();
            }
         } catch (const fc::exception &e) {
            // A partially restored database cannot be trusted by any later operation
            elog("Failed to undo a session, the object database is inconsistent: ${e}",
                 ("e", e.to_detail_string()));
            std::terminate();
         }
      }

      void undo_database::session::commit() {
         if (_apply_undo) {
            _db.commit();
         }
         _apply_undo = false;
      }

      void undo_database::session::undo() {
         if (_apply_undo) {
            _db.undo();
         }
         _apply_undo = false;
      }

      undo_database::session undo_database::start_undo_session() {
         FC_ASSERT(!_active, "Nested undo sessions are not supported");
         _active = true;
         return session(*this);
      }

      void undo_database::on_next_id(index &idx) {
         if (!_active) {
            return;
         }
         if (_state.old_index_next_ids.find(&idx) == _state.old_index_next_ids.end()) {
            _state.old_index_next_ids[&idx] = idx.get_next_id();
         }
      }

      void undo_database::on_create(const object &obj) {
         if (!_active) {
            return;
         }
         _state.new_ids.insert(obj.id);
      }

      void undo_database::on_modify(const object &obj) {
         if (!_active) {
            return;
         }
         // Objects created in this session are simply discarded on undo
         if (_state.new_ids.find(obj.id) != _state.new_ids.end()) {
            return;
         }
         // Only the state before the first modification needs to be kept
         if (_state.old_values.find(obj.id) != _state.old_values.end()) {
            return;
         }
         _state.old_values[obj.id] = obj.clone();
      }

      void undo_database::undo() {
         try {
            FC_ASSERT(_active, "There is no undo session to revert");

            // Stop tracking while the previous state is restored
            _active = false;

            for (auto &item : _state.old_values) {
               object &previous = *item.second;
               _db.modify_object(_db.get_object(item.first), [&previous](object &obj) {
                  obj.move_from(previous);
               });
            }

            for (const object_id_type &id : _state.new_ids) {
               _db.remove(_db.get_object(id));
            }

            for (auto &item : _state.old_index_next_ids) {
               item.first->set_next_id(item.second);
            }

            _state = undo_state();
         } FC_CAPTURE_AND_RETHROW()
      }

      void undo_database::commit() {
         _state = undo_state();
         _active = false;
      }

   }
} // soulbound::db
