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

#include <soulbound/db/object_database.hpp>

namespace soulbound {
   namespace db {

      object_database::object_database()
         : _undo_db(*this) {
      }

      object_database::~object_database() {}

      void object_database::modify_object(const object &obj, const std::function<void(object &)> &m) {
         index &idx = get_mutable_index(obj.id.space(), obj.id.type());
         _undo_db.on_modify(obj);
         idx.modify(obj, m);
      }

      const object *object_database::find_object(object_id_type id) const {
         return get_index(id.space(), id.type()).find(id);
      }

      const object &object_database::get_object(object_id_type id) const {
         return get_index(id.space(), id.type()).get(id);
      }

      const index &object_database::get_index(uint8_t space_id, uint8_t type_id) const {
         FC_ASSERT(_index.size() > space_id, "No index is registered for space ${s}", ("s", space_id));
         FC_ASSERT(_index[space_id].size() > type_id && _index[space_id][type_id],
                   "No index is registered for objects ${s}.${t}", ("s", space_id)("t", type_id));
         return *_index[space_id][type_id];
      }

      index &object_database::get_mutable_index(uint8_t space_id, uint8_t type_id) {
         return const_cast<index &>(get_index(space_id, type_id));
      }

      undo_database::session object_database::start_undo_session() {
         return _undo_db.start_undo_session();
      }

      void object_database::remove(const object &obj) {
         get_mutable_index(obj.id.space(), obj.id.type()).remove(obj);
      }

   }
} // soulbound::db
