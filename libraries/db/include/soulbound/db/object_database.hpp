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
#include <soulbound/db/undo_database.hpp>

#include <vector>

namespace soulbound {
   namespace db {

      /**
       *   @class object_database
       *   @brief maintains a set of indexed objects that can be modified with rollback support
       *
       *   Indexes are registered per object space and type with add_index().  All creation and
       *   modification goes through this class so that the undo_database can track it.
       */
      class object_database {
      public:
         object_database();

         virtual ~object_database();

         template<typename T, typename F>
         const T &create(F &&constructor) {
            index &idx = get_mutable_index(T::space_id, T::type_id);
            _undo_db.on_next_id(idx);
            const object &result = idx.create([&constructor](object &o) {
               constructor(static_cast<T &>(o));
            });
            _undo_db.on_create(result);
            return static_cast<const T &>(result);
         }

         template<typename T, typename Lambda>
         void modify(const T &obj, const Lambda &m) {
            modify_object(obj, [&m](object &o) {
               m(static_cast<T &>(o));
            });
         }

         void modify_object(const object &obj, const std::function<void(object &)> &m);

         template<typename T>
         const T *find(object_id_type id) const {
            return static_cast<const T *>(get_index(T::space_id, T::type_id).find(id));
         }

         template<typename T>
         const T &get(object_id_type id) const {
            const T *result = find<T>(id);
            FC_ASSERT(result != nullptr, "Unable to find object ${id}", ("id", id));
            return *result;
         }

         const object *find_object(object_id_type id) const;

         const object &get_object(object_id_type id) const;

         template<typename IndexType>
         IndexType *add_index() {
            typedef typename IndexType::object_type object_type;
            if (_index.size() <= object_type::space_id) {
               _index.resize(object_type::space_id + 1);
            }
            if (_index[object_type::space_id].size() <= object_type::type_id) {
               _index[object_type::space_id].resize(object_type::type_id + 1);
            }
            std::unique_ptr<index> &slot = _index[object_type::space_id][object_type::type_id];
            FC_ASSERT(!slot, "An index for objects ${space}.${type} is already registered",
                      ("space", uint64_t(object_type::space_id))("type", uint64_t(object_type::type_id)));
            IndexType *new_index = new IndexType();
            slot.reset(new_index);
            return new_index;
         }

         template<typename IndexType>
         const IndexType &get_index_type() const {
            typedef typename IndexType::object_type object_type;
            return dynamic_cast<const IndexType &>(get_index(object_type::space_id, object_type::type_id));
         }

         const index &get_index(uint8_t space_id, uint8_t type_id) const;

         undo_database::session start_undo_session();

      protected:
         index &get_mutable_index(uint8_t space_id, uint8_t type_id);

      private:
         friend class undo_database;

         /// Only the undo history removes objects, to discard objects created in a failed session
         void remove(const object &obj);

         undo_database _undo_db;
         std::vector<std::vector<std::unique_ptr<index>>> _index;
      };

   }
} // soulbound::db
