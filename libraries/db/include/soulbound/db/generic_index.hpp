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

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace soulbound {
   namespace db {

      using boost::multi_index_container;
      using namespace boost::multi_index;

      struct by_id;

      /**
       *  Almost all objects can be tracked and managed via a boost::multi_index container that uses
       *  an ordered_unique key on the object ID.  This template class adapts the generic index interface
       *  to work with arbitrary boost multi_index containers on the same type.
       *
       *  The first index of the container must be the ordered_unique by_id index.
       */
      template<typename ObjectType, typename MultiIndexType>
      class generic_index : public index {
      public:
         typedef MultiIndexType index_type;
         typedef ObjectType object_type;

         uint8_t object_space_id() const override { return object_type::space_id; }

         uint8_t object_type_id() const override { return object_type::type_id; }

         object_id_type get_next_id() const override { return _next_id; }

         void set_next_id(object_id_type id) override { _next_id = id; }

         const object &create(const std::function<void(object &)> &constructor) override {
            ObjectType item;
            item.id = _next_id;
            constructor(item);
            auto insert_result = _indices.insert(std::move(item));
            FC_ASSERT(insert_result.second, "Could not create object, most likely a uniqueness constraint was violated");
            ++_next_id;
            return *insert_result.first;
         }

         void modify(const object &obj, const std::function<void(object &)> &m) override {
            auto itr = _indices.find(obj.id);
            FC_ASSERT(itr != _indices.end(), "Could not modify object ${id}, it is not in the index", ("id", obj.id));
            const bool ok = _indices.modify(itr, [&m](ObjectType &o) { m(o); });
            FC_ASSERT(ok, "Could not modify object, most likely a uniqueness constraint was violated");
         }

         void remove(const object &obj) override {
            _indices.erase(obj.id);
         }

         const object *find(object_id_type id) const override {
            auto itr = _indices.find(id);
            if (itr == _indices.end()) {
               return nullptr;
            }
            return &*itr;
         }

         const index_type &indices() const { return _indices; }

      private:
         index_type _indices;
         object_id_type _next_id = object_id_type(ObjectType::space_id, ObjectType::type_id, 0);
      };

   }
} // soulbound::db
