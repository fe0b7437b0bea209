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

#include <soulbound/db/object.hpp>

#include <functional>

namespace soulbound {
   namespace db {

      /**
       *  @brief abstract base class for accessing objects indexed in various ways.
       *
       *  All indexes assume that there exists an object ID space that will grow
       *  forever in a sequential manner.  These IDs are used to identify the
       *  index, type, and instance of the object.
       *
       *  Objects are only ever created and modified through the object_database,
       *  which records their previous state in the undo history.
       */
      class index {
      public:
         virtual ~index() {}

         virtual uint8_t object_space_id() const = 0;

         virtual uint8_t object_type_id() const = 0;

         virtual object_id_type get_next_id() const = 0;

         virtual void set_next_id(object_id_type id) = 0;

         /**
          *  Builds a new object and assigns it the next available ID
          *  @return a reference to the newly added object
          */
         virtual const object &create(const std::function<void(object &)> &constructor) = 0;

         /**
          *  Modifies the object in place, keeping every secondary index current
          */
         virtual void modify(const object &obj, const std::function<void(object &)> &m) = 0;

         virtual void remove(const object &obj) = 0;

         /**
          * @return nullptr if no object with the given ID exists
          */
         virtual const object *find(object_id_type id) const = 0;

         const object &get(object_id_type id) const {
            const object *result = find(id);
            FC_ASSERT(result != nullptr, "Unable to find object ${id}", ("id", id));
            return *result;
         }
      };

   }
} // soulbound::db
