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

#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>

#include <cstdint>
#include <string>

#define SOULBOUND_DB_MAX_INSTANCE_ID  (uint64_t(-1)>>16)

namespace soulbound {
   namespace db {

      /**
       *  @brief Identifies an object by its space, type and instance
       *
       *  The space and type select the index holding the object and the instance is assigned
       *  sequentially by that index.  All three are packed into a single 64-bit number so that
       *  ids order first by space, then by type, then by instance.
       */
      struct object_id_type {
         object_id_type() = default;

         object_id_type(uint8_t s, uint8_t t, uint64_t i) {
            FC_ASSERT(i >> 48 == 0, "instance overflow", ("instance", i));
            number = (uint64_t(s) << 56) | (uint64_t(t) << 48) | i;
         }

         uint8_t space() const { return number >> 56; }

         uint8_t type() const { return number >> 48 & 0x00ff; }

         uint64_t instance() const { return number & SOULBOUND_DB_MAX_INSTANCE_ID; }

         bool is_null() const { return number == 0; }

         object_id_type &operator++() {
            ++number;
            return *this;
         }

         friend bool operator==(const object_id_type &a, const object_id_type &b) { return a.number == b.number; }

         friend bool operator!=(const object_id_type &a, const object_id_type &b) { return a.number != b.number; }

         friend bool operator<(const object_id_type &a, const object_id_type &b) { return a.number < b.number; }

         /// Formats the id as "space.type.instance"
         explicit operator std::string() const;

         uint64_t number = 0;
      };

   }
} // soulbound::db

namespace fc {
   void to_variant(const soulbound::db::object_id_type &var, fc::variant &vo, uint32_t max_depth = 1);

   void from_variant(const fc::variant &var, soulbound::db::object_id_type &vo, uint32_t max_depth = 1);
}

FC_REFLECT_TYPENAME( soulbound::db::object_id_type )
