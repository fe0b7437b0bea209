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

#include <soulbound/db/object_id.hpp>

namespace soulbound {
   namespace db {
      object_id_type::operator std::string() const {
         return std::to_string(space()) + "." + std::to_string(type()) + "." + std::to_string(instance());
      }
   }
}

namespace fc {
   void to_variant(const soulbound::db::object_id_type &var, fc::variant &vo, uint32_t max_depth) {
      vo = std::string(var);
   }

   void from_variant(const fc::variant &var, soulbound::db::object_id_type &vo, uint32_t max_depth) {
      try {
         const std::string s = var.as_string();
         const auto first_dot = s.find('.');
         const auto second_dot = s.find('.', first_dot + 1);
         FC_ASSERT(first_dot != std::string::npos && second_dot != std::string::npos,
                   "Object id should have the form space.type.instance");

         const uint64_t space = std::stoull(s.substr(0, first_dot));
         const uint64_t type = std::stoull(s.substr(first_dot + 1, second_dot - first_dot - 1));
         const uint64_t instance = std::stoull(s.substr(second_dot + 1));
         FC_ASSERT(space <= 0xff && type <= 0xff, "Object id space and type should fit in a single byte");

         vo = soulbound::db::object_id_type(uint8_t(space), uint8_t(type), instance);
      } FC_CAPTURE_AND_RETHROW((var))
   }
}
