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

#include <soulbound/protocol/address.hpp>

#include <fc/exception/exception.hpp>

#include <algorithm>
#include <cctype>

namespace soulbound {
   namespace protocol {
      address::address(const std::string &hex) {
         FC_ASSERT(is_valid(hex), "Invalid address (${address}): expected 0x followed by 40 hexadecimal digits",
                   ("address", hex));
         addr = fc::ripemd160(hex.substr(2));
      }

      address address::from_seed(const std::string &seed) {
         return address(fc::ripemd160::hash(seed));
      }

      bool address::is_valid(const std::string &hex) {
         const std::size_t expected_size = 2 + 2 * sizeof(fc::ripemd160);
         if (hex.size() != expected_size) {
            return false;
         }
         if (hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
            return false;
         }
         return std::all_of(hex.begin() + 2, hex.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
         });
      }

      address::operator std::string() const {
         return "0x" + addr.str();
      }
   }
} // soulbound::protocol

namespace fc {
   void to_variant(const soulbound::protocol::address &var, fc::variant &vo, uint32_t max_depth) {
      vo = std::string(var);
   }

   void from_variant(const fc::variant &var, soulbound::protocol::address &vo, uint32_t max_depth) {
      vo = soulbound::protocol::address(var.as_string());
   }
}
