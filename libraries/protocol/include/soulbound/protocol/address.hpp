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

#include <fc/crypto/ripemd160.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/variant.hpp>

#include <string>

namespace soulbound {
   namespace protocol {

      /**
       *  @brief a 20-byte account or contract address
       *
       *  Addresses are written as "0x" followed by 40 hexadecimal digits.  The all-zero address
       *  is the sentinel for "no address" and is never a valid owner, receiver or service.
       */
      class address {
      public:
         address() {}

         /// Parses the "0x"-prefixed hexadecimal form
         explicit address(const std::string &hex);

         explicit address(const fc::ripemd160 &a) : addr(a) {}

         /// Deterministic address derived from an arbitrary seed, such as a contract or account name
         static address from_seed(const std::string &seed);

         static bool is_valid(const std::string &hex);

         bool is_zero() const { return addr == fc::ripemd160(); }

         explicit operator std::string() const;

         friend bool operator==(const address &a, const address &b) { return a.addr == b.addr; }

         friend bool operator!=(const address &a, const address &b) { return a.addr != b.addr; }

         friend bool operator<(const address &a, const address &b) { return a.addr < b.addr; }

         fc::ripemd160 addr;
      };

   }
} // soulbound::protocol

namespace fc {
   void to_variant(const soulbound::protocol::address &var, fc::variant &vo, uint32_t max_depth = 1);

   void from_variant(const fc::variant &var, soulbound::protocol::address &vo, uint32_t max_depth = 1);
}

FC_REFLECT( soulbound::protocol::address, (addr) )
