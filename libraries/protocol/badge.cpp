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

#include <soulbound/protocol/badge.hpp>

namespace soulbound {
   namespace protocol {
      void badge_initialize_operation::validate() const {
         FC_ASSERT(!caller.is_zero(), "The caller should not be the zero address");
      }

      void badge_mint_root_operation::validate() const {
         FC_ASSERT(!caller.is_zero(), "The caller should not be the zero address");
         FC_ASSERT(!recipient.is_zero(), "The root badge may not be minted to the zero address");
      }

      void badge_mint_operation::validate() const {
         FC_ASSERT(!caller.is_zero(), "The caller should not be the zero address");
         FC_ASSERT(!recipient.is_zero(), "A badge may not be minted to the zero address");
      }
   }
}
