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

#include <soulbound/protocol/badge.hpp>
#include <soulbound/protocol/token.hpp>

namespace soulbound {
   namespace protocol {

      /**
       * @ingroup operations
       *
       * Defines the set of valid operations as a discriminated union type.
       * New operations are appended so that the position of existing ones never changes.
       */
      typedef fc::static_variant<
         /*  0 */ badge_initialize_operation,
         /*  1 */ badge_mint_root_operation,
         /*  2 */ badge_mint_operation,
         /*  3 */ badge_set_token_uri_operation,
         /*  4 */ badge_transfer_admin_operation,
         /*  5 */ token_approve_operation,
         /*  6 */ token_set_approval_for_all_operation,
         /*  7 */ token_transfer_from_operation,
         /*  8 */ token_safe_transfer_from_operation,
         /*  9 */ badge_minted_operation,                // VIRTUAL
         /* 10 */ batch_metadata_update_operation,       // VIRTUAL
         /* 11 */ admin_transferred_operation            // VIRTUAL
      > operation;

      typedef fc::static_variant<
         void_result,
         minted_ip
      > operation_result;

      /**
       * Visitor that calls validate() on whichever operation a variant holds
       */
      struct operation_validator {
         typedef void result_type;

         template<typename T>
         void operator()(const T &v) const { v.validate(); }
      };

      void operation_validate(const operation &op);

   }
} // soulbound::protocol

FC_REFLECT_TYPENAME( soulbound::protocol::operation )
FC_REFLECT_TYPENAME( soulbound::protocol::operation_result )
