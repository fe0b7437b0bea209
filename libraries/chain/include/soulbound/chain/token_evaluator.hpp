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

#include <soulbound/chain/evaluator.hpp>
#include <soulbound/protocol/token.hpp>

#include <fc/reflect/typename.hpp>

namespace soulbound {
   namespace chain {

      /**
       * @throws transfer_locked always
       */
      void reject_locked_transfer(const string &entry_point);

      /**
       * @brief Evaluator for a standard transfer or approval entry point of the token ledger
       *
       * Badges are soulbound: every such operation is rejected before any of its usual preconditions is
       * examined.  Tokens leave the contract's custody through database::transfer_token, which does not
       * go through these operations.
       */
      template<typename OperationType>
      class locked_transfer_evaluator : public evaluator<locked_transfer_evaluator<OperationType>> {
      public:
         typedef OperationType operation_type;

         void_result do_evaluate(const OperationType &) {
            reject_locked_transfer(fc::get_typename<OperationType>::name());
            return void_result();
         }

         void_result do_apply(const OperationType &) {
            reject_locked_transfer(fc::get_typename<OperationType>::name());
            return void_result();
         }
      };

      typedef locked_transfer_evaluator<token_approve_operation> token_approve_evaluator;
      typedef locked_transfer_evaluator<token_set_approval_for_all_operation> token_set_approval_for_all_evaluator;
      typedef locked_transfer_evaluator<token_transfer_from_operation> token_transfer_from_evaluator;
      typedef locked_transfer_evaluator<token_safe_transfer_from_operation> token_safe_transfer_from_evaluator;

   }
} // soulbound::chain
