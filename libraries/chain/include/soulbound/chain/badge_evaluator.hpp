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
#include <soulbound/protocol/badge.hpp>

namespace soulbound {
   namespace chain {

      class badge_state_object;

      class badge_initialize_evaluator : public evaluator<badge_initialize_evaluator> {
      public:
         typedef badge_initialize_operation operation_type;

         void_result do_evaluate(const badge_initialize_operation &o);

         void_result do_apply(const badge_initialize_operation &o);
      };

      class badge_mint_root_evaluator : public evaluator<badge_mint_root_evaluator> {
      public:
         typedef badge_mint_root_operation operation_type;

         void_result do_evaluate(const badge_mint_root_operation &o);

         minted_ip do_apply(const badge_mint_root_operation &o);

         const badge_state_object *_state = nullptr;
      };

      class badge_mint_evaluator : public evaluator<badge_mint_evaluator> {
      public:
         typedef badge_mint_operation operation_type;

         void_result do_evaluate(const badge_mint_operation &o);

         minted_ip do_apply(const badge_mint_operation &o);

         const badge_state_object *_state = nullptr;
      };

      class badge_set_token_uri_evaluator : public evaluator<badge_set_token_uri_evaluator> {
      public:
         typedef badge_set_token_uri_operation operation_type;

         void_result do_evaluate(const badge_set_token_uri_operation &o);

         void_result do_apply(const badge_set_token_uri_operation &o);

         const badge_state_object *_state = nullptr;
      };

      class badge_transfer_admin_evaluator : public evaluator<badge_transfer_admin_evaluator> {
      public:
         typedef badge_transfer_admin_operation operation_type;

         void_result do_evaluate(const badge_transfer_admin_operation &o);

         void_result do_apply(const badge_transfer_admin_operation &o);

         const badge_state_object *_state = nullptr;
      };

      /**
       * Verify that an account administers the badge collection
       * @param d Database
       * @param caller Account attempting a gated operation
       * @return Badge state
       * @throws not_initialized if the collection is not initialized
       * @throws unauthorized_account if @p caller is not the administrator
       */
      const badge_state_object &verify_badge_admin(const database &d, const address &caller);

   }
} // soulbound::chain
