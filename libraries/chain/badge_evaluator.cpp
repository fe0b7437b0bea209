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

#include <soulbound/chain/badge_evaluator.hpp>
#include <soulbound/chain/database.hpp>

#include <fc/log/logger.hpp>

namespace soulbound {
   namespace chain {

      const badge_state_object &verify_badge_admin(const database &d, const address &caller) {
         const badge_state_object &state = d.get_badge_state();
         SOULBOUND_ASSERT(caller == state.admin, unauthorized_account,
                          "Account ${caller} is not the badge administrator", ("caller", caller));
         return state;
      }

      void_result badge_initialize_evaluator::do_evaluate(const badge_initialize_operation &op) {
         try {
            const database &d = db();

            SOULBOUND_ASSERT(!d.is_initialized(), already_initialized,
                             "The badge collection is already initialized", ("caller", op.caller));
            SOULBOUND_ASSERT(!op.admin.is_zero(), invalid_owner,
                             "The administrator should not be the zero address", ("admin", op.admin));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_initialize_evaluator::do_apply(const badge_initialize_operation &op) {
         try {
            database &d = db();

            const token_collection_object &collection = d.create<token_collection_object>(
               [&op](token_collection_object &c) {
                  c.name = op.name;
                  c.symbol = op.symbol;
                  c.total_supply = 0;
               });
            FC_ASSERT(collection.id == token_collection_id(), "Unexpected id ${id} for the token collection",
                      ("id", collection.id));

            const badge_state_object &state = d.create<badge_state_object>([&op](badge_state_object &s) {
               s.admin = op.admin;
               s.contract_uri = op.contract_uri;
               s.metadata = op.metadata;
            });
            FC_ASSERT(state.id == badge_state_id(), "Unexpected id ${id} for the badge state", ("id", state.id));

            ilog("Badge collection ${name} (${symbol}) initialized with administrator ${admin}",
                 ("name", op.name)("symbol", op.symbol)("admin", op.admin));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_mint_root_evaluator::do_evaluate(const badge_mint_root_operation &op) {
         try {
            const database &d = db();

            _state = &verify_badge_admin(d, op.caller);

            SOULBOUND_ASSERT(!_state->root_ip_id.valid(), root_already_set,
                             "The root IP asset is already set to ${root}", ("root", _state->root_ip_id));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      minted_ip badge_mint_root_evaluator::do_apply(const badge_mint_root_operation &op) {
         try {
            database &d = db();
            const badge_contract_wiring &wiring = d.get_wiring();
            const badge_metadata metadata = _state->metadata;

            // The contract holds the new token until the root reference is recorded
            const minted_ip minted = d.get_ip_registry().mint_and_register(d, wiring.self,
                                                                           metadata.token_uri,
                                                                           metadata.ip_metadata_uri,
                                                                           metadata.ip_metadata_hash,
                                                                           metadata.nft_metadata_hash);

            d.get_licensing().attach_license_terms(d, wiring.self, minted.ip_id,
                                                   wiring.license_template, wiring.default_license_terms_id);

            d.modify(*_state, [&minted](badge_state_object &s) {
               s.root_ip_id = minted.ip_id;
            });

            d.transfer_token(wiring.self, op.recipient, minted.token_id);

            d.push_applied_operation(badge_minted_operation(op.recipient, minted.token_id, minted.ip_id));

            ilog("Root badge ${token_id} minted to ${recipient}, root IP asset is ${ip_id}",
                 ("token_id", minted.token_id)("recipient", op.recipient)("ip_id", minted.ip_id));

            return minted;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_mint_evaluator::do_evaluate(const badge_mint_operation &op) {
         try {
            const database &d = db();

            _state = &verify_badge_admin(d, op.caller);

            SOULBOUND_ASSERT(d.get_badge_balance(op.recipient) == 0, recipient_already_has_badge,
                             "Recipient ${recipient} already has a badge", ("recipient", op.recipient));
            SOULBOUND_ASSERT(_state->root_ip_id.valid(), root_not_set,
                             "A badge cannot be minted before the root badge", ("recipient", op.recipient));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      minted_ip badge_mint_evaluator::do_apply(const badge_mint_operation &op) {
         try {
            database &d = db();
            const badge_contract_wiring &wiring = d.get_wiring();
            const badge_metadata metadata = _state->metadata;
            const ip_id_type root_ip_id = *_state->root_ip_id;

            const minted_ip minted = d.get_ip_registry().mint_and_register(d, wiring.self,
                                                                           metadata.token_uri,
                                                                           metadata.ip_metadata_uri,
                                                                           metadata.ip_metadata_hash,
                                                                           metadata.nft_metadata_hash);

            // Every badge is a direct derivative of the root under the default terms
            const vector<ip_id_type> parent_ip_ids{root_ip_id};
            const vector<license_terms_id_type> license_terms_ids{wiring.default_license_terms_id};
            d.get_licensing().register_derivative(d, wiring.self, minted.ip_id, parent_ip_ids,
                                                  wiring.license_template, license_terms_ids,
                                                  vector<char>(), 0, 0, 0);

            d.transfer_token(wiring.self, op.recipient, minted.token_id);

            d.push_applied_operation(badge_minted_operation(op.recipient, minted.token_id, minted.ip_id));

            ilog("Badge ${token_id} minted to ${recipient} as IP asset ${ip_id}",
                 ("token_id", minted.token_id)("recipient", op.recipient)("ip_id", minted.ip_id));

            return minted;
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_set_token_uri_evaluator::do_evaluate(const badge_set_token_uri_operation &op) {
         try {
            _state = &verify_badge_admin(db(), op.caller);
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_set_token_uri_evaluator::do_apply(const badge_set_token_uri_operation &op) {
         try {
            database &d = db();

            d.modify(*_state, [&op](badge_state_object &s) {
               s.metadata.token_uri = op.token_uri;
            });

            // Every token resolves to the shared URI
            d.push_applied_operation(batch_metadata_update_operation(0, d.get_total_supply()));

            ilog("Token URI of every badge changed to ${uri}", ("uri", op.token_uri));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_transfer_admin_evaluator::do_evaluate(const badge_transfer_admin_operation &op) {
         try {
            _state = &verify_badge_admin(db(), op.caller);

            SOULBOUND_ASSERT(!op.new_admin.is_zero(), invalid_owner,
                             "The administrator should not be the zero address", ("new_admin", op.new_admin));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result badge_transfer_admin_evaluator::do_apply(const badge_transfer_admin_operation &op) {
         try {
            database &d = db();
            const address previous_admin = _state->admin;

            d.modify(*_state, [&op](badge_state_object &s) {
               s.admin = op.new_admin;
            });

            d.push_applied_operation(admin_transferred_operation(previous_admin, op.new_admin));

            ilog("Badge administration transferred from ${previous} to ${next}",
                 ("previous", previous_admin)("next", op.new_admin));

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

   }
} // soulbound::chain
