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

#include <soulbound/chain/database.hpp>

#include <soulbound/chain/badge_evaluator.hpp>
#include <soulbound/chain/token_evaluator.hpp>

#include <fc/log/logger.hpp>

namespace soulbound {
   namespace chain {

      database::database(const badge_contract_wiring &wiring)
         : _wiring(wiring) {
         try {
            SOULBOUND_ASSERT(!_wiring.self.is_zero(), zero_address_parameter,
                             "The badge contract should not have the zero address", ("self", _wiring.self));
            SOULBOUND_ASSERT(!_wiring.license_template.is_zero(), zero_address_parameter,
                             "The license template should not be the zero address",
                             ("license_template", _wiring.license_template));
            FC_ASSERT(_wiring.ip_registry, "An IP asset registry is required");
            FC_ASSERT(_wiring.licensing, "A licensing service is required");
            SOULBOUND_ASSERT(!_wiring.ip_registry->get_address().is_zero(), zero_address_parameter,
                             "The IP asset registry should not be the zero address",
                             ("ip_registry", _wiring.ip_registry->get_address()));
            SOULBOUND_ASSERT(!_wiring.licensing->get_address().is_zero(), zero_address_parameter,
                             "The licensing service should not be the zero address",
                             ("licensing", _wiring.licensing->get_address()));

            initialize_indexes();
            initialize_evaluators();
         } FC_CAPTURE_AND_RETHROW((wiring))
      }

      database::~database() {}

      void database::initialize_indexes() {
         add_index<token_collection_index>();
         add_index<badge_state_index>();
         add_index<token_index>();

         add_index<ip_asset_index>();
         add_index<license_terms_index>();
         add_index<license_attachment_index>();
         add_index<derivative_link_index>();
      }

      void database::initialize_evaluators() {
         _operation_evaluators.resize(operation::count());

         register_evaluator<badge_initialize_evaluator>();
         register_evaluator<badge_mint_root_evaluator>();
         register_evaluator<badge_mint_evaluator>();
         register_evaluator<badge_set_token_uri_evaluator>();
         register_evaluator<badge_transfer_admin_evaluator>();

         register_evaluator<token_approve_evaluator>();
         register_evaluator<token_set_approval_for_all_evaluator>();
         register_evaluator<token_transfer_from_evaluator>();
         register_evaluator<token_safe_transfer_from_evaluator>();
      }

      operation_result database::apply_operation(const operation &op) {
         try {
            // A rejected nested call must leave the active operation's list intact
            auto session = start_undo_session();
            _applied_ops.clear();
            try {
               operation_validate(op);

               const std::unique_ptr<op_evaluator> &eval = _operation_evaluators[op.which()];
               FC_ASSERT(eval, "No evaluator is registered for operation ${which}", ("which", op.which()));

               push_applied_operation(op);
               operation_result result = eval->evaluate(*this, op, true);

               session.commit();

               notify_applied_operations();
               return result;
            } catch (const fc::exception &) {
               _applied_ops.clear();
               throw;
            }
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void database::push_applied_operation(const operation &op) {
         _applied_ops.emplace_back(op);
      }

      void database::notify_applied_operations() {
         applied_operations(_applied_ops);
      }

      bool database::is_initialized() const {
         return find<badge_state_object>(badge_state_id()) != nullptr;
      }

      const badge_state_object &database::get_badge_state() const {
         const badge_state_object *state = find<badge_state_object>(badge_state_id());
         SOULBOUND_ASSERT(state != nullptr, not_initialized, "The badge collection is not initialized",
                          ("id", badge_state_id()));
         return *state;
      }

      const token_collection_object &database::get_token_collection() const {
         const token_collection_object *collection = find<token_collection_object>(token_collection_id());
         SOULBOUND_ASSERT(collection != nullptr, not_initialized, "The token collection is not initialized",
                          ("id", token_collection_id()));
         return *collection;
      }

   }
} // soulbound::chain
