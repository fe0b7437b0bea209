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

#include <soulbound/chain/badge_object.hpp>
#include <soulbound/chain/evaluator.hpp>
#include <soulbound/chain/ip_asset_registry.hpp>
#include <soulbound/chain/licensing_service.hpp>
#include <soulbound/chain/token_object.hpp>

#include <soulbound/db/object_database.hpp>

#include <boost/signals2/signal.hpp>

#include <memory>

namespace soulbound {
   namespace chain {

      /**
       * @brief Parameters fixed when a badge contract is constructed
       *
       * The wiring is shared by every collection deployed from the same code instance; the state of an
       * individual collection is created later by the initialize operation.
       */
      struct badge_contract_wiring {
         /// Address of the badge contract itself, the temporary holder of every freshly minted token
         address self;

         /// License template of the default terms
         address license_template;

         /// Terms attached to the root and inherited by every derivative
         license_terms_id_type default_license_terms_id = 0;

         std::shared_ptr<ip_asset_registry> ip_registry;
         std::shared_ptr<licensing_service> licensing;
      };

      /**
       *   @class database
       *   @brief tracks the state of a soulbound badge collection
       *
       *   Every public entry point is an operation applied with apply_operation().  An operation is
       *   validated, evaluated and applied inside a single undo session: when anything throws, including
       *   the IP asset registry or the licensing service, every object written during the operation is
       *   restored and the exception propagates to the caller.
       */
      class database : public db::object_database {
      public:
         /**
          * @throws zero_address_parameter if the contract, template or a collaborator has the zero address
          */
         explicit database(const badge_contract_wiring &wiring);

         ~database() override;

         /**
          * Apply an operation atomically
          * @return the result of the operation's evaluator
          */
         operation_result apply_operation(const operation &op);

         /**
          *  This signal is emitted after an operation is committed, with the operation followed by the
          *  virtual operations it produced.
          */
         boost::signals2::signal<void(const vector<operation> &)> applied_operations;

         /**
          * Record a virtual operation produced by the operation being applied
          */
         void push_applied_operation(const operation &op);

         /// Operations produced by the last committed operation
         const vector<operation> &get_applied_operations() const { return _applied_ops; }

         const badge_contract_wiring &get_wiring() const { return _wiring; }

         ip_asset_registry &get_ip_registry() const { return *_wiring.ip_registry; }

         licensing_service &get_licensing() const { return *_wiring.licensing; }

         /// @{ @group Badge state
         bool is_initialized() const;

         /// @throws not_initialized before the collection is initialized
         const badge_state_object &get_badge_state() const;

         /// @throws not_initialized before the collection is initialized
         const token_collection_object &get_token_collection() const;
         /// @}

         /// @{ @group Token ledger, see db_tokens.cpp
         /// These primitives perform no authorization and bypass the locked transfer operations.  They
         /// are open to anything holding a mutable database, such as the IP asset registry and the
         /// evaluators; public callers go through apply_operation.

         /**
          * Mint the next token id to an account
          * @throws invalid_receiver if @p to is the zero address
          */
         token_id_type mint_token(const address &to);

         /**
          * Move a token between accounts without any approval check.
          * The mint evaluators use it to release a token from the contract's custody.
          * @throws nonexistent_token, incorrect_owner, invalid_receiver
          */
         void transfer_token(const address &from, const address &to, token_id_type token_id);

         const token_object *find_token(token_id_type token_id) const;

         /// @throws nonexistent_token
         address get_token_owner(token_id_type token_id) const;

         /// @throws invalid_owner for the zero address
         uint64_t get_badge_balance(const address &owner) const;

         uint64_t get_total_supply() const;
         /// @}

      private:
         void initialize_indexes();

         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator() {
            _operation_evaluators[operation::tag<typename EvaluatorType::operation_type>::value].reset(
               new op_evaluator_impl<EvaluatorType>());
         }

         void notify_applied_operations();

         badge_contract_wiring _wiring;
         vector<std::unique_ptr<op_evaluator>> _operation_evaluators;
         vector<operation> _applied_ops;
      };

   }
} // soulbound::chain

FC_REFLECT( soulbound::chain::badge_contract_wiring, (self)(license_template)(default_license_terms_id) )
