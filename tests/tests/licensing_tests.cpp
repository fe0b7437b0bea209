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

#include <boost/test/unit_test.hpp>

#include <soulbound/chain/database.hpp>
#include <soulbound/chain/ip_asset_registry.hpp>
#include <soulbound/chain/licensing_service.hpp>
#include <soulbound/chain/token_object.hpp>

#include "../common/database_fixture.hpp"

using namespace soulbound::chain;
using namespace soulbound::chain::test;

namespace {

   /// Records the derivative and then refuses it
   class rejecting_derivative_licensing : public chain_licensing_service {
   public:
      explicit rejecting_derivative_licensing(const address &self) : chain_licensing_service(self) {}

      void register_derivative(database &db,
                               const address &caller,
                               const ip_id_type &child_ip_id,
                               const vector<ip_id_type> &parent_ip_ids,
                               const address &license_template,
                               const vector<license_terms_id_type> &license_terms_ids,
                               const vector<char> &royalty_context,
                               uint64_t minimum_royalty,
                               uint64_t max_minting_fee,
                               uint32_t max_revenue_share) override {
         chain_licensing_service::register_derivative(db, caller, child_ip_id, parent_ip_ids, license_template,
                                                      license_terms_ids, royalty_context, minimum_royalty,
                                                      max_minting_fee, max_revenue_share);
         FC_THROW_EXCEPTION(licensing_exception, "Derivative registration refused");
      }
   };

   /// Attaches the terms and then refuses them
   class rejecting_attach_licensing : public chain_licensing_service {
   public:
      explicit rejecting_attach_licensing(const address &self) : chain_licensing_service(self) {}

      void attach_license_terms(database &db,
                                const address &caller,
                                const ip_id_type &ip_id,
                                const address &license_template,
                                license_terms_id_type terms_id) override {
         chain_licensing_service::attach_license_terms(db, caller, ip_id, license_template, terms_id);
         FC_THROW_EXCEPTION(licensing_exception, "Attachment refused");
      }
   };

   /// Calls back into the badge contract while attaching terms and swallows the refusal
   class reentrant_licensing : public chain_licensing_service {
   public:
      explicit reentrant_licensing(const address &self) : chain_licensing_service(self) {}

      void attach_license_terms(database &db,
                                const address &caller,
                                const ip_id_type &ip_id,
                                const address &license_template,
                                license_terms_id_type terms_id) override {
         badge_set_token_uri_operation op;
         op.caller = db.get_badge_state().admin;
         op.token_uri = "ipfs://reentrant.json";
         try {
            db.apply_operation(op);
         } catch (const fc::assert_exception &) {
            ++rejected_calls;
         }
         chain_licensing_service::attach_license_terms(db, caller, ip_id, license_template, terms_id);
      }

      uint32_t rejected_calls = 0;
   };

   struct reentrant_fixture : database_fixture {
      reentrant_fixture()
         : database_fixture(std::make_shared<reentrant_licensing>(address::from_seed("licensing-module")), true) {}

      reentrant_licensing &reentrant() { return static_cast<reentrant_licensing &>(*licensing); }
   };

   struct rejecting_derivative_fixture : database_fixture {
      rejecting_derivative_fixture()
         : database_fixture(std::make_shared<rejecting_derivative_licensing>(address::from_seed("licensing-module")),
                            true) {}
   };

   struct rejecting_attach_fixture : database_fixture {
      rejecting_attach_fixture()
         : database_fixture(std::make_shared<rejecting_attach_licensing>(address::from_seed("licensing-module")),
                            true) {}
   };

   object_id_type next_id(const database &db, uint8_t space, uint8_t type) {
      return db.get_index(space, type).get_next_id();
   }

   template<typename IndexType>
   size_t object_count(const database &db) {
      return db.get_index_type<IndexType>().indices().size();
   }

}

BOOST_FIXTURE_TEST_SUITE( licensing_tests, database_fixture )

/**
 * Terms ids are assigned from 1 within each template
 */
BOOST_AUTO_TEST_CASE( register_license_terms ) {
   try {
      BOOST_CHECK(is_license_terms_registered(db, license_template, 1));
      BOOST_CHECK(!is_license_terms_registered(db, license_template, 2));

      BOOST_CHECK_EQUAL(licensing->register_license_terms(db, license_template, "ipfs://commercial"), 2u);
      BOOST_CHECK(is_license_terms_registered(db, license_template, 2));

      const address other_template = address::from_seed("other-template");
      BOOST_CHECK_EQUAL(licensing->register_license_terms(db, other_template, "ipfs://other"), 1u);
      BOOST_CHECK(is_license_terms_registered(db, other_template, 1));

      SOULBOUND_REQUIRE_THROW(licensing->register_license_terms(db, address(), "ipfs://none"), licensing_exception);

   } FC_LOG_AND_RETHROW()
}

/**
 * Attaching terms requires control of the IP asset and published terms
 */
BOOST_AUTO_TEST_CASE( attach_license_terms_rejections ) {
   try {
      ACTORS((alice)(carol));

      const minted_ip root = mint_root(alice);
      const minted_ip fresh = registry->mint_and_register(db, carol, "ipfs://fresh.json", "ipfs://fresh-ip.json",
                                                          digest_type(), digest_type());

      BOOST_TEST_MESSAGE("Unknown IP asset");
      const ip_id_type unknown = chain_ip_asset_registry::ip_id_for(badge_contract, 999);
      REQUIRE_EXCEPTION_WITH_TEXT(licensing->attach_license_terms(db, carol, unknown, license_template, 1),
                                  "is not registered");

      BOOST_TEST_MESSAGE("Caller does not control the IP asset");
      REQUIRE_EXCEPTION_WITH_TEXT(licensing->attach_license_terms(db, alice, fresh.ip_id, license_template, 1),
                                  "does not control");

      BOOST_TEST_MESSAGE("Terms were never published");
      REQUIRE_EXCEPTION_WITH_TEXT(licensing->attach_license_terms(db, carol, fresh.ip_id, license_template, 5),
                                  "are not registered");

      BOOST_TEST_MESSAGE("Terms are already attached to the root");
      REQUIRE_EXCEPTION_WITH_TEXT(licensing->attach_license_terms(db, alice, root.ip_id, license_template, 1),
                                  "already attached");

      BOOST_CHECK(!has_attached_license_terms(db, fresh.ip_id, license_template, 1));
      licensing->attach_license_terms(db, carol, fresh.ip_id, license_template, 1);
      BOOST_CHECK(has_attached_license_terms(db, fresh.ip_id, license_template, 1));

   } FC_LOG_AND_RETHROW()
}

/**
 * Derivative registration validates the child, the parents and the terms
 */
BOOST_AUTO_TEST_CASE( register_derivative_rejections ) {
   try {
      ACTORS((alice)(bob)(carol)(dave));

      const minted_ip root = mint_root(alice);
      const minted_ip badge = mint(bob);
      const minted_ip child = registry->mint_and_register(db, carol, "ipfs://child.json", "ipfs://child-ip.json",
                                                          digest_type(), digest_type());
      const minted_ip unlicensed = registry->mint_and_register(db, dave, "ipfs://dave.json", "ipfs://dave-ip.json",
                                                               digest_type(), digest_type());
      const ip_id_type unknown = chain_ip_asset_registry::ip_id_for(badge_contract, 999);

      auto register_child = [&](const address &caller, const vector<ip_id_type> &parents,
                                const vector<license_terms_id_type> &terms) {
         licensing->register_derivative(db, caller, child.ip_id, parents, license_template, terms,
                                        vector<char>(), 0, 0, 0);
      };

      REQUIRE_EXCEPTION_WITH_TEXT(register_child(alice, {root.ip_id}, {1}), "does not control");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {}, {}), "at least one parent");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {root.ip_id}, {1, 1}), "parents were given");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {child.ip_id}, {1}), "its own parent");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {root.ip_id, root.ip_id}, {1, 1}), "more than once");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {unknown}, {1}), "is not registered");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {unlicensed.ip_id}, {1}), "are not attached");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {root.ip_id}, {2}), "are not attached");
      SOULBOUND_REQUIRE_THROW(register_child(carol, {root.ip_id}, {2}), licensing_exception);

      BOOST_CHECK(get_parent_ips(db, child.ip_id).empty());
      BOOST_CHECK(!has_attached_license_terms(db, child.ip_id, license_template, 1));

      BOOST_TEST_MESSAGE("A derivative can have more than one parent");
      register_child(carol, {root.ip_id, badge.ip_id}, {1, 1});
      BOOST_CHECK(get_parent_ips(db, child.ip_id) == (vector<ip_id_type>{root.ip_id, badge.ip_id}) ||
                  get_parent_ips(db, child.ip_id) == (vector<ip_id_type>{badge.ip_id, root.ip_id}));
      BOOST_CHECK(has_attached_license_terms(db, child.ip_id, license_template, 1));
      BOOST_CHECK_EQUAL(get_derivative_ips(db, badge.ip_id).size(), 1u);
      BOOST_CHECK_EQUAL(get_derivative_ips(db, root.ip_id).size(), 2u);

      BOOST_TEST_MESSAGE("A derivative is registered only once");
      REQUIRE_EXCEPTION_WITH_TEXT(register_child(carol, {root.ip_id}, {1}), "already a derivative");

      BOOST_TEST_MESSAGE("An IP asset with its own terms cannot become a derivative");
      licensing->attach_license_terms(db, dave, unlicensed.ip_id, license_template, 1);
      REQUIRE_EXCEPTION_WITH_TEXT(
         licensing->register_derivative(db, dave, unlicensed.ip_id, {root.ip_id}, license_template, {1},
                                        vector<char>(), 0, 0, 0),
         "already has license terms attached");

   } FC_LOG_AND_RETHROW()
}

/**
 * An IP asset is controlled by whoever holds its token
 */
BOOST_AUTO_TEST_CASE( ip_asset_follows_token_holder ) {
   try {
      ACTORS((alice)(bob));

      const minted_ip root = mint_root(alice);
      const minted_ip badge = mint(bob);

      const ip_asset_object *root_ip = find_ip_asset(db, root.ip_id);
      BOOST_REQUIRE(root_ip != nullptr);
      BOOST_CHECK(root_ip->token_contract == badge_contract);
      BOOST_CHECK_EQUAL(root_ip->token_id, root.token_id);
      BOOST_CHECK_EQUAL(root_ip->token_uri, "ipfs://badge.json");
      BOOST_CHECK_EQUAL(root_ip->ip_metadata_uri, "ipfs://badge-ip.json");
      BOOST_CHECK(root_ip->ip_metadata_hash == default_metadata().ip_metadata_hash);
      BOOST_CHECK(root_ip->nft_metadata_hash == default_metadata().nft_metadata_hash);
      BOOST_CHECK(get_ip_owner(db, *root_ip) == alice);

      const ip_asset_object *badge_ip = find_ip_asset(db, badge.ip_id);
      BOOST_REQUIRE(badge_ip != nullptr);
      BOOST_CHECK(get_ip_owner(db, *badge_ip) == bob);
      BOOST_CHECK(badge.ip_id == chain_ip_asset_registry::ip_id_for(badge_contract, badge.token_id));

      BOOST_CHECK(find_ip_asset(db, chain_ip_asset_registry::ip_id_for(badge_contract, 2)) == nullptr);

      SOULBOUND_REQUIRE_THROW(registry->mint_and_register(db, address(), "", "", digest_type(), digest_type()),
                              ip_registry_exception);

   } FC_LOG_AND_RETHROW()
}

/**
 * A root mint whose default terms were never published leaves nothing behind
 */
BOOST_AUTO_TEST_CASE( mint_root_with_unpublished_terms_is_atomic ) {
   try {
      ACTORS((alice));

      badge_contract_wiring wiring = make_wiring();
      wiring.default_license_terms_id = 2;
      database other(wiring);

      badge_initialize_operation init = make_initialize_operation();
      other.apply_operation(init);

      const object_id_type token_next = next_id(other, protocol_ids, token_object_type);
      const object_id_type ip_next = next_id(other, ip_registry_ids, ip_asset_object_type);

      badge_mint_root_operation op;
      op.caller = admin;
      op.recipient = alice;
      SOULBOUND_REQUIRE_THROW(other.apply_operation(op), licensing_exception);

      app::badge_api other_api(other);
      BOOST_CHECK(!other_api.root_ip_id().valid());
      BOOST_CHECK_EQUAL(other_api.total_supply(), 0u);
      BOOST_CHECK_EQUAL(other_api.balance_of(alice), 0u);
      BOOST_CHECK_EQUAL(other_api.balance_of(badge_contract), 0u);
      BOOST_CHECK(other.find_token(0) == nullptr);
      BOOST_CHECK(find_ip_asset(other, chain_ip_asset_registry::ip_id_for(badge_contract, 0)) == nullptr);
      BOOST_CHECK(next_id(other, protocol_ids, token_object_type) == token_next);
      BOOST_CHECK(next_id(other, ip_registry_ids, ip_asset_object_type) == ip_next);
      BOOST_CHECK(other.get_applied_operations().empty());

      BOOST_TEST_MESSAGE("Publishing the terms lets the root mint succeed with the same token id");
      licensing->register_license_terms(other, license_template, "ipfs://terms-1");
      licensing->register_license_terms(other, license_template, "ipfs://terms-2");
      const minted_ip root = other.apply_operation(op).get<minted_ip>();
      BOOST_CHECK_EQUAL(root.token_id, 0u);
      BOOST_CHECK(other_api.owner_of(0) == alice);
      BOOST_CHECK(has_attached_license_terms(other, root.ip_id, license_template, 2));

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * A licensing refusal during a mint rolls back the token, the IP asset and the links
 */
BOOST_FIXTURE_TEST_CASE( mint_is_atomic_when_derivative_is_refused, rejecting_derivative_fixture ) {
   try {
      ACTORS((alice)(bob));

      const minted_ip root = mint_root(alice);

      const object_id_type token_next = next_id(db, protocol_ids, token_object_type);
      const object_id_type ip_next = next_id(db, ip_registry_ids, ip_asset_object_type);
      const object_id_type link_next = next_id(db, ip_registry_ids, derivative_link_object_type);
      const object_id_type attachment_next = next_id(db, ip_registry_ids, license_attachment_object_type);
      const size_t attachments = object_count<license_attachment_index>(db);

      REQUIRE_EXCEPTION_WITH_TEXT(mint(bob), "Derivative registration refused");
      SOULBOUND_REQUIRE_THROW(mint(bob), licensing_exception);

      BOOST_CHECK_EQUAL(api.total_supply(), 1u);
      BOOST_CHECK_EQUAL(api.balance_of(bob), 0u);
      BOOST_CHECK_EQUAL(api.balance_of(badge_contract), 0u);
      BOOST_CHECK(db.find_token(1) == nullptr);
      BOOST_CHECK(find_ip_asset(db, chain_ip_asset_registry::ip_id_for(badge_contract, 1)) == nullptr);
      BOOST_CHECK(get_derivative_ips(db, root.ip_id).empty());
      BOOST_CHECK_EQUAL(object_count<derivative_link_index>(db), 0u);
      BOOST_CHECK_EQUAL(object_count<license_attachment_index>(db), attachments);

      BOOST_CHECK(next_id(db, protocol_ids, token_object_type) == token_next);
      BOOST_CHECK(next_id(db, ip_registry_ids, ip_asset_object_type) == ip_next);
      BOOST_CHECK(next_id(db, ip_registry_ids, derivative_link_object_type) == link_next);
      BOOST_CHECK(next_id(db, ip_registry_ids, license_attachment_object_type) == attachment_next);
      BOOST_CHECK(db.get_applied_operations().empty());

      BOOST_CHECK(api.root_ip_id().valid());
      BOOST_CHECK(*api.root_ip_id() == root.ip_id);
      BOOST_CHECK(api.owner_of(root.token_id) == alice);

   } FC_LOG_AND_RETHROW()
}

/**
 * A licensing refusal during the root mint leaves the root unset
 */
BOOST_FIXTURE_TEST_CASE( mint_root_is_atomic_when_attachment_is_refused, rejecting_attach_fixture ) {
   try {
      ACTORS((alice));

      const object_id_type token_next = next_id(db, protocol_ids, token_object_type);

      SOULBOUND_REQUIRE_THROW(mint_root(alice), licensing_exception);

      BOOST_CHECK(!api.root_ip_id().valid());
      BOOST_CHECK_EQUAL(api.total_supply(), 0u);
      BOOST_CHECK_EQUAL(api.balance_of(alice), 0u);
      BOOST_CHECK(db.find_token(0) == nullptr);
      BOOST_CHECK_EQUAL(object_count<ip_asset_index>(db), 0u);
      BOOST_CHECK_EQUAL(object_count<license_attachment_index>(db), 0u);
      BOOST_CHECK(next_id(db, protocol_ids, token_object_type) == token_next);

      BOOST_TEST_MESSAGE("Every later mint still requires the root");
      SOULBOUND_REQUIRE_THROW(mint(alice), root_not_set);

   } FC_LOG_AND_RETHROW()
}

/**
 * A collaborator calling back into the contract is refused without disturbing the running operation
 */
BOOST_FIXTURE_TEST_CASE( reentrant_call_keeps_applied_operations, reentrant_fixture ) {
   try {
      ACTORS((alice));

      const minted_ip root = mint_root(alice);
      BOOST_CHECK_EQUAL(reentrant().rejected_calls, 1u);

      const vector<operation> &applied = db.get_applied_operations();
      BOOST_REQUIRE_EQUAL(applied.size(), 2u);
      BOOST_CHECK_EQUAL(applied[0].which(), operation::tag<badge_mint_root_operation>::value);
      BOOST_REQUIRE_EQUAL(applied[1].which(), operation::tag<badge_minted_operation>::value);
      BOOST_CHECK(applied[1].get<badge_minted_operation>().recipient == alice);
      BOOST_CHECK(applied[1].get<badge_minted_operation>().token_id == root.token_id);

      BOOST_CHECK_EQUAL(api.token_uri(0), "ipfs://badge.json");
      BOOST_CHECK(api.owner_of(root.token_id) == alice);

   } FC_LOG_AND_RETHROW()
}
