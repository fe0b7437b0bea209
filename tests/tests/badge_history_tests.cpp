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

#include <soulbound/badge_history/badge_history.hpp>

#include "../common/database_fixture.hpp"

using namespace soulbound::chain;
using namespace soulbound::chain::test;

namespace bpo = boost::program_options;

struct badge_history_fixture : database_fixture {
   soulbound::badge_history::badge_history history;

   badge_history_fixture() {
      initialize_history(5);
   }

   void initialize_history(uint32_t max_query_limit) {
      bpo::options_description cli;
      bpo::options_description cfg;
      history.plugin_set_program_options(cli, cfg);

      const std::string limit = std::to_string(max_query_limit);
      const char *argv[] = {"chain_test", "--badge-history-max-query-limit", limit.c_str()};
      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(3, argv, cli), options);
      bpo::notify(options);

      history.plugin_initialize(db, options);
   }
};

BOOST_FIXTURE_TEST_SUITE( badge_history_tests, badge_history_fixture )

/**
 * Every committed mint is recorded against its recipient and token
 */
BOOST_AUTO_TEST_CASE( records_mints ) {
   try {
      ACTORS((alice)(bob)(carol));

      BOOST_CHECK(!history.get_mint_by_recipient(alice).valid());
      BOOST_CHECK(!history.get_mint_by_token(0).valid());

      const minted_ip root = mint_root(alice);
      const minted_ip badge = mint(bob);

      auto root_record = history.get_mint_by_recipient(alice);
      BOOST_REQUIRE(root_record.valid());
      BOOST_CHECK_EQUAL(root_record->token_id, root.token_id);
      BOOST_CHECK(root_record->ip_id == root.ip_id);
      BOOST_CHECK(root_record->is_root);

      auto badge_record = history.get_mint_by_token(badge.token_id);
      BOOST_REQUIRE(badge_record.valid());
      BOOST_CHECK(badge_record->recipient == bob);
      BOOST_CHECK(badge_record->ip_id == badge.ip_id);
      BOOST_CHECK(!badge_record->is_root);

      BOOST_CHECK(!history.get_mint_by_recipient(carol).valid());
      BOOST_CHECK(!history.get_mint_by_recipient(badge_contract).valid());

   } FC_LOG_AND_RETHROW()
}

/**
 * Mint records are listed in mint order, paged by token id
 */
BOOST_AUTO_TEST_CASE( lists_mints_in_order ) {
   try {
      ACTORS((alice)(bob)(carol)(dave));

      mint_root(alice);
      mint(bob);
      mint(carol);
      mint(dave);

      auto all = history.get_mints(0, 5);
      BOOST_REQUIRE_EQUAL(all.size(), 4u);
      BOOST_CHECK(all[0].recipient == alice);
      BOOST_CHECK(all[1].recipient == bob);
      BOOST_CHECK(all[2].recipient == carol);
      BOOST_CHECK(all[3].recipient == dave);
      for (size_t i = 0; i < all.size(); ++i) {
         BOOST_CHECK_EQUAL(all[i].token_id, i);
      }

      auto page = history.get_mints(1, 2);
      BOOST_REQUIRE_EQUAL(page.size(), 2u);
      BOOST_CHECK(page[0].recipient == bob);
      BOOST_CHECK(page[1].recipient == carol);

      BOOST_CHECK(history.get_mints(4, 5).empty());
      BOOST_CHECK(history.get_mints(0, 0).empty());

      BOOST_TEST_MESSAGE("Queries are bounded by the configured limit");
      REQUIRE_EXCEPTION_WITH_TEXT(history.get_mints(0, 6), "At most");
      SOULBOUND_REQUIRE_THROW(history.get_mints(0, 6), fc::assert_exception);

   } FC_LOG_AND_RETHROW()
}

/**
 * Each token URI refresh is recorded with the URI it set
 */
BOOST_AUTO_TEST_CASE( records_metadata_updates ) {
   try {
      ACTORS((alice)(bob));

      BOOST_CHECK_EQUAL(history.get_metadata_update_count(), 0u);

      set_token_uri("ipfs://badge-v2.json");
      mint_root(alice);
      mint(bob);
      set_token_uri("ipfs://badge-v3.json");

      BOOST_CHECK_EQUAL(history.get_metadata_update_count(), 2u);
      auto updates = history.get_metadata_updates();
      BOOST_REQUIRE_EQUAL(updates.size(), 2u);
      BOOST_CHECK_EQUAL(updates[0].from_token_id, 0u);
      BOOST_CHECK_EQUAL(updates[0].to_token_id, 0u);
      BOOST_CHECK_EQUAL(updates[0].token_uri, "ipfs://badge-v2.json");
      BOOST_CHECK_EQUAL(updates[1].from_token_id, 0u);
      BOOST_CHECK_EQUAL(updates[1].to_token_id, 2u);
      BOOST_CHECK_EQUAL(updates[1].token_uri, "ipfs://badge-v3.json");

   } FC_LOG_AND_RETHROW()
}

/**
 * Rejected operations leave no record
 */
BOOST_AUTO_TEST_CASE( rejected_operations_are_not_recorded ) {
   try {
      ACTORS((alice)(bob)(mallory));

      SOULBOUND_REQUIRE_THROW(mint(bob), root_not_set);
      mint_root(alice);
      SOULBOUND_REQUIRE_THROW(mint(alice), recipient_already_has_badge);

      badge_mint_operation op;
      op.caller = mallory;
      op.recipient = bob;
      SOULBOUND_REQUIRE_THROW(db.apply_operation(op), unauthorized_account);

      badge_set_token_uri_operation uri_op;
      uri_op.caller = mallory;
      uri_op.token_uri = "ipfs://forged.json";
      SOULBOUND_REQUIRE_THROW(db.apply_operation(uri_op), unauthorized_account);

      BOOST_CHECK_EQUAL(history.get_mints(0, 5).size(), 1u);
      BOOST_CHECK(!history.get_mint_by_recipient(bob).valid());
      BOOST_CHECK_EQUAL(history.get_metadata_update_count(), 0u);

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_CASE( initializes_once ) {
   try {
      bpo::variables_map options;
      SOULBOUND_REQUIRE_THROW(history.plugin_initialize(db, options), fc::assert_exception);
      BOOST_CHECK_EQUAL(history.plugin_name(), "badge_history");

   } FC_LOG_AND_RETHROW()
}

BOOST_AUTO_TEST_SUITE_END()
