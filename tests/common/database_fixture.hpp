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

#include <soulbound/app/badge_api.hpp>
#include <soulbound/chain/database.hpp>
#include <soulbound/chain/exceptions.hpp>

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/test/unit_test.hpp>

#include <iostream>
#include <memory>

#define REQUIRE_EXCEPTION_WITH_TEXT(op, exc_text)                 \
{                                                                 \
   try                                                            \
   {                                                              \
      op;                                                         \
      BOOST_FAIL(std::string("Expected an exception with \"") +   \
                 std::string(exc_text) +                          \
                 std::string("\" but none thrown"));              \
   }                                                              \
   catch (fc::exception& ex)                                      \
   {                                                              \
      std::string what = ex.to_string(                            \
            fc::log_level(fc::log_level::all));                   \
      if (what.find(exc_text) == std::string::npos)               \
      {                                                           \
         BOOST_FAIL( std::string("Expected \"") +                 \
                     std::string(exc_text) +                      \
                     std::string("\" but got \"") +               \
                     std::string(what) );                         \
      }                                                           \
   }                                                              \
}                                                                 \

#define SOULBOUND_REQUIRE_THROW( expr, exc_type )         \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   BOOST_TEST_MESSAGE( "SOULBOUND_REQUIRE_THROW " << req_throw_info ); \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
}

#define ACTOR(name) \
   const soulbound::protocol::address name = soulbound::protocol::address::from_seed(BOOST_PP_STRINGIZE(name)); \
   (void)name;

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

namespace soulbound { namespace chain { namespace test {

/**
 * A badge contract wired to the in-process registry and licensing service, with the default license
 * terms published as terms 1 and the collection initialized by the administrator.
 */
struct database_fixture {
   const address badge_contract = address::from_seed("badge-contract");
   const address registry_address = address::from_seed("ip-asset-registry");
   const address licensing_address = address::from_seed("licensing-module");
   const address license_template = address::from_seed("license-template");
   const address admin = address::from_seed("admin");

   const license_terms_id_type default_terms_id = 1;

   std::shared_ptr<chain_ip_asset_registry> registry;
   std::shared_ptr<chain_licensing_service> licensing;

   std::unique_ptr<database> db_ptr;
   database& db;
   app::badge_api api;

   database_fixture();
   virtual ~database_fixture();

   badge_contract_wiring make_wiring() const;

   badge_metadata default_metadata() const;

   badge_initialize_operation make_initialize_operation() const;

   void initialize_collection();

   minted_ip mint_root(const address& recipient);
   minted_ip mint(const address& recipient);
   void set_token_uri(const string& token_uri);
   void transfer_admin(const address& new_admin);

protected:
   /**
    * @param licensing_service Licensing service to wire in place of the default
    * @param initialize Whether to initialize the collection
    */
   database_fixture(std::shared_ptr<chain_licensing_service> licensing_service, bool initialize);

private:
   database& create_database();
};

/// Fixture whose collection has not been initialized
struct uninitialized_database_fixture : database_fixture {
   uninitialized_database_fixture() : database_fixture(nullptr, false) {}
};

} } } // soulbound::chain::test
