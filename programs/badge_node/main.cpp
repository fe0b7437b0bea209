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

#include <soulbound/app/badge_commands.hpp>
#include <soulbound/badge_history/badge_history.hpp>
#include <soulbound/chain/database.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>

using namespace soulbound;
namespace bpo = boost::program_options;

namespace {

   protocol::digest_type parse_digest(const std::string &s) {
      if (s.empty()) {
         return protocol::digest_type();
      }
      return protocol::digest_type(s);
   }

   void print_result(const std::string &command, const fc::variant &result) {
      std::cout << fc::json::to_pretty_string(fc::mutable_variant_object()
                                                 ("command", command)
                                                 ("result", result)) << "\n";
   }

}

int main(int argc, char **argv) {
   try {
      bpo::options_description app_options("Soulbound Badge Node");
      bpo::options_description cfg_options("Soulbound Badge Node");
      app_options.add_options()
         ("help,h", "Print this help message and exit.")
         ("config-file,c", bpo::value<boost::filesystem::path>(), "Path to an INI configuration file")
         ("execute,e", bpo::value<std::vector<std::string>>()->composing(),
          "Command to execute, for example \"mint-root alice\" (may specify multiple times)");
      cfg_options.add_options()
         ("contract", bpo::value<std::string>()->default_value("soulbound-badge"),
          "Address or name of the badge contract")
         ("ip-asset-registry", bpo::value<std::string>()->default_value("ip-asset-registry"),
          "Address or name of the IP asset registry")
         ("licensing-module", bpo::value<std::string>()->default_value("licensing-module"),
          "Address or name of the licensing service")
         ("license-template", bpo::value<std::string>()->default_value("license-template"),
          "Address or name of the license template")
         ("license-terms-uri", bpo::value<std::string>()->default_value(""),
          "URI of the default license terms")
         ("default-license-terms-id", bpo::value<uint64_t>()->default_value(1),
          "Id of the default license terms")
         ("admin", bpo::value<std::string>()->default_value("admin"), "Address or name of the administrator")
         ("name", bpo::value<std::string>()->default_value("Soulbound Badge"), "Collection name")
         ("symbol", bpo::value<std::string>()->default_value("BADGE"), "Collection symbol")
         ("contract-uri", bpo::value<std::string>()->default_value(""), "Collection-level URI")
         ("token-uri", bpo::value<std::string>()->default_value(""), "URI shared by every badge")
         ("ip-metadata-uri", bpo::value<std::string>()->default_value(""), "URI of the IP metadata")
         ("ip-metadata-hash", bpo::value<std::string>()->default_value(""), "SHA-256 of the IP metadata, in hex")
         ("nft-metadata-hash", bpo::value<std::string>()->default_value(""), "SHA-256 of the token metadata, in hex");

      badge_history::badge_history history;
      bpo::options_description history_cli("badge_history");
      history.plugin_set_program_options(history_cli, cfg_options);
      app_options.add(cfg_options);

      bpo::variables_map options;
      bpo::store(bpo::parse_command_line(argc, argv, app_options), options);

      if (options.count("help")) {
         std::cout << app_options << "\n";
         return 0;
      }

      if (options.count("config-file")) {
         const boost::filesystem::path config_file = options["config-file"].as<boost::filesystem::path>();
         FC_ASSERT(boost::filesystem::exists(config_file), "Config file ${f} does not exist",
                   ("f", config_file.string()));
         bpo::store(bpo::parse_config_file<char>(config_file.string().c_str(), cfg_options, true), options);
      }
      bpo::notify(options);

      chain::badge_contract_wiring wiring;
      wiring.self = app::parse_account(options["contract"].as<std::string>());
      wiring.license_template = app::parse_account(options["license-template"].as<std::string>());
      wiring.default_license_terms_id = options["default-license-terms-id"].as<uint64_t>();

      auto registry = std::make_shared<chain::chain_ip_asset_registry>(
         app::parse_account(options["ip-asset-registry"].as<std::string>()));
      auto licensing = std::make_shared<chain::chain_licensing_service>(
         app::parse_account(options["licensing-module"].as<std::string>()));
      wiring.ip_registry = registry;
      wiring.licensing = licensing;

      chain::database db(wiring);

      history.plugin_initialize(db, options);

      const protocol::license_terms_id_type terms_id =
         licensing->register_license_terms(db, wiring.license_template,
                                           options["license-terms-uri"].as<std::string>());
      FC_ASSERT(terms_id == wiring.default_license_terms_id,
                "The default license terms were registered as ${terms_id} rather than ${expected}",
                ("terms_id", terms_id)("expected", wiring.default_license_terms_id));

      const protocol::address admin = app::parse_account(options["admin"].as<std::string>());

      protocol::badge_initialize_operation init;
      init.caller = admin;
      init.admin = admin;
      init.name = options["name"].as<std::string>();
      init.symbol = options["symbol"].as<std::string>();
      init.contract_uri = options["contract-uri"].as<std::string>();
      init.metadata.token_uri = options["token-uri"].as<std::string>();
      init.metadata.ip_metadata_uri = options["ip-metadata-uri"].as<std::string>();
      init.metadata.ip_metadata_hash = parse_digest(options["ip-metadata-hash"].as<std::string>());
      init.metadata.nft_metadata_hash = parse_digest(options["nft-metadata-hash"].as<std::string>());
      db.apply_operation(init);

      ilog("Badge collection ${name} ready at ${contract}",
           ("name", init.name)("contract", wiring.self));

      uint32_t failures = 0;
      if (options.count("execute")) {
         app::badge_command_runner runner(db, admin);
         failures = runner.execute_all(options["execute"].as<std::vector<std::string>>(), std::cout);
      }

      const auto mints = history.get_mints(0, options["badge-history-max-query-limit"].as<uint32_t>());
      print_result("summary", fc::mutable_variant_object()
                                 ("total_supply", db.get_total_supply())
                                 ("mints", fc::variant(mints, SOULBOUND_MAX_NESTED_OBJECTS))
                                 ("metadata_updates", history.get_metadata_update_count()));

      return failures == 0 ? 0 : 1;
   } catch (const fc::exception &e) {
      elog("Exiting with error:\n${e}", ("e", e.to_detail_string()));
      return 1;
   } catch (const std::exception &e) {
      elog("Exiting with error:\n${e}", ("e", e.what()));
      return 1;
   }
}
