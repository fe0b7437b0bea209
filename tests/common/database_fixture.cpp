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

#include "database_fixture.hpp"

namespace soulbound { namespace chain { namespace test {

database_fixture::database_fixture()
   : database_fixture(nullptr, true)
{
}

database_fixture::database_fixture(std::shared_ptr<chain_licensing_service> licensing_service, bool initialize)
   : registry(std::make_shared<chain_ip_asset_registry>(registry_address)),
     licensing(licensing_service ? licensing_service : std::make_shared<chain_licensing_service>(licensing_address)),
     db(create_database()),
     api(db)
{
   try {
      const license_terms_id_type terms_id = licensing->register_license_terms(db, license_template,
                                                                               "ipfs://default-terms");
      FC_ASSERT(terms_id == default_terms_id, "Unexpected default terms id ${id}", ("id", terms_id));

      if (initialize) {
         initialize_collection();
      }
   } FC_LOG_AND_RETHROW()
}

database_fixture::~database_fixture()
{
}

database& database_fixture::create_database()
{
   db_ptr.reset(new database(make_wiring()));
   return *db_ptr;
}

badge_contract_wiring database_fixture::make_wiring() const
{
   badge_contract_wiring wiring;
   wiring.self = badge_contract;
   wiring.license_template = license_template;
   wiring.default_license_terms_id = default_terms_id;
   wiring.ip_registry = registry;
   wiring.licensing = licensing;
   return wiring;
}

badge_metadata database_fixture::default_metadata() const
{
   badge_metadata metadata;
   metadata.token_uri = "ipfs://badge.json";
   metadata.ip_metadata_uri = "ipfs://badge-ip.json";
   metadata.ip_metadata_hash = fc::sha256::hash(string("badge-ip-metadata"));
   metadata.nft_metadata_hash = fc::sha256::hash(string("badge-nft-metadata"));
   return metadata;
}

badge_initialize_operation database_fixture::make_initialize_operation() const
{
   badge_initialize_operation op;
   op.caller = admin;
   op.admin = admin;
   op.name = "Member Badge";
   op.symbol = "MBR";
   op.contract_uri = "ipfs://collection.json";
   op.metadata = default_metadata();
   return op;
}

void database_fixture::initialize_collection()
{
   db.apply_operation(make_initialize_operation());
}

minted_ip database_fixture::mint_root(const address& recipient)
{
   badge_mint_root_operation op;
   op.caller = admin;
   op.recipient = recipient;
   return db.apply_operation(op).get<minted_ip>();
}

minted_ip database_fixture::mint(const address& recipient)
{
   badge_mint_operation op;
   op.caller = admin;
   op.recipient = recipient;
   return db.apply_operation(op).get<minted_ip>();
}

void database_fixture::set_token_uri(const string& token_uri)
{
   badge_set_token_uri_operation op;
   op.caller = admin;
   op.token_uri = token_uri;
   db.apply_operation(op);
}

void database_fixture::transfer_admin(const address& new_admin)
{
   badge_transfer_admin_operation op;
   op.caller = api.admin();
   op.new_admin = new_admin;
   db.apply_operation(op);
}

} } } // soulbound::chain::test
