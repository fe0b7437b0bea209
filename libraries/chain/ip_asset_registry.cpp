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

#include <soulbound/chain/ip_asset_registry.hpp>
#include <soulbound/chain/database.hpp>

#include <fc/crypto/ripemd160.hpp>

namespace soulbound {
   namespace chain {

      ip_id_type chain_ip_asset_registry::ip_id_for(const address &token_contract, token_id_type token_id) {
         return ip_id_type(fc::ripemd160::hash(std::string(token_contract) + ":" + std::to_string(token_id)));
      }

      minted_ip chain_ip_asset_registry::mint_and_register(database &db,
                                                           const address &owner,
                                                           const string &token_uri,
                                                           const string &ip_metadata_uri,
                                                           const digest_type &ip_metadata_hash,
                                                           const digest_type &nft_metadata_hash) {
         try {
            SOULBOUND_ASSERT(!owner.is_zero(), ip_registry_exception,
                             "Cannot register an IP asset held by the zero address", ("owner", owner));

            const address token_contract = db.get_wiring().self;
            const token_id_type token_id = db.mint_token(owner);
            const ip_id_type ip_id = ip_id_for(token_contract, token_id);

            const auto &idx = db.get_index_type<ip_asset_index>().indices().get<by_ip_id>();
            SOULBOUND_ASSERT(idx.find(ip_id) == idx.end(), ip_registry_exception,
                             "Token ${token_id} is already registered as IP asset ${ip_id}",
                             ("token_id", token_id)("ip_id", ip_id));

            db.create<ip_asset_object>([&](ip_asset_object &ip) {
               ip.ip_id = ip_id;
               ip.token_contract = token_contract;
               ip.token_id = token_id;
               ip.token_uri = token_uri;
               ip.ip_metadata_uri = ip_metadata_uri;
               ip.ip_metadata_hash = ip_metadata_hash;
               ip.nft_metadata_hash = nft_metadata_hash;
            });

            return minted_ip(token_id, ip_id);
         } FC_CAPTURE_AND_RETHROW((owner)(token_uri)(ip_metadata_uri))
      }

      const ip_asset_object *find_ip_asset(const database &db, const ip_id_type &ip_id) {
         const auto &idx = db.get_index_type<ip_asset_index>().indices().get<by_ip_id>();
         auto itr = idx.find(ip_id);
         if (itr == idx.end()) {
            return nullptr;
         }
         return &*itr;
      }

      address get_ip_owner(const database &db, const ip_asset_object &ip) {
         return db.get_token_owner(ip.token_id);
      }

   }
} // soulbound::chain
