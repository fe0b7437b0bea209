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

#include <soulbound/chain/ip_asset_object.hpp>

namespace soulbound {
   namespace chain {

      class database;

      /**
       * @brief Registers IP assets for newly minted badge tokens
       *
       * mint_and_register is a single coupled call: it mints a token in the badge ledger and registers
       * the IP asset bound to it.  Implementations throw on failure and leave the caller's undo session
       * to discard anything already written.
       */
      class ip_asset_registry {
      public:
         virtual ~ip_asset_registry() {}

         virtual address get_address() const = 0;

         /**
          * Mint a token to @p owner and register an IP asset for it
          * @return the new token id and IP id
          */
         virtual minted_ip mint_and_register(database &db,
                                             const address &owner,
                                             const string &token_uri,
                                             const string &ip_metadata_uri,
                                             const digest_type &ip_metadata_hash,
                                             const digest_type &nft_metadata_hash) = 0;
      };

      /**
       * @brief IP asset registry kept in the same object database as the badge ledger
       */
      class chain_ip_asset_registry : public ip_asset_registry {
      public:
         explicit chain_ip_asset_registry(const address &self) : _self(self) {}

         address get_address() const override { return _self; }

         minted_ip mint_and_register(database &db,
                                     const address &owner,
                                     const string &token_uri,
                                     const string &ip_metadata_uri,
                                     const digest_type &ip_metadata_hash,
                                     const digest_type &nft_metadata_hash) override;

         /// Deterministic IP id of a token
         static ip_id_type ip_id_for(const address &token_contract, token_id_type token_id);

      private:
         address _self;
      };

      const ip_asset_object *find_ip_asset(const database &db, const ip_id_type &ip_id);

      /**
       * @return the account controlling an IP asset, which is the current holder of its token
       */
      address get_ip_owner(const database &db, const ip_asset_object &ip);

   }
} // soulbound::chain
