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

#include <soulbound/chain/database.hpp>

namespace soulbound {
   namespace app {
      using namespace soulbound::chain;

      /**
       * @brief Read-only queries of a badge collection
       *
       * None of these require authorization.  Queries of the collection fields throw not_initialized
       * before the collection is initialized.
       */
      class badge_api {
      public:
         explicit badge_api(const database &db) : _db(db) {}

         /**
          * @brief Get the metadata URI of a token
          * @param token_id Token ID, which is not checked for existence
          * @return The URI shared by every badge
          */
         string token_uri(token_id_type token_id) const;

         /**
          * @brief Whether a token is locked to its holder
          * @param token_id Token ID, which is not checked for existence
          * @return Always true
          */
         bool locked(token_id_type token_id) const;

         address owner_of(token_id_type token_id) const;

         uint64_t balance_of(const address &owner) const;

         string name() const;

         string symbol() const;

         uint64_t total_supply() const;

         string contract_uri() const;

         address admin() const;

         /// @return the root IP asset, unset until the root badge is minted
         optional<ip_id_type> root_ip_id() const;

         badge_metadata metadata() const;

         /**
          * @brief Interface discovery
          * @param interface_id Four-byte interface identifier
          */
         bool supports_interface(uint32_t interface_id) const;

         /// @{ @group Provenance graph
         vector<ip_id_type> parent_ip_ids(const ip_id_type &ip_id) const;

         vector<ip_id_type> derivative_ip_ids(const ip_id_type &ip_id) const;

         bool has_license_terms(const ip_id_type &ip_id, const address &license_template,
                                license_terms_id_type terms_id) const;
         /// @}

      private:
         const database &_db;
      };

   }
} // soulbound::app
