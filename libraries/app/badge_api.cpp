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

#include <soulbound/app/badge_api.hpp>

namespace soulbound {
   namespace app {

      string badge_api::token_uri(token_id_type) const {
         return _db.get_badge_state().metadata.token_uri;
      }

      bool badge_api::locked(token_id_type) const {
         return true;
      }

      address badge_api::owner_of(token_id_type token_id) const {
         return _db.get_token_owner(token_id);
      }

      uint64_t badge_api::balance_of(const address &owner) const {
         return _db.get_badge_balance(owner);
      }

      string badge_api::name() const {
         return _db.get_token_collection().name;
      }

      string badge_api::symbol() const {
         return _db.get_token_collection().symbol;
      }

      uint64_t badge_api::total_supply() const {
         return _db.get_total_supply();
      }

      string badge_api::contract_uri() const {
         return _db.get_badge_state().contract_uri;
      }

      address badge_api::admin() const {
         return _db.get_badge_state().admin;
      }

      optional<ip_id_type> badge_api::root_ip_id() const {
         return _db.get_badge_state().root_ip_id;
      }

      badge_metadata badge_api::metadata() const {
         return _db.get_badge_state().metadata;
      }

      bool badge_api::supports_interface(uint32_t interface_id) const {
         switch (interface_id) {
            case SOULBOUND_ERC165_INTERFACE_ID:
            case SOULBOUND_ERC721_INTERFACE_ID:
            case SOULBOUND_ERC721_METADATA_INTERFACE_ID:
            case SOULBOUND_ERC4906_INTERFACE_ID:
            case SOULBOUND_ERC5192_INTERFACE_ID:
               return true;
            default:
               return false;
         }
      }

      vector<ip_id_type> badge_api::parent_ip_ids(const ip_id_type &ip_id) const {
         return get_parent_ips(_db, ip_id);
      }

      vector<ip_id_type> badge_api::derivative_ip_ids(const ip_id_type &ip_id) const {
         return get_derivative_ips(_db, ip_id);
      }

      bool badge_api::has_license_terms(const ip_id_type &ip_id, const address &license_template,
                                        license_terms_id_type terms_id) const {
         return has_attached_license_terms(_db, ip_id, license_template, terms_id);
      }

   }
} // soulbound::app
