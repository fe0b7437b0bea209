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
       * @brief Attaches license terms to IP assets and links derivatives to their parents
       */
      class licensing_service {
      public:
         virtual ~licensing_service() {}

         virtual address get_address() const = 0;

         /**
          * Attach a set of license terms to an IP asset
          * @param caller Account making the call, which must control the IP asset
          */
         virtual void attach_license_terms(database &db,
                                           const address &caller,
                                           const ip_id_type &ip_id,
                                           const address &license_template,
                                           license_terms_id_type terms_id) = 0;

         /**
          * Register @p child_ip_id as a licensed derivative of each of @p parent_ip_ids
          * @param caller Account making the call, which must control the child
          * @param license_terms_ids Terms of each parent, in the same order as the parents
          */
         virtual void register_derivative(database &db,
                                          const address &caller,
                                          const ip_id_type &child_ip_id,
                                          const vector<ip_id_type> &parent_ip_ids,
                                          const address &license_template,
                                          const vector<license_terms_id_type> &license_terms_ids,
                                          const vector<char> &royalty_context,
                                          uint64_t minimum_royalty,
                                          uint64_t max_minting_fee,
                                          uint32_t max_revenue_share) = 0;
      };

      /**
       * @brief Licensing service kept in the same object database as the badge ledger
       *
       * Terms must be published with register_license_terms before they can be attached.  A
       * derivative inherits the terms under which it was derived from each of its parents.
       */
      class chain_licensing_service : public licensing_service {
      public:
         explicit chain_licensing_service(const address &self) : _self(self) {}

         address get_address() const override { return _self; }

         /**
          * Publish license terms under a template
          * @return the terms id, assigned sequentially from 1 within the template
          */
         virtual license_terms_id_type register_license_terms(database &db,
                                                              const address &license_template,
                                                              const string &terms_uri);

         void attach_license_terms(database &db,
                                   const address &caller,
                                   const ip_id_type &ip_id,
                                   const address &license_template,
                                   license_terms_id_type terms_id) override;

         void register_derivative(database &db,
                                  const address &caller,
                                  const ip_id_type &child_ip_id,
                                  const vector<ip_id_type> &parent_ip_ids,
                                  const address &license_template,
                                  const vector<license_terms_id_type> &license_terms_ids,
                                  const vector<char> &royalty_context,
                                  uint64_t minimum_royalty,
                                  uint64_t max_minting_fee,
                                  uint32_t max_revenue_share) override;

      private:
         address _self;
      };

      bool is_license_terms_registered(const database &db, const address &license_template,
                                       license_terms_id_type terms_id);

      bool has_attached_license_terms(const database &db, const ip_id_type &ip_id,
                                      const address &license_template, license_terms_id_type terms_id);

      /// @return the parents of a derivative, empty for an IP asset that is not a derivative
      vector<ip_id_type> get_parent_ips(const database &db, const ip_id_type &child_ip_id);

      vector<ip_id_type> get_derivative_ips(const database &db, const ip_id_type &parent_ip_id);

   }
} // soulbound::chain
