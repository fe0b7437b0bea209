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

#include <soulbound/chain/licensing_service.hpp>
#include <soulbound/chain/database.hpp>

#include <boost/tuple/tuple.hpp>

#include <iterator>
#include <set>

namespace soulbound {
   namespace chain {

      license_terms_id_type chain_licensing_service::register_license_terms(database &db,
                                                                            const address &license_template,
                                                                            const string &terms_uri) {
         try {
            SOULBOUND_ASSERT(!license_template.is_zero(), licensing_exception,
                             "The license template should not be the zero address",
                             ("license_template", license_template));

            const auto &idx = db.get_index_type<license_terms_index>().indices().get<by_template_terms>();
            auto range = idx.equal_range(boost::make_tuple(license_template));
            const license_terms_id_type terms_id = std::distance(range.first, range.second) + 1;

            db.create<license_terms_object>([&](license_terms_object &t) {
               t.license_template = license_template;
               t.terms_id = terms_id;
               t.terms_uri = terms_uri;
            });

            return terms_id;
         } FC_CAPTURE_AND_RETHROW((license_template)(terms_uri))
      }

      void chain_licensing_service::attach_license_terms(database &db,
                                                         const address &caller,
                                                         const ip_id_type &ip_id,
                                                         const address &license_template,
                                                         license_terms_id_type terms_id) {
         try {
            const ip_asset_object *ip = find_ip_asset(db, ip_id);
            SOULBOUND_ASSERT(ip != nullptr, licensing_exception, "IP asset ${ip_id} is not registered",
                             ("ip_id", ip_id));
            SOULBOUND_ASSERT(get_ip_owner(db, *ip) == caller, licensing_exception,
                             "Account ${caller} does not control IP asset ${ip_id}",
                             ("caller", caller)("ip_id", ip_id));
            SOULBOUND_ASSERT(is_license_terms_registered(db, license_template, terms_id), licensing_exception,
                             "License terms ${terms_id} are not registered under template ${license_template}",
                             ("terms_id", terms_id)("license_template", license_template));
            SOULBOUND_ASSERT(!has_attached_license_terms(db, ip_id, license_template, terms_id), licensing_exception,
                             "License terms ${terms_id} are already attached to IP asset ${ip_id}",
                             ("terms_id", terms_id)("ip_id", ip_id));

            db.create<license_attachment_object>([&](license_attachment_object &a) {
               a.ip_id = ip_id;
               a.license_template = license_template;
               a.terms_id = terms_id;
            });
         } FC_CAPTURE_AND_RETHROW((caller)(ip_id)(license_template)(terms_id))
      }

      void chain_licensing_service::register_derivative(database &db,
                                                        const address &caller,
                                                        const ip_id_type &child_ip_id,
                                                        const vector<ip_id_type> &parent_ip_ids,
                                                        const address &license_template,
                                                        const vector<license_terms_id_type> &license_terms_ids,
                                                        const vector<char> &royalty_context,
                                                        uint64_t minimum_royalty,
                                                        uint64_t max_minting_fee,
                                                        uint32_t max_revenue_share) {
         try {
            const ip_asset_object *child = find_ip_asset(db, child_ip_id);
            SOULBOUND_ASSERT(child != nullptr, licensing_exception, "IP asset ${ip_id} is not registered",
                             ("ip_id", child_ip_id));
            SOULBOUND_ASSERT(get_ip_owner(db, *child) == caller, licensing_exception,
                             "Account ${caller} does not control IP asset ${ip_id}",
                             ("caller", caller)("ip_id", child_ip_id));

            SOULBOUND_ASSERT(!parent_ip_ids.empty(), licensing_exception,
                             "A derivative requires at least one parent", ("child", child_ip_id));
            SOULBOUND_ASSERT(parent_ip_ids.size() == license_terms_ids.size(), licensing_exception,
                             "${parents} parents were given with ${terms} license terms",
                             ("parents", parent_ip_ids.size())("terms", license_terms_ids.size()));

            SOULBOUND_ASSERT(get_parent_ips(db, child_ip_id).empty(), licensing_exception,
                             "IP asset ${ip_id} is already a derivative", ("ip_id", child_ip_id));
            const auto &attachments = db.get_index_type<license_attachment_index>().indices().get<by_ip_terms>();
            auto child_terms = attachments.equal_range(boost::make_tuple(child_ip_id));
            SOULBOUND_ASSERT(child_terms.first == child_terms.second, licensing_exception,
                             "IP asset ${ip_id} already has license terms attached", ("ip_id", child_ip_id));

            std::set<ip_id_type> seen;
            for (size_t i = 0; i < parent_ip_ids.size(); ++i) {
               const ip_id_type &parent_ip_id = parent_ip_ids[i];
               const license_terms_id_type terms_id = license_terms_ids[i];

               SOULBOUND_ASSERT(parent_ip_id != child_ip_id, licensing_exception,
                                "IP asset ${ip_id} cannot be its own parent", ("ip_id", child_ip_id));
               SOULBOUND_ASSERT(seen.insert(parent_ip_id).second, licensing_exception,
                                "Parent ${parent} is listed more than once", ("parent", parent_ip_id));
               SOULBOUND_ASSERT(find_ip_asset(db, parent_ip_id) != nullptr, licensing_exception,
                                "Parent IP asset ${parent} is not registered", ("parent", parent_ip_id));
               SOULBOUND_ASSERT(has_attached_license_terms(db, parent_ip_id, license_template, terms_id),
                                licensing_exception,
                                "License terms ${terms_id} are not attached to parent ${parent}",
                                ("terms_id", terms_id)("parent", parent_ip_id));
            }

            for (size_t i = 0; i < parent_ip_ids.size(); ++i) {
               const ip_id_type &parent_ip_id = parent_ip_ids[i];
               const license_terms_id_type terms_id = license_terms_ids[i];

               db.create<derivative_link_object>([&](derivative_link_object &link) {
                  link.child_ip_id = child_ip_id;
                  link.parent_ip_id = parent_ip_id;
                  link.license_template = license_template;
                  link.terms_id = terms_id;
               });

               // The child inherits the terms it was derived under
               if (!has_attached_license_terms(db, child_ip_id, license_template, terms_id)) {
                  db.create<license_attachment_object>([&](license_attachment_object &a) {
                     a.ip_id = child_ip_id;
                     a.license_template = license_template;
                     a.terms_id = terms_id;
                  });
               }
            }
         } FC_CAPTURE_AND_RETHROW((caller)(child_ip_id)(parent_ip_ids)(license_template)(license_terms_ids)
                                  (royalty_context)(minimum_royalty)(max_minting_fee)(max_revenue_share))
      }

      bool is_license_terms_registered(const database &db, const address &license_template,
                                       license_terms_id_type terms_id) {
         const auto &idx = db.get_index_type<license_terms_index>().indices().get<by_template_terms>();
         return idx.find(boost::make_tuple(license_template, terms_id)) != idx.end();
      }

      bool has_attached_license_terms(const database &db, const ip_id_type &ip_id,
                                      const address &license_template, license_terms_id_type terms_id) {
         const auto &idx = db.get_index_type<license_attachment_index>().indices().get<by_ip_terms>();
         return idx.find(boost::make_tuple(ip_id, license_template, terms_id)) != idx.end();
      }

      vector<ip_id_type> get_parent_ips(const database &db, const ip_id_type &child_ip_id) {
         const auto &idx = db.get_index_type<derivative_link_index>().indices().get<by_child>();
         vector<ip_id_type> parents;
         auto range = idx.equal_range(boost::make_tuple(child_ip_id));
         for (auto itr = range.first; itr != range.second; ++itr) {
            parents.push_back(itr->parent_ip_id);
         }
         return parents;
      }

      vector<ip_id_type> get_derivative_ips(const database &db, const ip_id_type &parent_ip_id) {
         const auto &idx = db.get_index_type<derivative_link_index>().indices().get<by_parent>();
         vector<ip_id_type> children;
         auto range = idx.equal_range(boost::make_tuple(parent_ip_id));
         for (auto itr = range.first; itr != range.second; ++itr) {
            children.push_back(itr->child_ip_id);
         }
         return children;
      }

   }
} // soulbound::chain
