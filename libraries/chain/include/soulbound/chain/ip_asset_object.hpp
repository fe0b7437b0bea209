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
#include <soulbound/chain/types.hpp>

namespace soulbound {
   namespace chain {
      using namespace soulbound::db;

      /**
       *  @brief An IP asset registered for a token
       *  @ingroup object
       *
       *  The IP id is derived from the token contract and token id, so a token can be registered at
       *  most once.  The asset is controlled by whoever currently holds the token.
       */
      class ip_asset_object : public abstract_object<ip_asset_object> {
      public:
         static constexpr uint8_t space_id = ip_registry_ids;
         static constexpr uint8_t type_id = ip_asset_object_type;

         ip_id_type ip_id;

         /// Contract of the token bound to this IP asset
         address token_contract;
         token_id_type token_id = 0;

         string token_uri;
         string ip_metadata_uri;
         digest_type ip_metadata_hash;
         digest_type nft_metadata_hash;
      };

      struct by_ip_id;
      struct by_token;
      typedef multi_index_container<
         ip_asset_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_ip_id>, member<ip_asset_object, ip_id_type, &ip_asset_object::ip_id> >,
            ordered_unique< tag<by_token>,
               composite_key<ip_asset_object,
                  member<ip_asset_object, address, &ip_asset_object::token_contract>,
                  member<ip_asset_object, token_id_type, &ip_asset_object::token_id>
               >
            >
         >
      > ip_asset_multi_index_type;
      typedef generic_index<ip_asset_object, ip_asset_multi_index_type> ip_asset_index;

      /**
       *  @brief A set of license terms published under a license template
       *  @ingroup object
       */
      class license_terms_object : public abstract_object<license_terms_object> {
      public:
         static constexpr uint8_t space_id = ip_registry_ids;
         static constexpr uint8_t type_id = license_terms_object_type;

         address license_template;

         /// Assigned sequentially from 1 within each template
         license_terms_id_type terms_id = 0;

         string terms_uri;
      };

      struct by_template_terms;
      typedef multi_index_container<
         license_terms_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_template_terms>,
               composite_key<license_terms_object,
                  member<license_terms_object, address, &license_terms_object::license_template>,
                  member<license_terms_object, license_terms_id_type, &license_terms_object::terms_id>
               >
            >
         >
      > license_terms_multi_index_type;
      typedef generic_index<license_terms_object, license_terms_multi_index_type> license_terms_index;

      /**
       *  @brief License terms attached to an IP asset
       *  @ingroup object
       */
      class license_attachment_object : public abstract_object<license_attachment_object> {
      public:
         static constexpr uint8_t space_id = ip_registry_ids;
         static constexpr uint8_t type_id = license_attachment_object_type;

         ip_id_type ip_id;
         address license_template;
         license_terms_id_type terms_id = 0;
      };

      struct by_ip_terms;
      typedef multi_index_container<
         license_attachment_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_ip_terms>,
               composite_key<license_attachment_object,
                  member<license_attachment_object, ip_id_type, &license_attachment_object::ip_id>,
                  member<license_attachment_object, address, &license_attachment_object::license_template>,
                  member<license_attachment_object, license_terms_id_type, &license_attachment_object::terms_id>
               >
            >
         >
      > license_attachment_multi_index_type;
      typedef generic_index<license_attachment_object, license_attachment_multi_index_type> license_attachment_index;

      /**
       *  @brief Edge of the provenance graph: child is a licensed derivative of parent
       *  @ingroup object
       */
      class derivative_link_object : public abstract_object<derivative_link_object> {
      public:
         static constexpr uint8_t space_id = ip_registry_ids;
         static constexpr uint8_t type_id = derivative_link_object_type;

         ip_id_type child_ip_id;
         ip_id_type parent_ip_id;

         /// Terms of the parent under which the child was derived
         address license_template;
         license_terms_id_type terms_id = 0;
      };

      struct by_child;
      struct by_parent;
      typedef multi_index_container<
         derivative_link_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_child>,
               composite_key<derivative_link_object,
                  member<derivative_link_object, ip_id_type, &derivative_link_object::child_ip_id>,
                  member<derivative_link_object, ip_id_type, &derivative_link_object::parent_ip_id>
               >
            >,
            ordered_unique< tag<by_parent>,
               composite_key<derivative_link_object,
                  member<derivative_link_object, ip_id_type, &derivative_link_object::parent_ip_id>,
                  member<derivative_link_object, ip_id_type, &derivative_link_object::child_ip_id>
               >
            >
         >
      > derivative_link_multi_index_type;
      typedef generic_index<derivative_link_object, derivative_link_multi_index_type> derivative_link_index;
   }
} // soulbound::chain

FC_REFLECT_DERIVED( soulbound::chain::ip_asset_object, (soulbound::db::object),
                    (ip_id)
                    (token_contract)
                    (token_id)
                    (token_uri)
                    (ip_metadata_uri)
                    (ip_metadata_hash)
                    (nft_metadata_hash)
                  )

FC_REFLECT_DERIVED( soulbound::chain::license_terms_object, (soulbound::db::object),
                    (license_template)
                    (terms_id)
                    (terms_uri)
                  )

FC_REFLECT_DERIVED( soulbound::chain::license_attachment_object, (soulbound::db::object),
                    (ip_id)
                    (license_template)
                    (terms_id)
                  )

FC_REFLECT_DERIVED( soulbound::chain::derivative_link_object, (soulbound::db::object),
                    (child_ip_id)
                    (parent_ip_id)
                    (license_template)
                    (terms_id)
                  )
