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
       *  @brief State of the soulbound badge module
       *  @ingroup object
       *  @ingroup implementation
       *
       *  Every field of the module lives in this one record, stored under a single well-known id
       *  (see badge_state_id()) independent of the objects kept by the token ledger.  The record is
       *  created by initialization, so its presence is what marks the collection initialized.
       */
      class badge_state_object : public abstract_object<badge_state_object> {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id = impl_badge_state_object_type;

         /// Sole account permitted to mint and to update the shared token URI
         address admin;

         /// Collection-level descriptive URI
         string contract_uri;

         /// Descriptor shared by every badge
         badge_metadata metadata;

         /// IP asset under which every derivative badge is registered.
         /// Unset until the first successful root mint, and never changed afterwards.
         optional<ip_id_type> root_ip_id;
      };

      typedef multi_index_container<
         badge_state_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
         >
      > badge_state_multi_index_type;
      typedef generic_index<badge_state_object, badge_state_multi_index_type> badge_state_index;

      /// Well-known id of the badge state singleton
      inline object_id_type badge_state_id() {
         return object_id_type(implementation_ids, impl_badge_state_object_type, 0);
      }
   }
} // soulbound::chain

FC_REFLECT_DERIVED( soulbound::chain::badge_state_object, (soulbound::db::object),
                    (admin)
                    (contract_uri)
                    (metadata)
                    (root_ip_id)
                  )
