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

#include <soulbound/db/generic_index.hpp>
#include <soulbound/protocol/operations.hpp>

namespace soulbound {
   namespace chain {
      using namespace soulbound::protocol;

      using soulbound::db::abstract_object;
      using soulbound::db::object;
      using soulbound::db::object_id_type;

      enum object_space {
         protocol_ids = 1,
         implementation_ids = 2,
         ip_registry_ids = 3
      };

      /// Objects of the token ledger
      enum protocol_object_type {
         token_object_type = 0
      };

      /// Singletons holding collection-wide state
      enum impl_object_type {
         impl_token_collection_object_type = 0,
         impl_badge_state_object_type = 1
      };

      /// Objects of the in-process IP asset registry and licensing service
      enum ip_registry_object_type {
         ip_asset_object_type = 0,
         license_terms_object_type = 1,
         license_attachment_object_type = 2,
         derivative_link_object_type = 3
      };

   }
} // soulbound::chain
