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

#include <soulbound/protocol/types.hpp>

namespace soulbound {
   namespace protocol {
      struct badge_initialize_operation : public base_operation {
         /// Account deploying the collection; any account may initialize an uninitialized collection
         address caller;

         /// Administrator of the collection, the only account permitted to mint and update metadata
         address admin;

         /// Collection name
         string name;

         /// Collection symbol
         string symbol;

         /// Collection-level descriptive URI
         string contract_uri;

         /// Descriptor shared by every badge
         badge_metadata metadata;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      struct badge_mint_root_operation : public base_operation {
         /// This account must be the badge administrator
         address caller;

         /// Account receiving the root badge
         address recipient;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      struct badge_mint_operation : public base_operation {
         /// This account must be the badge administrator
         address caller;

         /// Account receiving the derivative badge.  It may not already hold a badge.
         address recipient;

         /***
          * @brief Perform simple validation of this object
          */
         void validate() const;
      };

      struct badge_set_token_uri_operation : public base_operation {
         /// This account must be the badge administrator
         address caller;

         /// Replacement for the URI shared by every badge
         string token_uri;
      };

      struct badge_transfer_admin_operation : public base_operation {
         /// This account must be the badge administrator
         address caller;

         /// Account that will administer the collection
         address new_admin;
      };

      /**
       * @brief Virtual operation recording the issue of a badge by either mint path
       */
      struct badge_minted_operation : public base_operation {
         badge_minted_operation() {}
         badge_minted_operation(const address &to, token_id_type token, const ip_id_type &ip)
            : recipient(to), token_id(token), ip_id(ip) {}

         void validate() const { FC_ASSERT( !"virtual operation" ); }

         address recipient;
         token_id_type token_id = 0;
         ip_id_type ip_id;
      };

      /**
       * @brief Virtual operation signalling that the metadata of a whole range of token ids changed
       *
       * Indexers should refresh every token id from from_token_id to to_token_id inclusive.
       */
      struct batch_metadata_update_operation : public base_operation {
         batch_metadata_update_operation() {}
         batch_metadata_update_operation(token_id_type from, token_id_type to)
            : from_token_id(from), to_token_id(to) {}

         void validate() const { FC_ASSERT( !"virtual operation" ); }

         token_id_type from_token_id = 0;
         token_id_type to_token_id = 0;
      };

      /**
       * @brief Virtual operation recording a change of administrator
       */
      struct admin_transferred_operation : public base_operation {
         admin_transferred_operation() {}
         admin_transferred_operation(const address &previous, const address &next)
            : previous_admin(previous), new_admin(next) {}

         void validate() const { FC_ASSERT( !"virtual operation" ); }

         address previous_admin;
         address new_admin;
      };

   }
}

FC_REFLECT( soulbound::protocol::badge_initialize_operation,
(caller)(admin)(name)(symbol)(contract_uri)(metadata)
)

FC_REFLECT( soulbound::protocol::badge_mint_root_operation,
(caller)(recipient)
)

FC_REFLECT( soulbound::protocol::badge_mint_operation,
(caller)(recipient)
)

FC_REFLECT( soulbound::protocol::badge_set_token_uri_operation,
(caller)(token_uri)
)

FC_REFLECT( soulbound::protocol::badge_transfer_admin_operation,
(caller)(new_admin)
)

FC_REFLECT( soulbound::protocol::badge_minted_operation,
(recipient)(token_id)(ip_id))

FC_REFLECT( soulbound::protocol::batch_metadata_update_operation,
(from_token_id)(to_token_id))

FC_REFLECT( soulbound::protocol::admin_transferred_operation,
(previous_admin)(new_admin))
