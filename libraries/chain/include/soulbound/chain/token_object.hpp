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

/**
 * @defgroup token_ledger Non-fungible token ledger objects
 */

namespace soulbound {
   namespace chain {
      using namespace soulbound::db;

      /**
       *  @brief Name, symbol and supply of the token collection
       *  @ingroup object
       *  @ingroup implementation
       *
       *  A single instance exists once the collection has been initialized.
       */
      class token_collection_object : public abstract_object<token_collection_object> {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id = impl_token_collection_object_type;

         /// Collection name
         string name;

         /// Collection symbol
         string symbol;

         /// Number of tokens minted so far.
         /// Token ids are assigned sequentially from zero and tokens are never burned,
         /// so this is also the id of the next token.
         uint64_t total_supply = 0;
      };

      typedef multi_index_container<
         token_collection_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
         >
      > token_collection_multi_index_type;
      typedef generic_index<token_collection_object, token_collection_multi_index_type> token_collection_index;

      /// Well-known id of the token collection singleton
      inline object_id_type token_collection_id() {
         return object_id_type(implementation_ids, impl_token_collection_object_type, 0);
      }

      /**
       *  @brief Tracks the holder of a token
       *  @ingroup object
       *  @ingroup protocol
       */
      class token_object : public abstract_object<token_object> {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id = token_object_type;

         /// Sequential token id
         token_id_type token_id = 0;

         /// Current holder
         address owner;
      };

      struct by_token_id;
      struct by_owner;
      typedef multi_index_container<
         token_object,
         indexed_by<
            ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
            ordered_unique< tag<by_token_id>, member<token_object, token_id_type, &token_object::token_id> >,
            ordered_unique< tag<by_owner>,
               composite_key<token_object,
                  member<token_object, address, &token_object::owner>,
                  member<token_object, token_id_type, &token_object::token_id>
               >
            >
         >
      > token_multi_index_type;
      typedef generic_index<token_object, token_multi_index_type> token_index;
   }
} // soulbound::chain

FC_REFLECT_DERIVED( soulbound::chain::token_collection_object, (soulbound::db::object),
                    (name)
                    (symbol)
                    (total_supply)
                  )

FC_REFLECT_DERIVED( soulbound::chain::token_object, (soulbound::db::object),
                    (token_id)
                    (owner)
                  )
