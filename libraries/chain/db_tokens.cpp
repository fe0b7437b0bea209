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

#include <soulbound/chain/database.hpp>

#include <boost/tuple/tuple.hpp>

#include <iterator>

namespace soulbound {
   namespace chain {

      token_id_type database::mint_token(const address &to) {
         SOULBOUND_ASSERT(!to.is_zero(), invalid_receiver, "Cannot mint a token to the zero address", ("to", to));

         const token_collection_object &collection = get_token_collection();
         const token_id_type token_id = collection.total_supply;

         create<token_object>([&to, token_id](token_object &t) {
            t.token_id = token_id;
            t.owner = to;
         });
         modify(collection, [](token_collection_object &c) {
            ++c.total_supply;
         });

         return token_id;
      }

      void database::transfer_token(const address &from, const address &to, token_id_type token_id) {
         SOULBOUND_ASSERT(!to.is_zero(), invalid_receiver, "Cannot transfer token ${token_id} to the zero address",
                          ("token_id", token_id));

         const token_object *token = find_token(token_id);
         SOULBOUND_ASSERT(token != nullptr, nonexistent_token, "Token ${token_id} does not exist",
                          ("token_id", token_id));
         SOULBOUND_ASSERT(token->owner == from, incorrect_owner,
                          "Token ${token_id} is held by ${owner} rather than ${from}",
                          ("token_id", token_id)("owner", token->owner)("from", from));

         modify(*token, [&to](token_object &t) {
            t.owner = to;
         });
      }

      const token_object *database::find_token(token_id_type token_id) const {
         const auto &idx = get_index_type<token_index>().indices().get<by_token_id>();
         auto itr = idx.find(token_id);
         if (itr == idx.end()) {
            return nullptr;
         }
         return &*itr;
      }

      address database::get_token_owner(token_id_type token_id) const {
         const token_object *token = find_token(token_id);
         SOULBOUND_ASSERT(token != nullptr, nonexistent_token, "Token ${token_id} does not exist",
                          ("token_id", token_id));
         return token->owner;
      }

      uint64_t database::get_badge_balance(const address &owner) const {
         SOULBOUND_ASSERT(!owner.is_zero(), invalid_owner, "The zero address does not hold tokens",
                          ("owner", owner));

         const auto &idx = get_index_type<token_index>().indices().get<by_owner>();
         auto range = idx.equal_range(boost::make_tuple(owner));
         return std::distance(range.first, range.second);
      }

      uint64_t database::get_total_supply() const {
         const token_collection_object *collection = find<token_collection_object>(token_collection_id());
         if (collection == nullptr) {
            return 0;
         }
         return collection->total_supply;
      }

   }
} // soulbound::chain
