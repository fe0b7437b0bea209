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

#include <boost/program_options.hpp>

namespace soulbound { namespace badge_history {
using namespace chain;

//
// Plugins should #define their SPACE_ID's so plugins with
// conflicting SPACE_ID assignments can be compiled into the
// same binary (by simply re-assigning some of the conflicting #defined
// SPACE_ID's in a build script).
//
#ifndef BADGE_HISTORY_SPACE_ID
#define BADGE_HISTORY_SPACE_ID 8
#endif

enum badge_history_object_type
{
   BADGE_MINT_RECORD_TYPE_ID = 0,
   METADATA_UPDATE_RECORD_TYPE_ID = 1
};

struct badge_mint_record_object : public abstract_object<badge_mint_record_object>
{
   static constexpr uint8_t space_id = BADGE_HISTORY_SPACE_ID;
   static constexpr uint8_t type_id  = BADGE_MINT_RECORD_TYPE_ID;

   address recipient;
   token_id_type token_id = 0;
   ip_id_type ip_id;
   /// True for the badge registered as the root IP asset
   bool is_root = false;
};

struct metadata_update_record_object : public abstract_object<metadata_update_record_object>
{
   static constexpr uint8_t space_id = BADGE_HISTORY_SPACE_ID;
   static constexpr uint8_t type_id  = METADATA_UPDATE_RECORD_TYPE_ID;

   token_id_type from_token_id = 0;
   token_id_type to_token_id = 0;
   /// Shared token URI after the update
   string token_uri;
};

namespace detail
{
    class badge_history_impl;
}

/**
 * @brief Indexes committed badge mints and metadata refreshes
 *
 * Records are written after the operation that produced them is committed, so a rejected operation
 * never leaves a record.
 */
class badge_history
{
   public:
      badge_history();
      ~badge_history();

      std::string plugin_name()const;
      std::string plugin_description()const;
      void plugin_set_program_options(
         boost::program_options::options_description& cli,
         boost::program_options::options_description& cfg);
      /**
       * @brief Register the history indexes and start observing committed operations
       * @param db Database to observe, which must outlive the plugin
       * @param options Parsed options, including those added by plugin_set_program_options
       */
      void plugin_initialize(chain::database& db, const boost::program_options::variables_map& options);

      /**
       * @brief Get the mint record of a recipient
       * @param recipient Account that received a badge
       * @return The record, or an empty optional if the account never received a badge
       */
      optional<badge_mint_record_object> get_mint_by_recipient(const address& recipient) const;

      /**
       * @brief Get the mint record of a token
       * @param token_id Token ID
       * @return The record, or an empty optional if the token was never minted
       */
      optional<badge_mint_record_object> get_mint_by_token(token_id_type token_id) const;

      /**
       * @brief List mint records in mint order
       * @param start First token ID to return
       * @param limit Maximum number of records, at most the configured query limit
       */
      vector<badge_mint_record_object> get_mints(token_id_type start, uint32_t limit) const;

      /// Number of times the shared metadata was refreshed
      uint64_t get_metadata_update_count() const;

      vector<metadata_update_record_object> get_metadata_updates() const;

   private:
      std::unique_ptr<detail::badge_history_impl> my;
};

struct by_recipient;
struct by_mint_token;
typedef multi_index_container <
   badge_mint_record_object,
   indexed_by<
      ordered_unique < tag < by_id>, member<object, object_id_type, &object::id>>,
      ordered_non_unique < tag<by_recipient>, member<badge_mint_record_object, address, &badge_mint_record_object::recipient> >,
      ordered_unique < tag<by_mint_token>, member<badge_mint_record_object, token_id_type, &badge_mint_record_object::token_id> >
   >
> badge_mint_record_multi_index_type;

typedef generic_index <badge_mint_record_object, badge_mint_record_multi_index_type> badge_mint_record_index;

typedef multi_index_container <
   metadata_update_record_object,
   indexed_by<
      ordered_unique < tag < by_id>, member<object, object_id_type, &object::id>>
   >
> metadata_update_record_multi_index_type;

typedef generic_index <metadata_update_record_object, metadata_update_record_multi_index_type> metadata_update_record_index;

} } //soulbound::badge_history

FC_REFLECT_DERIVED( soulbound::badge_history::badge_mint_record_object, (soulbound::db::object), (recipient)(token_id)(ip_id)(is_root))
FC_REFLECT_DERIVED( soulbound::badge_history::metadata_update_record_object, (soulbound::db::object), (from_token_id)(to_token_id)(token_uri))
