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

#include <soulbound/badge_history/badge_history.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>

namespace soulbound {
   namespace badge_history {

      namespace detail {

         class badge_history_impl {
         public:
            explicit badge_history_impl(badge_history &_plugin);

            virtual ~badge_history_impl();

            void on_operations_applied(const vector<operation> &ops);

            chain::database &database() const {
               FC_ASSERT(_db != nullptr, "badge_history is not initialized");
               return *_db;
            }

            friend class soulbound::badge_history::badge_history;

         private:
            badge_history &_self;
            chain::database *_db = nullptr;
            boost::signals2::scoped_connection _applied_operations_connection;
            uint32_t _max_query_limit = SOULBOUND_MAX_HISTORY_QUERY_LIMIT;
         };

         struct operation_process_badge_related {
            chain::database& d;

            explicit operation_process_badge_related( chain::database& db ) : d(db) {}

            typedef void result_type;

            /** do nothing for other operation types */
            template<typename T>
            void operator()( const T& )const{}

            void operator()( const badge_minted_operation& op ) const {
               const badge_state_object& state = d.get_badge_state();
               const bool is_root = state.root_ip_id.valid() && *state.root_ip_id == op.ip_id;
               d.create<badge_mint_record_object>( [&op, is_root]( badge_mint_record_object& r ) {
                  r.recipient = op.recipient;
                  r.token_id = op.token_id;
                  r.ip_id = op.ip_id;
                  r.is_root = is_root;
               });
            }

            void operator()( const batch_metadata_update_operation& op ) const {
               const string token_uri = d.get_badge_state().metadata.token_uri;
               d.create<metadata_update_record_object>( [&op, &token_uri]( metadata_update_record_object& r ) {
                  r.from_token_id = op.from_token_id;
                  r.to_token_id = op.to_token_id;
                  r.token_uri = token_uri;
               });
            }
         };

         badge_history_impl::badge_history_impl(badge_history &_plugin) :
            _self(_plugin) {
         }

         badge_history_impl::~badge_history_impl() {
         }

         void badge_history_impl::on_operations_applied(const vector<operation> &ops) {
            chain::database& db = database();
            for( const operation& op : ops )
            {
               // A failure to index must not affect the committed operation
               try{
                  op.visit( operation_process_badge_related( db ) );
               } FC_CAPTURE_AND_LOG( (op) )
            }
         }

      } // end namespace detail

      badge_history::badge_history() :
         my(new detail::badge_history_impl(*this)) {
      }

      badge_history::~badge_history() {
      }

      std::string badge_history::plugin_name() const {
         return "badge_history";
      }

      std::string badge_history::plugin_description() const {
         return "Indexes badge mints and metadata refreshes";
      }

      void badge_history::plugin_set_program_options(
         boost::program_options::options_description &cli,
         boost::program_options::options_description &cfg
      ) {
         cli.add_options()
            ("badge-history-max-query-limit",
             boost::program_options::value<uint32_t>()->default_value(SOULBOUND_MAX_HISTORY_QUERY_LIMIT),
             "Maximum number of mint records returned by a single query");
         cfg.add(cli);
      }

      void badge_history::plugin_initialize(chain::database &db, const boost::program_options::variables_map &options) {
         FC_ASSERT(my->_db == nullptr, "badge_history is already initialized");
         my->_db = &db;

         db.add_index< badge_mint_record_index >();
         db.add_index< metadata_update_record_index >();

         my->_applied_operations_connection = db.applied_operations.connect([this](const vector<operation> &ops) {
            my->on_operations_applied(ops);
         });

         if (options.count("badge-history-max-query-limit") > 0) {
            my->_max_query_limit = options["badge-history-max-query-limit"].as<uint32_t>();
         }
         ilog("badge_history: plugin_initialize() query limit ${limit}", ("limit", my->_max_query_limit));
      }

      optional<badge_mint_record_object> badge_history::get_mint_by_recipient(const address &recipient) const {
         const auto &idx = my->database().get_index_type<badge_mint_record_index>().indices().get<by_recipient>();
         auto itr = idx.find(recipient);
         if (itr == idx.end()) {
            return optional<badge_mint_record_object>();
         }
         return *itr;
      }

      optional<badge_mint_record_object> badge_history::get_mint_by_token(token_id_type token_id) const {
         const auto &idx = my->database().get_index_type<badge_mint_record_index>().indices().get<by_mint_token>();
         auto itr = idx.find(token_id);
         if (itr == idx.end()) {
            return optional<badge_mint_record_object>();
         }
         return *itr;
      }

      vector<badge_mint_record_object> badge_history::get_mints(token_id_type start, uint32_t limit) const {
         FC_ASSERT(limit <= my->_max_query_limit, "At most ${max} records can be queried at once",
                   ("max", my->_max_query_limit)("limit", limit));

         const auto &idx = my->database().get_index_type<badge_mint_record_index>().indices().get<by_mint_token>();
         vector<badge_mint_record_object> result;
         for (auto itr = idx.lower_bound(start); itr != idx.end() && result.size() < limit; ++itr) {
            result.push_back(*itr);
         }
         return result;
      }

      uint64_t badge_history::get_metadata_update_count() const {
         return my->database().get_index_type<metadata_update_record_index>().indices().size();
      }

      vector<metadata_update_record_object> badge_history::get_metadata_updates() const {
         const auto &idx = my->database().get_index_type<metadata_update_record_index>().indices();
         return vector<metadata_update_record_object>(idx.begin(), idx.end());
      }

   }
} // soulbound::badge_history
