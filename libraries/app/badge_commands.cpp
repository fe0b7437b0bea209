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

#include <soulbound/app/badge_commands.hpp>

#include <fc/exception/exception.hpp>
#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cctype>

namespace soulbound {
   namespace app {

      namespace {

         void require_args(const vector<string> &args, size_t count) {
            FC_ASSERT(args.size() == count, "${name} expects ${n} arguments",
                      ("name", args[0])("n", count - 1));
         }

         void print_result(std::ostream &out, const string &command, const fc::variant &result) {
            out << fc::json::to_pretty_string(fc::mutable_variant_object()
                                                 ("command", command)
                                                 ("result", result)) << "\n";
         }

         void print_error(std::ostream &out, const string &command, const string &name, int64_t code,
                          const string &message) {
            out << fc::json::to_pretty_string(fc::mutable_variant_object()
                                                 ("command", command)
                                                 ("error", name)
                                                 ("code", code)
                                                 ("message", message)) << "\n";
         }

      }

      address parse_account(const string &s) {
         if (address::is_valid(s)) {
            return address(s);
         }
         return address::from_seed(s);
      }

      token_id_type parse_token_id(const string &s) {
         const bool decimal = !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
         });
         if (!decimal) {
            FC_THROW_EXCEPTION(fc::parse_error_exception, "Invalid token id ${s}", ("s", s));
         }
         try {
            return boost::lexical_cast<token_id_type>(s);
         } catch (const boost::bad_lexical_cast &) {
            FC_THROW_EXCEPTION(fc::out_of_range_exception, "Token id ${s} is out of range", ("s", s));
         }
      }

      fc::variant badge_command_runner::execute(const vector<string> &args) {
         FC_ASSERT(!args.empty() && !args[0].empty(), "Empty command");
         const string &name = args[0];

         if (name == "mint-root") {
            require_args(args, 2);
            badge_mint_root_operation op;
            op.caller = _admin;
            op.recipient = parse_account(args[1]);
            return fc::variant(_db.apply_operation(op).get<minted_ip>(), SOULBOUND_MAX_NESTED_OBJECTS);
         }
         if (name == "mint") {
            require_args(args, 2);
            badge_mint_operation op;
            op.caller = _admin;
            op.recipient = parse_account(args[1]);
            return fc::variant(_db.apply_operation(op).get<minted_ip>(), SOULBOUND_MAX_NESTED_OBJECTS);
         }
         if (name == "set-token-uri") {
            require_args(args, 2);
            badge_set_token_uri_operation op;
            op.caller = _admin;
            op.token_uri = args[1];
            _db.apply_operation(op);
            return fc::variant(_db.get_applied_operations(), SOULBOUND_MAX_NESTED_OBJECTS);
         }
         if (name == "transfer-admin") {
            require_args(args, 2);
            badge_transfer_admin_operation op;
            op.caller = _admin;
            op.new_admin = parse_account(args[1]);
            _db.apply_operation(op);
            _admin = op.new_admin;
            return fc::variant(_db.get_applied_operations(), SOULBOUND_MAX_NESTED_OBJECTS);
         }
         if (name == "transfer") {
            require_args(args, 4);
            token_transfer_from_operation op;
            op.caller = parse_account(args[1]);
            op.from = op.caller;
            op.to = parse_account(args[2]);
            op.token_id = parse_token_id(args[3]);
            _db.apply_operation(op);
            return fc::variant(true);
         }
         if (name == "approve") {
            require_args(args, 4);
            token_approve_operation op;
            op.caller = parse_account(args[1]);
            op.approved = parse_account(args[2]);
            op.token_id = parse_token_id(args[3]);
            _db.apply_operation(op);
            return fc::variant(true);
         }
         if (name == "token-uri") {
            require_args(args, 2);
            return fc::variant(_api.token_uri(parse_token_id(args[1])));
         }
         if (name == "locked") {
            require_args(args, 2);
            return fc::variant(_api.locked(parse_token_id(args[1])));
         }
         if (name == "owner-of") {
            require_args(args, 2);
            return fc::variant(_api.owner_of(parse_token_id(args[1])), 1);
         }
         if (name == "balance-of") {
            require_args(args, 2);
            return fc::variant(_api.balance_of(parse_account(args[1])));
         }

         FC_THROW("Unknown command ${name}", ("name", name));
      }

      uint32_t badge_command_runner::execute_all(const vector<string> &commands, std::ostream &out) {
         uint32_t failures = 0;
         for (const string &command : commands) {
            vector<string> args;
            const string trimmed = boost::trim_copy(command);
            boost::split(args, trimmed, boost::is_any_of(" "), boost::token_compress_on);
            try {
               print_result(out, command, execute(args));
            } catch (const fc::exception &e) {
               print_error(out, command, e.name(), e.code(), e.top_message());
               ++failures;
            } catch (const std::exception &e) {
               print_error(out, command, "std_exception", 0, e.what());
               ++failures;
            }
         }
         return failures;
      }

   }
} // soulbound::app
