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

#include <soulbound/app/badge_api.hpp>

#include <fc/variant.hpp>

#include <ostream>

namespace soulbound {
   namespace app {

      /// Accepts either a "0x" address or a name from which an address is derived
      address parse_account(const string &s);

      /**
       * @brief Parse a decimal token ID
       * @throws fc::parse_error_exception if @p s is not a decimal number
       * @throws fc::out_of_range_exception if the number does not fit a token ID
       */
      token_id_type parse_token_id(const string &s);

      /**
       * @brief Executes textual badge commands against a database
       *
       * Administrative commands are signed by the administrator given at construction.  Each command
       * is a name followed by space separated arguments, for example "mint-root alice".
       */
      class badge_command_runner {
      public:
         badge_command_runner(database &db, const address &admin)
            : _db(db), _api(db), _admin(admin) {}

         /// @return the command result
         fc::variant execute(const vector<string> &args);

         /**
          * @brief Execute every command, printing each result or error as JSON
          * @return the number of commands that failed
          */
         uint32_t execute_all(const vector<string> &commands, std::ostream &out);

      private:
         database &_db;
         badge_api _api;
         address _admin;
      };

   }
} // soulbound::app
