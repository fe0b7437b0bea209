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

/**
 * The standard transfer-capable entry points of a non-fungible token ledger.
 *
 * Badges are soulbound, so every one of these operations is rejected by the chain.  They carry
 * no validation of their own so that the rejection is the same for every input.
 */
namespace soulbound {
   namespace protocol {
      /// Authorize a single account to transfer one token
      struct token_approve_operation : public base_operation {
         address caller;
         address approved;
         token_id_type token_id = 0;
      };

      /// Authorize or revoke an operator for every token held by the caller
      struct token_set_approval_for_all_operation : public base_operation {
         address caller;
         address operator_account;
         bool approved = false;
      };

      /// Move a token between holders
      struct token_transfer_from_operation : public base_operation {
         address caller;
         address from;
         address to;
         token_id_type token_id = 0;
      };

      /// Move a token between holders and notify a receiving contract with optional data
      struct token_safe_transfer_from_operation : public base_operation {
         address caller;
         address from;
         address to;
         token_id_type token_id = 0;
         vector<char> data;
      };
   }
}

FC_REFLECT( soulbound::protocol::token_approve_operation, (caller)(approved)(token_id) )
FC_REFLECT( soulbound::protocol::token_set_approval_for_all_operation, (caller)(operator_account)(approved) )
FC_REFLECT( soulbound::protocol::token_transfer_from_operation, (caller)(from)(to)(token_id) )
FC_REFLECT( soulbound::protocol::token_safe_transfer_from_operation, (caller)(from)(to)(token_id)(data) )
