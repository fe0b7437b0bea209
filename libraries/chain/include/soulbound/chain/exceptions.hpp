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

#include <fc/exception/exception.hpp>

#define SOULBOUND_ASSERT( expr, exc_type, FORMAT, ... )                \
   do {                                                               \
      if( !(expr) )                                                   \
         FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );         \
   } while( 0 )

namespace soulbound {
   namespace chain {

      FC_DECLARE_EXCEPTION( badge_exception, 3000000, "badge exception" )

      /// A collaborator address was the zero address when the module was wired
      FC_DECLARE_DERIVED_EXCEPTION( zero_address_parameter,      badge_exception, 3010000, "zero address parameter" )
      /// The caller is not the badge administrator
      FC_DECLARE_DERIVED_EXCEPTION( unauthorized_account,        badge_exception, 3020000, "unauthorized account" )
      FC_DECLARE_DERIVED_EXCEPTION( already_initialized,         badge_exception, 3030000, "collection already initialized" )
      FC_DECLARE_DERIVED_EXCEPTION( not_initialized,             badge_exception, 3040000, "collection not initialized" )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_owner,               badge_exception, 3050000, "invalid owner" )
      FC_DECLARE_DERIVED_EXCEPTION( root_already_set,            badge_exception, 3060000, "root already set" )
      FC_DECLARE_DERIVED_EXCEPTION( root_not_set,                badge_exception, 3070000, "root not set" )
      FC_DECLARE_DERIVED_EXCEPTION( recipient_already_has_badge, badge_exception, 3080000, "recipient already has a badge" )
      FC_DECLARE_DERIVED_EXCEPTION( transfer_locked,             badge_exception, 3090000, "transfer locked" )

      /// Token ledger
      /// @{
      FC_DECLARE_DERIVED_EXCEPTION( nonexistent_token,           badge_exception, 3100000, "nonexistent token" )
      FC_DECLARE_DERIVED_EXCEPTION( invalid_receiver,            badge_exception, 3110000, "invalid receiver" )
      FC_DECLARE_DERIVED_EXCEPTION( incorrect_owner,             badge_exception, 3120000, "incorrect owner" )
      /// @}

      /// Collaborators
      /// @{
      FC_DECLARE_DERIVED_EXCEPTION( ip_registry_exception,       badge_exception, 3130000, "IP asset registry exception" )
      FC_DECLARE_DERIVED_EXCEPTION( licensing_exception,         badge_exception, 3140000, "licensing exception" )
      /// @}

   }
} // soulbound::chain
