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

#include <soulbound/protocol/address.hpp>
#include <soulbound/protocol/config.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/exception/exception.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/static_variant.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace soulbound {
   namespace protocol {
      using std::string;
      using std::vector;
      using fc::optional;
      using fc::static_variant;

      typedef uint64_t token_id_type;
      typedef uint64_t license_terms_id_type;
      typedef fc::sha256 digest_type;

      /// IP assets are identified by the address of their IP account
      typedef address ip_id_type;

      struct void_result {};

      /**
       * @brief The single descriptor shared by every badge of a collection
       *
       * token_uri may be replaced by the administrator at any time.  The remaining fields are
       * fixed when the collection is initialized.
       */
      struct badge_metadata {
         /// URI of the token metadata JSON, identical for every token id
         string token_uri;

         /// URI of the IP metadata registered with every IP asset
         string ip_metadata_uri;

         /// Hash of the content behind ip_metadata_uri
         digest_type ip_metadata_hash;

         /// Hash of the content behind token_uri at initialization
         digest_type nft_metadata_hash;
      };

      /// Token and IP asset created together by a single coupled mint-and-register call
      struct minted_ip {
         minted_ip() {}

         minted_ip(token_id_type t, const ip_id_type &ip) : token_id(t), ip_id(ip) {}

         token_id_type token_id = 0;
         ip_id_type ip_id;
      };

      struct base_operation {
         void validate() const {}
      };

   }
} // soulbound::protocol

FC_REFLECT( soulbound::protocol::void_result, )
FC_REFLECT( soulbound::protocol::badge_metadata, (token_uri)(ip_metadata_uri)(ip_metadata_hash)(nft_metadata_hash) )
FC_REFLECT( soulbound::protocol::minted_ip, (token_id)(ip_id) )
