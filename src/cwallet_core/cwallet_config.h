// Copyright (c) 2021, The Monero Project
//
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

// NOT FOR PRODUCTION

// Protocol constants and hash domain separators for the wallet core.

#pragma once

#include <cstddef>
#include <cstdint>

namespace config
{
  // transaction shape
  const constexpr std::size_t CW_RING_SIZE = 11;
  const constexpr std::size_t CW_MAX_INPUTS = 16;
  const constexpr std::size_t CW_MAX_OUTPUTS = 16;
  const constexpr std::size_t CW_RESERVED_CHANGE_OUTPUTS = 1;

  // fees: network fee map defaults (per token id, see NetworkContext)
  const constexpr std::uint64_t CW_MINIMUM_FEE = 400000000;
  const constexpr std::uint64_t CW_DEFAULT_TOKEN_ID = 0;

  // tombstone horizon: number of blocks a new tx stays valid for
  const constexpr std::uint64_t CW_DEFAULT_NEW_TX_BLOCK_ATTEMPTS = 50;

  // subaddress indices assigned at account creation
  const constexpr std::uint64_t CW_MAIN_SUBADDRESS_INDEX = 0;
  const constexpr std::uint64_t CW_CHANGE_SUBADDRESS_INDEX = 1;

  // sync engine
  const constexpr std::uint64_t CW_SYNC_BLOCKS_PER_CHUNK = 5;
  const constexpr std::uint64_t CW_SYNC_POLL_INTERVAL_MS = 1000;

  const constexpr char CW_TRANSCRIPT_PREFIX[] = "cw_tscrpt";

  const constexpr char HASH_KEY_CW_ACCOUNT_ID[] = "cw_account_id";
  const constexpr char HASH_KEY_CW_TXO_ID[] = "cw_txo_id";
  const constexpr char HASH_KEY_CW_TOKEN_ID_ENCODING_FACTOR[] = "cw_token_id";
  const constexpr char HASH_KEY_CW_CONFIRMATION_NUMBER[] = "cw_confirmation_number";
  const constexpr char HASH_KEY_CW_MEMO_KEYSTREAM[] = "cw_memo_keystream";
  const constexpr char HASH_KEY_CW_MEMO_TYPE_KEYSTREAM[] = "cw_memo_type_keystream";
  const constexpr char HASH_KEY_CW_ADDRESS_HASH[] = "cw_address_hash";
  const constexpr char HASH_KEY_CW_RTH_MEMO_HMAC[] = "cw_rth_memo_hmac";
  const constexpr char HASH_KEY_CW_TOKEN_GENERATOR[] = "cw_token_generator";
  const constexpr char HASH_KEY_CW_GENERATOR_LINK_PROOF[] = "cw_generator_link_proof";
  const constexpr char HASH_KEY_CW_TX_PREFIX[] = "cw_tx_prefix";
  const constexpr char HASH_KEY_CW_TXO_MEMBERSHIP_LEAF[] = "cw_txo_membership_leaf";
  const constexpr char HASH_KEY_CW_TXO_MEMBERSHIP_NIL[] = "cw_txo_membership_nil";
  const constexpr char HASH_KEY_CW_TXO_MEMBERSHIP_NODE[] = "cw_txo_membership_node";
}
