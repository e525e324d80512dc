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

// Sync one account against the ledger, one chunk of blocks at a time.


#pragma once

//local headers
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "ringct/rctTypes.h"
#include "wallet_store_types.h"

//third party headers

//standard headers
#include <cstdint>

//forward declarations
namespace cw
{
    class LedgerContext;
    class WalletStore;
}

namespace cw
{

enum class AccountSyncResult : unsigned char
{
    /// the account is caught up with the ledger (or no longer exists)
    NO_MORE_BLOCKS,
    /// the chunk was exhausted before reaching the ledger tip
    MORE_BLOCKS_POTENTIALLY_AVAILABLE
};

/**
* brief: scan_block_for_account - view-scan a block for an account
* param: account -
* param: subaddress_map - {K^{s,i} : i} for the account's assigned subaddresses
* param: block_index -
* param: block_contents -
* outparam: update_out - the block's changes for the account
*/
void scan_block_for_account(const Account &account,
    const subaddress_map_t &subaddress_map,
    const std::uint64_t block_index,
    const BlockContents &block_contents,
    BlockSyncUpdate &update_out);
/**
* brief: sync_account_chunk - scan up to 'blocks per chunk' blocks from an account's cursor
*   - each block is applied to the store atomically
*   - store and ledger errors propagate (the blocks applied so far stay applied)
* param: store -
* param: ledger -
* param: account_id -
* param: blocks_per_chunk -
* return: NO_MORE_BLOCKS if the account was deleted or the ledger tip was reached
*/
AccountSyncResult sync_account_chunk(WalletStore &store,
    const LedgerContext &ledger,
    const rct::key &account_id,
    const std::uint64_t blocks_per_chunk);
/**
* brief: sync_account_to_tip - sync an account chunk by chunk until it reaches the ledger tip
* param: store -
* param: ledger -
* param: account_id -
* param: blocks_per_chunk -
*/
void sync_account_to_tip(WalletStore &store,
    const LedgerContext &ledger,
    const rct::key &account_id,
    const std::uint64_t blocks_per_chunk);

} //namespace cw
