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

//paired header
#include "account_sync.h"

//local headers
#include "cwallet_core/ledger_context.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "wallet_errors.h"
#include "wallet_store.h"
#include "wallet_store_types.h"

//third party headers

//standard headers
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.sync"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
void scan_block_for_account(const Account &account,
    const subaddress_map_t &subaddress_map,
    const std::uint64_t block_index,
    const BlockContents &block_contents,
    BlockSyncUpdate &update_out)
{
    update_out.m_account_id = account.m_id;
    update_out.m_block_index = block_index;
    update_out.m_received_records.clear();
    update_out.m_spent_key_images = block_contents.m_key_images;
    update_out.m_ephemeral_pubkeys.clear();
    update_out.m_ephemeral_pubkeys.reserve(block_contents.m_outputs.size());

    TxoRecord record;
    for (const TxOut &tx_out : block_contents.m_outputs)
    {
        update_out.m_ephemeral_pubkeys.emplace_back(tx_out.m_ephemeral_pubkey);

        if (try_view_scan_tx_out(tx_out, account.m_keys, subaddress_map, record))
            update_out.m_received_records.emplace_back(record);
    }
}
//-------------------------------------------------------------------------------------------------------------------
AccountSyncResult sync_account_chunk(WalletStore &store,
    const LedgerContext &ledger,
    const rct::key &account_id,
    const std::uint64_t blocks_per_chunk)
{
    Account account;
    BlockContents block_contents;
    BlockSyncUpdate update;

    for (std::uint64_t block_count{0}; block_count < blocks_per_chunk; ++block_count)
    {
        // 1. reload the account (it may have been removed or resynced since the last block)
        if (!store.try_get_account(account_id, account))
        {
            MDEBUG("Account " << account_id << " no longer exists, stopping its sync.");
            return AccountSyncResult::NO_MORE_BLOCKS;
        }

        // 2. get the next block
        if (!ledger.try_get_block_contents(account.m_next_block_index, block_contents))
            return AccountSyncResult::NO_MORE_BLOCKS;

        // 3. scan it
        subaddress_map_t subaddress_map;
        try
        {
            subaddress_map = store.get_subaddress_map(account_id);
        }
        catch (const error::account_not_found&)
        {
            MDEBUG("Account " << account_id << " was removed during its sync.");
            return AccountSyncResult::NO_MORE_BLOCKS;
        }

        scan_block_for_account(account, subaddress_map, account.m_next_block_index, block_contents, update);

        // 4. apply it
        if (!store.try_apply_block_sync_update(update))
        {
            MDEBUG("Account " << account_id << " was removed during its sync.");
            return AccountSyncResult::NO_MORE_BLOCKS;
        }

        MDEBUG("Account " << account_id << " synced block " << update.m_block_index << " ("
            << update.m_received_records.size() << " owned outputs).");
    }

    return AccountSyncResult::MORE_BLOCKS_POTENTIALLY_AVAILABLE;
}
//-------------------------------------------------------------------------------------------------------------------
void sync_account_to_tip(WalletStore &store,
    const LedgerContext &ledger,
    const rct::key &account_id,
    const std::uint64_t blocks_per_chunk)
{
    CHECK_AND_ASSERT_THROW_MES(blocks_per_chunk > 0, "sync account to tip: chunks must contain at least one block.");

    while (sync_account_chunk(store, ledger, account_id, blocks_per_chunk) ==
        AccountSyncResult::MORE_BLOCKS_POTENTIALLY_AVAILABLE)
    {}
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
