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

// Wallet store: accounts, subaddresses, Txos and transaction logs.
// - implementations are internally synchronized
// - every multi-row update is a single member function that validates all of its preconditions before mutating


#pragma once

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "ringct/rctTypes.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <string>
#include <vector>

//forward declarations


namespace cw
{

////
// KeyImageImport
// - a key image recovered by an offline signer for a view-only account's Txo
///
struct KeyImageImport final
{
    /// the Txo
    rct::key m_txo_id;
    /// its key image
    crypto::key_image m_key_image;
    /// block where the key image was spent (from the ledger)
    boost::optional<std::uint64_t> m_spent_block_index;
};

////
// WalletStore
///
class WalletStore
{
public:
//destructor
    virtual ~WalletStore() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    WalletStore& operator=(WalletStore&&) = delete;

//member functions

    //// ACCOUNTS

    /// add an account with its initial subaddresses (throws account_already_exists)
    virtual void add_account(const Account &account, const std::vector<AssignedSubaddress> &subaddresses) = 0;
    virtual bool try_get_account(const rct::key &account_id, Account &account_out) const = 0;
    virtual std::vector<rct::key> get_account_ids() const = 0;
    /// remove an account with its subaddresses, Txos and transaction logs (throws account_not_found)
    virtual void remove_account(const rct::key &account_id) = 0;
    /// move the sync cursor back to the account's first block (throws account_not_found)
    virtual void reset_account_sync(const rct::key &account_id) = 0;

    //// SUBADDRESSES

    /**
    * brief: assign_next_subaddress - assign the account's next subaddress
    *   - orphaned Txos sent to the new subaddress are attached to it
    * param: account_id -
    * param: comment -
    * return: the new subaddress
    */
    virtual AssignedSubaddress assign_next_subaddress(const rct::key &account_id, const std::string &comment) = 0;
    virtual std::vector<AssignedSubaddress> get_subaddresses(const rct::key &account_id) const = 0;
    /// {K^{s,i} : i} for the account's assigned subaddresses
    virtual subaddress_map_t get_subaddress_map(const rct::key &account_id) const = 0;

    //// SYNC

    /**
    * brief: try_apply_block_sync_update - apply one scanned block to an account
    *   - upserts received Txos (idempotent on Txo id)
    *   - marks Txos whose key images were spent in the block
    *   - pending logs whose outputs appear in the block succeed
    *   - advances the cursor past the block
    *   - pending logs whose tombstone is at or below the new cursor fail
    *   - throws store_conflict if the update's block is not the account's cursor
    * param: update -
    * return: false if the account does not exist
    */
    virtual bool try_apply_block_sync_update(const BlockSyncUpdate &update) = 0;

    //// TXOS

    virtual bool try_get_txo(const rct::key &txo_id, Txo &txo_out) const = 0;
    virtual std::vector<Txo> get_txos(const rct::key &account_id) const = 0;
    /// throws txo_not_found
    virtual TxoStatus get_txo_status(const rct::key &txo_id) const = 0;
    /// unspent Txos of an account and token with value <= max spendable value (if set)
    virtual std::vector<Txo> get_spendable_txos(const rct::key &account_id,
        const token_id_t token_id,
        const boost::optional<rct::xmr_amount> &max_spendable_value) const = 0;
    /// attach imported key images to an account's Txos (throws on unknown/foreign Txos or conflicting key images)
    virtual void import_key_images(const rct::key &account_id, const std::vector<KeyImageImport> &imports) = 0;
    /// sums of an account's Txo values for a token, by status
    virtual Balance get_balance(const rct::key &account_id, const token_id_t token_id) const = 0;

    //// TRANSACTION LOGS

    /**
    * brief: add_pending_transaction_log - record a submitted tx
    *   - throws txo_not_spendable if any input is not unspent
    * param: log - a PENDING log
    * param: minted_txos - the tx's change outputs, owned by the account
    */
    virtual void add_pending_transaction_log(const TransactionLog &log, const std::vector<Txo> &minted_txos) = 0;
    /// PENDING -> FAILED: releases the inputs and removes unconfirmed change
    virtual void fail_transaction_log(const rct::key &transaction_log_id) = 0;
    virtual bool try_get_transaction_log(const rct::key &transaction_log_id, TransactionLog &log_out) const = 0;
    virtual std::vector<TransactionLog> get_transaction_logs(const rct::key &account_id) const = 0;
};

} //namespace cw
