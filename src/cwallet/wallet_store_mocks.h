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

// In-memory wallet store: for testing and for embedding in single-process wallets.


#pragma once

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "ringct/rctTypes.h"
#include "wallet_store.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

//forward declarations


namespace cw
{

////
// WalletStoreMockV1
// - one shared mutex guards all tables (readers share, every update is exclusive)
///
class WalletStoreMockV1 final : public WalletStore
{
public:
//member functions
    void add_account(const Account &account, const std::vector<AssignedSubaddress> &subaddresses) override;
    bool try_get_account(const rct::key &account_id, Account &account_out) const override;
    std::vector<rct::key> get_account_ids() const override;
    void remove_account(const rct::key &account_id) override;
    void reset_account_sync(const rct::key &account_id) override;

    AssignedSubaddress assign_next_subaddress(const rct::key &account_id, const std::string &comment) override;
    std::vector<AssignedSubaddress> get_subaddresses(const rct::key &account_id) const override;
    subaddress_map_t get_subaddress_map(const rct::key &account_id) const override;

    bool try_apply_block_sync_update(const BlockSyncUpdate &update) override;

    bool try_get_txo(const rct::key &txo_id, Txo &txo_out) const override;
    std::vector<Txo> get_txos(const rct::key &account_id) const override;
    TxoStatus get_txo_status(const rct::key &txo_id) const override;
    std::vector<Txo> get_spendable_txos(const rct::key &account_id,
        const token_id_t token_id,
        const boost::optional<rct::xmr_amount> &max_spendable_value) const override;
    void import_key_images(const rct::key &account_id, const std::vector<KeyImageImport> &imports) override;
    Balance get_balance(const rct::key &account_id, const token_id_t token_id) const override;

    void add_pending_transaction_log(const TransactionLog &log, const std::vector<Txo> &minted_txos) override;
    void fail_transaction_log(const rct::key &transaction_log_id) override;
    bool try_get_transaction_log(const rct::key &transaction_log_id, TransactionLog &log_out) const override;
    std::vector<TransactionLog> get_transaction_logs(const rct::key &account_id) const override;

private:
    /// implementations and helpers of the above, without internally locking the store mutex
    const Account& get_account_impl(const rct::key &account_id) const;
    subaddress_map_t get_subaddress_map_impl(const rct::key &account_id) const;
    TxoStatus get_txo_status_impl(const Txo &txo) const;
    void upsert_txo_impl(const Txo &txo);
    void erase_txo_impl(const rct::key &txo_id);
    void release_transaction_log_inputs_impl(const TransactionLog &log);
    void remove_minted_txos_impl(const TransactionLog &log);

//member variables
    /// store mutex (mutable for use in const member functions)
    mutable boost::shared_mutex m_store_mutex;

    /// accounts (mapped to account id)
    std::unordered_map<rct::key, Account> m_accounts;
    /// assigned subaddresses (mapped to account id, then subaddress index)
    std::unordered_map<rct::key, std::map<std::uint64_t, AssignedSubaddress>> m_subaddresses;
    /// Txos (mapped to Txo id)
    std::unordered_map<rct::key, Txo> m_txos;
    /// Txo ids (mapped to the Txos' key images)
    std::unordered_map<crypto::key_image, rct::key> m_key_image_txo_ids;
    /// transaction logs (mapped to tx id)
    std::unordered_map<rct::key, TransactionLog> m_transaction_logs;
    /// ids of pending logs (mapped to the ids of the Txos they spend)
    std::unordered_map<rct::key, rct::key> m_pending_txo_ids;
};

} //namespace cw
