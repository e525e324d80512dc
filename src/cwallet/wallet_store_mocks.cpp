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
#include "wallet_store_mocks.h"

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "string_tools.h"
#include "wallet_errors.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.store"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
template <typename MapT, typename PredT>
static void for_all_in_map_erase_if(MapT &map_inout, PredT predicate)
{
    for (auto map_it = map_inout.begin(); map_it != map_inout.end();)
    {
        if (predicate(*map_it))
            map_it = map_inout.erase(map_it);
        else
            ++map_it;
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void add_to_balance(const Txo &txo, const TxoStatus status, Balance &balance_inout)
{
    switch (status)
    {
        case TxoStatus::ORPHANED: balance_inout.m_orphaned += txo.m_amount.m_value; break;
        case TxoStatus::MINTED:   balance_inout.m_minted += txo.m_amount.m_value;   break;
        case TxoStatus::UNSPENT:  balance_inout.m_unspent += txo.m_amount.m_value;  break;
        case TxoStatus::PENDING:  balance_inout.m_pending += txo.m_amount.m_value;  break;
        case TxoStatus::SPENT:    balance_inout.m_spent += txo.m_amount.m_value;    break;
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::add_account(const Account &account, const std::vector<AssignedSubaddress> &subaddresses)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    // 1. validate
    CW_THROW_WALLET_EXCEPTION_IF(m_accounts.find(account.m_id) != m_accounts.end(),
        error::account_already_exists, account.m_id);
    CHECK_AND_ASSERT_THROW_MES(account.m_next_block_index >= account.m_first_block_index,
        "add account (mock wallet store): the sync cursor is below the account's first block.");

    for (const AssignedSubaddress &subaddress : subaddresses)
    {
        CHECK_AND_ASSERT_THROW_MES(subaddress.m_account_id == account.m_id,
            "add account (mock wallet store): subaddress belongs to another account.");
        CHECK_AND_ASSERT_THROW_MES(subaddress.m_index < account.m_next_subaddress_index,
            "add account (mock wallet store): subaddress index is not below the account's next subaddress index.");
    }

    // 2. add
    m_accounts[account.m_id] = account;

    std::map<std::uint64_t, AssignedSubaddress> &account_subaddresses{m_subaddresses[account.m_id]};
    for (const AssignedSubaddress &subaddress : subaddresses)
        account_subaddresses[subaddress.m_index] = subaddress;

    MINFO("Added account " << account.m_id << " (" << account.m_name << ") syncing from block "
        << account.m_next_block_index << ".");
}
//-------------------------------------------------------------------------------------------------------------------
bool WalletStoreMockV1::try_get_account(const rct::key &account_id, Account &account_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto account_it = m_accounts.find(account_id);
    if (account_it == m_accounts.end())
        return false;

    account_out = account_it->second;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<rct::key> WalletStoreMockV1::get_account_ids() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    std::vector<rct::key> account_ids;
    account_ids.reserve(m_accounts.size());

    for (const auto &account : m_accounts)
        account_ids.emplace_back(account.first);

    return account_ids;
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::remove_account(const rct::key &account_id)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    CW_THROW_WALLET_EXCEPTION_IF(m_accounts.find(account_id) == m_accounts.end(),
        error::account_not_found, account_id);

    // 1. transaction logs (and their pending inputs)
    for_all_in_map_erase_if(m_transaction_logs,
            [&](const std::pair<const rct::key, TransactionLog> &log) -> bool
            {
                if (!(log.second.m_account_id == account_id))
                    return false;

                this->release_transaction_log_inputs_impl(log.second);
                return true;
            }
        );

    // 2. Txos (and their key images)
    for_all_in_map_erase_if(m_txos,
            [&](const std::pair<const rct::key, Txo> &txo) -> bool
            {
                if (!(txo.second.m_account_id == account_id))
                    return false;

                if (txo.second.m_key_image)
                    m_key_image_txo_ids.erase(*txo.second.m_key_image);
                return true;
            }
        );

    // 3. subaddresses and the account
    m_subaddresses.erase(account_id);
    m_accounts.erase(account_id);

    MINFO("Removed account " << account_id << ".");
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::reset_account_sync(const rct::key &account_id)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto account_it = m_accounts.find(account_id);
    CW_THROW_WALLET_EXCEPTION_IF(account_it == m_accounts.end(), error::account_not_found, account_id);

    account_it->second.m_next_block_index = account_it->second.m_first_block_index;

    MINFO("Reset the sync cursor of account " << account_id << " to block " << account_it->second.m_first_block_index
        << ".");
}
//-------------------------------------------------------------------------------------------------------------------
AssignedSubaddress WalletStoreMockV1::assign_next_subaddress(const rct::key &account_id, const std::string &comment)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto account_it = m_accounts.find(account_id);
    CW_THROW_WALLET_EXCEPTION_IF(account_it == m_accounts.end(), error::account_not_found, account_id);
    Account &account{account_it->second};

    // 1. make the subaddress
    AssignedSubaddress new_subaddress;
    new_subaddress.m_account_id = account_id;
    new_subaddress.m_index = account.m_next_subaddress_index;
    new_subaddress.m_comment = comment;
    make_account_subaddress(account.m_keys, new_subaddress.m_index, new_subaddress.m_address);

    // 2. find orphaned Txos sent to it
    const subaddress_map_t new_subaddress_map{{new_subaddress.m_address.m_spend_pubkey, new_subaddress.m_index}};
    std::vector<Txo> recovered_txos;

    for (const auto &txo : m_txos)
    {
        if (!(txo.second.m_account_id == account_id) ||
            txo.second.m_subaddress_index ||
            !(txo.second.m_nominal_spend_pubkey == new_subaddress.m_address.m_spend_pubkey))
            continue;

        Txo recovered_txo{txo.second};
        if (try_recover_orphaned_txo(account.m_keys, new_subaddress_map, recovered_txo))
            recovered_txos.emplace_back(std::move(recovered_txo));
    }

    // 3. save
    m_subaddresses[account_id][new_subaddress.m_index] = new_subaddress;
    ++account.m_next_subaddress_index;

    for (const Txo &recovered_txo : recovered_txos)
    {
        this->upsert_txo_impl(recovered_txo);
        MINFO("Recovered orphaned txo " << recovered_txo.m_id << " at subaddress " << new_subaddress.m_index << ".");
    }

    return new_subaddress;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<AssignedSubaddress> WalletStoreMockV1::get_subaddresses(const rct::key &account_id) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    std::vector<AssignedSubaddress> subaddresses;

    const auto subaddresses_it = m_subaddresses.find(account_id);
    if (subaddresses_it == m_subaddresses.end())
        return subaddresses;

    subaddresses.reserve(subaddresses_it->second.size());
    for (const auto &subaddress : subaddresses_it->second)
        subaddresses.emplace_back(subaddress.second);

    return subaddresses;
}
//-------------------------------------------------------------------------------------------------------------------
subaddress_map_t WalletStoreMockV1::get_subaddress_map(const rct::key &account_id) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};
    return this->get_subaddress_map_impl(account_id);
}
//-------------------------------------------------------------------------------------------------------------------
bool WalletStoreMockV1::try_apply_block_sync_update(const BlockSyncUpdate &update)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto account_it = m_accounts.find(update.m_account_id);
    if (account_it == m_accounts.end())
        return false;
    Account &account{account_it->second};

    // 1. the update must continue from the account's cursor
    CW_THROW_WALLET_EXCEPTION_IF(update.m_block_index != account.m_next_block_index,
        error::store_conflict,
        "block " + std::to_string(update.m_block_index) + " does not match the sync cursor " +
            std::to_string(account.m_next_block_index) + " of account " +
            epee::string_tools::pod_to_hex(account.m_id));

    // 2. prepare Txo upserts
    std::vector<Txo> upserted_txos;
    std::vector<bool> txo_is_new;
    upserted_txos.reserve(update.m_received_records.size());
    txo_is_new.reserve(update.m_received_records.size());

    for (const TxoRecord &record : update.m_received_records)
    {
        const auto existing_it = m_txos.find(record.m_txo_id);

        if (existing_it == m_txos.end())
        {
            upserted_txos.emplace_back();
            make_txo(record, account, update.m_block_index, upserted_txos.back());
            txo_is_new.emplace_back(true);
            continue;
        }

        // re-received (resync, or an own minted change output): only the receipt fields change
        const Txo &existing_txo{existing_it->second};
        CW_THROW_WALLET_EXCEPTION_IF(!(existing_txo.m_account_id == account.m_id),
            error::store_conflict,
            "txo " + epee::string_tools::pod_to_hex(record.m_txo_id) + " is owned by another account");
        CW_THROW_WALLET_EXCEPTION_IF(existing_txo.m_key_image && record.m_key_image &&
                !(*existing_txo.m_key_image == *record.m_key_image),
            error::invalid_key_image, record.m_txo_id);

        upserted_txos.emplace_back(existing_txo);
        upserted_txos.back().m_received_block_index = update.m_block_index;
        if (!upserted_txos.back().m_subaddress_index)
            upserted_txos.back().m_subaddress_index = record.m_subaddress_index;
        if (!upserted_txos.back().m_key_image)
            upserted_txos.back().m_key_image = record.m_key_image;
        txo_is_new.emplace_back(false);
    }

    // 3. find spent Txos
    std::vector<rct::key> spent_txo_ids;
    for (const crypto::key_image &key_image : update.m_spent_key_images)
    {
        const auto txo_id_it = m_key_image_txo_ids.find(key_image);
        if (txo_id_it == m_key_image_txo_ids.end())
            continue;

        const Txo &spent_txo{m_txos.at(txo_id_it->second)};
        if (spent_txo.m_account_id == account.m_id && !spent_txo.m_spent_block_index)
            spent_txo_ids.emplace_back(spent_txo.m_id);
    }

    // 4. find pending logs that landed in this block, or whose tombstone the cursor will reach
    const std::uint64_t new_cursor{update.m_block_index + 1};
    const std::unordered_set<rct::key> block_ephemeral_pubkeys{
            update.m_ephemeral_pubkeys.begin(),
            update.m_ephemeral_pubkeys.end()
        };
    std::vector<rct::key> succeeded_log_ids;
    std::vector<rct::key> failed_log_ids;

    for (const auto &log : m_transaction_logs)
    {
        if (!(log.second.m_account_id == account.m_id) || log.second.m_status != TransactionLogStatus::PENDING)
            continue;

        bool landed{false};
        for (const rct::key &ephemeral_pubkey : block_ephemeral_pubkeys)
        {
            if (transaction_log_has_output(log.second, ephemeral_pubkey))
            {
                landed = true;
                break;
            }
        }

        if (landed)
            succeeded_log_ids.emplace_back(log.first);
        else if (log.second.m_tombstone_block_index <= new_cursor)
            failed_log_ids.emplace_back(log.first);
    }

    // 5. apply (nothing below can fail)
    for (std::size_t txo_index{0}; txo_index < upserted_txos.size(); ++txo_index)
    {
        this->upsert_txo_impl(upserted_txos[txo_index]);

        if (txo_is_new[txo_index])
        {
            MINFO("Account " << account.m_id << " received txo " << upserted_txos[txo_index].m_id << " ("
                << upserted_txos[txo_index].m_amount.m_value << " of token "
                << upserted_txos[txo_index].m_amount.m_token_id << ") in block " << update.m_block_index << ".");
        }
    }

    for (const rct::key &spent_txo_id : spent_txo_ids)
        m_txos.at(spent_txo_id).m_spent_block_index = update.m_block_index;

    for (const rct::key &succeeded_log_id : succeeded_log_ids)
    {
        TransactionLog &log{m_transaction_logs.at(succeeded_log_id)};
        log.m_status = TransactionLogStatus::SUCCEEDED;
        log.m_finalized_block_index = update.m_block_index;
        this->release_transaction_log_inputs_impl(log);

        MINFO("Transaction " << log.m_id << " succeeded in block " << update.m_block_index << ".");
    }

    for (const rct::key &failed_log_id : failed_log_ids)
    {
        TransactionLog &log{m_transaction_logs.at(failed_log_id)};
        log.m_status = TransactionLogStatus::FAILED;
        log.m_finalized_block_index = update.m_block_index;
        this->release_transaction_log_inputs_impl(log);
        this->remove_minted_txos_impl(log);

        MINFO("Transaction " << log.m_id << " failed: tombstone block " << log.m_tombstone_block_index
            << " reached.");
    }

    account.m_next_block_index = new_cursor;

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool WalletStoreMockV1::try_get_txo(const rct::key &txo_id, Txo &txo_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto txo_it = m_txos.find(txo_id);
    if (txo_it == m_txos.end())
        return false;

    txo_out = txo_it->second;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<Txo> WalletStoreMockV1::get_txos(const rct::key &account_id) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    std::vector<Txo> txos;
    for (const auto &txo : m_txos)
    {
        if (txo.second.m_account_id == account_id)
            txos.emplace_back(txo.second);
    }

    return txos;
}
//-------------------------------------------------------------------------------------------------------------------
TxoStatus WalletStoreMockV1::get_txo_status(const rct::key &txo_id) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto txo_it = m_txos.find(txo_id);
    CW_THROW_WALLET_EXCEPTION_IF(txo_it == m_txos.end(), error::txo_not_found, txo_id);

    return this->get_txo_status_impl(txo_it->second);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<Txo> WalletStoreMockV1::get_spendable_txos(const rct::key &account_id,
    const token_id_t token_id,
    const boost::optional<rct::xmr_amount> &max_spendable_value) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    std::vector<Txo> spendable_txos;
    for (const auto &txo : m_txos)
    {
        if (!(txo.second.m_account_id == account_id) ||
            txo.second.m_amount.m_token_id != token_id ||
            (max_spendable_value && txo.second.m_amount.m_value > *max_spendable_value) ||
            this->get_txo_status_impl(txo.second) != TxoStatus::UNSPENT)
            continue;

        spendable_txos.emplace_back(txo.second);
    }

    return spendable_txos;
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::import_key_images(const rct::key &account_id, const std::vector<KeyImageImport> &imports)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    CW_THROW_WALLET_EXCEPTION_IF(m_accounts.find(account_id) == m_accounts.end(),
        error::account_not_found, account_id);

    // 1. validate
    for (const KeyImageImport &key_image_import : imports)
    {
        const auto txo_it = m_txos.find(key_image_import.m_txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(txo_it == m_txos.end(), error::txo_not_found, key_image_import.m_txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(!(txo_it->second.m_account_id == account_id),
            error::txo_not_owned, key_image_import.m_txo_id, account_id);
        CW_THROW_WALLET_EXCEPTION_IF(!txo_it->second.m_subaddress_index,
            error::txo_not_spendable, key_image_import.m_txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(txo_it->second.m_key_image &&
                !(*txo_it->second.m_key_image == key_image_import.m_key_image),
            error::invalid_key_image, key_image_import.m_txo_id);

        const auto owner_it = m_key_image_txo_ids.find(key_image_import.m_key_image);
        CW_THROW_WALLET_EXCEPTION_IF(owner_it != m_key_image_txo_ids.end() &&
                !(owner_it->second == key_image_import.m_txo_id),
            error::invalid_key_image, key_image_import.m_txo_id);
    }

    // 2. import
    for (const KeyImageImport &key_image_import : imports)
    {
        Txo &txo{m_txos.at(key_image_import.m_txo_id)};
        txo.m_key_image = key_image_import.m_key_image;
        m_key_image_txo_ids[key_image_import.m_key_image] = txo.m_id;

        if (key_image_import.m_spent_block_index && !txo.m_spent_block_index)
            txo.m_spent_block_index = key_image_import.m_spent_block_index;
    }
}
//-------------------------------------------------------------------------------------------------------------------
Balance WalletStoreMockV1::get_balance(const rct::key &account_id, const token_id_t token_id) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    CW_THROW_WALLET_EXCEPTION_IF(m_accounts.find(account_id) == m_accounts.end(),
        error::account_not_found, account_id);

    Balance balance;
    for (const auto &txo : m_txos)
    {
        if (!(txo.second.m_account_id == account_id) || txo.second.m_amount.m_token_id != token_id)
            continue;

        add_to_balance(txo.second, this->get_txo_status_impl(txo.second), balance);
    }

    return balance;
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::add_pending_transaction_log(const TransactionLog &log, const std::vector<Txo> &minted_txos)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    // 1. validate
    CW_THROW_WALLET_EXCEPTION_IF(m_accounts.find(log.m_account_id) == m_accounts.end(),
        error::account_not_found, log.m_account_id);
    CHECK_AND_ASSERT_THROW_MES(log.m_status == TransactionLogStatus::PENDING,
        "add pending transaction log (mock wallet store): the log is not pending.");
    CW_THROW_WALLET_EXCEPTION_IF(m_transaction_logs.find(log.m_id) != m_transaction_logs.end(),
        error::store_conflict,
        "transaction log " + epee::string_tools::pod_to_hex(log.m_id) + " already exists");

    for (const TransactionLogInput &input : log.m_inputs)
    {
        const auto txo_it = m_txos.find(input.m_txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(txo_it == m_txos.end(), error::txo_not_found, input.m_txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(!(txo_it->second.m_account_id == log.m_account_id),
            error::txo_not_owned, input.m_txo_id, log.m_account_id);
        CW_THROW_WALLET_EXCEPTION_IF(this->get_txo_status_impl(txo_it->second) != TxoStatus::UNSPENT,
            error::txo_not_spendable, input.m_txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(txo_it->second.m_key_image &&
                !(*txo_it->second.m_key_image == input.m_key_image),
            error::invalid_key_image, input.m_txo_id);
    }

    for (const Txo &minted_txo : minted_txos)
    {
        CHECK_AND_ASSERT_THROW_MES(minted_txo.m_account_id == log.m_account_id,
            "add pending transaction log (mock wallet store): minted txo is owned by another account.");
        CHECK_AND_ASSERT_THROW_MES(!minted_txo.m_received_block_index,
            "add pending transaction log (mock wallet store): minted txo has a received block.");
    }

    // 2. save the log and claim its inputs
    m_transaction_logs[log.m_id] = log;

    for (const TransactionLogInput &input : log.m_inputs)
    {
        m_pending_txo_ids[input.m_txo_id] = log.m_id;

        // signed txs reveal key images of view-only accounts' Txos
        Txo &input_txo{m_txos.at(input.m_txo_id)};
        if (!input_txo.m_key_image)
        {
            input_txo.m_key_image = input.m_key_image;
            m_key_image_txo_ids[input.m_key_image] = input_txo.m_id;
        }
    }

    // 3. save minted change
    for (const Txo &minted_txo : minted_txos)
    {
        if (m_txos.find(minted_txo.m_id) == m_txos.end())
            this->upsert_txo_impl(minted_txo);
    }

    MINFO("Transaction " << log.m_id << " is pending (" << log.m_inputs.size() << " inputs, tombstone block "
        << log.m_tombstone_block_index << ").");
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::fail_transaction_log(const rct::key &transaction_log_id)
{
    boost::unique_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto log_it = m_transaction_logs.find(transaction_log_id);
    CW_THROW_WALLET_EXCEPTION_IF(log_it == m_transaction_logs.end(),
        error::transaction_log_not_found, transaction_log_id);
    CW_THROW_WALLET_EXCEPTION_IF(log_it->second.m_status != TransactionLogStatus::PENDING,
        error::store_conflict,
        "transaction log " + epee::string_tools::pod_to_hex(transaction_log_id) + " is not pending");

    log_it->second.m_status = TransactionLogStatus::FAILED;
    this->release_transaction_log_inputs_impl(log_it->second);
    this->remove_minted_txos_impl(log_it->second);

    MINFO("Transaction " << transaction_log_id << " failed.");
}
//-------------------------------------------------------------------------------------------------------------------
bool WalletStoreMockV1::try_get_transaction_log(const rct::key &transaction_log_id, TransactionLog &log_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    const auto log_it = m_transaction_logs.find(transaction_log_id);
    if (log_it == m_transaction_logs.end())
        return false;

    log_out = log_it->second;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<TransactionLog> WalletStoreMockV1::get_transaction_logs(const rct::key &account_id) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_store_mutex};

    std::vector<TransactionLog> logs;
    for (const auto &log : m_transaction_logs)
    {
        if (log.second.m_account_id == account_id)
            logs.emplace_back(log.second);
    }

    return logs;
}
//-------------------------------------------------------------------------------------------------------------------
const Account& WalletStoreMockV1::get_account_impl(const rct::key &account_id) const
{
    const auto account_it = m_accounts.find(account_id);
    CW_THROW_WALLET_EXCEPTION_IF(account_it == m_accounts.end(), error::account_not_found, account_id);

    return account_it->second;
}
//-------------------------------------------------------------------------------------------------------------------
subaddress_map_t WalletStoreMockV1::get_subaddress_map_impl(const rct::key &account_id) const
{
    // validate the account exists
    this->get_account_impl(account_id);

    subaddress_map_t subaddress_map;

    const auto subaddresses_it = m_subaddresses.find(account_id);
    if (subaddresses_it == m_subaddresses.end())
        return subaddress_map;

    for (const auto &subaddress : subaddresses_it->second)
        subaddress_map[subaddress.second.m_address.m_spend_pubkey] = subaddress.first;

    return subaddress_map;
}
//-------------------------------------------------------------------------------------------------------------------
TxoStatus WalletStoreMockV1::get_txo_status_impl(const Txo &txo) const
{
    return cw::get_txo_status(txo, m_pending_txo_ids.find(txo.m_id) != m_pending_txo_ids.end());
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::upsert_txo_impl(const Txo &txo)
{
    if (txo.m_key_image)
        m_key_image_txo_ids[*txo.m_key_image] = txo.m_id;

    m_txos[txo.m_id] = txo;
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::erase_txo_impl(const rct::key &txo_id)
{
    const auto txo_it = m_txos.find(txo_id);
    if (txo_it == m_txos.end())
        return;

    if (txo_it->second.m_key_image)
        m_key_image_txo_ids.erase(*txo_it->second.m_key_image);

    m_pending_txo_ids.erase(txo_id);
    m_txos.erase(txo_it);
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::release_transaction_log_inputs_impl(const TransactionLog &log)
{
    for (const TransactionLogInput &input : log.m_inputs)
    {
        const auto pending_it = m_pending_txo_ids.find(input.m_txo_id);
        if (pending_it != m_pending_txo_ids.end() && pending_it->second == log.m_id)
            m_pending_txo_ids.erase(pending_it);
    }
}
//-------------------------------------------------------------------------------------------------------------------
void WalletStoreMockV1::remove_minted_txos_impl(const TransactionLog &log)
{
    for (const OutputTxo &change_txo : log.m_change_txos)
    {
        const rct::key change_txo_id{make_txo_id(change_txo.m_tx_out)};

        const auto txo_it = m_txos.find(change_txo_id);
        if (txo_it != m_txos.end() && !txo_it->second.m_received_block_index)
            this->erase_txo_impl(change_txo_id);
    }
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
