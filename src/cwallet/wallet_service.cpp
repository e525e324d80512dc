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
#include "wallet_service.h"

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/cwallet_config.h"
#include "cwallet_core/ledger_context.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"
#include "wallet_errors.h"
#include "wallet_store.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/none.hpp>

//standard headers
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.tx"

namespace cw
{

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static Account get_account(const WalletStore &store, const rct::key &account_id)
{
    Account account;
    CW_THROW_WALLET_EXCEPTION_IF(!store.try_get_account(account_id, account), error::account_not_found, account_id);

    return account;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static AssignedSubaddress make_assigned_subaddress(const Account &account,
    const std::uint64_t subaddress_index,
    const std::string &comment)
{
    AssignedSubaddress subaddress;
    subaddress.m_account_id = account.m_id;
    subaddress.m_index = subaddress_index;
    subaddress.m_comment = comment;
    make_account_subaddress(account.m_keys, subaddress_index, subaddress.m_address);

    return subaddress;
}
//-------------------------------------------------------------------------------------------------------------------
rct::key create_account(const AccountKeys &keys,
    const std::uint64_t first_block_index,
    const std::string &name,
    WalletStore &store_inout)
{
    Account account;
    account.m_id = make_account_id(keys);
    account.m_keys = keys;
    account.m_main_subaddress_index = config::CW_MAIN_SUBADDRESS_INDEX;
    account.m_change_subaddress_index = config::CW_CHANGE_SUBADDRESS_INDEX;
    account.m_next_subaddress_index = config::CW_CHANGE_SUBADDRESS_INDEX + 1;
    account.m_first_block_index = first_block_index;
    account.m_next_block_index = first_block_index;
    account.m_name = name;

    store_inout.add_account(account,
        {
            make_assigned_subaddress(account, account.m_main_subaddress_index, "Main"),
            make_assigned_subaddress(account, account.m_change_subaddress_index, "Change")
        });

    MINFO("Created account " << account.m_id << (can_spend(keys) ? "" : " (view-only)") << " starting at block "
        << first_block_index << ".");

    return account.m_id;
}
//-------------------------------------------------------------------------------------------------------------------
AssignedSubaddress assign_next_subaddress(const rct::key &account_id,
    const std::string &comment,
    WalletStore &store_inout)
{
    return store_inout.assign_next_subaddress(account_id, comment);
}
//-------------------------------------------------------------------------------------------------------------------
void import_key_images(const LedgerContext &ledger,
    const rct::key &account_id,
    const std::vector<TxoKeyImage> &key_images,
    WalletStore &store_inout)
{
    std::vector<KeyImageImport> imports;
    imports.reserve(key_images.size());

    for (const TxoKeyImage &key_image : key_images)
    {
        imports.emplace_back();
        imports.back().m_txo_id = key_image.m_txo_id;
        imports.back().m_key_image = key_image.m_key_image;

        std::uint64_t spent_block_index;
        if (ledger.try_get_key_image_block_index(key_image.m_key_image, spent_block_index))
            imports.back().m_spent_block_index = spent_block_index;
    }

    store_inout.import_key_images(account_id, imports);

    MINFO("Imported " << imports.size() << " key image(s) for account " << account_id << ".");
}
//-------------------------------------------------------------------------------------------------------------------
Balance get_balance(const WalletStore &store, const rct::key &account_id, const token_id_t token_id)
{
    return store.get_balance(account_id, token_id);
}
//-------------------------------------------------------------------------------------------------------------------
void verify_txo_confirmation_number(const WalletStore &store,
    const rct::key &account_id,
    const rct::key &txo_id,
    const rct::key &confirmation_number)
{
    const Account account{get_account(store, account_id)};

    Txo txo;
    CW_THROW_WALLET_EXCEPTION_IF(!store.try_get_txo(txo_id, txo), error::txo_not_found, txo_id);
    CW_THROW_WALLET_EXCEPTION_IF(!(txo.m_account_id == account_id), error::txo_not_owned, txo_id, account_id);
    CW_THROW_WALLET_EXCEPTION_IF(!verify_confirmation_number(txo.m_tx_out, account.m_keys.m_view_privkey, confirmation_number),
        error::invalid_confirmation_number, "the confirmation number does not match txo " +
            epee::string_tools::pod_to_hex(txo_id));
}
//-------------------------------------------------------------------------------------------------------------------
void reset_account_sync(const rct::key &account_id, WalletStore &store_inout)
{
    store_inout.reset_account_sync(account_id);

    MINFO("Reset the sync cursor of account " << account_id << ".");
}
//-------------------------------------------------------------------------------------------------------------------
TransactionLog submit_tx_proposal(const TxProposal &proposal,
    const LedgerContext &ledger,
    const std::string &comment,
    NetworkContext &network_inout,
    WalletStore &store_inout)
{
    const Account account{get_account(store_inout, proposal.m_account_id)};

    // 1. the log
    TransactionLog log;
    make_transaction_log(proposal, ledger.num_blocks(), comment, log);

    // 2. change outputs become minted Txos until they are seen on chain
    const subaddress_map_t subaddress_map{store_inout.get_subaddress_map(account.m_id)};
    std::vector<Txo> minted_txos;
    minted_txos.reserve(proposal.m_change_txos.size());

    for (const OutputTxo &change_txo : proposal.m_change_txos)
    {
        TxoRecord record;
        CHECK_AND_ASSERT_THROW_MES(try_view_scan_tx_out(change_txo.m_tx_out, account.m_keys, subaddress_map, record) &&
                record.m_subaddress_index,
            "submit tx: a change output does not belong to the account.");

        minted_txos.emplace_back();
        make_txo(record, account, boost::none, minted_txos.back());
    }

    // 3. record, then submit
    store_inout.add_pending_transaction_log(log, minted_txos);

    if (!network_inout.try_submit_transaction(proposal.m_tx))
    {
        store_inout.fail_transaction_log(log.m_id);
        CW_THROW_WALLET_EXCEPTION(error::tx_rejected, log.m_id);
    }

    MINFO("Submitted tx " << log.m_id << " for account " << account.m_id << " at block " << ledger.num_blocks()
        << " (tombstone " << log.m_tombstone_block_index << ").");

    return log;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
