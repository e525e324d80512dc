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

// Wallet store rows: accounts, assigned subaddresses, Txos, transaction logs.


#pragma once

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/tx_memo_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <string>
#include <vector>

//forward declarations


namespace cw
{

enum class TxoType : unsigned char
{
    /// received from the ledger at a non-change subaddress
    RECEIVED,
    /// sent by the account to its own change subaddress
    CHANGE
};

enum class TxoStatus : unsigned char
{
    /// decodes with the account's view key but the subaddress is not assigned yet
    ORPHANED,
    /// own change output of a submitted tx, not seen on-chain yet
    MINTED,
    /// spendable
    UNSPENT,
    /// an input of a pending transaction log
    PENDING,
    /// its key image was seen on-chain
    SPENT
};

enum class TransactionLogStatus : unsigned char
{
    BUILT,
    PENDING,
    SUCCEEDED,
    FAILED
};

////
// Account
// - a locally-held account and its sync cursor
///
struct Account final
{
    /// H32(main address)
    rct::key m_id;
    /// view privkey, optional spend privkey, base spend pubkey
    AccountKeys m_keys;
    /// subaddress shown to payers
    std::uint64_t m_main_subaddress_index;
    /// subaddress that receives change
    std::uint64_t m_change_subaddress_index;
    /// next subaddress to assign
    std::uint64_t m_next_subaddress_index;
    /// first block the account cares about
    std::uint64_t m_first_block_index;
    /// sync cursor: next block to scan
    std::uint64_t m_next_block_index;
    /// display name
    std::string m_name;
};

////
// AssignedSubaddress
///
struct AssignedSubaddress final
{
    /// owner
    rct::key m_account_id;
    /// i
    std::uint64_t m_index;
    /// {K^{s,i}, K^{v,i}}
    PublicAddress m_address;
    /// user comment
    std::string m_comment;
};

////
// Txo
// - an output owned by an account
// - the amount and owner never change after creation; the key image never changes once set
///
struct Txo final
{
    /// H32(Ko, R)
    rct::key m_id;
    /// owner
    rct::key m_account_id;
    /// the output
    TxOut m_tx_out;
    /// decoded value and token id
    Amount m_amount;
    /// subaddress the output was sent to (none: orphaned)
    boost::optional<std::uint64_t> m_subaddress_index;
    /// K^{s,i} recovered from the output (for orphan recovery)
    rct::key m_nominal_spend_pubkey;
    /// block the output was seen in (none: minted)
    boost::optional<std::uint64_t> m_received_block_index;
    /// key image (none: orphaned, or view-only and not imported yet)
    boost::optional<crypto::key_image> m_key_image;
    /// block the key image was seen in
    boost::optional<std::uint64_t> m_spent_block_index;
    /// received or change
    TxoType m_type;
    /// decoded memo
    MemoPayload m_memo;
};

////
// TransactionLogInput
///
struct TransactionLogInput final
{
    /// Txo spent by the tx
    rct::key m_txo_id;
    /// its key image
    crypto::key_image m_key_image;
};

////
// TransactionLog
// - a tx made by an account
// - BUILT -> PENDING (submitted) -> SUCCEEDED (an output was seen on-chain) or FAILED (tombstone/rejected)
///
struct TransactionLog final
{
    /// tx id (prefix hash)
    rct::key m_id;
    /// account that made the tx
    rct::key m_account_id;
    /// inputs in tx order
    std::vector<TransactionLogInput> m_inputs;
    /// outputs to recipients
    std::vector<OutputTxo> m_payload_txos;
    /// outputs to the account's change subaddress
    std::vector<OutputTxo> m_change_txos;
    /// fee value and token id
    Amount m_fee;
    /// the tx is invalid in blocks with index >= tombstone
    std::uint64_t m_tombstone_block_index;
    /// ledger height when the tx was submitted
    boost::optional<std::uint64_t> m_submitted_block_index;
    /// block where the tx was seen (succeeded) or the cursor passed its tombstone (failed)
    boost::optional<std::uint64_t> m_finalized_block_index;
    /// state
    TransactionLogStatus m_status;
    /// user comment
    std::string m_comment;
};

////
// BlockSyncUpdate
// - everything one scanned block changes for one account (applied atomically)
///
struct BlockSyncUpdate final
{
    /// account that was scanned
    rct::key m_account_id;
    /// the scanned block (must equal the account's cursor)
    std::uint64_t m_block_index;
    /// outputs owned by the account (including orphaned ones)
    std::vector<TxoRecord> m_received_records;
    /// key images spent in the block
    std::vector<crypto::key_image> m_spent_key_images;
    /// ephemeral pubkeys of all outputs in the block (to detect our txs landing)
    std::vector<rct::key> m_ephemeral_pubkeys;
};

////
// Balance
// - sums of Txo values for one account and token, by status
///
struct Balance final
{
    boost::multiprecision::uint128_t m_unspent{0};
    boost::multiprecision::uint128_t m_pending{0};
    boost::multiprecision::uint128_t m_spent{0};
    boost::multiprecision::uint128_t m_orphaned{0};
    boost::multiprecision::uint128_t m_minted{0};
};

/**
* brief: get_txo_status - derive the status of a Txo
* param: txo -
* param: is_pending_input - true if the Txo is an input of a pending transaction log
* return: the Txo's status
*/
TxoStatus get_txo_status(const Txo &txo, const bool is_pending_input);
/**
* brief: make_txo - make a Txo row from a recovered output
* param: record -
* param: account -
* param: received_block_index - none for minted change
* outparam: txo_out -
*/
void make_txo(const TxoRecord &record,
    const Account &account,
    const boost::optional<std::uint64_t> &received_block_index,
    Txo &txo_out);
/**
* brief: make_transaction_log - make a pending transaction log for a signed proposal
* param: proposal -
* param: submitted_block_index - ledger height at submission
* param: comment -
* outparam: log_out -
*/
void make_transaction_log(const TxProposal &proposal,
    const std::uint64_t submitted_block_index,
    std::string comment,
    TransactionLog &log_out);
/**
* brief: try_recover_orphaned_txo - try to attach an orphaned Txo to a newly assigned subaddress
* param: keys - the owner's keys (the key image is made if they can spend)
* param: subaddress_map - {K^{s,i} : i} for the owner's assigned subaddresses
* inoutparam: txo_inout -
* return: true if the Txo is no longer orphaned
*/
bool try_recover_orphaned_txo(const AccountKeys &keys, const subaddress_map_t &subaddress_map, Txo &txo_inout);
/// get the ids of the Txos a log spends
std::vector<rct::key> get_transaction_log_input_ids(const TransactionLog &log);
/// check if any of a log's outputs have the given ephemeral pubkey
bool transaction_log_has_output(const TransactionLog &log, const rct::key &ephemeral_pubkey);

} //namespace cw
