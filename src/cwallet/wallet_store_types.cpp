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
#include "wallet_store_types.h"

//local headers
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <string>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.store"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
TxoStatus get_txo_status(const Txo &txo, const bool is_pending_input)
{
    if (!txo.m_subaddress_index)
        return TxoStatus::ORPHANED;
    if (txo.m_spent_block_index)
        return TxoStatus::SPENT;
    if (is_pending_input)
        return TxoStatus::PENDING;
    if (!txo.m_received_block_index)
        return TxoStatus::MINTED;

    return TxoStatus::UNSPENT;
}
//-------------------------------------------------------------------------------------------------------------------
void make_txo(const TxoRecord &record,
    const Account &account,
    const boost::optional<std::uint64_t> &received_block_index,
    Txo &txo_out)
{
    txo_out.m_id = record.m_txo_id;
    txo_out.m_account_id = account.m_id;
    txo_out.m_tx_out = record.m_tx_out;
    txo_out.m_amount = record.m_amount;
    txo_out.m_subaddress_index = record.m_subaddress_index;
    txo_out.m_nominal_spend_pubkey = record.m_nominal_spend_pubkey;
    txo_out.m_received_block_index = received_block_index;
    txo_out.m_key_image = record.m_key_image;
    txo_out.m_spent_block_index = boost::none;
    txo_out.m_type =
        record.m_subaddress_index && *record.m_subaddress_index == account.m_change_subaddress_index
        ? TxoType::CHANGE
        : TxoType::RECEIVED;
    txo_out.m_memo = record.m_memo;
}
//-------------------------------------------------------------------------------------------------------------------
void make_transaction_log(const TxProposal &proposal,
    const std::uint64_t submitted_block_index,
    std::string comment,
    TransactionLog &log_out)
{
    CHECK_AND_ASSERT_THROW_MES(proposal.m_input_txos.size() == proposal.m_tx.m_prefix.m_inputs.size(),
        "make transaction log: input metadata does not line up with the tx inputs.");

    log_out.m_id = get_tx_proposal_id(proposal);
    log_out.m_account_id = proposal.m_account_id;

    log_out.m_inputs.clear();
    log_out.m_inputs.reserve(proposal.m_input_txos.size());
    for (const InputTxo &input_txo : proposal.m_input_txos)
        log_out.m_inputs.emplace_back(TransactionLogInput{input_txo.m_txo_id, input_txo.m_key_image});

    log_out.m_payload_txos = proposal.m_payload_txos;
    log_out.m_change_txos = proposal.m_change_txos;
    log_out.m_fee = Amount{proposal.m_tx.m_prefix.m_fee, proposal.m_tx.m_prefix.m_fee_token_id};
    log_out.m_tombstone_block_index = proposal.m_tx.m_prefix.m_tombstone_block_index;
    log_out.m_submitted_block_index = submitted_block_index;
    log_out.m_finalized_block_index = boost::none;
    log_out.m_status = TransactionLogStatus::PENDING;
    log_out.m_comment = std::move(comment);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_recover_orphaned_txo(const AccountKeys &keys, const subaddress_map_t &subaddress_map, Txo &txo_inout)
{
    if (txo_inout.m_subaddress_index)
        return true;

    TxoRecord record;
    record.m_tx_out = txo_inout.m_tx_out;
    record.m_nominal_spend_pubkey = txo_inout.m_nominal_spend_pubkey;
    record.m_subaddress_index = boost::none;

    if (!try_complete_orphaned_record(keys, subaddress_map, record))
        return false;

    txo_inout.m_subaddress_index = record.m_subaddress_index;
    if (!txo_inout.m_key_image)
        txo_inout.m_key_image = record.m_key_image;

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<rct::key> get_transaction_log_input_ids(const TransactionLog &log)
{
    std::vector<rct::key> input_ids;
    input_ids.reserve(log.m_inputs.size());

    for (const TransactionLogInput &input : log.m_inputs)
        input_ids.emplace_back(input.m_txo_id);

    return input_ids;
}
//-------------------------------------------------------------------------------------------------------------------
bool transaction_log_has_output(const TransactionLog &log, const rct::key &ephemeral_pubkey)
{
    for (const OutputTxo &payload_txo : log.m_payload_txos)
    {
        if (payload_txo.m_tx_out.m_ephemeral_pubkey == ephemeral_pubkey)
            return true;
    }

    for (const OutputTxo &change_txo : log.m_change_txos)
    {
        if (change_txo.m_tx_out.m_ephemeral_pubkey == ephemeral_pubkey)
            return true;
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
