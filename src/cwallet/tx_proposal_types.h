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

// Transaction proposals: unsigned (ring data + outputs, view key only) and signed (a full tx).


#pragma once

//local headers
#include "cwallet_core/tx_component_types.h"
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"

//third party headers
#include <boost/variant/variant.hpp>

//standard headers
#include <cstdint>
#include <vector>

//forward declarations


namespace cw
{

////
// OutputTxo
// - an output made by a tx proposal, with what the sender knows about it
///
struct OutputTxo final
{
    /// the output
    TxOut m_tx_out;
    /// recipient address
    PublicAddress m_recipient;
    /// value and token id
    Amount m_amount;
    /// x (needed for the range proof)
    crypto::secret_key m_amount_blinding_factor;
    /// confirmation number (the sender can reveal it to prove it made the output)
    rct::key m_confirmation_number;
    /// position of the output in the tx's sorted output list
    std::size_t m_tx_out_index;
};

////
// UnsignedInput
// - a selected input with its ring, before the key image and ring signature are made
///
struct UnsignedInput final
{
    /// id of the Txo being spent
    rct::key m_txo_id;
    /// value and token id of the Txo
    Amount m_amount;
    /// subaddress the Txo was received at
    std::uint64_t m_subaddress_index;
    /// ring members (the real one is at m_real_index)
    std::vector<TxOut> m_ring;
    /// membership proofs (one per ring member)
    std::vector<TxOutMembershipProof> m_membership_proofs;
    /// position of the real output in the ring
    std::size_t m_real_index;
};

////
// InputTxo
// - a spent input of a signed tx
///
struct InputTxo final
{
    /// id of the Txo being spent
    rct::key m_txo_id;
    /// the Txo's output
    TxOut m_tx_out;
    /// value and token id of the Txo
    Amount m_amount;
    /// subaddress the Txo was received at
    std::uint64_t m_subaddress_index;
    /// key image recovered at signing
    crypto::key_image m_key_image;
};

////
// UnsignedTxProposal
// - everything except key images and signatures (outputs only need the recipients' public keys)
///
struct UnsignedTxProposal final
{
    /// account whose Txos are spent
    rct::key m_account_id;
    /// inputs (sorted by txo id)
    std::vector<UnsignedInput> m_inputs;
    /// outputs to recipients
    std::vector<OutputTxo> m_payload_txos;
    /// change outputs to the account (at most one per token id)
    std::vector<OutputTxo> m_change_txos;
    /// fee value and token id
    Amount m_fee;
    /// the tx is invalid in blocks with index >= tombstone
    std::uint64_t m_tombstone_block_index;
};

////
// TxProposal
// - a signed tx with its input and output metadata
///
struct TxProposal final
{
    /// account whose Txos are spent
    rct::key m_account_id;
    /// the tx
    Tx m_tx;
    /// spent Txos (1:1 with the tx's inputs)
    std::vector<InputTxo> m_input_txos;
    /// outputs to recipients
    std::vector<OutputTxo> m_payload_txos;
    /// change outputs to the account
    std::vector<OutputTxo> m_change_txos;
};

/// either phase of a proposal
using TxProposalVariant = boost::variant<UnsignedTxProposal, TxProposal>;

/**
* brief: get_sorted_tx_outs - collect the outputs of a proposal in tx order
* param: payload_txos -
* param: change_txos -
* outparam: tx_outs_out - outputs ordered by m_tx_out_index
*/
void get_sorted_tx_outs(const std::vector<OutputTxo> &payload_txos,
    const std::vector<OutputTxo> &change_txos,
    std::vector<TxOut> &tx_outs_out);
/**
* brief: make_tx_prefix - make the prefix of the tx an unsigned proposal will become
* param: unsigned_proposal -
* outparam: tx_prefix_out -
*/
void make_tx_prefix(const UnsignedTxProposal &unsigned_proposal, TxPrefix &tx_prefix_out);
/**
* brief: get_tx_proposal_id - get the id of a signed proposal's tx (its prefix hash)
* param: proposal -
* return: tx id
*/
rct::key get_tx_proposal_id(const TxProposal &proposal);
/// get the account id of either phase of a proposal
const rct::key& get_tx_proposal_account_id(const TxProposalVariant &proposal);

} //namespace cw
