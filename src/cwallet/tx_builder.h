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

// Transaction builder: select inputs, make rings and outputs for an account's spend request.
// - build_unsigned() only needs the account's view key (outputs are made from the recipients' public keys)
// - build() also signs, so it needs the account's spend key


#pragma once

//local headers
#include "cwallet_core/cwallet_config.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/tx_memo_types.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <vector>

//forward declarations
namespace cw
{
    class LedgerContext;
    class NetworkContext;
    class WalletStore;
}

namespace cw
{

struct TxBuilderConfig final
{
    /// ring members per input
    std::size_t m_ring_size{config::CW_RING_SIZE};
    /// max inputs per tx
    std::size_t m_max_inputs{config::CW_MAX_INPUTS};
    /// max outputs per tx (including change)
    std::size_t m_max_outputs{config::CW_MAX_OUTPUTS};
    /// fee floor used when the network does not advertise a minimum for the fee token
    rct::xmr_amount m_minimum_fee{config::CW_MINIMUM_FEE};
    /// tombstone of a tx built without one: ledger height + horizon
    std::uint64_t m_default_tombstone_horizon{config::CW_DEFAULT_NEW_TX_BLOCK_ATTEMPTS};
};

////
// TxOutlay
// - a payment to a recipient
///
struct TxOutlay final
{
    PublicAddress m_recipient;
    Amount m_amount;
};

////
// TxBuildRequest
///
struct TxBuildRequest final
{
    /// payments (all in one token)
    std::vector<TxOutlay> m_outlays;
    /// fee value (none: the network minimum for the fee token)
    boost::optional<rct::xmr_amount> m_fee_value;
    /// fee token (none: the outlays' token)
    boost::optional<token_id_t> m_fee_token_id;
    /// allow paying the fee in a different token than the outlays
    bool m_allow_mixed_token_fee{false};
    /// Txos to spend (empty: select automatically)
    std::vector<rct::key> m_input_txo_ids;
    /// only select Txos worth at most this much
    boost::optional<rct::xmr_amount> m_max_spendable_value;
    /// the tx is invalid in blocks with index >= tombstone (0: ledger height + default horizon)
    std::uint64_t m_tombstone_block_index{0};
    /// memo scheme (none: authenticated sender memos from the account's main address)
    boost::optional<MemoBuilderVariant> m_memo_builder;
    /// allow more than one outlay
    bool m_allow_multiple_outlays{false};
};

////
// TransactionBuilder
// - holds no state between requests (safe to use from several threads at once)
///
class TransactionBuilder final
{
public:
//constructors
    TransactionBuilder(const WalletStore &store,
        const LedgerContext &ledger,
        const NetworkContext &network,
        const TxBuilderConfig &config);

//member functions
    /**
    * brief: build_unsigned - make an unsigned proposal
    * param: account_id - account that pays
    * param: request -
    * return: proposal with inputs, rings, outputs, fee and tombstone
    */
    UnsignedTxProposal build_unsigned(const rct::key &account_id, const TxBuildRequest &request) const;
    /**
    * brief: build - make a signed proposal (equivalent to sign_tx_proposal(build_unsigned(...)))
    * param: account_id - account that pays (must have a spend key)
    * param: request -
    * return: signed proposal
    */
    TxProposal build(const rct::key &account_id, const TxBuildRequest &request) const;

private:
//member variables
    const WalletStore &m_store;
    const LedgerContext &m_ledger;
    const NetworkContext &m_network;
    const TxBuilderConfig m_config;
};

/**
* brief: make_rings_for_inputs - sample decoys for a set of inputs and get their membership proofs
*   - all ring members in the set are distinct
* param: ledger -
* param: input_txos - the real outputs (must be in the ledger)
* param: ring_size -
* outparam: rings_out - one ring per input
* outparam: membership_proofs_out - one proof per ring member
* outparam: real_indices_out - position of each real output in its ring
*/
void make_rings_for_inputs(const LedgerContext &ledger,
    const std::vector<TxOut> &input_txos,
    const std::size_t ring_size,
    std::vector<std::vector<TxOut>> &rings_out,
    std::vector<std::vector<TxOutMembershipProof>> &membership_proofs_out,
    std::vector<std::size_t> &real_indices_out);

} //namespace cw
