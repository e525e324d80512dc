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
#include "tx_proposal_types.h"

//local headers
#include "cwallet_core/tx_component_types.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"

//third party headers
#include <boost/variant/get.hpp>

//standard headers
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.tx"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
void get_sorted_tx_outs(const std::vector<OutputTxo> &payload_txos,
    const std::vector<OutputTxo> &change_txos,
    std::vector<TxOut> &tx_outs_out)
{
    const std::size_t num_outputs{payload_txos.size() + change_txos.size()};
    tx_outs_out.clear();
    tx_outs_out.resize(num_outputs);

    std::vector<bool> filled(num_outputs, false);
    auto place_output =
        [&](const OutputTxo &output_txo)
        {
            CHECK_AND_ASSERT_THROW_MES(output_txo.m_tx_out_index < num_outputs &&
                    !filled[output_txo.m_tx_out_index],
                "get sorted tx outs: invalid output index.");

            tx_outs_out[output_txo.m_tx_out_index] = output_txo.m_tx_out;
            filled[output_txo.m_tx_out_index] = true;
        };

    for (const OutputTxo &payload_txo : payload_txos)
        place_output(payload_txo);
    for (const OutputTxo &change_txo : change_txos)
        place_output(change_txo);
}
//-------------------------------------------------------------------------------------------------------------------
void make_tx_prefix(const UnsignedTxProposal &unsigned_proposal, TxPrefix &tx_prefix_out)
{
    // inputs
    tx_prefix_out.m_inputs.clear();
    tx_prefix_out.m_inputs.reserve(unsigned_proposal.m_inputs.size());

    for (const UnsignedInput &input : unsigned_proposal.m_inputs)
    {
        tx_prefix_out.m_inputs.emplace_back();
        tx_prefix_out.m_inputs.back().m_ring = input.m_ring;
        tx_prefix_out.m_inputs.back().m_proofs = input.m_membership_proofs;
    }

    // outputs
    get_sorted_tx_outs(unsigned_proposal.m_payload_txos, unsigned_proposal.m_change_txos, tx_prefix_out.m_outputs);

    // fee and tombstone
    tx_prefix_out.m_fee = unsigned_proposal.m_fee.m_value;
    tx_prefix_out.m_fee_token_id = unsigned_proposal.m_fee.m_token_id;
    tx_prefix_out.m_tombstone_block_index = unsigned_proposal.m_tombstone_block_index;
}
//-------------------------------------------------------------------------------------------------------------------
rct::key get_tx_proposal_id(const TxProposal &proposal)
{
    rct::key tx_id;
    get_tx_prefix_hash(proposal.m_tx.m_prefix, tx_id);

    return tx_id;
}
//-------------------------------------------------------------------------------------------------------------------
const rct::key& get_tx_proposal_account_id(const TxProposalVariant &proposal)
{
    if (const UnsignedTxProposal *unsigned_proposal = boost::get<UnsignedTxProposal>(&proposal))
        return unsigned_proposal->m_account_id;

    return boost::get<TxProposal>(proposal).m_account_id;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
