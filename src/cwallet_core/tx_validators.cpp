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
#include "tx_validators.h"

//local headers
#include "crypto/crypto.h"
#include "cwallet_config.h"
#include "ledger_context.h"
#include "misc_log_ex.h"
#include "ringct/bulletproofs_plus.h"
#include "ringct/rctOps.h"
#include "ringct/rctSigs.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"
#include "tx_misc_utils.h"
#include "tx_out_membership_utils.h"

//third party headers

//standard headers
#include <algorithm>
#include <unordered_set>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static rct::ctkeyV ring_to_ctkeys(const std::vector<TxOut> &ring)
{
    // vector of pairs <Ko_i, C_i> for ring members
    rct::ctkeyV ring_converted;
    ring_converted.reserve(ring.size());

    for (const TxOut &ring_member : ring)
        ring_converted.emplace_back(rct::ctkey{ring_member.m_onetime_address, ring_member.m_amount_commitment});

    return ring_converted;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TxValidationConfig default_tx_validation_config()
{
    return TxValidationConfig{
            config::CW_RING_SIZE,
            1,
            config::CW_MAX_INPUTS,
            1,
            config::CW_MAX_OUTPUTS
        };
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_semantics_component_counts(const TxValidationConfig &config, const Tx &tx)
{
    const std::size_t num_inputs{tx.m_prefix.m_inputs.size()};
    const std::size_t num_outputs{tx.m_prefix.m_outputs.size()};

    // input count
    if (num_inputs < config.m_min_inputs ||
        num_inputs > config.m_max_inputs)
        return false;

    // output count
    if (num_outputs < config.m_min_outputs ||
        num_outputs > config.m_max_outputs)
        return false;

    // rings and membership proofs
    for (const TxIn &input : tx.m_prefix.m_inputs)
    {
        if (input.m_ring.size() != config.m_ring_size)
            return false;
        if (input.m_proofs.size() != input.m_ring.size())
            return false;
    }

    // pseudo-output commitments and ring signatures should be 1:1 with inputs
    if (tx.m_pseudo_output_commitments.size() != num_inputs ||
        tx.m_ring_signatures.size() != num_inputs)
        return false;

    // range commitments, output token ids and generator link proofs should be 1:1 with outputs
    if (tx.m_range_proof.V.size() != num_outputs ||
        tx.m_output_token_ids.size() != num_outputs ||
        tx.m_generator_link_proofs.size() != num_outputs)
        return false;

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_semantics_sorting(const std::vector<TxOut> &outputs)
{
    // strictly ascending by ephemeral pubkey (also implies unique)
    for (std::size_t output_index{1}; output_index < outputs.size(); ++output_index)
    {
        if (!(outputs[output_index - 1] < outputs[output_index]))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_key_images(const Tx &tx, const LedgerContext &ledger_context)
{
    const std::vector<crypto::key_image> key_images{tx.get_key_images()};
    std::unordered_set<crypto::key_image> seen_key_images;
    std::uint64_t spent_block_index;

    for (const crypto::key_image &key_image : key_images)
    {
        // unique in the tx
        if (!seen_key_images.insert(key_image).second)
            return false;

        // not spent in the ledger
        if (ledger_context.try_get_key_image_block_index(key_image, spent_block_index))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_tombstone(const std::uint64_t tombstone_block_index, const std::uint64_t next_block_index)
{
    return next_block_index < tombstone_block_index;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_fee(const rct::xmr_amount fee, const rct::xmr_amount minimum_fee)
{
    return fee >= minimum_fee;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_membership_proofs(const std::vector<TxIn> &inputs, const LedgerContext &ledger_context)
{
    rct::key proof_root;
    rct::key ledger_root;

    for (const TxIn &input : inputs)
    {
        if (input.m_ring.size() != input.m_proofs.size())
            return false;

        // ring members must be distinct ledger outputs
        std::vector<rct::key> ring_member_ids;
        ring_member_ids.reserve(input.m_ring.size());

        for (std::size_t ring_index{0}; ring_index < input.m_ring.size(); ++ring_index)
        {
            if (!try_compute_root_from_membership_proof(input.m_ring[ring_index],
                    input.m_proofs[ring_index],
                    proof_root))
                return false;

            if (!ledger_context.try_get_tx_out_membership_root(input.m_proofs[ring_index].m_highest_index,
                    ledger_root))
                return false;

            if (!(proof_root == ledger_root))
                return false;

            ring_member_ids.emplace_back(make_txo_id(input.m_ring[ring_index]));
        }

        if (!keys_are_unique(ring_member_ids))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_amount_balance(const Tx &tx, const bool defer_batchable)
{
    const rct::BulletproofPlus &range_proofs = tx.m_range_proof;
    const std::size_t num_outputs{tx.m_prefix.m_outputs.size()};

    // sanity check
    if (range_proofs.V.size() == 0 ||
        range_proofs.V.size() != num_outputs ||
        tx.m_output_token_ids.size() != num_outputs ||
        tx.m_generator_link_proofs.size() != num_outputs)
        return false;

    // 1. sum(C') ?= sum(C_out) + fee H_fee  (per token, since each token has its own generator)
    if (!commitments_balance(tx.m_pseudo_output_commitments,
            get_tx_outs_amount_commitments(tx.m_prefix.m_outputs),
            Amount{tx.m_prefix.m_fee, tx.m_prefix.m_fee_token_id}))
        return false;

    // 2. each output commitment must hide the same amount as its range commitment C_r = 8 V
    for (std::size_t output_index{0}; output_index < num_outputs; ++output_index)
    {
        if (!verify_generator_link_proof(tx.m_generator_link_proofs[output_index],
                tx.m_output_token_ids[output_index],
                tx.m_prefix.m_outputs[output_index].m_amount_commitment,
                rct::scalarmult8(range_proofs.V[output_index])))
            return false;
    }

    // 3. range proofs must be valid
    if (!defer_batchable)
    {
        std::vector<const rct::BulletproofPlus*> range_proof_ptrs;
        range_proof_ptrs.emplace_back(&range_proofs);  //note: there is only one range proofs aggregate per tx

        if (!rct::bulletproof_plus_VERIFY(range_proof_ptrs))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx_ring_signatures(const Tx &tx)
{
    if (tx.m_ring_signatures.size() != tx.m_prefix.m_inputs.size() ||
        tx.m_pseudo_output_commitments.size() != tx.m_prefix.m_inputs.size())
        return false;

    rct::key tx_prefix_hash;
    get_tx_prefix_hash(tx.m_prefix, tx_prefix_hash);

    for (std::size_t input_index{0}; input_index < tx.m_prefix.m_inputs.size(); ++input_index)
    {
        if (!rct::verRctCLSAGSimple(tx_prefix_hash,
                tx.m_ring_signatures[input_index],
                ring_to_ctkeys(tx.m_prefix.m_inputs[input_index].m_ring),
                tx.m_pseudo_output_commitments[input_index]))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool validate_tx(const Tx &tx,
    const TxValidationConfig &config,
    const LedgerContext &ledger_context,
    const rct::xmr_amount minimum_fee)
{
    // 1. semantics
    if (!validate_tx_semantics_component_counts(config, tx))
    {
        MWARNING("tx validation: bad component counts.");
        return false;
    }
    if (!validate_tx_semantics_sorting(tx.m_prefix.m_outputs))
    {
        MWARNING("tx validation: outputs are not sorted.");
        return false;
    }

    // 2. ledger context
    if (!validate_tx_tombstone(tx.m_prefix.m_tombstone_block_index, ledger_context.num_blocks()))
    {
        MWARNING("tx validation: tombstone block " << tx.m_prefix.m_tombstone_block_index << " has passed.");
        return false;
    }
    if (!validate_tx_fee(tx.m_prefix.m_fee, minimum_fee))
    {
        MWARNING("tx validation: fee " << tx.m_prefix.m_fee << " is below the minimum " << minimum_fee << ".");
        return false;
    }
    if (!validate_tx_key_images(tx, ledger_context))
    {
        MWARNING("tx validation: key image is duplicated or already spent.");
        return false;
    }
    if (!validate_tx_membership_proofs(tx.m_prefix.m_inputs, ledger_context))
    {
        MWARNING("tx validation: invalid membership proof.");
        return false;
    }

    // 3. balance and signatures
    if (!validate_tx_amount_balance(tx, false))
    {
        MWARNING("tx validation: amounts do not balance.");
        return false;
    }
    if (!validate_tx_ring_signatures(tx))
    {
        MWARNING("tx validation: invalid ring signature.");
        return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
