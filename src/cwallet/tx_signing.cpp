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
#include "tx_signing.h"

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/tx_misc_utils.h"
#include "cwallet_core/txo_core_utils.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "device/device.hpp"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctSigs.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"
#include "wallet_errors.h"

//third party headers

//standard headers
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.tx"

namespace cw
{

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_unsigned_input(const UnsignedInput &input)
{
    CHECK_AND_ASSERT_THROW_MES(input.m_ring.size() > 0, "sign tx: an input has an empty ring.");
    CHECK_AND_ASSERT_THROW_MES(input.m_real_index < input.m_ring.size(),
        "sign tx: an input has a malformed real index.");
    CW_THROW_WALLET_EXCEPTION_IF(input.m_membership_proofs.size() != input.m_ring.size(),
        error::membership_proof_mismatch, input.m_ring.size(), input.m_membership_proofs.size());
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_output_txo(const OutputTxo &output_txo)
{
    CW_THROW_WALLET_EXCEPTION_IF(output_txo.m_confirmation_number == rct::zero(),
        error::invalid_confirmation_number, "an output has no confirmation number");
    CHECK_AND_ASSERT_THROW_MES(make_amount_commitment(output_txo.m_amount, output_txo.m_amount_blinding_factor) ==
            output_txo.m_tx_out.m_amount_commitment,
        "sign tx: an output's amount commitment does not match its amount.");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void recover_input_secrets(const UnsignedInput &input,
    const AccountKeys &keys,
    crypto::secret_key &onetime_address_privkey_out,
    crypto::secret_key &amount_blinding_factor_out,
    crypto::key_image &key_image_out)
{
    const TxOut &real_tx_out{input.m_ring[input.m_real_index]};

    // 1. k^o
    make_txo_spend_privkey(keys, real_tx_out, input.m_subaddress_index, onetime_address_privkey_out);

    // 2. x (the amount commitment must open to the recorded amount)
    crypto::key_derivation derivation;
    crypto::secret_key sender_receiver_secret;
    make_sender_receiver_derivation(real_tx_out.m_ephemeral_pubkey, keys.m_view_privkey, derivation);
    make_sender_receiver_secret(derivation, sender_receiver_secret);
    make_amount_blinding_factor(sender_receiver_secret, amount_blinding_factor_out);

    CW_THROW_WALLET_EXCEPTION_IF(!(make_amount_commitment(input.m_amount, amount_blinding_factor_out) ==
            real_tx_out.m_amount_commitment),
        error::txo_decode_failed, input.m_txo_id);

    // 3. KI = k^o Hp(Ko)
    crypto::generate_key_image(rct::rct2pk(real_tx_out.m_onetime_address), onetime_address_privkey_out, key_image_out);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static rct::ctkeyV ring_to_ctkeys(const std::vector<TxOut> &ring)
{
    rct::ctkeyV ring_ctkeys;
    ring_ctkeys.reserve(ring.size());

    // vector of pairs <onetime addr, amount commitment>
    for (const TxOut &ring_member : ring)
        ring_ctkeys.emplace_back(rct::ctkey{ring_member.m_onetime_address, ring_member.m_amount_commitment});

    return ring_ctkeys;
}
//-------------------------------------------------------------------------------------------------------------------
TxProposal sign_tx_proposal(const UnsignedTxProposal &unsigned_proposal, const AccountKeys &keys)
{
    CW_THROW_WALLET_EXCEPTION_IF(!can_spend(keys), error::missing_spend_key, unsigned_proposal.m_account_id);
    CHECK_AND_ASSERT_THROW_MES(unsigned_proposal.m_inputs.size() > 0, "sign tx: the proposal has no inputs.");
    CHECK_AND_ASSERT_THROW_MES(unsigned_proposal.m_payload_txos.size() + unsigned_proposal.m_change_txos.size() > 0,
        "sign tx: the proposal has no outputs.");

    // 1. sanity checks
    for (const UnsignedInput &input : unsigned_proposal.m_inputs)
        check_unsigned_input(input);

    for (const OutputTxo &payload_txo : unsigned_proposal.m_payload_txos)
        check_output_txo(payload_txo);
    for (const OutputTxo &change_txo : unsigned_proposal.m_change_txos)
        check_output_txo(change_txo);

    // 2. amounts must balance (per token)
    std::vector<Amount> input_amounts;
    std::vector<Amount> output_amounts;
    input_amounts.reserve(unsigned_proposal.m_inputs.size());

    for (const UnsignedInput &input : unsigned_proposal.m_inputs)
        input_amounts.emplace_back(input.m_amount);

    TxProposal proposal;
    proposal.m_account_id = unsigned_proposal.m_account_id;
    proposal.m_payload_txos = unsigned_proposal.m_payload_txos;
    proposal.m_change_txos = unsigned_proposal.m_change_txos;

    // outputs in tx order
    std::vector<const OutputTxo*> output_txos(proposal.m_payload_txos.size() + proposal.m_change_txos.size(), nullptr);
    for (const OutputTxo &payload_txo : proposal.m_payload_txos)
    {
        CHECK_AND_ASSERT_THROW_MES(payload_txo.m_tx_out_index < output_txos.size(), "sign tx: malformed output index.");
        output_txos[payload_txo.m_tx_out_index] = &payload_txo;
    }
    for (const OutputTxo &change_txo : proposal.m_change_txos)
    {
        CHECK_AND_ASSERT_THROW_MES(change_txo.m_tx_out_index < output_txos.size(), "sign tx: malformed output index.");
        output_txos[change_txo.m_tx_out_index] = &change_txo;
    }

    std::vector<crypto::secret_key> output_blinding_factors;
    output_amounts.reserve(output_txos.size());
    output_blinding_factors.reserve(output_txos.size());

    for (const OutputTxo *output_txo : output_txos)
    {
        CHECK_AND_ASSERT_THROW_MES(output_txo, "sign tx: output indices are not a permutation.");
        output_amounts.emplace_back(output_txo->m_amount);
        output_blinding_factors.emplace_back(output_txo->m_amount_blinding_factor);
    }

    CHECK_AND_ASSERT_THROW_MES(token_amounts_balance(input_amounts, output_amounts, unsigned_proposal.m_fee),
        "sign tx: input amounts do not balance with output amounts and the fee.");

    // 3. input secrets and key images
    std::vector<crypto::secret_key> onetime_address_privkeys(unsigned_proposal.m_inputs.size());
    std::vector<crypto::secret_key> input_blinding_factors(unsigned_proposal.m_inputs.size());
    proposal.m_input_txos.resize(unsigned_proposal.m_inputs.size());

    for (std::size_t input_index{0}; input_index < unsigned_proposal.m_inputs.size(); ++input_index)
    {
        const UnsignedInput &input{unsigned_proposal.m_inputs[input_index]};
        InputTxo &input_txo{proposal.m_input_txos[input_index]};

        recover_input_secrets(input,
            keys,
            onetime_address_privkeys[input_index],
            input_blinding_factors[input_index],
            input_txo.m_key_image);

        input_txo.m_txo_id = input.m_txo_id;
        input_txo.m_tx_out = input.m_ring[input.m_real_index];
        input_txo.m_amount = input.m_amount;
        input_txo.m_subaddress_index = input.m_subaddress_index;
    }

    // 4. pseudo-output commitments: C' = x' G + a H_t, with sum(x') == sum(output x)
    std::vector<crypto::secret_key> pseudo_blinding_factors;
    make_pseudo_output_blinding_factors(unsigned_proposal.m_inputs.size(),
        output_blinding_factors,
        pseudo_blinding_factors);

    Tx &tx{proposal.m_tx};
    tx.m_pseudo_output_commitments.reserve(unsigned_proposal.m_inputs.size());

    for (std::size_t input_index{0}; input_index < unsigned_proposal.m_inputs.size(); ++input_index)
    {
        tx.m_pseudo_output_commitments.emplace_back(
                make_amount_commitment(unsigned_proposal.m_inputs[input_index].m_amount,
                    pseudo_blinding_factors[input_index])
            );
    }

    // 5. range proof over C_r = y G + a H (fresh y), and a link from each C_out to its C_r
    std::vector<rct::xmr_amount> output_values;
    std::vector<crypto::secret_key> range_blinding_factors;
    output_values.reserve(output_amounts.size());
    range_blinding_factors.reserve(output_amounts.size());
    tx.m_output_token_ids.reserve(output_amounts.size());
    tx.m_generator_link_proofs.reserve(output_amounts.size());

    for (std::size_t output_index{0}; output_index < output_amounts.size(); ++output_index)
    {
        output_values.emplace_back(output_amounts[output_index].m_value);
        range_blinding_factors.emplace_back(rct::rct2sk(rct::skGen()));

        tx.m_output_token_ids.emplace_back(output_amounts[output_index].m_token_id);
        tx.m_generator_link_proofs.emplace_back(
                make_generator_link_proof(output_amounts[output_index],
                    output_blinding_factors[output_index],
                    range_blinding_factors.back())
            );
    }

    tx.m_range_proof = make_output_range_proof(output_values, range_blinding_factors);

    // 6. prefix
    make_tx_prefix(unsigned_proposal, tx.m_prefix);

    rct::key tx_prefix_hash;
    get_tx_prefix_hash(tx.m_prefix, tx_prefix_hash);

    // 7. ring signatures
    tx.m_ring_signatures.reserve(unsigned_proposal.m_inputs.size());

    for (std::size_t input_index{0}; input_index < unsigned_proposal.m_inputs.size(); ++input_index)
    {
        const UnsignedInput &input{unsigned_proposal.m_inputs[input_index]};

        // spent output privkeys <ko, x>
        rct::ctkey spent_output_privkeys;
        spent_output_privkeys.dest = rct::sk2rct(onetime_address_privkeys[input_index]);
        spent_output_privkeys.mask = rct::sk2rct(input_blinding_factors[input_index]);

        tx.m_ring_signatures.emplace_back(
                rct::proveRctCLSAGSimple(tx_prefix_hash,
                    ring_to_ctkeys(input.m_ring),
                    spent_output_privkeys,
                    rct::sk2rct(pseudo_blinding_factors[input_index]),
                    tx.m_pseudo_output_commitments[input_index],
                    nullptr, nullptr, nullptr,  //no multisig
                    input.m_real_index,
                    hw::get_device("default"))
            );

        CHECK_AND_ASSERT_THROW_MES(rct::rct2ki(tx.m_ring_signatures.back().I) ==
                proposal.m_input_txos[input_index].m_key_image,
            "sign tx: the ring signature's key image does not match the input's key image.");
    }

    // 8. sanity check: sum(C') == sum(C_out) + fee H_fee
    CHECK_AND_ASSERT_THROW_MES(commitments_balance(tx.m_pseudo_output_commitments,
            get_tx_outs_amount_commitments(tx.m_prefix.m_outputs),
            Amount{tx.m_prefix.m_fee, tx.m_prefix.m_fee_token_id}),
        "sign tx: commitments do not balance.");

    MDEBUG("Signed tx " << tx_prefix_hash << " with " << tx.m_ring_signatures.size() << " ring signature(s).");

    return proposal;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
