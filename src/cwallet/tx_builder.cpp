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
#include "tx_builder.h"

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/ledger_context.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/tx_memo_types.h"
#include "cwallet_core/txo_core_utils.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "input_selection.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"
#include "tx_signing.h"
#include "wallet_errors.h"
#include "wallet_store.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/optional/optional.hpp>

//standard headers
#include <algorithm>
#include <cstring>
#include <limits>
#include <unordered_set>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.tx"

namespace cw
{

////
// FundingTarget
// - value the inputs of one token must cover (outlays and/or fee)
///
struct FundingTarget final
{
    token_id_t m_token_id;
    boost::multiprecision::uint128_t m_target;
};

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static token_id_t check_outlays(const TxBuildRequest &request, boost::multiprecision::uint128_t &outlay_sum_out)
{
    CW_THROW_WALLET_EXCEPTION_IF(request.m_outlays.empty(), error::no_recipient);
    CW_THROW_WALLET_EXCEPTION_IF(request.m_outlays.size() > 1 && !request.m_allow_multiple_outlays,
        error::multiple_recipients, request.m_outlays.size());

    const token_id_t spend_token_id{request.m_outlays.front().m_amount.m_token_id};
    outlay_sum_out = 0;

    for (const TxOutlay &outlay : request.m_outlays)
    {
        CW_THROW_WALLET_EXCEPTION_IF(outlay.m_amount.m_token_id != spend_token_id, error::mixed_token_outlays);
        outlay_sum_out += outlay.m_amount.m_value;
    }

    CW_THROW_WALLET_EXCEPTION_IF(outlay_sum_out > std::numeric_limits<rct::xmr_amount>::max(),
        error::outbound_value_too_large);

    return spend_token_id;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static Amount resolve_fee(const TxBuildRequest &request,
    const token_id_t spend_token_id,
    const NetworkContext &network,
    const TxBuilderConfig &config)
{
    Amount fee;

    // 1. token
    fee.m_token_id = request.m_fee_token_id ? *request.m_fee_token_id : spend_token_id;
    CW_THROW_WALLET_EXCEPTION_IF(fee.m_token_id != spend_token_id && !request.m_allow_mixed_token_fee,
        error::mixed_token_fee_not_allowed, fee.m_token_id, spend_token_id);

    // 2. value: explicit -> network minimum
    rct::xmr_amount network_minimum_fee{0};
    const bool has_network_minimum{network.try_get_minimum_fee(fee.m_token_id, network_minimum_fee)};

    if (request.m_fee_value)
        fee.m_value = *request.m_fee_value;
    else
    {
        CW_THROW_WALLET_EXCEPTION_IF(!has_network_minimum, error::fee_not_found_for_token, fee.m_token_id);
        fee.m_value = network_minimum_fee;
    }

    // 3. floor
    const rct::xmr_amount minimum_fee{has_network_minimum ? network_minimum_fee : config.m_minimum_fee};
    CW_THROW_WALLET_EXCEPTION_IF(fee.m_value < minimum_fee, error::insufficient_fee, fee.m_value, minimum_fee);

    return fee;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::uint64_t resolve_tombstone(const std::uint64_t requested_tombstone,
    const std::uint64_t num_blocks,
    const std::uint64_t default_horizon)
{
    if (requested_tombstone == 0)
        return num_blocks + default_horizon;

    CW_THROW_WALLET_EXCEPTION_IF(requested_tombstone <= num_blocks,
        error::invalid_tombstone, requested_tombstone, num_blocks);

    return requested_tombstone;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static boost::multiprecision::uint128_t sum_txo_values_for_token(const std::vector<Txo> &txos,
    const token_id_t token_id)
{
    boost::multiprecision::uint128_t sum{0};
    for (const Txo &txo : txos)
    {
        if (txo.m_amount.m_token_id == token_id)
            sum += txo.m_amount.m_value;
    }

    return sum;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void select_inputs(const WalletStore &store,
    const rct::key &account_id,
    const TxBuildRequest &request,
    const std::vector<FundingTarget> &funding_targets,
    const std::size_t max_inputs,
    std::vector<Txo> &inputs_out)
{
    inputs_out.clear();

    // 1. caller-chosen inputs
    if (!request.m_input_txo_ids.empty())
    {
        get_explicit_input_txos(store, account_id, request.m_input_txo_ids, inputs_out);
        CW_THROW_WALLET_EXCEPTION_IF(inputs_out.size() > max_inputs,
            error::too_many_inputs, inputs_out.size(), max_inputs);

        for (const Txo &input : inputs_out)
        {
            const bool funds_a_target{
                    std::find_if(funding_targets.begin(), funding_targets.end(),
                            [&input](const FundingTarget &target) -> bool
                            {
                                return target.m_token_id == input.m_amount.m_token_id;
                            }
                        ) != funding_targets.end()
                };
            CW_THROW_WALLET_EXCEPTION_IF(!funds_a_target, error::txo_not_spendable, input.m_id);
        }

        for (const FundingTarget &target : funding_targets)
        {
            const boost::multiprecision::uint128_t available{sum_txo_values_for_token(inputs_out, target.m_token_id)};
            CW_THROW_WALLET_EXCEPTION_IF(available < target.m_target,
                error::insufficient_funds, target.m_token_id, available.str(), target.m_target.str(), false);
        }

        return;
    }

    // 2. automatic selection (the outlay token gets first pick of the input budget)
    std::vector<Txo> selected_txos;
    for (const FundingTarget &target : funding_targets)
    {
        CW_THROW_WALLET_EXCEPTION_IF(inputs_out.size() >= max_inputs,
            error::insufficient_funds_fragmented, target.m_token_id, max_inputs);

        select_txos_for_target(store.get_spendable_txos(account_id, target.m_token_id, request.m_max_spendable_value),
            target.m_token_id,
            target.m_target,
            max_inputs - inputs_out.size(),
            static_cast<bool>(request.m_max_spendable_value),
            selected_txos);

        inputs_out.insert(inputs_out.end(), selected_txos.begin(), selected_txos.end());
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void make_output_txo(const PublicAddress &recipient,
    const Amount &amount,
    const bool is_change,
    const MemoBuilderVariant &memo_builder,
    const boost::optional<SenderMemoCredential> &sender_credential,
    const DestinationMemoInfo &destination_info,
    OutputTxo &output_txo_out)
{
    // 1. secrets (fresh ephemeral privkey)
    TxOutSecrets secrets;
    make_tx_out_secrets(recipient, rct::rct2sk(rct::skGen()), secrets);

    // 2. memo: payload outputs get the scheme's payload memo, change gets a destination memo
    MemoPayload memo;
    if (!is_change)
    {
        make_payload_memo(memo_builder,
            sender_credential,
            recipient,
            secrets.m_ephemeral_pubkey,
            memo);
    }
    else
        make_change_memo(memo_builder, destination_info, memo);

    // 3. the output
    make_tx_out(recipient, amount, secrets, memo, output_txo_out.m_tx_out);
    output_txo_out.m_recipient = recipient;
    output_txo_out.m_amount = amount;
    output_txo_out.m_amount_blinding_factor = secrets.m_amount_blinding_factor;
    make_confirmation_number(secrets.m_derivation, output_txo_out.m_confirmation_number);
    output_txo_out.m_tx_out_index = 0;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void set_output_indices(std::vector<OutputTxo> &payload_txos_inout, std::vector<OutputTxo> &change_txos_inout)
{
    // outputs are sorted by ephemeral pubkey in the tx
    std::vector<OutputTxo*> output_txos;
    output_txos.reserve(payload_txos_inout.size() + change_txos_inout.size());

    for (OutputTxo &payload_txo : payload_txos_inout)
        output_txos.emplace_back(&payload_txo);
    for (OutputTxo &change_txo : change_txos_inout)
        output_txos.emplace_back(&change_txo);

    std::sort(output_txos.begin(), output_txos.end(),
            [](const OutputTxo *a, const OutputTxo *b) -> bool
            {
                return a->m_tx_out < b->m_tx_out;
            }
        );

    for (std::size_t output_index{0}; output_index < output_txos.size(); ++output_index)
        output_txos[output_index]->m_tx_out_index = output_index;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void make_rings_for_inputs(const LedgerContext &ledger,
    const std::vector<TxOut> &input_txos,
    const std::size_t ring_size,
    std::vector<std::vector<TxOut>> &rings_out,
    std::vector<std::vector<TxOutMembershipProof>> &membership_proofs_out,
    std::vector<std::size_t> &real_indices_out)
{
    CHECK_AND_ASSERT_THROW_MES(ring_size > 0, "make rings: ring size must be positive.");

    rings_out.clear();
    membership_proofs_out.clear();
    real_indices_out.clear();
    rings_out.resize(input_txos.size());
    membership_proofs_out.resize(input_txos.size());
    real_indices_out.resize(input_txos.size());

    // 1. the ledger must have enough outputs for all rings to be disjoint
    const std::uint64_t num_tx_outs{ledger.num_tx_outs()};
    const std::uint64_t num_needed{input_txos.size() * ring_size};
    CW_THROW_WALLET_EXCEPTION_IF(num_tx_outs < num_needed, error::insufficient_tx_outs, num_tx_outs, num_needed);

    // 2. ledger indices of the real outputs
    std::unordered_set<std::uint64_t> used_indices;
    std::vector<std::uint64_t> real_ledger_indices;
    real_ledger_indices.reserve(input_txos.size());

    for (const TxOut &input_txo : input_txos)
    {
        std::uint64_t ledger_index;
        CHECK_AND_ASSERT_THROW_MES(ledger.try_get_tx_out_index_by_public_key(input_txo.m_ephemeral_pubkey, ledger_index),
            "make rings: an input is not in the ledger.");
        CHECK_AND_ASSERT_THROW_MES(used_indices.insert(ledger_index).second, "make rings: duplicate input.");

        real_ledger_indices.emplace_back(ledger_index);
    }

    // 3. rings: uniformly sampled decoys with the real output at a random position
    std::vector<std::uint64_t> ring_indices;
    for (std::size_t input_index{0}; input_index < input_txos.size(); ++input_index)
    {
        ring_indices.clear();
        ring_indices.reserve(ring_size);

        while (ring_indices.size() + 1 < ring_size)
        {
            const std::uint64_t decoy_index{crypto::rand_idx(num_tx_outs)};
            if (used_indices.insert(decoy_index).second)
                ring_indices.emplace_back(decoy_index);
        }

        real_indices_out[input_index] = crypto::rand_idx(ring_size);
        ring_indices.insert(ring_indices.begin() + real_indices_out[input_index], real_ledger_indices[input_index]);

        ledger.get_tx_outs(ring_indices, rings_out[input_index]);
        ledger.get_tx_out_membership_proofs(ring_indices, membership_proofs_out[input_index]);

        CW_THROW_WALLET_EXCEPTION_IF(rings_out[input_index].size() != ring_size,
            error::ring_size_mismatch, ring_size, rings_out[input_index].size());
        CW_THROW_WALLET_EXCEPTION_IF(membership_proofs_out[input_index].size() != rings_out[input_index].size(),
            error::membership_proof_mismatch, rings_out[input_index].size(), membership_proofs_out[input_index].size());
        CHECK_AND_ASSERT_THROW_MES(rings_out[input_index][real_indices_out[input_index]] == input_txos[input_index],
            "make rings: the ledger returned a different output for a real input.");
    }
}
//-------------------------------------------------------------------------------------------------------------------
TransactionBuilder::TransactionBuilder(const WalletStore &store,
    const LedgerContext &ledger,
    const NetworkContext &network,
    const TxBuilderConfig &config) :
        m_store{store},
        m_ledger{ledger},
        m_network{network},
        m_config{config}
{
    CHECK_AND_ASSERT_THROW_MES(m_config.m_ring_size > 0, "tx builder: ring size must be positive.");
    CHECK_AND_ASSERT_THROW_MES(m_config.m_max_inputs > 0, "tx builder: max inputs must be positive.");
    CHECK_AND_ASSERT_THROW_MES(m_config.m_max_outputs > 1, "tx builder: max outputs must leave room for change.");
}
//-------------------------------------------------------------------------------------------------------------------
UnsignedTxProposal TransactionBuilder::build_unsigned(const rct::key &account_id, const TxBuildRequest &request) const
{
    // 1. account
    Account account;
    CW_THROW_WALLET_EXCEPTION_IF(!m_store.try_get_account(account_id, account), error::account_not_found, account_id);

    // 2. outlays, fee, output count, tombstone
    boost::multiprecision::uint128_t outlay_sum;
    const token_id_t spend_token_id{check_outlays(request, outlay_sum)};
    const Amount fee{resolve_fee(request, spend_token_id, m_network, m_config)};

    std::vector<FundingTarget> funding_targets;
    if (fee.m_token_id == spend_token_id)
        funding_targets.emplace_back(FundingTarget{spend_token_id, outlay_sum + fee.m_value});
    else
    {
        funding_targets.emplace_back(FundingTarget{spend_token_id, outlay_sum});
        funding_targets.emplace_back(FundingTarget{fee.m_token_id, fee.m_value});
    }

    const std::size_t max_num_outputs{request.m_outlays.size() + funding_targets.size()};
    CW_THROW_WALLET_EXCEPTION_IF(max_num_outputs > m_config.m_max_outputs,
        error::too_many_outputs, max_num_outputs, m_config.m_max_outputs);

    const std::uint64_t tombstone_block_index{
            resolve_tombstone(request.m_tombstone_block_index,
                m_ledger.num_blocks(),
                m_config.m_default_tombstone_horizon)
        };

    // 3. inputs (sorted by txo id)
    std::vector<Txo> input_txos;
    select_inputs(m_store, account_id, request, funding_targets, m_config.m_max_inputs, input_txos);

    std::sort(input_txos.begin(), input_txos.end(),
            [](const Txo &a, const Txo &b) -> bool
            {
                return memcmp(a.m_id.bytes, b.m_id.bytes, sizeof(rct::key)) < 0;
            }
        );

    // 4. rings
    std::vector<TxOut> input_tx_outs;
    input_tx_outs.reserve(input_txos.size());
    for (const Txo &input_txo : input_txos)
        input_tx_outs.emplace_back(input_txo.m_tx_out);

    std::vector<std::vector<TxOut>> rings;
    std::vector<std::vector<TxOutMembershipProof>> membership_proofs;
    std::vector<std::size_t> real_indices;
    make_rings_for_inputs(m_ledger, input_tx_outs, m_config.m_ring_size, rings, membership_proofs, real_indices);

    UnsignedTxProposal proposal;
    proposal.m_account_id = account_id;
    proposal.m_fee = fee;
    proposal.m_tombstone_block_index = tombstone_block_index;
    proposal.m_inputs.reserve(input_txos.size());

    for (std::size_t input_index{0}; input_index < input_txos.size(); ++input_index)
    {
        CHECK_AND_ASSERT_THROW_MES(input_txos[input_index].m_subaddress_index,
            "tx builder: selected an orphaned txo.");

        proposal.m_inputs.emplace_back();
        UnsignedInput &input{proposal.m_inputs.back()};
        input.m_txo_id = input_txos[input_index].m_id;
        input.m_amount = input_txos[input_index].m_amount;
        input.m_subaddress_index = *input_txos[input_index].m_subaddress_index;
        input.m_ring = std::move(rings[input_index]);
        input.m_membership_proofs = std::move(membership_proofs[input_index]);
        input.m_real_index = real_indices[input_index];
    }

    // 5. outputs
    MemoBuilderVariant payload_memo_builder{RTHMemoBuilder{}};
    if (request.m_memo_builder)
        payload_memo_builder = *request.m_memo_builder;

    // the memo sender is always this account's main subaddress (view-only accounts cannot authenticate memos)
    boost::optional<SenderMemoCredential> sender_credential;
    if (can_spend(account.m_keys))
    {
        sender_credential = SenderMemoCredential{};
        make_sender_memo_credential(account.m_keys, account.m_main_subaddress_index, *sender_credential);
    }

    DestinationMemoInfo destination_info;
    destination_info.m_recipient = request.m_outlays.front().m_recipient;
    destination_info.m_num_recipients =
        static_cast<std::uint8_t>(std::min<std::size_t>(request.m_outlays.size(), 255));
    destination_info.m_fee = fee.m_value;
    destination_info.m_total_outlay = static_cast<rct::xmr_amount>(outlay_sum);

    // a. payload
    proposal.m_payload_txos.resize(request.m_outlays.size());
    for (std::size_t outlay_index{0}; outlay_index < request.m_outlays.size(); ++outlay_index)
    {
        make_output_txo(request.m_outlays[outlay_index].m_recipient,
            request.m_outlays[outlay_index].m_amount,
            false,
            payload_memo_builder,
            sender_credential,
            destination_info,
            proposal.m_payload_txos[outlay_index]);
    }

    // b. change (one per funded token; zero change is elided)
    PublicAddress change_address;
    make_account_subaddress(account.m_keys, account.m_change_subaddress_index, change_address);

    for (const FundingTarget &target : funding_targets)
    {
        const boost::multiprecision::uint128_t input_sum{sum_txo_values_for_token(input_txos, target.m_token_id)};
        CHECK_AND_ASSERT_THROW_MES(input_sum >= target.m_target, "tx builder: inputs do not cover the outlays and fee.");

        const boost::multiprecision::uint128_t change_value{input_sum - target.m_target};
        if (change_value == 0)
            continue;
        CW_THROW_WALLET_EXCEPTION_IF(change_value > std::numeric_limits<rct::xmr_amount>::max(),
            error::outbound_value_too_large);

        proposal.m_change_txos.emplace_back();
        make_output_txo(change_address,
            Amount{static_cast<rct::xmr_amount>(change_value), target.m_token_id},
            true,
            payload_memo_builder,
            boost::none,
            destination_info,
            proposal.m_change_txos.back());
    }

    set_output_indices(proposal.m_payload_txos, proposal.m_change_txos);

    MINFO("Built an unsigned tx for account " << account_id << ": " << proposal.m_inputs.size() << " input(s), "
        << proposal.m_payload_txos.size() << " payload output(s), " << proposal.m_change_txos.size()
        << " change output(s), fee " << fee.m_value << " of token " << fee.m_token_id << ", tombstone "
        << tombstone_block_index << ".");

    return proposal;
}
//-------------------------------------------------------------------------------------------------------------------
TxProposal TransactionBuilder::build(const rct::key &account_id, const TxBuildRequest &request) const
{
    Account account;
    CW_THROW_WALLET_EXCEPTION_IF(!m_store.try_get_account(account_id, account), error::account_not_found, account_id);
    CW_THROW_WALLET_EXCEPTION_IF(!can_spend(account.m_keys), error::missing_spend_key, account_id);

    return sign_tx_proposal(this->build_unsigned(account_id, request), account.m_keys);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
