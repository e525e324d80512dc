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
#include "input_selection.h"

//local headers
#include "cwallet_core/tx_misc_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "wallet_errors.h"
#include "wallet_store.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>

//standard headers
#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.tx"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
void select_txos_for_target(std::vector<Txo> candidates,
    const token_id_t token_id,
    const boost::multiprecision::uint128_t &target,
    const std::size_t max_inputs,
    const bool under_max_spendable_value,
    std::vector<Txo> &selected_out)
{
    selected_out.clear();

    CW_THROW_WALLET_EXCEPTION_IF(candidates.empty(), error::no_spendable_txos, token_id);
    CHECK_AND_ASSERT_THROW_MES(max_inputs > 0, "select txos: no inputs allowed.");

    // 1. largest first (ties broken by id so selection is deterministic)
    std::sort(candidates.begin(), candidates.end(),
            [](const Txo &a, const Txo &b) -> bool
            {
                if (a.m_amount.m_value != b.m_amount.m_value)
                    return a.m_amount.m_value > b.m_amount.m_value;
                return memcmp(a.m_id.bytes, b.m_id.bytes, sizeof(rct::key)) < 0;
            }
        );

    // 2. the largest 'max inputs' Txos must cover the target
    boost::multiprecision::uint128_t top_sum{0};
    boost::multiprecision::uint128_t total_sum{0};

    for (std::size_t candidate_index{0}; candidate_index < candidates.size(); ++candidate_index)
    {
        if (candidate_index < max_inputs)
            top_sum += candidates[candidate_index].m_amount.m_value;
        total_sum += candidates[candidate_index].m_amount.m_value;
    }

    if (top_sum < target)
    {
        CW_THROW_WALLET_EXCEPTION_IF(total_sum >= target,
            error::insufficient_funds_fragmented, token_id, max_inputs);
        CW_THROW_WALLET_EXCEPTION(error::insufficient_funds,
            token_id,
            total_sum.str(),
            target.str(),
            under_max_spendable_value);
    }

    // 3. select greedily
    boost::multiprecision::uint128_t selected_sum{0};
    for (Txo &candidate : candidates)
    {
        if (!selected_out.empty() && selected_sum >= target)
            break;

        selected_sum += candidate.m_amount.m_value;
        selected_out.emplace_back(std::move(candidate));
    }

    MDEBUG("Selected " << selected_out.size() << " input(s) of token " << token_id << " worth " << selected_sum
        << " for a target of " << target << ".");
}
//-------------------------------------------------------------------------------------------------------------------
void get_explicit_input_txos(const WalletStore &store,
    const rct::key &account_id,
    const std::vector<rct::key> &txo_ids,
    std::vector<Txo> &inputs_out)
{
    if (!keys_are_unique(txo_ids))
    {
        for (auto txo_id_it = txo_ids.begin(); txo_id_it != txo_ids.end(); ++txo_id_it)
        {
            CW_THROW_WALLET_EXCEPTION_IF(std::find(txo_ids.begin(), txo_id_it, *txo_id_it) != txo_id_it,
                error::duplicate_input_txo, *txo_id_it);
        }
    }

    inputs_out.clear();
    inputs_out.reserve(txo_ids.size());

    for (const rct::key &txo_id : txo_ids)
    {
        inputs_out.emplace_back();
        CW_THROW_WALLET_EXCEPTION_IF(!store.try_get_txo(txo_id, inputs_out.back()), error::txo_not_found, txo_id);
        CW_THROW_WALLET_EXCEPTION_IF(!(inputs_out.back().m_account_id == account_id),
            error::txo_not_owned, txo_id, account_id);
        CW_THROW_WALLET_EXCEPTION_IF(store.get_txo_status(txo_id) != TxoStatus::UNSPENT,
            error::txo_not_spendable, txo_id);
    }
}
//-------------------------------------------------------------------------------------------------------------------
boost::multiprecision::uint128_t sum_txo_values(const std::vector<Txo> &txos)
{
    boost::multiprecision::uint128_t sum{0};
    for (const Txo &txo : txos)
        sum += txo.m_amount.m_value;

    return sum;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
