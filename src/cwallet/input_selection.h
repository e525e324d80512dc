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

// Utilities for selecting tx inputs from an account's Txos.


#pragma once

//local headers
#include "cwallet_core/tx_component_types.h"
#include "ringct/rctTypes.h"
#include "wallet_store_types.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/optional/optional.hpp>

//standard headers
#include <cstddef>
#include <vector>

//forward declarations
namespace cw { class WalletStore; }


namespace cw
{

/**
* brief: select_txos_for_target - greedily select the largest Txos until they cover a target
*   - at least one Txo is always selected
*   - throws no_spendable_txos if there are no candidates
*   - throws insufficient_funds_fragmented if the candidates cover the target but the largest 'max inputs' do not
*   - throws insufficient_funds if all candidates together do not cover the target
* param: candidates - spendable Txos of one token
* param: token_id - token of the candidates
* param: target - value to cover
* param: max_inputs - max number of Txos to select
* param: under_max_spendable_value - the candidates were filtered by a max spendable value (for error reporting)
* outparam: selected_out - selected Txos, in descending value order
*/
void select_txos_for_target(std::vector<Txo> candidates,
    const token_id_t token_id,
    const boost::multiprecision::uint128_t &target,
    const std::size_t max_inputs,
    const bool under_max_spendable_value,
    std::vector<Txo> &selected_out);
/**
* brief: get_explicit_input_txos - get caller-chosen inputs
*   - throws txo_not_found, txo_not_owned, or txo_not_spendable
* param: store -
* param: account_id - owner of the inputs
* param: txo_ids - ids of the inputs (must be unique)
* outparam: inputs_out -
*/
void get_explicit_input_txos(const WalletStore &store,
    const rct::key &account_id,
    const std::vector<rct::key> &txo_ids,
    std::vector<Txo> &inputs_out);
/// sum the values of a set of Txos
boost::multiprecision::uint128_t sum_txo_values(const std::vector<Txo> &txos);

} //namespace cw
