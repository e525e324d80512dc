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

// Amount commitment helpers for building and checking txs.
// - every token has its own amount generator H_t (H_0 = H), so commitments of different tokens never cancel
// - range proofs (BP+) are over H, so each output's commitment is linked to a BP+ range commitment


#pragma once

//local headers
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"

//third party headers

//standard headers
#include <vector>

//forward declarations


namespace cw
{

/// true if no key appears twice
bool keys_are_unique(const std::vector<rct::key> &keys);
/**
* brief: make_token_generator - get the amount generator of a token
*   - H_0 = H
*   - H_t = hash_to_point(H32("cw_token_generator", t))
* param: token_id - t
* return: H_t
*/
rct::key make_token_generator(const token_id_t token_id);
/**
* brief: make_amount_commitment - commit to an amount of a token
*   - C = x G + a H_t
* param: amount - a, t
* param: blinding_factor - x
* return: C
*/
rct::key make_amount_commitment(const Amount &amount, const crypto::secret_key &blinding_factor);
/**
* brief: make_output_range_proof - aggregate BP+ range proof for a tx's output range commitments
* param: output_amounts - a
* param: range_blinding_factors - y (C_r = y G + a H)
* return: the range proof
*/
rct::BulletproofPlus make_output_range_proof(const std::vector<rct::xmr_amount> &output_amounts,
    const std::vector<crypto::secret_key> &range_blinding_factors);
/**
* brief: make_generator_link_proof - prove an amount commitment and a range commitment hide the same amount
* param: amount - a, t
* param: blinding_factor - x
* param: range_blinding_factor - y
* return: proof for C = x G + a H_t and C_r = y G + a H
*/
GeneratorLinkProof make_generator_link_proof(const Amount &amount,
    const crypto::secret_key &blinding_factor,
    const crypto::secret_key &range_blinding_factor);
/**
* brief: verify_generator_link_proof - check a generator link proof
* param: proof -
* param: token_id - t
* param: amount_commitment - C
* param: range_commitment - C_r
* return: true if the proof is valid
*/
bool verify_generator_link_proof(const GeneratorLinkProof &proof,
    const token_id_t token_id,
    const rct::key &amount_commitment,
    const rct::key &range_commitment);
/**
* brief: make_pseudo_output_blinding_factors - make blinding factors for pseudo-output commitments
*   - all random except the last, which makes sum(pseudo blinding factors) == sum(output blinding factors)
* param: num_inputs -
* param: output_blinding_factors -
* outparam: pseudo_blinding_factors_out -
*/
void make_pseudo_output_blinding_factors(const std::size_t num_inputs,
    const std::vector<crypto::secret_key> &output_blinding_factors,
    std::vector<crypto::secret_key> &pseudo_blinding_factors_out);
/**
* brief: commitments_balance - sum(C') ?= sum(C) + fee H_fee
*   - with independent generators this holds only if every token balances on its own
* param: pseudo_output_commitments - C'
* param: output_commitments - C
* param: fee - amount and token of the fee
* return: true if the commitments balance
*/
bool commitments_balance(const rct::keyV &pseudo_output_commitments,
    const rct::keyV &output_commitments,
    const Amount &fee);
/**
* brief: amounts_balance - sum(inputs) ?= sum(outputs) + fee, without overflow
* param: input_amounts -
* param: output_amounts -
* param: fee -
* return: true if the amounts balance
*/
bool amounts_balance(const std::vector<rct::xmr_amount> &input_amounts,
    const std::vector<rct::xmr_amount> &output_amounts,
    const rct::xmr_amount fee);
/**
* brief: token_amounts_balance - amounts_balance() for every token that appears
* param: input_amounts -
* param: output_amounts -
* param: fee -
* return: true if each token balances
*/
bool token_amounts_balance(const std::vector<Amount> &input_amounts,
    const std::vector<Amount> &output_amounts,
    const Amount &fee);

} //namespace cw
