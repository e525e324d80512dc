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
#include "tx_misc_utils.h"

//local headers
#include "crypto/crypto.h"
extern "C"
{
#include "crypto/crypto-ops.h"
}
#include "cw_hash_functions.h"
#include "cwallet_config.h"
#include "misc_log_ex.h"
#include "ringct/bulletproofs_plus.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "transcript.h"
#include "tx_component_types.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>

//standard headers
#include <map>
#include <unordered_set>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static rct::key make_generator_link_proof_challenge(const rct::key &token_generator,
    const rct::key &amount_commitment,
    const rct::key &range_commitment,
    const rct::key &amount_commitment_nonce,
    const rct::key &range_commitment_nonce)
{
    // c = H_n(H_t, C, C_r, A_1, A_2)
    CwTranscript transcript{TranscriptMode::LABELED, config::HASH_KEY_CW_GENERATOR_LINK_PROOF, 5*sizeof(rct::key)};
    transcript.append("H_t", token_generator);
    transcript.append("C", amount_commitment);
    transcript.append("C_r", range_commitment);
    transcript.append("A_1", amount_commitment_nonce);
    transcript.append("A_2", range_commitment_nonce);

    return cw_hash_to_scalar(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool keys_are_unique(const std::vector<rct::key> &keys)
{
    const std::unordered_set<rct::key> unique_keys{keys.begin(), keys.end()};
    return unique_keys.size() == keys.size();
}
//-------------------------------------------------------------------------------------------------------------------
rct::key make_token_generator(const token_id_t token_id)
{
    if (token_id == config::CW_DEFAULT_TOKEN_ID)
        return rct::H;

    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_TOKEN_GENERATOR, sizeof(token_id_t)};
    transcript.append("token_id", token_id);

    return rct::hashToPoint(cw_hash_to_key(transcript));
}
//-------------------------------------------------------------------------------------------------------------------
rct::key make_amount_commitment(const Amount &amount, const crypto::secret_key &blinding_factor)
{
    // C = x G + a H_t
    rct::key amount_commitment;
    rct::addKeys2(amount_commitment,
        rct::sk2rct(blinding_factor),
        rct::d2h(amount.m_value),
        make_token_generator(amount.m_token_id));

    return amount_commitment;
}
//-------------------------------------------------------------------------------------------------------------------
rct::BulletproofPlus make_output_range_proof(const std::vector<rct::xmr_amount> &output_amounts,
    const std::vector<crypto::secret_key> &range_blinding_factors)
{
    CHECK_AND_ASSERT_THROW_MES(output_amounts.size() == range_blinding_factors.size(),
        "make output range proof: amounts and blinding factors do not line up.");
    CHECK_AND_ASSERT_THROW_MES(output_amounts.size() > 0, "make output range proof: no outputs.");

    rct::keyV blinding_factors;
    blinding_factors.reserve(range_blinding_factors.size());
    for (const crypto::secret_key &blinding_factor : range_blinding_factors)
        blinding_factors.emplace_back(rct::sk2rct(blinding_factor));

    return rct::bulletproof_plus_PROVE(output_amounts, blinding_factors);
}
//-------------------------------------------------------------------------------------------------------------------
GeneratorLinkProof make_generator_link_proof(const Amount &amount,
    const crypto::secret_key &blinding_factor,
    const crypto::secret_key &range_blinding_factor)
{
    const rct::key token_generator{make_token_generator(amount.m_token_id)};
    const rct::key amount_scalar{rct::d2h(amount.m_value)};

    // C = x G + a H_t,  C_r = y G + a H
    rct::key amount_commitment;
    rct::key range_commitment;
    rct::addKeys2(amount_commitment, rct::sk2rct(blinding_factor), amount_scalar, token_generator);
    rct::addKeys2(range_commitment, rct::sk2rct(range_blinding_factor), amount_scalar, rct::H);

    // A_1 = beta G + alpha H_t,  A_2 = gamma G + alpha H
    rct::key alpha{rct::skGen()};
    rct::key beta{rct::skGen()};
    rct::key gamma{rct::skGen()};

    rct::key amount_commitment_nonce;
    rct::key range_commitment_nonce;
    rct::addKeys2(amount_commitment_nonce, beta, alpha, token_generator);
    rct::addKeys2(range_commitment_nonce, gamma, alpha, rct::H);

    GeneratorLinkProof proof;
    proof.m_challenge = make_generator_link_proof_challenge(token_generator,
        amount_commitment,
        range_commitment,
        amount_commitment_nonce,
        range_commitment_nonce);

    // s_a = alpha + c a,  s_x = beta + c x,  s_y = gamma + c y
    sc_muladd(proof.m_response_amount.bytes, proof.m_challenge.bytes, amount_scalar.bytes, alpha.bytes);
    sc_muladd(proof.m_response_blinding_factor.bytes, proof.m_challenge.bytes, to_bytes(blinding_factor), beta.bytes);
    sc_muladd(proof.m_response_range_blinding_factor.bytes,
        proof.m_challenge.bytes,
        to_bytes(range_blinding_factor),
        gamma.bytes);

    memwipe(alpha.bytes, sizeof(rct::key));
    memwipe(beta.bytes, sizeof(rct::key));
    memwipe(gamma.bytes, sizeof(rct::key));

    return proof;
}
//-------------------------------------------------------------------------------------------------------------------
bool verify_generator_link_proof(const GeneratorLinkProof &proof,
    const token_id_t token_id,
    const rct::key &amount_commitment,
    const rct::key &range_commitment)
{
    // responses must be canonical scalars
    if (sc_check(proof.m_response_amount.bytes) != 0 ||
        sc_check(proof.m_response_blinding_factor.bytes) != 0 ||
        sc_check(proof.m_response_range_blinding_factor.bytes) != 0)
        return false;

    const rct::key token_generator{make_token_generator(token_id)};

    // A_1 = s_x G + s_a H_t - c C
    rct::key amount_commitment_nonce;
    rct::addKeys2(amount_commitment_nonce, proof.m_response_blinding_factor, proof.m_response_amount, token_generator);
    rct::subKeys(amount_commitment_nonce,
        amount_commitment_nonce,
        rct::scalarmultKey(amount_commitment, proof.m_challenge));

    // A_2 = s_y G + s_a H - c C_r
    rct::key range_commitment_nonce;
    rct::addKeys2(range_commitment_nonce, proof.m_response_range_blinding_factor, proof.m_response_amount, rct::H);
    rct::subKeys(range_commitment_nonce,
        range_commitment_nonce,
        rct::scalarmultKey(range_commitment, proof.m_challenge));

    return proof.m_challenge == make_generator_link_proof_challenge(token_generator,
        amount_commitment,
        range_commitment,
        amount_commitment_nonce,
        range_commitment_nonce);
}
//-------------------------------------------------------------------------------------------------------------------
void make_pseudo_output_blinding_factors(const std::size_t num_inputs,
    const std::vector<crypto::secret_key> &output_blinding_factors,
    std::vector<crypto::secret_key> &pseudo_blinding_factors_out)
{
    CHECK_AND_ASSERT_THROW_MES(num_inputs > 0, "make pseudo output blinding factors: no inputs.");

    pseudo_blinding_factors_out.clear();
    pseudo_blinding_factors_out.reserve(num_inputs);

    // remainder = sum(x_out) - sum(x'_0 .. x'_{n-2})
    rct::key remainder{rct::zero()};
    for (const crypto::secret_key &output_blinding_factor : output_blinding_factors)
        sc_add(remainder.bytes, remainder.bytes, to_bytes(output_blinding_factor));

    while (pseudo_blinding_factors_out.size() + 1 < num_inputs)
    {
        const rct::key random_factor{rct::skGen()};
        sc_sub(remainder.bytes, remainder.bytes, random_factor.bytes);
        pseudo_blinding_factors_out.emplace_back(rct::rct2sk(random_factor));
    }

    pseudo_blinding_factors_out.emplace_back(rct::rct2sk(remainder));
}
//-------------------------------------------------------------------------------------------------------------------
bool commitments_balance(const rct::keyV &pseudo_output_commitments,
    const rct::keyV &output_commitments,
    const Amount &fee)
{
    if (pseudo_output_commitments.empty())
        return false;

    // sum(C') - sum(C) - fee H_fee ?= identity
    rct::key difference{rct::addKeys(pseudo_output_commitments)};
    if (!output_commitments.empty())
        rct::subKeys(difference, difference, rct::addKeys(output_commitments));
    rct::subKeys(difference, difference, rct::scalarmultKey(make_token_generator(fee.m_token_id), rct::d2h(fee.m_value)));

    return difference == rct::identity();
}
//-------------------------------------------------------------------------------------------------------------------
bool amounts_balance(const std::vector<rct::xmr_amount> &input_amounts,
    const std::vector<rct::xmr_amount> &output_amounts,
    const rct::xmr_amount fee)
{
    boost::multiprecision::uint128_t input_sum{0};
    boost::multiprecision::uint128_t output_sum{fee};

    for (const rct::xmr_amount input_amount : input_amounts)
        input_sum += input_amount;
    for (const rct::xmr_amount output_amount : output_amounts)
        output_sum += output_amount;

    return input_sum == output_sum;
}
//-------------------------------------------------------------------------------------------------------------------
bool token_amounts_balance(const std::vector<Amount> &input_amounts,
    const std::vector<Amount> &output_amounts,
    const Amount &fee)
{
    // {token id : {inputs, outputs}}
    std::map<token_id_t, std::pair<std::vector<rct::xmr_amount>, std::vector<rct::xmr_amount>>> amounts_by_token;

    for (const Amount &input_amount : input_amounts)
        amounts_by_token[input_amount.m_token_id].first.emplace_back(input_amount.m_value);
    for (const Amount &output_amount : output_amounts)
        amounts_by_token[output_amount.m_token_id].second.emplace_back(output_amount.m_value);
    amounts_by_token[fee.m_token_id];

    for (const auto &token_amounts : amounts_by_token)
    {
        const rct::xmr_amount token_fee{token_amounts.first == fee.m_token_id ? fee.m_value : 0};

        if (!amounts_balance(token_amounts.second.first, token_amounts.second.second, token_fee))
            return false;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
