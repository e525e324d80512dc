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
#include "tx_out_membership_utils.h"

//local headers
#include "cw_hash_functions.h"
#include "cwallet_config.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "transcript.h"
#include "tx_component_types.h"

//third party headers

//standard headers
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::size_t padded_layer_size(const std::size_t num_leaves)
{
    std::size_t layer_size{1};
    while (layer_size < num_leaves)
        layer_size *= 2;

    return layer_size;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::size_t tree_depth(const std::uint64_t highest_index)
{
    std::size_t depth{0};
    for (std::size_t layer_size{padded_layer_size(highest_index + 1)}; layer_size > 1; layer_size /= 2)
        ++depth;

    return depth;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
rct::key make_tx_out_membership_leaf(const TxOut &tx_out)
{
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_TXO_MEMBERSHIP_LEAF, TxOut::get_size_bytes()};
    transcript.append("tx_out", tx_out);

    return cw_hash_to_key(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
rct::key make_tx_out_membership_nil_leaf()
{
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_TXO_MEMBERSHIP_NIL, 0};

    return cw_hash_to_key(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
rct::key make_tx_out_membership_node(const rct::key &left, const rct::key &right)
{
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_TXO_MEMBERSHIP_NODE, 2*sizeof(rct::key)};
    transcript.append("left", left);
    transcript.append("right", right);

    return cw_hash_to_key(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
rct::key compute_tx_out_membership_root(const rct::keyV &leaves, const std::uint64_t highest_index)
{
    CHECK_AND_ASSERT_THROW_MES(highest_index < leaves.size(),
        "compute tx out membership root: highest index is not in the leaf set.");

    // 1. leaf layer (padded)
    rct::keyV layer(leaves.begin(), leaves.begin() + highest_index + 1);
    layer.resize(padded_layer_size(layer.size()), make_tx_out_membership_nil_leaf());

    // 2. hash up to the root
    while (layer.size() > 1)
    {
        for (std::size_t node_index{0}; node_index < layer.size() / 2; ++node_index)
            layer[node_index] = make_tx_out_membership_node(layer[2*node_index], layer[2*node_index + 1]);

        layer.resize(layer.size() / 2);
    }

    return layer.front();
}
//-------------------------------------------------------------------------------------------------------------------
void make_tx_out_membership_proof(const rct::keyV &leaves,
    const std::uint64_t index,
    const std::uint64_t highest_index,
    TxOutMembershipProof &proof_out)
{
    CHECK_AND_ASSERT_THROW_MES(highest_index < leaves.size(),
        "make tx out membership proof: highest index is not in the leaf set.");
    CHECK_AND_ASSERT_THROW_MES(index <= highest_index,
        "make tx out membership proof: index is above the highest index.");

    proof_out.m_index = index;
    proof_out.m_highest_index = highest_index;
    proof_out.m_elements.clear();
    proof_out.m_elements.reserve(tree_depth(highest_index));

    // 1. leaf layer (padded)
    rct::keyV layer(leaves.begin(), leaves.begin() + highest_index + 1);
    layer.resize(padded_layer_size(layer.size()), make_tx_out_membership_nil_leaf());

    // 2. record the sibling at each layer while hashing up
    std::uint64_t position{index};

    while (layer.size() > 1)
    {
        proof_out.m_elements.emplace_back(layer[position ^ 1]);

        for (std::size_t node_index{0}; node_index < layer.size() / 2; ++node_index)
            layer[node_index] = make_tx_out_membership_node(layer[2*node_index], layer[2*node_index + 1]);

        layer.resize(layer.size() / 2);
        position >>= 1;
    }
}
//-------------------------------------------------------------------------------------------------------------------
bool try_compute_root_from_membership_proof(const TxOut &tx_out,
    const TxOutMembershipProof &proof,
    rct::key &root_out)
{
    if (proof.m_index > proof.m_highest_index)
        return false;
    if (proof.m_elements.size() != tree_depth(proof.m_highest_index))
        return false;

    root_out = make_tx_out_membership_leaf(tx_out);
    std::uint64_t position{proof.m_index};

    for (const rct::key &sibling : proof.m_elements)
    {
        root_out = (position & 1)
            ? make_tx_out_membership_node(sibling, root_out)
            : make_tx_out_membership_node(root_out, sibling);
        position >>= 1;
    }

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
