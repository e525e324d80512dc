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

////
// Ledger output membership tree
// - a binary merkle tree over the ledger's outputs [0, highest_index] (padded with nil leaves to a power of 2)
// - leaf: H32("cw_txo_membership_leaf", tx out)
// - node: H32("cw_txo_membership_node", left, right)
// - a membership proof is the list of sibling hashes from the leaf level up to the root
///

#pragma once

//local headers
#include "ringct/rctTypes.h"
#include "tx_component_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <vector>

//forward declarations


namespace cw
{

/// leaf of an output in the membership tree
rct::key make_tx_out_membership_leaf(const TxOut &tx_out);
/// padding leaf
rct::key make_tx_out_membership_nil_leaf();
/// internal node from two children
rct::key make_tx_out_membership_node(const rct::key &left, const rct::key &right);
/**
* brief: compute_tx_out_membership_root - compute the root of the tree over leaves [0, highest_index]
* param: leaves - all leaves of the ledger (at least highest_index + 1)
* param: highest_index -
* return: root
*/
rct::key compute_tx_out_membership_root(const rct::keyV &leaves, const std::uint64_t highest_index);
/**
* brief: make_tx_out_membership_proof - make a proof that leaf 'index' is in the tree over [0, highest_index]
* param: leaves - all leaves of the ledger (at least highest_index + 1)
* param: index -
* param: highest_index -
* outparam: proof_out -
*/
void make_tx_out_membership_proof(const rct::keyV &leaves,
    const std::uint64_t index,
    const std::uint64_t highest_index,
    TxOutMembershipProof &proof_out);
/**
* brief: try_compute_root_from_membership_proof - recompute a tree root from an output and its proof
* param: tx_out -
* param: proof -
* outparam: root_out -
* return: false if the proof is malformed (index out of range or wrong number of elements)
*/
bool try_compute_root_from_membership_proof(const TxOut &tx_out,
    const TxOutMembershipProof &proof,
    rct::key &root_out);

} //namespace cw
