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

// Ledger-level components of a confidential transaction: outputs, rings, membership proofs, blocks.


#pragma once

//local headers
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"

//third party headers

//standard headers
#include <array>
#include <cstdint>
#include <vector>

//forward declarations
namespace cw { class CwTranscript; }


namespace cw
{

/// token id of an amount (one ledger carries several tokens)
using token_id_t = std::uint64_t;
/// encrypted memo: enc(memo type || memo data)
using encrypted_memo_t = std::array<unsigned char, 66>;

////
// Amount
// - a decoded value with its token id
///
struct Amount final
{
    /// a
    rct::xmr_amount m_value;
    /// token id of 'a'
    token_id_t m_token_id;
};
bool operator==(const Amount &a, const Amount &b);

////
// PublicAddress
// - a subaddress: K^{s,i} = (Hn(k^v, i) + k^s) G,  K^{v,i} = k^v K^{s,i}
///
struct PublicAddress final
{
    /// K^{s,i}
    rct::key m_spend_pubkey;
    /// K^{v,i}
    rct::key m_view_pubkey;
};
bool operator==(const PublicAddress &a, const PublicAddress &b);
void append_to_transcript(const PublicAddress &container, CwTranscript &transcript_inout);

////
// TxOut
// - a confidential output
// - every output has its own ephemeral pubkey, so derivations always use output index 0
///
struct TxOut final
{
    /// Ko = Hn(r K^{v,i}, 0) G + K^{s,i}
    rct::key m_onetime_address;
    /// R = r K^{s,i}
    rct::key m_ephemeral_pubkey;
    /// C = x G + a H_t  (H_t: generator of the output's token)
    rct::key m_amount_commitment;
    /// enc(a)
    rct::xmr_amount m_encoded_amount;
    /// enc(token id)
    std::uint64_t m_encoded_token_id;
    /// view_tag
    crypto::view_tag m_view_tag;
    /// enc(memo)
    encrypted_memo_t m_encrypted_memo;

    /// less-than operator for sorting (outputs in a tx are sorted by ephemeral pubkey)
    bool operator<(const TxOut &other_tx_out) const;

    /// generate a dummy output (all random; completely unspendable)
    void gen();

    static std::size_t get_size_bytes()
    {
        return 3*32 + sizeof(rct::xmr_amount) + sizeof(std::uint64_t) + sizeof(crypto::view_tag) + 66;
    }
};
bool operator==(const TxOut &a, const TxOut &b);
void append_to_transcript(const TxOut &container, CwTranscript &transcript_inout);

////
// TxOutMembershipProof
// - merkle path from an output's leaf to the root of the ledger's output tree at 'highest index'
///
struct TxOutMembershipProof final
{
    /// ledger index of the output
    std::uint64_t m_index;
    /// the tree covers outputs [0, highest_index]
    std::uint64_t m_highest_index;
    /// sibling hashes from the leaf level up
    rct::keyV m_elements;
};
bool operator==(const TxOutMembershipProof &a, const TxOutMembershipProof &b);
void append_to_transcript(const TxOutMembershipProof &container, CwTranscript &transcript_inout);

////
// TxIn
// - ring of outputs (one is real) with a membership proof for each ring member
///
struct TxIn final
{
    /// ring members
    std::vector<TxOut> m_ring;
    /// membership proofs (one per ring member)
    std::vector<TxOutMembershipProof> m_proofs;
};
void append_to_transcript(const TxIn &container, CwTranscript &transcript_inout);

////
// TxPrefix
// - everything a tx signs
///
struct TxPrefix final
{
    /// inputs
    std::vector<TxIn> m_inputs;
    /// outputs (sorted)
    std::vector<TxOut> m_outputs;
    /// fee
    rct::xmr_amount m_fee;
    /// token id of the fee
    token_id_t m_fee_token_id;
    /// the tx is invalid in blocks with index >= tombstone
    std::uint64_t m_tombstone_block_index;
};
void append_to_transcript(const TxPrefix &container, CwTranscript &transcript_inout);

////
// GeneratorLinkProof
// - proves C = a H_t + x G and C_r = a H + y G commit to the same 'a' (C_r is range-proofed with BP+)
// - Schnorr-style proof of knowledge of {a, x, y}: challenge c, responses s_a, s_x, s_y
///
struct GeneratorLinkProof final
{
    /// c
    rct::key m_challenge;
    /// s_a = alpha + c a
    rct::key m_response_amount;
    /// s_x = beta + c x
    rct::key m_response_blinding_factor;
    /// s_y = gamma + c y
    rct::key m_response_range_blinding_factor;
};

////
// Tx
// - a signed transaction: prefix + pseudo-output commitments + CLSAGs (one per input) + BP+ range proof
// - output token ids are visible to validators, amounts are not (a C' carries its ring's token implicitly)
///
struct Tx final
{
    /// signed contents
    TxPrefix m_prefix;
    /// C' = x' G + a H_t (one per input)
    rct::keyV m_pseudo_output_commitments;
    /// t of each output commitment (tx output order)
    std::vector<token_id_t> m_output_token_ids;
    /// ring signatures (one per input; key images are the 'I' members)
    std::vector<rct::clsag> m_ring_signatures;
    /// range proof for the outputs' range commitments C_r = a H + y G (V = C_r / 8)
    rct::BulletproofPlus m_range_proof;
    /// links each output commitment to its range commitment (one per output)
    std::vector<GeneratorLinkProof> m_generator_link_proofs;

    /// get the key images of this tx's inputs
    std::vector<crypto::key_image> get_key_images() const;
};

////
// BlockContents
// - outputs and spent key images of one block
///
struct BlockContents final
{
    /// outputs created in this block
    std::vector<TxOut> m_outputs;
    /// key images spent in this block
    std::vector<crypto::key_image> m_key_images;
};

/**
* brief: make_txo_id - stable identifier of an output
*   - H32(onetime address, ephemeral pubkey)
* param: tx_out -
* return: txo id
*/
rct::key make_txo_id(const TxOut &tx_out);
/**
* brief: get_tx_prefix_hash - the message signed by a tx's ring signatures (also used as the tx id)
* param: tx_prefix -
* outparam: tx_prefix_hash_out -
*/
void get_tx_prefix_hash(const TxPrefix &tx_prefix, rct::key &tx_prefix_hash_out);
/**
* brief: get_tx_outs_amount_commitments - collect output amount commitments
* param: tx_outs -
* return: {C}
*/
rct::keyV get_tx_outs_amount_commitments(const std::vector<TxOut> &tx_outs);

} //namespace cw
