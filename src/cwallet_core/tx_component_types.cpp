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
#include "tx_component_types.h"

//local headers
#include "crypto/crypto.h"
#include "cw_hash_functions.h"
#include "cwallet_config.h"
#include "int-util.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "transcript.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <array>
#include <cstring>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void append_u64_as_buffer(const boost::string_ref label,
    const std::uint64_t value,
    CwTranscript &transcript_inout)
{
    // encoded values are semantically 8-byte buffers
    const std::uint64_t le_value{SWAP64LE(value)};
    std::array<unsigned char, 8> value_buffer;
    memcpy(value_buffer.data(), &le_value, 8);
    transcript_inout.append(label, value_buffer);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const Amount &a, const Amount &b)
{
    return a.m_value == b.m_value &&
        a.m_token_id == b.m_token_id;
}
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const PublicAddress &a, const PublicAddress &b)
{
    return a.m_spend_pubkey == b.m_spend_pubkey &&
        a.m_view_pubkey == b.m_view_pubkey;
}
//-------------------------------------------------------------------------------------------------------------------
void append_to_transcript(const PublicAddress &container, CwTranscript &transcript_inout)
{
    transcript_inout.append("K_s", container.m_spend_pubkey);
    transcript_inout.append("K_v", container.m_view_pubkey);
}
//-------------------------------------------------------------------------------------------------------------------
bool TxOut::operator<(const TxOut &other_tx_out) const
{
    return memcmp(m_ephemeral_pubkey.bytes, other_tx_out.m_ephemeral_pubkey.bytes, sizeof(rct::key)) < 0;
}
//-------------------------------------------------------------------------------------------------------------------
void TxOut::gen()
{
    // generate a dummy output: random pieces, completely unspendable
    m_onetime_address = rct::pkGen();
    m_ephemeral_pubkey = rct::pkGen();
    m_amount_commitment = rct::pkGen();
    m_encoded_amount = crypto::rand_idx(static_cast<rct::xmr_amount>(-1));
    m_encoded_token_id = crypto::rand_idx(static_cast<std::uint64_t>(-1));
    m_view_tag.data = static_cast<char>(crypto::rand_idx(static_cast<unsigned char>(-1)));
    crypto::rand(m_encrypted_memo.size(), m_encrypted_memo.data());
}
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const TxOut &a, const TxOut &b)
{
    return a.m_onetime_address == b.m_onetime_address &&
        a.m_ephemeral_pubkey == b.m_ephemeral_pubkey &&
        a.m_amount_commitment == b.m_amount_commitment &&
        a.m_encoded_amount == b.m_encoded_amount &&
        a.m_encoded_token_id == b.m_encoded_token_id &&
        a.m_view_tag == b.m_view_tag &&
        a.m_encrypted_memo == b.m_encrypted_memo;
}
//-------------------------------------------------------------------------------------------------------------------
void append_to_transcript(const TxOut &container, CwTranscript &transcript_inout)
{
    transcript_inout.append("Ko", container.m_onetime_address);
    transcript_inout.append("R", container.m_ephemeral_pubkey);
    transcript_inout.append("C", container.m_amount_commitment);
    append_u64_as_buffer("enc_a", container.m_encoded_amount, transcript_inout);
    append_u64_as_buffer("enc_token_id", container.m_encoded_token_id, transcript_inout);
    transcript_inout.append("view_tag", static_cast<unsigned char>(container.m_view_tag.data));
    transcript_inout.append("enc_memo", container.m_encrypted_memo);
}
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const TxOutMembershipProof &a, const TxOutMembershipProof &b)
{
    return a.m_index == b.m_index &&
        a.m_highest_index == b.m_highest_index &&
        a.m_elements == b.m_elements;
}
//-------------------------------------------------------------------------------------------------------------------
void append_to_transcript(const TxOutMembershipProof &container, CwTranscript &transcript_inout)
{
    transcript_inout.append("index", container.m_index);
    transcript_inout.append("highest_index", container.m_highest_index);
    transcript_inout.append("elements", container.m_elements);
}
//-------------------------------------------------------------------------------------------------------------------
void append_to_transcript(const TxIn &container, CwTranscript &transcript_inout)
{
    transcript_inout.append("ring", container.m_ring);
    transcript_inout.append("proofs", container.m_proofs);
}
//-------------------------------------------------------------------------------------------------------------------
void append_to_transcript(const TxPrefix &container, CwTranscript &transcript_inout)
{
    transcript_inout.append("inputs", container.m_inputs);
    transcript_inout.append("outputs", container.m_outputs);
    transcript_inout.append("fee", container.m_fee);
    transcript_inout.append("fee_token_id", container.m_fee_token_id);
    transcript_inout.append("tombstone", container.m_tombstone_block_index);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<crypto::key_image> Tx::get_key_images() const
{
    std::vector<crypto::key_image> key_images;
    key_images.reserve(m_ring_signatures.size());

    for (const rct::clsag &ring_signature : m_ring_signatures)
        key_images.emplace_back(rct::rct2ki(ring_signature.I));

    return key_images;
}
//-------------------------------------------------------------------------------------------------------------------
rct::key make_txo_id(const TxOut &tx_out)
{
    // H_32(Ko, R)
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_TXO_ID, 2*sizeof(rct::key)};
    transcript.append("Ko", tx_out.m_onetime_address);
    transcript.append("R", tx_out.m_ephemeral_pubkey);

    rct::key txo_id;
    txo_id = cw_hash_to_key(transcript);

    return txo_id;
}
//-------------------------------------------------------------------------------------------------------------------
void get_tx_prefix_hash(const TxPrefix &tx_prefix, rct::key &tx_prefix_hash_out)
{
    // H_32(tx prefix)
    CwTranscript transcript{TranscriptMode::LABELED, config::HASH_KEY_CW_TX_PREFIX,
        (tx_prefix.m_inputs.size()*config::CW_RING_SIZE + tx_prefix.m_outputs.size())*TxOut::get_size_bytes()};
    transcript.append("tx_prefix", tx_prefix);

    tx_prefix_hash_out = cw_hash_to_key(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
rct::keyV get_tx_outs_amount_commitments(const std::vector<TxOut> &tx_outs)
{
    rct::keyV amount_commitments;
    amount_commitments.reserve(tx_outs.size());

    for (const TxOut &tx_out : tx_outs)
        amount_commitments.emplace_back(tx_out.m_amount_commitment);

    return amount_commitments;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
