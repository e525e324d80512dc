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

// Core key derivations for confidential outputs sent to subaddresses.
// Note: outputs use the cryptonote subaddress scheme; every output has its own ephemeral pubkey.


#pragma once

//local headers
#include "crypto/crypto.h"
#include "cryptonote_basic/subaddress_index.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <array>
#include <cstdint>

//forward declarations


namespace cw
{

/// address hash: short identifier of a public address (used in memos)
using address_hash_t = std::array<unsigned char, 16>;

/**
* brief: make_cryptonote_subaddress_index - map a wallet subaddress index to a cryptonote subaddress index
*   - {major: 0, minor: i}
* param: subaddress_index - i
* return: cryptonote subaddress index
*/
cryptonote::subaddress_index make_cryptonote_subaddress_index(const std::uint64_t subaddress_index);
/**
* brief: make_subaddress_spendkey - make a subaddress's spendkey
*   - (Hn(k^v, i) + k^s) G
*   - note: Hn(k^v, i) = Hn("SubAddr" || k^v || index_major || index_minor)
* param: base_spend_pubkey - k^s G
* param: view_privkey - k^v
* param: subaddress_index - i
* outparam: subaddress_spendkey_out - (Hn(k^v, i) + k^s) G
*/
void make_subaddress_spendkey(const rct::key &base_spend_pubkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    rct::key &subaddress_spendkey_out);
/**
* brief: make_subaddress_spend_privkey - make a subaddress's spend privkey
*   - Hn(k^v, i) + k^s
* param: spend_privkey - k^s
* param: view_privkey - k^v
* param: subaddress_index - i
* outparam: subaddress_spend_privkey_out - Hn(k^v, i) + k^s
*/
void make_subaddress_spend_privkey(const crypto::secret_key &spend_privkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    crypto::secret_key &subaddress_spend_privkey_out);
/**
* brief: make_subaddress_view_privkey - make a subaddress's view privkey
*   - k^v (Hn(k^v, i) + k^s), so K^{v,i} = k^{v,i} G
* param: spend_privkey - k^s
* param: view_privkey - k^v
* param: subaddress_index - i
* outparam: subaddress_view_privkey_out - k^v (Hn(k^v, i) + k^s)
*/
void make_subaddress_view_privkey(const crypto::secret_key &spend_privkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    crypto::secret_key &subaddress_view_privkey_out);
/**
* brief: make_subaddress - make a subaddress
*   - K^{s,i} = (Hn(k^v, i) + k^s) G
*   - K^{v,i} = k^v K^{s,i}
* param: base_spend_pubkey - k^s G
* param: view_privkey - k^v
* param: subaddress_index - i
* outparam: subaddress_out - {K^{s,i}, K^{v,i}}
*/
void make_subaddress(const rct::key &base_spend_pubkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    PublicAddress &subaddress_out);
/**
* brief: make_sender_receiver_derivation - make the sender-receiver DH derivation of an output
*   - [sender: r K^{v,i}] [recipient: k^v R]
* param: base_key - [sender: K^{v,i}] [recipient: R]
* param: DH_privkey - [sender: r] [recipient: k^v]
* outparam: derivation_out - 8 * [sender: r K^{v,i}] [recipient: k^v R]
*/
void make_sender_receiver_derivation(const rct::key &base_key,
    const crypto::secret_key &DH_privkey,
    crypto::key_derivation &derivation_out);
/**
* brief: make_sender_receiver_secret - make the sender-receiver secret of an output
*   - Hn(r K^{v,i}, 0)
* param: derivation - r K^{v,i}
* outparam: sender_receiver_secret_out - Hn(r K^{v,i}, 0)
*/
void make_sender_receiver_secret(const crypto::key_derivation &derivation,
    crypto::secret_key &sender_receiver_secret_out);
/**
* brief: make_enote_view_privkey - make an output's view privkey
*   - component of onetime address privkey involving view key
*   - Hn(k^v R, 0) + Hn(k^v, i)
* param: derivation - k^v R
* param: view_privkey - k^v
* param: subaddress_index - i
* outparam: enote_view_privkey_out - Hn(k^v R, 0) + Hn(k^v, i)
*/
void make_enote_view_privkey(const crypto::key_derivation &derivation,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    crypto::secret_key &enote_view_privkey_out);
/**
* brief: make_onetime_address - make an output's onetime address
*   - Ko = Hn(r K^{v,i}, 0) G + K^{s,i}
* param: derivation - r K^{v,i}
* param: destination_spendkey - K^{s,i}
* outparam: onetime_address_out - Ko
*/
void make_onetime_address(const crypto::key_derivation &derivation,
    const rct::key &destination_spendkey,
    rct::key &onetime_address_out);
/**
* brief: make_onetime_address_privkey - make an output's onetime address privkey
*   - k^o = k^{o,v} + k^s
* param: enote_view_privkey - k^{o,v}
* param: spend_privkey - k^s
* outparam: onetime_address_privkey_out - k^o
*/
void make_onetime_address_privkey(const crypto::secret_key &enote_view_privkey,
    const crypto::secret_key &spend_privkey,
    crypto::secret_key &onetime_address_privkey_out);
/**
* brief: make_key_image - make a cryptonote-style key image
*   - (k^{o,v} + k^s) * Hp(Ko)
* param: enote_view_privkey - k^{o,v}
* param: spend_privkey - k^s
* param: onetime_address - Ko
* outparam: key_image_out - (k^{o,v} + k^s) * Hp(Ko)
*/
void make_key_image(const crypto::secret_key &enote_view_privkey,
    const crypto::secret_key &spend_privkey,
    const rct::key &onetime_address,
    crypto::key_image &key_image_out);
/**
* brief: make_amount_blinding_factor - make an output's amount blinding factor
*   - Hn("commitment_mask", Hn(r K^{v,i}, 0))
* param: sender_receiver_secret - Hn(r K^{v,i}, 0)
* outparam: amount_blinding_factor_out - Hn("commitment_mask", Hn(r K^{v,i}, 0))
*/
void make_amount_blinding_factor(const crypto::secret_key &sender_receiver_secret,
    crypto::secret_key &amount_blinding_factor_out);
/**
* brief: make_amount_encoding_factor - make an output's amount encoding factor
*   - H32("amount", Hn(r K^{v,i}, 0))
* param: sender_receiver_secret - Hn(r K^{v,i}, 0)
* outparam: amount_encoding_factor_out - H32("amount", Hn(r K^{v,i}, 0))
*/
void make_amount_encoding_factor(const crypto::secret_key &sender_receiver_secret,
    rct::key &amount_encoding_factor_out);
/**
* brief: make_token_id_encoding_factor - make an output's token id encoding factor
*   - H32("cw_token_id", Hn(r K^{v,i}, 0))
* param: sender_receiver_secret - Hn(r K^{v,i}, 0)
* outparam: token_id_encoding_factor_out - H32("cw_token_id", Hn(r K^{v,i}, 0))
*/
void make_token_id_encoding_factor(const crypto::secret_key &sender_receiver_secret,
    rct::key &token_id_encoding_factor_out);
/**
* brief: xor_amount - encode/decode an 8-byte value
*   - enc(a) = little_endian(a) XOR8 encoding_factor
* param: value - a
* param: encoding_factor -
* return: enc(a)
*/
std::uint64_t xor_amount(const std::uint64_t value, const rct::key &encoding_factor);
/**
* brief: xor_encoded_amount - decode an 8-byte value
*   - little_endian(enc(a) XOR8 encoding_factor)
* param: encoded_value - enc(a)
* param: encoding_factor -
* return: a
*/
std::uint64_t xor_encoded_amount(const std::uint64_t encoded_value, const rct::key &encoding_factor);
/**
* brief: make_confirmation_number - make an output's confirmation number
*   - H32("cw_confirmation_number", r K^{v,i})
*   - the sender knows it from r, the recipient recomputes it from k^v; it proves the sender made the output
* param: derivation - r K^{v,i}
* outparam: confirmation_number_out -
*/
void make_confirmation_number(const crypto::key_derivation &derivation, rct::key &confirmation_number_out);
/**
* brief: make_address_hash - make a short hash of a public address
* param: address -
* outparam: address_hash_out - H16(K^{s,i}, K^{v,i})
*/
void make_address_hash(const PublicAddress &address, address_hash_t &address_hash_out);

} //namespace cw
