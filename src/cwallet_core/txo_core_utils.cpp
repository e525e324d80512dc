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
#include "txo_core_utils.h"

//local headers
#include "crypto/crypto.h"
extern "C"
{
#include "crypto/crypto-ops.h"
}
#include "cryptonote_basic/subaddress_index.h"
#include "cw_hash_functions.h"
#include "cwallet_config.h"
#include "device/device.hpp"
#include "int-util.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "transcript.h"
#include "tx_component_types.h"

//third party headers

//standard headers
#include <cstring>
#include <limits>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
cryptonote::subaddress_index make_cryptonote_subaddress_index(const std::uint64_t subaddress_index)
{
    CHECK_AND_ASSERT_THROW_MES(subaddress_index <= std::numeric_limits<std::uint32_t>::max(),
        "make cryptonote subaddress index: subaddress index is out of range.");

    return cryptonote::subaddress_index{0, static_cast<std::uint32_t>(subaddress_index)};
}
//-------------------------------------------------------------------------------------------------------------------
void make_subaddress_spendkey(const rct::key &base_spend_pubkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    rct::key &subaddress_spendkey_out)
{
    // Hn(k^v, i) = Hn("SubAddr" || k^v || index_major || index_minor)
    const crypto::secret_key subaddress_modifier{
            hw::get_device("default").get_subaddress_secret_key(view_privkey,
                make_cryptonote_subaddress_index(subaddress_index))
        };

    // Hn(k^v, i) G
    rct::key subaddress_extension;
    rct::scalarmultBase(subaddress_extension, rct::sk2rct(subaddress_modifier));

    // K^{s,i} = Hn(k^v, i) G + k^s G
    rct::addKeys(subaddress_spendkey_out, subaddress_extension, base_spend_pubkey);
}
//-------------------------------------------------------------------------------------------------------------------
void make_subaddress_spend_privkey(const crypto::secret_key &spend_privkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    crypto::secret_key &subaddress_spend_privkey_out)
{
    // Hn(k^v, i)
    const crypto::secret_key subaddress_modifier{
            hw::get_device("default").get_subaddress_secret_key(view_privkey,
                make_cryptonote_subaddress_index(subaddress_index))
        };

    // k^{s,i} = Hn(k^v, i) + k^s
    sc_add(to_bytes(subaddress_spend_privkey_out), to_bytes(subaddress_modifier), to_bytes(spend_privkey));
}
//-------------------------------------------------------------------------------------------------------------------
void make_subaddress_view_privkey(const crypto::secret_key &spend_privkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    crypto::secret_key &subaddress_view_privkey_out)
{
    // k^{s,i}
    crypto::secret_key subaddress_spend_privkey;
    make_subaddress_spend_privkey(spend_privkey, view_privkey, subaddress_index, subaddress_spend_privkey);

    // k^{v,i} = k^v k^{s,i}
    sc_mul(to_bytes(subaddress_view_privkey_out), to_bytes(view_privkey), to_bytes(subaddress_spend_privkey));
}
//-------------------------------------------------------------------------------------------------------------------
void make_subaddress(const rct::key &base_spend_pubkey,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    PublicAddress &subaddress_out)
{
    // K^{s,i}
    make_subaddress_spendkey(base_spend_pubkey, view_privkey, subaddress_index, subaddress_out.m_spend_pubkey);

    // K^{v,i} = k^v K^{s,i}
    rct::scalarmultKey(subaddress_out.m_view_pubkey, subaddress_out.m_spend_pubkey, rct::sk2rct(view_privkey));
}
//-------------------------------------------------------------------------------------------------------------------
void make_sender_receiver_derivation(const rct::key &base_key,
    const crypto::secret_key &DH_privkey,
    crypto::key_derivation &derivation_out)
{
    // r K^{v,i} = k^v R
    CHECK_AND_ASSERT_THROW_MES(
            hw::get_device("default").generate_key_derivation(rct::rct2pk(base_key), DH_privkey, derivation_out),
        "make sender-receiver derivation: failed to generate key derivation.");
}
//-------------------------------------------------------------------------------------------------------------------
void make_sender_receiver_secret(const crypto::key_derivation &derivation,
    crypto::secret_key &sender_receiver_secret_out)
{
    // Hn(r K^{v,i}, 0)
    hw::get_device("default").derivation_to_scalar(derivation, 0, sender_receiver_secret_out);
}
//-------------------------------------------------------------------------------------------------------------------
void make_enote_view_privkey(const crypto::key_derivation &derivation,
    const crypto::secret_key &view_privkey,
    const std::uint64_t subaddress_index,
    crypto::secret_key &enote_view_privkey_out)
{
    // Hn(k^v R, 0)
    crypto::derivation_to_scalar(derivation, 0, enote_view_privkey_out);

    // Hn(k^v, i) = Hn(k^v || index_major || index_minor)
    const crypto::secret_key subaddress_modifier{
            hw::get_device("default").get_subaddress_secret_key(view_privkey,
                make_cryptonote_subaddress_index(subaddress_index))
        };

    // Hn(k^v R, 0) + Hn(k^v, i)
    sc_add(to_bytes(enote_view_privkey_out), to_bytes(enote_view_privkey_out), to_bytes(subaddress_modifier));
}
//-------------------------------------------------------------------------------------------------------------------
void make_onetime_address(const crypto::key_derivation &derivation,
    const rct::key &destination_spendkey,
    rct::key &onetime_address_out)
{
    // K^o = Hn(r K^{v,i}, 0) G + K^{s,i}
    crypto::public_key onetime_address_temp;
    CHECK_AND_ASSERT_THROW_MES(hw::get_device("default").derive_public_key(derivation,
                0,
                rct::rct2pk(destination_spendkey),
                onetime_address_temp),
        "make onetime address: failed to derive public key.");

    onetime_address_out = rct::pk2rct(onetime_address_temp);
}
//-------------------------------------------------------------------------------------------------------------------
void make_onetime_address_privkey(const crypto::secret_key &enote_view_privkey,
    const crypto::secret_key &spend_privkey,
    crypto::secret_key &onetime_address_privkey_out)
{
    // k^o = k^{o,v} + k^s
    sc_add(to_bytes(onetime_address_privkey_out), to_bytes(enote_view_privkey), to_bytes(spend_privkey));
}
//-------------------------------------------------------------------------------------------------------------------
void make_key_image(const crypto::secret_key &enote_view_privkey,
    const crypto::secret_key &spend_privkey,
    const rct::key &onetime_address,
    crypto::key_image &key_image_out)
{
    // KI = (view_key_stuff + k^s) * Hp(Ko)
    crypto::secret_key onetime_address_privkey;
    make_onetime_address_privkey(enote_view_privkey, spend_privkey, onetime_address_privkey);

    crypto::generate_key_image(rct::rct2pk(onetime_address), onetime_address_privkey, key_image_out);
}
//-------------------------------------------------------------------------------------------------------------------
void make_amount_blinding_factor(const crypto::secret_key &sender_receiver_secret,
    crypto::secret_key &amount_blinding_factor_out)
{
    // Hn("commitment_mask", Hn(r K^{v,i}, 0))
    char data[15 + sizeof(rct::key)];
    memcpy(data, "commitment_mask", 15);
    memcpy(data + 15, to_bytes(sender_receiver_secret), sizeof(rct::key));
    crypto::hash_to_scalar(data, sizeof(data), amount_blinding_factor_out);
}
//-------------------------------------------------------------------------------------------------------------------
void make_amount_encoding_factor(const crypto::secret_key &sender_receiver_secret,
    rct::key &amount_encoding_factor_out)
{
    // H32("amount", Hn(r K^{v,i}, 0))
    char data[6 + sizeof(rct::key)];
    memcpy(data, "amount", 6);
    memcpy(data + 6, to_bytes(sender_receiver_secret), sizeof(rct::key));
    rct::cn_fast_hash(amount_encoding_factor_out, data, sizeof(data));
}
//-------------------------------------------------------------------------------------------------------------------
void make_token_id_encoding_factor(const crypto::secret_key &sender_receiver_secret,
    rct::key &token_id_encoding_factor_out)
{
    // H32("cw_token_id", Hn(r K^{v,i}, 0))
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_TOKEN_ID_ENCODING_FACTOR, sizeof(rct::key)};
    transcript.append("secret", sender_receiver_secret);

    token_id_encoding_factor_out = cw_hash_to_key(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t xor_amount(const std::uint64_t value, const rct::key &encoding_factor)
{
    // a XOR_8 factor
    std::uint64_t factor;
    memcpy(&factor, encoding_factor.bytes, 8);

    return SWAP64LE(value) ^ factor;
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t xor_encoded_amount(const std::uint64_t encoded_value, const rct::key &encoding_factor)
{
    // a XOR_8 factor
    std::uint64_t factor;
    memcpy(&factor, encoding_factor.bytes, 8);

    return SWAP64LE(encoded_value ^ factor);
}
//-------------------------------------------------------------------------------------------------------------------
void make_confirmation_number(const crypto::key_derivation &derivation, rct::key &confirmation_number_out)
{
    // H32("cw_confirmation_number", r K^{v,i})
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_CONFIRMATION_NUMBER, sizeof(crypto::key_derivation)};
    transcript.append("derivation", derivation);

    confirmation_number_out = cw_hash_to_key(transcript);
}
//-------------------------------------------------------------------------------------------------------------------
void make_address_hash(const PublicAddress &address, address_hash_t &address_hash_out)
{
    // H16(K^{s,i}, K^{v,i})
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_ADDRESS_HASH, 2*sizeof(rct::key)};
    transcript.append("address", address);

    cw_hash_to_bytes(transcript, 16, address_hash_out.data());
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
