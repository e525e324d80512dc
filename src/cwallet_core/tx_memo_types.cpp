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
#include "tx_memo_types.h"

//local headers
#include "account_keys.h"
#include "crypto/crypto.h"
#include "cw_hash_functions.h"
#include "cwallet_config.h"
#include "int-util.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "transcript.h"
#include "txo_core_utils.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/variant/get.hpp>
#include <sodium/crypto_verify_16.h>

//standard headers
#include <algorithm>
#include <cstring>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void write_u64_le(const std::uint64_t value, unsigned char *buffer_out)
{
    const std::uint64_t le_value{SWAP64LE(value)};
    memcpy(buffer_out, &le_value, 8);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::uint64_t read_u64_le(const unsigned char *buffer)
{
    std::uint64_t value;
    memcpy(&value, buffer, 8);
    return SWAP64LE(value);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void make_authenticated_sender_memo_hmac(const MemoPayload &memo,
    const rct::key &sender_recipient_shared_secret,
    const rct::key &ephemeral_pubkey,
    unsigned char *hmac_out)
{
    // H16(k^{s,i} K^{v,j}, R, type, data[0, 48))
    CwTranscript transcript{TranscriptMode::KDF, config::HASH_KEY_CW_RTH_MEMO_HMAC, 2*sizeof(rct::key) + 50};
    transcript.append("shared_secret", sender_recipient_shared_secret);
    transcript.append("R", ephemeral_pubkey);
    transcript.append("type", static_cast<std::uint16_t>(memo.m_type));
    transcript.append("data", boost::string_ref{reinterpret_cast<const char*>(memo.m_data.data()), 48});

    cw_hash_to_bytes(transcript, 16, hmac_out);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const MemoPayload &a, const MemoPayload &b)
{
    return a.m_type == b.m_type &&
        a.m_data == b.m_data;
}
//-------------------------------------------------------------------------------------------------------------------
void make_sender_memo_credential(const AccountKeys &keys,
    const std::uint64_t subaddress_index,
    SenderMemoCredential &credential_out)
{
    CHECK_AND_ASSERT_THROW_MES(can_spend(keys), "make sender memo credential: the account keys are view-only.");

    make_account_subaddress(keys, subaddress_index, credential_out.m_address);
    make_subaddress_spend_privkey(*keys.m_spend_privkey,
        keys.m_view_privkey,
        subaddress_index,
        credential_out.m_subaddress_spend_privkey);
}
//-------------------------------------------------------------------------------------------------------------------
void make_payload_memo(const MemoBuilderVariant &memo_builder,
    const boost::optional<SenderMemoCredential> &sender_credential,
    const PublicAddress &recipient,
    const rct::key &ephemeral_pubkey,
    MemoPayload &memo_out)
{
    memo_out.m_data.fill(0);

    // burn redemption: caller-defined data
    if (const BurnRedemptionMemoBuilder *burn_builder = boost::get<BurnRedemptionMemoBuilder>(&memo_builder))
    {
        memo_out.m_type = MemoType::BURN_REDEMPTION;
        memo_out.m_data = burn_builder->m_redemption_memo;
        return;
    }

    // authenticated sender
    const RTHMemoBuilder &rth_builder{boost::get<RTHMemoBuilder>(memo_builder)};
    CHECK_AND_ASSERT_THROW_MES(!(rth_builder.m_payment_request_id && rth_builder.m_payment_intent_id),
        "make payload memo: a memo can have a payment request id or a payment intent id, not both.");

    if (!sender_credential)
    {
        MDEBUG("make payload memo: no sender credential, the payload memo is unused.");
        memo_out.m_type = MemoType::UNUSED;
        return;
    }

    // 1. sender address hash
    address_hash_t sender_address_hash;
    make_address_hash(sender_credential->m_address, sender_address_hash);
    std::copy(sender_address_hash.begin(), sender_address_hash.end(), memo_out.m_data.begin());

    // 2. payment id
    memo_out.m_type = MemoType::AUTHENTICATED_SENDER;

    if (rth_builder.m_payment_request_id)
    {
        memo_out.m_type = MemoType::AUTHENTICATED_SENDER_WITH_PAYMENT_REQUEST_ID;
        write_u64_le(*rth_builder.m_payment_request_id, memo_out.m_data.data() + 16);
    }
    else if (rth_builder.m_payment_intent_id)
    {
        memo_out.m_type = MemoType::AUTHENTICATED_SENDER_WITH_PAYMENT_INTENT_ID;
        write_u64_le(*rth_builder.m_payment_intent_id, memo_out.m_data.data() + 16);
    }

    // 3. hmac keyed on k^{s,i} K^{v,j}
    rct::key shared_secret{
            rct::scalarmultKey(recipient.m_view_pubkey, rct::sk2rct(sender_credential->m_subaddress_spend_privkey))
        };
    make_authenticated_sender_memo_hmac(memo_out, shared_secret, ephemeral_pubkey, memo_out.m_data.data() + 48);
    memwipe(shared_secret.bytes, sizeof(rct::key));
}
//-------------------------------------------------------------------------------------------------------------------
void make_change_memo(const MemoBuilderVariant&,
    const DestinationMemoInfo &destination_info,
    MemoPayload &memo_out)
{
    memo_out.m_type = MemoType::DESTINATION;
    memo_out.m_data.fill(0);

    address_hash_t recipient_address_hash;
    make_address_hash(destination_info.m_recipient, recipient_address_hash);
    std::copy(recipient_address_hash.begin(), recipient_address_hash.end(), memo_out.m_data.begin());

    memo_out.m_data[16] = destination_info.m_num_recipients;
    write_u64_le(destination_info.m_fee, memo_out.m_data.data() + 17);
    write_u64_le(destination_info.m_total_outlay, memo_out.m_data.data() + 25);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_check_authenticated_sender_memo(const MemoPayload &memo,
    const PublicAddress &sender_address,
    const crypto::secret_key &recipient_subaddress_view_privkey,
    const rct::key &ephemeral_pubkey)
{
    if (memo.m_type != MemoType::AUTHENTICATED_SENDER &&
        memo.m_type != MemoType::AUTHENTICATED_SENDER_WITH_PAYMENT_REQUEST_ID &&
        memo.m_type != MemoType::AUTHENTICATED_SENDER_WITH_PAYMENT_INTENT_ID)
        return false;

    // 1. the memo must name this sender
    address_hash_t sender_address_hash;
    make_address_hash(sender_address, sender_address_hash);
    if (!std::equal(sender_address_hash.begin(), sender_address_hash.end(), memo.m_data.begin()))
        return false;

    // 2. hmac keyed on (k^v k^{s,j}) K^{s,i}
    rct::key shared_secret{
            rct::scalarmultKey(sender_address.m_spend_pubkey, rct::sk2rct(recipient_subaddress_view_privkey))
        };
    unsigned char nominal_hmac[16];
    make_authenticated_sender_memo_hmac(memo, shared_secret, ephemeral_pubkey, nominal_hmac);
    memwipe(shared_secret.bytes, sizeof(rct::key));

    return crypto_verify_16(nominal_hmac, memo.m_data.data() + 48) == 0;
}
//-------------------------------------------------------------------------------------------------------------------
bool try_get_destination_memo_info(const MemoPayload &memo,
    address_hash_t &recipient_address_hash_out,
    std::uint8_t &num_recipients_out,
    rct::xmr_amount &fee_out,
    rct::xmr_amount &total_outlay_out)
{
    if (memo.m_type != MemoType::DESTINATION)
        return false;

    std::copy(memo.m_data.begin(), memo.m_data.begin() + 16, recipient_address_hash_out.begin());
    num_recipients_out = memo.m_data[16];
    fee_out = read_u64_le(memo.m_data.data() + 17);
    total_outlay_out = read_u64_le(memo.m_data.data() + 25);

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
void encrypt_memo(const MemoPayload &memo,
    const crypto::secret_key &sender_receiver_secret,
    encrypted_memo_t &encrypted_memo_out)
{
    // 1. keystreams
    unsigned char type_keystream[2];
    unsigned char data_keystream[64];

    CwTranscript type_transcript{TranscriptMode::KDF, config::HASH_KEY_CW_MEMO_TYPE_KEYSTREAM, sizeof(rct::key)};
    type_transcript.append("secret", sender_receiver_secret);
    cw_hash_to_bytes(type_transcript, 2, type_keystream);

    CwTranscript data_transcript{TranscriptMode::KDF, config::HASH_KEY_CW_MEMO_KEYSTREAM, sizeof(rct::key)};
    data_transcript.append("secret", sender_receiver_secret);
    cw_hash_to_bytes(data_transcript, 64, data_keystream);

    // 2. enc(type || data)
    const std::uint16_t type{static_cast<std::uint16_t>(memo.m_type)};
    encrypted_memo_out[0] = static_cast<unsigned char>(type >> 8) ^ type_keystream[0];
    encrypted_memo_out[1] = static_cast<unsigned char>(type & 0xFF) ^ type_keystream[1];

    for (std::size_t i{0}; i < 64; ++i)
        encrypted_memo_out[2 + i] = memo.m_data[i] ^ data_keystream[i];

    memwipe(data_keystream, sizeof(data_keystream));
}
//-------------------------------------------------------------------------------------------------------------------
void decrypt_memo(const encrypted_memo_t &encrypted_memo,
    const crypto::secret_key &sender_receiver_secret,
    MemoPayload &memo_out)
{
    // the memo cipher is a keystream XOR, so decrypting is re-encrypting
    MemoPayload encrypted_as_payload;
    encrypted_as_payload.m_type =
        static_cast<MemoType>((static_cast<std::uint16_t>(encrypted_memo[0]) << 8) | encrypted_memo[1]);
    std::copy(encrypted_memo.begin() + 2, encrypted_memo.end(), encrypted_as_payload.m_data.begin());

    encrypted_memo_t decrypted;
    encrypt_memo(encrypted_as_payload, sender_receiver_secret, decrypted);

    memo_out.m_type = static_cast<MemoType>((static_cast<std::uint16_t>(decrypted[0]) << 8) | decrypted[1]);
    std::copy(decrypted.begin() + 2, decrypted.end(), memo_out.m_data.begin());
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
