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

// Output memos: payload layouts, memo builders, encryption.


#pragma once

//local headers
#include "account_keys.h"
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"
#include "txo_core_utils.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/variant/variant.hpp>

//standard headers
#include <array>
#include <cstdint>

//forward declarations


namespace cw
{

/// memo data: 64 bytes
using memo_data_t = std::array<unsigned char, 64>;

enum class MemoType : std::uint16_t
{
    UNUSED = 0x0000,
    BURN_REDEMPTION = 0x0001,
    AUTHENTICATED_SENDER = 0x0100,
    AUTHENTICATED_SENDER_WITH_PAYMENT_REQUEST_ID = 0x0101,
    AUTHENTICATED_SENDER_WITH_PAYMENT_INTENT_ID = 0x0102,
    DESTINATION = 0x0200
};

////
// MemoPayload
// - decrypted memo of an output
// - layouts (offsets into the data):
//   - authenticated sender: [0, 16) sender address hash, [16, 24) payment id (request/intent), [48, 64) hmac
//     - hmac key: k^{s,i}_sender K^{v,j}_recipient = (k^v k^{s,j})_recipient K^{s,i}_sender
//   - destination: [0, 16) recipient address hash, [16] num recipients, [17, 25) fee, [25, 33) total outlay
//   - burn redemption: caller-defined 64 bytes
///
struct MemoPayload final
{
    /// memo type
    MemoType m_type;
    /// memo data
    memo_data_t m_data;
};
bool operator==(const MemoPayload &a, const MemoPayload &b);

////
// SenderMemoCredential
// - what a sender needs to authenticate memos: one of its subaddresses and that subaddress's spend privkey
///
struct SenderMemoCredential final
{
    /// K^{s,i}, K^{v,i}: the address the recipient sees as the sender
    PublicAddress m_address;
    /// k^{s,i} = Hn(k^v, i) + k^s
    crypto::secret_key m_subaddress_spend_privkey;
};

////
// RTHMemoBuilder
// - 'recoverable transaction history' memos
// - payload outputs get an authenticated sender memo (optionally with a payment request or intent id)
//   - the sender is always the building account; without a spend key (view-only) payload memos are unused
// - change outputs get a destination memo
///
struct RTHMemoBuilder final
{
    /// payment request id (optional)
    boost::optional<std::uint64_t> m_payment_request_id;
    /// payment intent id (optional; exclusive with the payment request id)
    boost::optional<std::uint64_t> m_payment_intent_id;
};

////
// BurnRedemptionMemoBuilder
// - payload outputs (the burn) get a redemption memo
// - change outputs get a destination memo
///
struct BurnRedemptionMemoBuilder final
{
    /// caller-defined redemption data
    memo_data_t m_redemption_memo;
};

/// closed set of memo schemes
using MemoBuilderVariant = boost::variant<RTHMemoBuilder, BurnRedemptionMemoBuilder>;

////
// DestinationMemoInfo
// - what a change output's destination memo records about the tx
///
struct DestinationMemoInfo final
{
    /// recipient of the first payload output
    PublicAddress m_recipient;
    /// number of payload outputs
    std::uint8_t m_num_recipients;
    /// fee paid by the tx
    rct::xmr_amount m_fee;
    /// sum of payload output values (saturates at uint64 max)
    rct::xmr_amount m_total_outlay;
};

/**
* brief: make_sender_memo_credential - make the memo credential of one of an account's subaddresses
* param: keys - account keys with a spend privkey
* param: subaddress_index - i
* outparam: credential_out -
*/
void make_sender_memo_credential(const AccountKeys &keys,
    const std::uint64_t subaddress_index,
    SenderMemoCredential &credential_out);
/**
* brief: make_payload_memo - make the memo of a payload output
* param: memo_builder -
* param: sender_credential - credential of the sender (none: RTH payload memos are unused)
* param: recipient - {K^{s,j}, K^{v,j}} of the output
* param: ephemeral_pubkey - R of the output
* outparam: memo_out -
*/
void make_payload_memo(const MemoBuilderVariant &memo_builder,
    const boost::optional<SenderMemoCredential> &sender_credential,
    const PublicAddress &recipient,
    const rct::key &ephemeral_pubkey,
    MemoPayload &memo_out);
/**
* brief: make_change_memo - make the memo of a change output
* param: memo_builder - (all memo schemes use a destination memo for change)
* param: destination_info -
* outparam: memo_out -
*/
void make_change_memo(const MemoBuilderVariant &memo_builder,
    const DestinationMemoInfo &destination_info,
    MemoPayload &memo_out);
/**
* brief: try_check_authenticated_sender_memo - check that an authenticated sender memo was made by a given sender
*   - the recipient needs the view privkey of the subaddress that received the output (a full-key operation)
* param: memo -
* param: sender_address - {K^{s,i}, K^{v,i}} the memo claims (e.g. found from its address hash in a contact list)
* param: recipient_subaddress_view_privkey - k^v k^{s,j} of the receiving subaddress
* param: ephemeral_pubkey - R of the output
* return: true if the memo is an authenticated sender memo from 'sender_address' with a valid hmac
*/
bool try_check_authenticated_sender_memo(const MemoPayload &memo,
    const PublicAddress &sender_address,
    const crypto::secret_key &recipient_subaddress_view_privkey,
    const rct::key &ephemeral_pubkey);
/**
* brief: try_get_destination_memo_info - read a destination memo
* param: memo -
* outparam: recipient_address_hash_out -
* outparam: num_recipients_out -
* outparam: fee_out -
* outparam: total_outlay_out -
* return: true if the memo is a destination memo
*/
bool try_get_destination_memo_info(const MemoPayload &memo,
    address_hash_t &recipient_address_hash_out,
    std::uint8_t &num_recipients_out,
    rct::xmr_amount &fee_out,
    rct::xmr_amount &total_outlay_out);
/**
* brief: encrypt_memo - encrypt a memo with a keystream derived from the output's sender-receiver secret
*   - enc(memo) = (type || data) XOR (H2(k_type, s) || H64(k_data, s))
* param: memo -
* param: sender_receiver_secret - s
* outparam: encrypted_memo_out -
*/
void encrypt_memo(const MemoPayload &memo,
    const crypto::secret_key &sender_receiver_secret,
    encrypted_memo_t &encrypted_memo_out);
/**
* brief: decrypt_memo - decrypt a memo
* param: encrypted_memo -
* param: sender_receiver_secret - s
* outparam: memo_out -
*/
void decrypt_memo(const encrypted_memo_t &encrypted_memo,
    const crypto::secret_key &sender_receiver_secret,
    MemoPayload &memo_out);

} //namespace cw
