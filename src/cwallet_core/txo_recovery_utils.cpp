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
#include "txo_recovery_utils.h"

//local headers
#include "account_keys.h"
#include "crypto/crypto.h"
#include "device/device.hpp"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"
#include "tx_memo_types.h"
#include "tx_misc_utils.h"
#include "txo_core_utils.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_check_view_tag(const crypto::view_tag &view_tag, const crypto::key_derivation &derivation)
{
    // view_tag = H_1("view_tag", k^v R, 0)
    crypto::view_tag nominal_view_tag;
    crypto::derive_view_tag(derivation, 0, nominal_view_tag);

    return nominal_view_tag == view_tag;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static rct::key make_nominal_spendkey(const rct::key &onetime_address, const crypto::key_derivation &derivation)
{
    // K^{s,i} = Ko - Hn(k^v R, 0) G
    crypto::public_key nominal_spendkey;
    hw::get_device("default").derive_subaddress_public_key(rct::rct2pk(onetime_address),
        derivation,
        0,
        nominal_spendkey);

    return rct::pk2rct(nominal_spendkey);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_check_nominal_spendkey(const rct::key &nominal_spendkey,
    const subaddress_map_t &subaddress_map,
    boost::optional<std::uint64_t> &subaddress_index_out)
{
    const auto map_it = subaddress_map.find(nominal_spendkey);
    if (map_it == subaddress_map.end())
        return false;

    subaddress_index_out = map_it->second;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_get_amount_commitment_information(const TxOut &tx_out,
    const crypto::secret_key &sender_receiver_secret,
    Amount &amount_out,
    crypto::secret_key &amount_blinding_factor_out)
{
    // 1. x = Hn("commitment_mask", s)
    make_amount_blinding_factor(sender_receiver_secret, amount_blinding_factor_out);

    // 2. a = enc(a) XOR8 H32("amount", s)
    rct::key amount_encoding_factor;
    make_amount_encoding_factor(sender_receiver_secret, amount_encoding_factor);
    amount_out.m_value = xor_encoded_amount(tx_out.m_encoded_amount, amount_encoding_factor);

    // 3. token id = enc(token id) XOR8 H32("cw_token_id", s)
    rct::key token_id_encoding_factor;
    make_token_id_encoding_factor(sender_receiver_secret, token_id_encoding_factor);
    amount_out.m_token_id = xor_encoded_amount(tx_out.m_encoded_token_id, token_id_encoding_factor);

    // 4. try to reproduce the amount commitment with the decoded token's generator
    // - this is the real ownership check for the view key, and it binds the decoded token id to the commitment
    return make_amount_commitment(amount_out, amount_blinding_factor_out) == tx_out.m_amount_commitment;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void set_record_key_image(const AccountKeys &keys,
    const crypto::key_derivation &derivation,
    TxoRecord &record_inout)
{
    record_inout.m_key_image = boost::none;

    if (!can_spend(keys) || !record_inout.m_subaddress_index)
        return;

    // KI = (Hn(k^v R, 0) + Hn(k^v, i) + k^s) Hp(Ko)
    crypto::secret_key enote_view_privkey;
    make_enote_view_privkey(derivation, keys.m_view_privkey, *record_inout.m_subaddress_index, enote_view_privkey);

    crypto::key_image key_image;
    make_key_image(enote_view_privkey, *keys.m_spend_privkey, record_inout.m_tx_out.m_onetime_address, key_image);
    record_inout.m_key_image = key_image;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void make_tx_out_secrets(const PublicAddress &recipient,
    const crypto::secret_key &ephemeral_privkey,
    TxOutSecrets &secrets_out)
{
    // R = r K^{s,i}
    rct::scalarmultKey(secrets_out.m_ephemeral_pubkey, recipient.m_spend_pubkey, rct::sk2rct(ephemeral_privkey));

    // r K^{v,i}
    make_sender_receiver_derivation(recipient.m_view_pubkey, ephemeral_privkey, secrets_out.m_derivation);

    // s = Hn(r K^{v,i}, 0)
    make_sender_receiver_secret(secrets_out.m_derivation, secrets_out.m_sender_receiver_secret);

    // x = Hn("commitment_mask", s)
    make_amount_blinding_factor(secrets_out.m_sender_receiver_secret, secrets_out.m_amount_blinding_factor);
}
//-------------------------------------------------------------------------------------------------------------------
void make_tx_out(const PublicAddress &recipient,
    const Amount &amount,
    const TxOutSecrets &secrets,
    const MemoPayload &memo,
    TxOut &tx_out_out)
{
    // 1. Ko = Hn(r K^{v,i}, 0) G + K^{s,i}
    make_onetime_address(secrets.m_derivation, recipient.m_spend_pubkey, tx_out_out.m_onetime_address);

    // 2. R
    tx_out_out.m_ephemeral_pubkey = secrets.m_ephemeral_pubkey;

    // 3. C = x G + a H_t
    tx_out_out.m_amount_commitment = make_amount_commitment(amount, secrets.m_amount_blinding_factor);

    // 4. enc(a), enc(token id)
    rct::key amount_encoding_factor;
    make_amount_encoding_factor(secrets.m_sender_receiver_secret, amount_encoding_factor);
    tx_out_out.m_encoded_amount = xor_amount(amount.m_value, amount_encoding_factor);

    rct::key token_id_encoding_factor;
    make_token_id_encoding_factor(secrets.m_sender_receiver_secret, token_id_encoding_factor);
    tx_out_out.m_encoded_token_id = xor_amount(amount.m_token_id, token_id_encoding_factor);

    // 5. view tag
    crypto::derive_view_tag(secrets.m_derivation, 0, tx_out_out.m_view_tag);

    // 6. enc(memo)
    encrypt_memo(memo, secrets.m_sender_receiver_secret, tx_out_out.m_encrypted_memo);
}
//-------------------------------------------------------------------------------------------------------------------
bool try_view_scan_tx_out(const TxOut &tx_out,
    const AccountKeys &keys,
    const subaddress_map_t &subaddress_map,
    TxoRecord &record_out)
{
    // 1. k^v R
    crypto::key_derivation derivation;
    if (!hw::get_device("default").generate_key_derivation(rct::rct2pk(tx_out.m_ephemeral_pubkey),
            keys.m_view_privkey,
            derivation))
        return false;

    // 2. view tag (cheap filter)
    if (!try_check_view_tag(tx_out.m_view_tag, derivation))
        return false;

    // 3. amount (all outputs sent to the account's subaddresses decode, assigned or not)
    crypto::secret_key sender_receiver_secret;
    make_sender_receiver_secret(derivation, sender_receiver_secret);

    if (!try_get_amount_commitment_information(tx_out,
            sender_receiver_secret,
            record_out.m_amount,
            record_out.m_amount_blinding_factor))
        return false;

    // 4. subaddress (none: orphaned)
    record_out.m_nominal_spend_pubkey = make_nominal_spendkey(tx_out.m_onetime_address, derivation);
    record_out.m_subaddress_index = boost::none;
    if (!try_check_nominal_spendkey(record_out.m_nominal_spend_pubkey, subaddress_map, record_out.m_subaddress_index))
        MDEBUG("view scan: output decodes but its subaddress is not assigned (orphaned).");

    // 5. finish the record
    record_out.m_tx_out = tx_out;
    record_out.m_txo_id = make_txo_id(tx_out);
    set_record_key_image(keys, derivation, record_out);
    decrypt_memo(tx_out.m_encrypted_memo, sender_receiver_secret, record_out.m_memo);

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool try_complete_orphaned_record(const AccountKeys &keys,
    const subaddress_map_t &subaddress_map,
    TxoRecord &record_inout)
{
    if (record_inout.m_subaddress_index)
        return true;

    if (!try_check_nominal_spendkey(record_inout.m_nominal_spend_pubkey, subaddress_map, record_inout.m_subaddress_index))
        return false;

    crypto::key_derivation derivation;
    make_sender_receiver_derivation(record_inout.m_tx_out.m_ephemeral_pubkey, keys.m_view_privkey, derivation);

    set_record_key_image(keys, derivation, record_inout);
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
void make_txo_spend_privkey(const AccountKeys &keys,
    const TxOut &tx_out,
    const std::uint64_t subaddress_index,
    crypto::secret_key &onetime_address_privkey_out)
{
    CHECK_AND_ASSERT_THROW_MES(can_spend(keys), "make txo spend privkey: the account keys are view-only.");

    // k^v R
    crypto::key_derivation derivation;
    make_sender_receiver_derivation(tx_out.m_ephemeral_pubkey, keys.m_view_privkey, derivation);

    // k^o = Hn(k^v R, 0) + Hn(k^v, i) + k^s
    crypto::secret_key enote_view_privkey;
    make_enote_view_privkey(derivation, keys.m_view_privkey, subaddress_index, enote_view_privkey);
    make_onetime_address_privkey(enote_view_privkey, *keys.m_spend_privkey, onetime_address_privkey_out);

    // sanity check: k^o G == Ko
    rct::key nominal_onetime_address;
    rct::scalarmultBase(nominal_onetime_address, rct::sk2rct(onetime_address_privkey_out));
    CHECK_AND_ASSERT_THROW_MES(nominal_onetime_address == tx_out.m_onetime_address,
        "make txo spend privkey: the output is not owned by this subaddress.");
}
//-------------------------------------------------------------------------------------------------------------------
bool verify_confirmation_number(const TxOut &tx_out,
    const crypto::secret_key &view_privkey,
    const rct::key &confirmation_number)
{
    crypto::key_derivation derivation;
    if (!hw::get_device("default").generate_key_derivation(rct::rct2pk(tx_out.m_ephemeral_pubkey),
            view_privkey,
            derivation))
        return false;

    rct::key nominal_confirmation_number;
    make_confirmation_number(derivation, nominal_confirmation_number);

    return nominal_confirmation_number == confirmation_number;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
