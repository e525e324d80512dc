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

// Making outputs (sender side) and recovering them with a view key (recipient side).


#pragma once

//local headers
#include "account_keys.h"
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"
#include "tx_memo_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <unordered_map>

//forward declarations


namespace cw
{

////
// TxOutSecrets
// - sender-side secrets of a new output (computed before the memo, which may depend on them)
///
struct TxOutSecrets final
{
    /// R = r K^{s,i}
    rct::key m_ephemeral_pubkey;
    /// r K^{v,i}
    crypto::key_derivation m_derivation;
    /// s = Hn(r K^{v,i}, 0)
    crypto::secret_key m_sender_receiver_secret;
    /// x = Hn("commitment_mask", s)
    crypto::secret_key m_amount_blinding_factor;
};

////
// TxoRecord
// - an output recovered with an account's view key
///
struct TxoRecord final
{
    /// the output
    TxOut m_tx_out;
    /// H32(Ko, R)
    rct::key m_txo_id;
    /// decoded value and token id
    Amount m_amount;
    /// x
    crypto::secret_key m_amount_blinding_factor;
    /// K^{s,i} = Ko - Hn(k^v R, 0) G (the spendkey of the subaddress the output was sent to)
    rct::key m_nominal_spend_pubkey;
    /// subaddress the output was sent to (none if the subaddress is not assigned yet: 'orphaned')
    boost::optional<std::uint64_t> m_subaddress_index;
    /// key image (none if orphaned or if the account is view-only)
    boost::optional<crypto::key_image> m_key_image;
    /// decrypted memo
    MemoPayload m_memo;
};

/// map of subaddress spendkeys to subaddress indices: {K^{s,i} : i}
using subaddress_map_t = std::unordered_map<rct::key, std::uint64_t>;

/**
* brief: make_tx_out_secrets - make the secrets of a new output
* param: recipient - {K^{s,i}, K^{v,i}}
* param: ephemeral_privkey - r
* outparam: secrets_out -
*/
void make_tx_out_secrets(const PublicAddress &recipient,
    const crypto::secret_key &ephemeral_privkey,
    TxOutSecrets &secrets_out);
/**
* brief: make_tx_out - make a new output
* param: recipient - {K^{s,i}, K^{v,i}}
* param: amount - a and its token id
* param: secrets - secrets from make_tx_out_secrets() for the same recipient
* param: memo - memo to encrypt into the output
* outparam: tx_out_out -
*/
void make_tx_out(const PublicAddress &recipient,
    const Amount &amount,
    const TxOutSecrets &secrets,
    const MemoPayload &memo,
    TxOut &tx_out_out);
/**
* brief: try_view_scan_tx_out - try to recover an output with an account's view key
*   - an output that decodes but whose spendkey is not in the subaddress map is recorded as orphaned
* param: tx_out -
* param: keys - account keys (the spend privkey is optional)
* param: subaddress_map - {K^{s,i} : i} for the account's assigned subaddresses
* outparam: record_out -
* return: true if the output belongs to the account
*/
bool try_view_scan_tx_out(const TxOut &tx_out,
    const AccountKeys &keys,
    const subaddress_map_t &subaddress_map,
    TxoRecord &record_out);
/**
* brief: try_complete_orphaned_record - try to resolve the subaddress (and key image) of an orphaned record
* param: keys -
* param: subaddress_map -
* inoutparam: record_inout -
* return: true if the record is no longer orphaned
*/
bool try_complete_orphaned_record(const AccountKeys &keys,
    const subaddress_map_t &subaddress_map,
    TxoRecord &record_inout);
/**
* brief: make_txo_spend_privkey - make the privkey of an owned output's onetime address
*   - k^o = Hn(k^v R, 0) + Hn(k^v, i) + k^s
* param: keys - account keys with a spend privkey
* param: tx_out -
* param: subaddress_index - i
* outparam: onetime_address_privkey_out - k^o
*/
void make_txo_spend_privkey(const AccountKeys &keys,
    const TxOut &tx_out,
    const std::uint64_t subaddress_index,
    crypto::secret_key &onetime_address_privkey_out);
/**
* brief: verify_confirmation_number - check that a confirmation number matches an owned output
* param: tx_out -
* param: view_privkey - k^v
* param: confirmation_number -
* return: true if the confirmation number proves the sender made the output
*/
bool verify_confirmation_number(const TxOut &tx_out,
    const crypto::secret_key &view_privkey,
    const rct::key &confirmation_number);

} //namespace cw
