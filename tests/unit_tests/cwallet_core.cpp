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

#include "crypto/crypto.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/cw_hash_functions.h"
#include "cwallet_core/transcript.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/tx_memo_types.h"
#include "cwallet_core/tx_misc_utils.h"
#include "cwallet_core/tx_out_membership_utils.h"
#include "cwallet_core/txo_core_utils.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"

#include "gtest/gtest.h"

#include <cstdint>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::subaddress_map_t make_subaddress_map(const cw::AccountKeys &keys, const std::uint64_t num_subaddresses)
{
    cw::subaddress_map_t subaddress_map;

    for (std::uint64_t subaddress_index{0}; subaddress_index < num_subaddresses; ++subaddress_index)
    {
        cw::PublicAddress subaddress;
        cw::make_account_subaddress(keys, subaddress_index, subaddress);
        subaddress_map[subaddress.m_spend_pubkey] = subaddress_index;
    }

    return subaddress_map;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::TxOut make_tx_out_for(const cw::PublicAddress &recipient,
    const cw::Amount &amount,
    cw::TxOutSecrets &secrets_out)
{
    cw::make_tx_out_secrets(recipient, rct::rct2sk(rct::skGen()), secrets_out);

    cw::MemoPayload memo;
    memo.m_type = cw::MemoType::UNUSED;
    memo.m_data.fill(0);

    cw::TxOut tx_out;
    cw::make_tx_out(recipient, amount, secrets_out, memo, tx_out);

    return tx_out;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_scanned_record(const cw::AccountKeys &keys,
    const cw::TxOut &tx_out,
    const cw::Amount &expected_amount,
    const std::uint64_t expected_subaddress_index)
{
    cw::TxoRecord record;
    CHECK_AND_ASSERT_THROW_MES(cw::try_view_scan_tx_out(tx_out, keys, make_subaddress_map(keys, 4), record),
        "scanned record: output not found");
    CHECK_AND_ASSERT_THROW_MES(record.m_amount == expected_amount, "scanned record: amount mismatch");
    CHECK_AND_ASSERT_THROW_MES(record.m_subaddress_index, "scanned record: unexpectedly orphaned");
    CHECK_AND_ASSERT_THROW_MES(*record.m_subaddress_index == expected_subaddress_index,
        "scanned record: subaddress mismatch");
    CHECK_AND_ASSERT_THROW_MES(record.m_txo_id == cw::make_txo_id(tx_out), "scanned record: txo id mismatch");
    CHECK_AND_ASSERT_THROW_MES(cw::make_amount_commitment(record.m_amount, record.m_amount_blinding_factor) ==
            tx_out.m_amount_commitment,
        "scanned record: amount commitment mismatch");

    // key image: KI = k^o Hp(Ko)
    CHECK_AND_ASSERT_THROW_MES(record.m_key_image, "scanned record: missing key image");

    crypto::secret_key onetime_address_privkey;
    cw::make_txo_spend_privkey(keys, tx_out, expected_subaddress_index, onetime_address_privkey);

    crypto::key_image expected_key_image;
    crypto::generate_key_image(rct::rct2pk(tx_out.m_onetime_address), onetime_address_privkey, expected_key_image);
    CHECK_AND_ASSERT_THROW_MES(*record.m_key_image == expected_key_image, "scanned record: key image mismatch");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, account_keys)
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    EXPECT_TRUE(cw::can_spend(keys));

    // view-only keys keep the account id
    cw::AccountKeys view_only_keys;
    cw::make_view_only_account_keys(keys, view_only_keys);
    EXPECT_FALSE(cw::can_spend(view_only_keys));
    EXPECT_FALSE(cw::account_keys_equal(keys, view_only_keys));
    EXPECT_TRUE(cw::make_account_id(keys) == cw::make_account_id(view_only_keys));

    // keys rebuilt from the privkeys are the same keys
    cw::AccountKeys rebuilt_keys;
    cw::make_account_keys(keys.m_view_privkey, *keys.m_spend_privkey, rebuilt_keys);
    EXPECT_TRUE(cw::account_keys_equal(keys, rebuilt_keys));
    EXPECT_TRUE(cw::make_account_id(keys) == cw::make_account_id(rebuilt_keys));

    // different accounts have different ids
    cw::AccountKeys other_keys;
    cw::make_random_account_keys(other_keys);
    EXPECT_FALSE(cw::make_account_id(keys) == cw::make_account_id(other_keys));

    // subaddresses are distinct and deterministic
    cw::PublicAddress main_address, change_address, main_address_again;
    cw::make_account_subaddress(keys, 0, main_address);
    cw::make_account_subaddress(keys, 1, change_address);
    cw::make_account_subaddress(keys, 0, main_address_again);
    EXPECT_FALSE(main_address == change_address);
    EXPECT_TRUE(main_address == main_address_again);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, view_scan_tx_out)
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);

    for (std::uint64_t subaddress_index{0}; subaddress_index < 4; ++subaddress_index)
    {
        cw::PublicAddress recipient;
        cw::make_account_subaddress(keys, subaddress_index, recipient);

        const cw::Amount amount{1000 + subaddress_index, subaddress_index % 2};
        cw::TxOutSecrets secrets;
        const cw::TxOut tx_out{make_tx_out_for(recipient, amount, secrets)};

        EXPECT_NO_THROW(check_scanned_record(keys, tx_out, amount, subaddress_index));
    }

    // someone else's output
    cw::AccountKeys other_keys;
    cw::make_random_account_keys(other_keys);
    cw::PublicAddress other_address;
    cw::make_account_subaddress(other_keys, 0, other_address);

    cw::TxOutSecrets secrets;
    cw::TxoRecord record;
    EXPECT_FALSE(cw::try_view_scan_tx_out(make_tx_out_for(other_address, cw::Amount{5, 0}, secrets),
        keys,
        make_subaddress_map(keys, 4),
        record));

    // random outputs
    for (std::size_t i{0}; i < 20; ++i)
    {
        cw::TxOut dummy_tx_out;
        dummy_tx_out.gen();
        EXPECT_FALSE(cw::try_view_scan_tx_out(dummy_tx_out, keys, make_subaddress_map(keys, 4), record));
    }
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, relabeled_token_id_is_rejected)
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);

    cw::PublicAddress recipient;
    cw::make_account_subaddress(keys, 0, recipient);

    // an output of token 1 whose encoded token id is rewritten to token 0
    cw::TxOutSecrets secrets;
    cw::TxOut tx_out{make_tx_out_for(recipient, cw::Amount{500, 1}, secrets)};

    rct::key token_id_encoding_factor;
    cw::make_token_id_encoding_factor(secrets.m_sender_receiver_secret, token_id_encoding_factor);
    tx_out.m_encoded_token_id = cw::xor_amount(0, token_id_encoding_factor);

    cw::TxoRecord record;
    EXPECT_FALSE(cw::try_view_scan_tx_out(tx_out, keys, make_subaddress_map(keys, 2), record));

    // the honest label scans
    tx_out.m_encoded_token_id = cw::xor_amount(1, token_id_encoding_factor);
    ASSERT_TRUE(cw::try_view_scan_tx_out(tx_out, keys, make_subaddress_map(keys, 2), record));
    EXPECT_TRUE(record.m_amount == (cw::Amount{500, 1}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, view_only_scan)
{
    cw::AccountKeys keys, view_only_keys;
    cw::make_random_account_keys(keys);
    cw::make_view_only_account_keys(keys, view_only_keys);

    cw::PublicAddress recipient;
    cw::make_account_subaddress(keys, 0, recipient);

    cw::TxOutSecrets secrets;
    const cw::TxOut tx_out{make_tx_out_for(recipient, cw::Amount{77, 0}, secrets)};

    // view-only accounts decode outputs but cannot make key images
    cw::TxoRecord record;
    ASSERT_TRUE(cw::try_view_scan_tx_out(tx_out, view_only_keys, make_subaddress_map(view_only_keys, 2), record));
    EXPECT_TRUE(record.m_amount.m_value == 77);
    EXPECT_FALSE(record.m_key_image);

    // and cannot make spend keys
    crypto::secret_key onetime_address_privkey;
    EXPECT_ANY_THROW(cw::make_txo_spend_privkey(view_only_keys, tx_out, 0, onetime_address_privkey));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, orphaned_record)
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);

    // send to subaddress 5, which is not in the map yet
    cw::PublicAddress recipient;
    cw::make_account_subaddress(keys, 5, recipient);

    cw::TxOutSecrets secrets;
    const cw::TxOut tx_out{make_tx_out_for(recipient, cw::Amount{300, 0}, secrets)};

    cw::TxoRecord record;
    ASSERT_TRUE(cw::try_view_scan_tx_out(tx_out, keys, make_subaddress_map(keys, 2), record));
    EXPECT_FALSE(record.m_subaddress_index);
    EXPECT_FALSE(record.m_key_image);
    EXPECT_TRUE(record.m_amount.m_value == 300);
    EXPECT_TRUE(record.m_nominal_spend_pubkey == recipient.m_spend_pubkey);

    // a map without the subaddress does not help
    EXPECT_FALSE(cw::try_complete_orphaned_record(keys, make_subaddress_map(keys, 5), record));

    // assigning it does
    ASSERT_TRUE(cw::try_complete_orphaned_record(keys, make_subaddress_map(keys, 6), record));
    ASSERT_TRUE(record.m_subaddress_index);
    EXPECT_TRUE(*record.m_subaddress_index == 5);
    EXPECT_TRUE(record.m_key_image);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, confirmation_number)
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);

    cw::PublicAddress recipient;
    cw::make_account_subaddress(keys, 3, recipient);

    cw::TxOutSecrets secrets;
    const cw::TxOut tx_out{make_tx_out_for(recipient, cw::Amount{1, 0}, secrets)};

    // the sender knows the confirmation number from r K^{v,i}
    rct::key confirmation_number;
    cw::make_confirmation_number(secrets.m_derivation, confirmation_number);

    // the recipient verifies it with k^v
    EXPECT_TRUE(cw::verify_confirmation_number(tx_out, keys.m_view_privkey, confirmation_number));
    EXPECT_FALSE(cw::verify_confirmation_number(tx_out, keys.m_view_privkey, rct::skGen()));

    // another output's confirmation number does not verify
    cw::TxOutSecrets other_secrets;
    make_tx_out_for(recipient, cw::Amount{1, 0}, other_secrets);
    rct::key other_confirmation_number;
    cw::make_confirmation_number(other_secrets.m_derivation, other_confirmation_number);
    EXPECT_FALSE(cw::verify_confirmation_number(tx_out, keys.m_view_privkey, other_confirmation_number));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, authenticated_sender_memo)
{
    cw::AccountKeys sender_keys, recipient_keys;
    cw::make_random_account_keys(sender_keys);
    cw::make_random_account_keys(recipient_keys);

    cw::SenderMemoCredential sender_credential;
    cw::make_sender_memo_credential(sender_keys, 0, sender_credential);

    cw::RTHMemoBuilder memo_builder;
    memo_builder.m_payment_request_id = 42;

    cw::PublicAddress recipient;
    cw::make_account_subaddress(recipient_keys, 2, recipient);
    cw::TxOutSecrets secrets;
    cw::make_tx_out_secrets(recipient, rct::rct2sk(rct::skGen()), secrets);

    cw::MemoPayload memo;
    cw::make_payload_memo(memo_builder, sender_credential, recipient, secrets.m_ephemeral_pubkey, memo);
    EXPECT_TRUE(memo.m_type == cw::MemoType::AUTHENTICATED_SENDER_WITH_PAYMENT_REQUEST_ID);

    // the recipient checks the memo with the view privkey of the receiving subaddress
    crypto::secret_key recipient_view_privkey;
    cw::make_subaddress_view_privkey(*recipient_keys.m_spend_privkey,
        recipient_keys.m_view_privkey,
        2,
        recipient_view_privkey);

    rct::key recipient_view_pubkey;
    rct::scalarmultBase(recipient_view_pubkey, rct::sk2rct(recipient_view_privkey));
    EXPECT_TRUE(recipient_view_pubkey == recipient.m_view_pubkey);

    EXPECT_TRUE(cw::try_check_authenticated_sender_memo(memo,
        sender_credential.m_address,
        recipient_view_privkey,
        secrets.m_ephemeral_pubkey));

    // the hmac binds the memo to the output
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(memo,
        sender_credential.m_address,
        recipient_view_privkey,
        rct::pkGen()));

    cw::MemoPayload tampered_memo{memo};
    tampered_memo.m_data[20] ^= 1;
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(tampered_memo,
        sender_credential.m_address,
        recipient_view_privkey,
        secrets.m_ephemeral_pubkey));

    // another subaddress of the recipient cannot check it
    crypto::secret_key other_view_privkey;
    cw::make_subaddress_view_privkey(*recipient_keys.m_spend_privkey, recipient_keys.m_view_privkey, 0, other_view_privkey);
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(memo,
        sender_credential.m_address,
        other_view_privkey,
        secrets.m_ephemeral_pubkey));

    // the memo survives encryption inside the output
    cw::TxOut tx_out;
    cw::make_tx_out(recipient, cw::Amount{10, 0}, secrets, memo, tx_out);

    cw::TxoRecord record;
    ASSERT_TRUE(cw::try_view_scan_tx_out(tx_out, recipient_keys, make_subaddress_map(recipient_keys, 3), record));
    EXPECT_TRUE(record.m_memo == memo);

    // no credential (view-only sender): the payload memo is unused
    cw::MemoPayload unauthenticated_memo;
    cw::make_payload_memo(memo_builder, boost::none, recipient, secrets.m_ephemeral_pubkey, unauthenticated_memo);
    EXPECT_TRUE(unauthenticated_memo.m_type == cw::MemoType::UNUSED);

    cw::AccountKeys view_only_sender_keys;
    cw::make_view_only_account_keys(sender_keys, view_only_sender_keys);
    cw::SenderMemoCredential view_only_credential;
    EXPECT_ANY_THROW(cw::make_sender_memo_credential(view_only_sender_keys, 0, view_only_credential));

    // request id and intent id are exclusive
    memo_builder.m_payment_intent_id = 7;
    EXPECT_ANY_THROW(cw::make_payload_memo(memo_builder,
        sender_credential,
        recipient,
        secrets.m_ephemeral_pubkey,
        memo));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, forged_sender_memo)
{
    cw::AccountKeys honest_sender_keys, forger_keys, recipient_keys;
    cw::make_random_account_keys(honest_sender_keys);
    cw::make_random_account_keys(forger_keys);
    cw::make_random_account_keys(recipient_keys);

    cw::PublicAddress recipient;
    cw::make_account_subaddress(recipient_keys, 0, recipient);
    crypto::secret_key recipient_view_privkey;
    cw::make_subaddress_view_privkey(*recipient_keys.m_spend_privkey,
        recipient_keys.m_view_privkey,
        0,
        recipient_view_privkey);

    cw::TxOutSecrets secrets;
    cw::make_tx_out_secrets(recipient, rct::rct2sk(rct::skGen()), secrets);

    // the forger claims the honest sender's address but only has its own spend key
    cw::SenderMemoCredential forged_credential;
    cw::make_sender_memo_credential(forger_keys, 0, forged_credential);
    cw::make_account_subaddress(honest_sender_keys, 0, forged_credential.m_address);

    cw::MemoPayload forged_memo;
    cw::make_payload_memo(cw::RTHMemoBuilder{}, forged_credential, recipient, secrets.m_ephemeral_pubkey, forged_memo);
    EXPECT_TRUE(forged_memo.m_type == cw::MemoType::AUTHENTICATED_SENDER);

    // the sender-receiver secret is known to the forger, but the hmac key is not
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(forged_memo,
        forged_credential.m_address,
        recipient_view_privkey,
        secrets.m_ephemeral_pubkey));

    // the forger's own address does not match the memo's address hash
    cw::PublicAddress forger_address;
    cw::make_account_subaddress(forger_keys, 0, forger_address);
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(forged_memo,
        forger_address,
        recipient_view_privkey,
        secrets.m_ephemeral_pubkey));

    // the honest sender's memo checks
    cw::SenderMemoCredential honest_credential;
    cw::make_sender_memo_credential(honest_sender_keys, 0, honest_credential);
    cw::MemoPayload honest_memo;
    cw::make_payload_memo(cw::RTHMemoBuilder{}, honest_credential, recipient, secrets.m_ephemeral_pubkey, honest_memo);
    EXPECT_TRUE(cw::try_check_authenticated_sender_memo(honest_memo,
        honest_credential.m_address,
        recipient_view_privkey,
        secrets.m_ephemeral_pubkey));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, destination_and_burn_memos)
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);

    cw::DestinationMemoInfo destination_info;
    cw::make_account_subaddress(keys, 2, destination_info.m_recipient);
    destination_info.m_num_recipients = 3;
    destination_info.m_fee = 400000000;
    destination_info.m_total_outlay = 123456789;

    // change memos are destination memos for every memo scheme
    cw::BurnRedemptionMemoBuilder burn_builder;
    burn_builder.m_redemption_memo.fill(0xab);

    for (const cw::MemoBuilderVariant &memo_builder :
        std::vector<cw::MemoBuilderVariant>{cw::RTHMemoBuilder{}, burn_builder})
    {
        cw::MemoPayload memo;
        cw::make_change_memo(memo_builder, destination_info, memo);
        EXPECT_TRUE(memo.m_type == cw::MemoType::DESTINATION);

        cw::address_hash_t recipient_hash, expected_recipient_hash;
        std::uint8_t num_recipients;
        rct::xmr_amount fee, total_outlay;
        ASSERT_TRUE(cw::try_get_destination_memo_info(memo, recipient_hash, num_recipients, fee, total_outlay));

        cw::make_address_hash(destination_info.m_recipient, expected_recipient_hash);
        EXPECT_TRUE(recipient_hash == expected_recipient_hash);
        EXPECT_TRUE(num_recipients == 3);
        EXPECT_TRUE(fee == 400000000);
        EXPECT_TRUE(total_outlay == 123456789);
    }

    // burn redemption payload memos carry the caller's data
    cw::MemoPayload burn_memo;
    cw::make_payload_memo(burn_builder, boost::none, destination_info.m_recipient, rct::pkGen(), burn_memo);
    EXPECT_TRUE(burn_memo.m_type == cw::MemoType::BURN_REDEMPTION);
    EXPECT_TRUE(burn_memo.m_data == burn_builder.m_redemption_memo);

    cw::address_hash_t recipient_hash;
    std::uint8_t num_recipients;
    rct::xmr_amount fee, total_outlay;
    EXPECT_FALSE(cw::try_get_destination_memo_info(burn_memo, recipient_hash, num_recipients, fee, total_outlay));

    // encryption needs the right secret
    const crypto::secret_key memo_secret{rct::rct2sk(rct::skGen())};
    cw::encrypted_memo_t encrypted_memo;
    cw::encrypt_memo(burn_memo, memo_secret, encrypted_memo);

    cw::MemoPayload decrypted_memo, wrongly_decrypted_memo;
    cw::decrypt_memo(encrypted_memo, memo_secret, decrypted_memo);
    cw::decrypt_memo(encrypted_memo, rct::rct2sk(rct::skGen()), wrongly_decrypted_memo);
    EXPECT_TRUE(decrypted_memo == burn_memo);
    EXPECT_FALSE(wrongly_decrypted_memo == burn_memo);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, tx_out_membership_proofs)
{
    std::vector<cw::TxOut> tx_outs(7);
    rct::keyV leaves;

    for (cw::TxOut &tx_out : tx_outs)
    {
        tx_out.gen();
        leaves.emplace_back(cw::make_tx_out_membership_leaf(tx_out));
    }

    for (std::uint64_t highest_index{0}; highest_index < tx_outs.size(); ++highest_index)
    {
        const rct::key expected_root{cw::compute_tx_out_membership_root(leaves, highest_index)};

        for (std::uint64_t index{0}; index <= highest_index; ++index)
        {
            cw::TxOutMembershipProof proof;
            cw::make_tx_out_membership_proof(leaves, index, highest_index, proof);

            rct::key root;
            ASSERT_TRUE(cw::try_compute_root_from_membership_proof(tx_outs[index], proof, root));
            EXPECT_TRUE(root == expected_root);

            // the proof does not work for another output
            if (highest_index > 0)
            {
                ASSERT_TRUE(cw::try_compute_root_from_membership_proof(tx_outs[(index + 1) % (highest_index + 1)],
                    proof,
                    root));
                EXPECT_FALSE(root == expected_root);
            }
        }
    }

    // malformed proofs
    cw::TxOutMembershipProof proof;
    EXPECT_ANY_THROW(cw::make_tx_out_membership_proof(leaves, 3, 2, proof));
    EXPECT_ANY_THROW(cw::make_tx_out_membership_proof(leaves, 0, leaves.size(), proof));

    cw::make_tx_out_membership_proof(leaves, 1, 4, proof);
    proof.m_elements.pop_back();
    rct::key root;
    EXPECT_FALSE(cw::try_compute_root_from_membership_proof(tx_outs[1], proof, root));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, transcripts)
{
    const rct::key key{rct::skGen()};

    // KDF transcripts are the raw concatenation
    cw::CwTranscript kdf_transcript{cw::TranscriptMode::KDF, "domain", sizeof(rct::key)};
    kdf_transcript.append("key", key);
    EXPECT_EQ(kdf_transcript.size(), sizeof(config::CW_TRANSCRIPT_PREFIX) - 1 + 6 + sizeof(rct::key));

    // labels only matter in labeled transcripts
    cw::CwTranscript kdf_transcript_relabeled{cw::TranscriptMode::KDF, "domain", sizeof(rct::key)};
    kdf_transcript_relabeled.append("other", key);
    EXPECT_TRUE(cw::cw_hash_to_key(kdf_transcript) == cw::cw_hash_to_key(kdf_transcript_relabeled));

    cw::CwTranscript labeled_transcript{cw::TranscriptMode::LABELED, "domain", sizeof(rct::key)};
    labeled_transcript.append("key", key);
    cw::CwTranscript labeled_transcript_relabeled{cw::TranscriptMode::LABELED, "domain", sizeof(rct::key)};
    labeled_transcript_relabeled.append("other", key);
    EXPECT_FALSE(cw::cw_hash_to_key(labeled_transcript) == cw::cw_hash_to_key(labeled_transcript_relabeled));

    // domain separation
    cw::CwTranscript other_domain_transcript{cw::TranscriptMode::KDF, "domain2", sizeof(rct::key)};
    other_domain_transcript.append("key", key);
    EXPECT_FALSE(cw::cw_hash_to_key(kdf_transcript) == cw::cw_hash_to_key(other_domain_transcript));

    // variable output length
    unsigned char hash16[16];
    EXPECT_NO_THROW(cw::cw_hash_to_bytes(kdf_transcript, 16, hash16));
    unsigned char hash65[65];
    EXPECT_ANY_THROW(cw::cw_hash_to_bytes(kdf_transcript, 65, hash65));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, commitment_balance)
{
    // 2 inputs -> 2 outputs + fee
    const std::vector<rct::xmr_amount> input_amounts{70, 40};
    const std::vector<rct::xmr_amount> output_amounts{60, 45};
    const rct::xmr_amount fee{5};
    EXPECT_TRUE(cw::amounts_balance(input_amounts, output_amounts, fee));
    EXPECT_FALSE(cw::amounts_balance(input_amounts, output_amounts, fee + 1));

    // sums do not wrap
    const rct::xmr_amount max_amount{static_cast<rct::xmr_amount>(-1)};
    EXPECT_TRUE(cw::amounts_balance({max_amount, max_amount}, {max_amount, max_amount - 1}, 1));
    EXPECT_FALSE(cw::amounts_balance({max_amount, 1}, {0}, 0));

    const std::vector<crypto::secret_key> output_blinding_factors{
            rct::rct2sk(rct::skGen()),
            rct::rct2sk(rct::skGen())
        };
    std::vector<crypto::secret_key> pseudo_blinding_factors;
    cw::make_pseudo_output_blinding_factors(input_amounts.size(), output_blinding_factors, pseudo_blinding_factors);
    ASSERT_EQ(pseudo_blinding_factors.size(), 2);

    // token 0 commitments are plain ringct commitments
    EXPECT_TRUE(cw::make_amount_commitment(cw::Amount{input_amounts[0], 0}, pseudo_blinding_factors[0]) ==
        rct::commit(input_amounts[0], rct::sk2rct(pseudo_blinding_factors[0])));

    rct::keyV pseudo_output_commitments;
    for (std::size_t input_index{0}; input_index < input_amounts.size(); ++input_index)
    {
        pseudo_output_commitments.emplace_back(
                cw::make_amount_commitment(cw::Amount{input_amounts[input_index], 0},
                    pseudo_blinding_factors[input_index])
            );
    }

    rct::keyV output_commitments;
    for (std::size_t output_index{0}; output_index < output_amounts.size(); ++output_index)
    {
        output_commitments.emplace_back(
                cw::make_amount_commitment(cw::Amount{output_amounts[output_index], 0},
                    output_blinding_factors[output_index])
            );
    }

    EXPECT_TRUE(cw::commitments_balance(pseudo_output_commitments, output_commitments, cw::Amount{fee, 0}));
    EXPECT_FALSE(cw::commitments_balance(pseudo_output_commitments, output_commitments, cw::Amount{fee + 1, 0}));
    EXPECT_FALSE(cw::commitments_balance(pseudo_output_commitments, output_commitments, cw::Amount{fee, 1}));
    EXPECT_FALSE(cw::commitments_balance({}, output_commitments, cw::Amount{fee, 0}));

    // key uniqueness
    EXPECT_TRUE(cw::keys_are_unique(output_commitments));
    EXPECT_FALSE(cw::keys_are_unique({output_commitments[0], output_commitments[1], output_commitments[0]}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, commitments_do_not_balance_across_tokens)
{
    // token 1 inputs cannot pay for token 0 outputs, even when the values add up
    const std::vector<crypto::secret_key> output_blinding_factors{rct::rct2sk(rct::skGen())};
    std::vector<crypto::secret_key> pseudo_blinding_factors;
    cw::make_pseudo_output_blinding_factors(1, output_blinding_factors, pseudo_blinding_factors);

    const rct::keyV token_0_output{cw::make_amount_commitment(cw::Amount{95, 0}, output_blinding_factors[0])};
    const rct::keyV token_1_pseudo_output{cw::make_amount_commitment(cw::Amount{100, 1}, pseudo_blinding_factors[0])};
    const rct::keyV token_0_pseudo_output{cw::make_amount_commitment(cw::Amount{100, 0}, pseudo_blinding_factors[0])};

    EXPECT_FALSE(cw::commitments_balance(token_1_pseudo_output, token_0_output, cw::Amount{5, 0}));
    EXPECT_FALSE(cw::commitments_balance(token_1_pseudo_output, token_0_output, cw::Amount{5, 1}));
    EXPECT_TRUE(cw::commitments_balance(token_0_pseudo_output, token_0_output, cw::Amount{5, 0}));

    // generators are distinct per token
    EXPECT_TRUE(cw::make_token_generator(0) == rct::H);
    EXPECT_FALSE(cw::make_token_generator(1) == rct::H);
    EXPECT_FALSE(cw::make_token_generator(1) == cw::make_token_generator(2));
    EXPECT_TRUE(cw::make_token_generator(7) == cw::make_token_generator(7));

    // per-token amount balance
    EXPECT_TRUE(cw::token_amounts_balance({cw::Amount{100, 1}, cw::Amount{10, 0}},
        {cw::Amount{100, 1}, cw::Amount{4, 0}},
        cw::Amount{6, 0}));
    EXPECT_FALSE(cw::token_amounts_balance({cw::Amount{100, 1}}, {cw::Amount{95, 0}}, cw::Amount{5, 0}));
    EXPECT_FALSE(cw::token_amounts_balance({cw::Amount{100, 1}}, {cw::Amount{95, 1}}, cw::Amount{5, 0}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_core, generator_link_proofs)
{
    const std::vector<rct::xmr_amount> output_values{60, 45};
    const std::vector<cw::Amount> output_amounts{cw::Amount{60, 0}, cw::Amount{45, 3}};
    const std::vector<crypto::secret_key> blinding_factors{rct::rct2sk(rct::skGen()), rct::rct2sk(rct::skGen())};
    const std::vector<crypto::secret_key> range_blinding_factors{
            rct::rct2sk(rct::skGen()),
            rct::rct2sk(rct::skGen())
        };

    // the range proof commits to C_r = y G + a H (V = C_r / 8)
    const rct::BulletproofPlus range_proof{cw::make_output_range_proof(output_values, range_blinding_factors)};
    ASSERT_EQ(range_proof.V.size(), 2);
    EXPECT_TRUE(rct::scalarmult8(range_proof.V[1]) == rct::commit(45, rct::sk2rct(range_blinding_factors[1])));

    for (std::size_t output_index{0}; output_index < output_amounts.size(); ++output_index)
    {
        const cw::Amount &amount = output_amounts[output_index];
        const rct::key amount_commitment{cw::make_amount_commitment(amount, blinding_factors[output_index])};
        const rct::key range_commitment{rct::scalarmult8(range_proof.V[output_index])};

        const cw::GeneratorLinkProof proof{
                cw::make_generator_link_proof(amount, blinding_factors[output_index], range_blinding_factors[output_index])
            };
        EXPECT_TRUE(cw::verify_generator_link_proof(proof, amount.m_token_id, amount_commitment, range_commitment));

        // a different declared token fails
        EXPECT_FALSE(cw::verify_generator_link_proof(proof, amount.m_token_id + 1, amount_commitment, range_commitment));

        // a different range commitment fails
        EXPECT_FALSE(cw::verify_generator_link_proof(proof,
            amount.m_token_id,
            amount_commitment,
            rct::scalarmult8(range_proof.V[1 - output_index])));

        // a tampered response fails
        cw::GeneratorLinkProof tampered_proof{proof};
        tampered_proof.m_response_amount = rct::skGen();
        EXPECT_FALSE(cw::verify_generator_link_proof(tampered_proof,
            amount.m_token_id,
            amount_commitment,
            range_commitment));
    }

    // a commitment to another amount cannot be linked
    const cw::GeneratorLinkProof mismatched_proof{
            cw::make_generator_link_proof(cw::Amount{61, 0}, blinding_factors[0], range_blinding_factors[0])
        };
    EXPECT_FALSE(cw::verify_generator_link_proof(mismatched_proof,
        0,
        cw::make_amount_commitment(cw::Amount{61, 0}, blinding_factors[0]),
        rct::scalarmult8(range_proof.V[0])));
}
//-------------------------------------------------------------------------------------------------------------------
