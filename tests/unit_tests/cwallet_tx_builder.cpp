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
#include "cwallet/account_sync.h"
#include "cwallet/tx_builder.h"
#include "cwallet/tx_proposal_types.h"
#include "cwallet/tx_signing.h"
#include "cwallet/wallet_errors.h"
#include "cwallet/wallet_service.h"
#include "cwallet/wallet_store.h"
#include "cwallet/wallet_store_mocks.h"
#include "cwallet/wallet_store_types.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/mock_ledger_context.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/tx_memo_types.h"
#include "cwallet_core/tx_validators.h"
#include "cwallet_core/txo_core_utils.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"

#include "boost/variant/get.hpp"
#include "gtest/gtest.h"

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

static constexpr rct::xmr_amount COIN{1000000000};

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::TxOut make_tx_out_to(const cw::AccountKeys &keys,
    const std::uint64_t subaddress_index,
    const cw::Amount &amount)
{
    cw::PublicAddress recipient;
    cw::make_account_subaddress(keys, subaddress_index, recipient);

    cw::TxOutSecrets secrets;
    cw::make_tx_out_secrets(recipient, rct::rct2sk(rct::skGen()), secrets);

    cw::MemoPayload memo;
    memo.m_type = cw::MemoType::UNUSED;
    memo.m_data.fill(0);

    cw::TxOut tx_out;
    cw::make_tx_out(recipient, amount, secrets, memo, tx_out);

    return tx_out;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void add_decoy_block(const std::size_t num_decoys, cw::MockLedgerContext &ledger_inout)
{
    std::vector<cw::TxOut> decoys(num_decoys);
    for (cw::TxOut &decoy : decoys)
        decoy.gen();

    ledger_inout.add_block(std::move(decoys), {});
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void fund_account(const cw::AccountKeys &keys,
    const std::vector<cw::Amount> &amounts,
    cw::MockLedgerContext &ledger_inout)
{
    std::vector<cw::TxOut> outputs;
    for (const cw::Amount &amount : amounts)
        outputs.emplace_back(make_tx_out_to(keys, 0, amount));

    ledger_inout.add_block(std::move(outputs), {});
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::PublicAddress make_random_recipient()
{
    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);

    cw::PublicAddress recipient;
    cw::make_account_subaddress(keys, 0, recipient);

    return recipient;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::TxBuildRequest make_request(const cw::PublicAddress &recipient, const cw::Amount &amount)
{
    cw::TxBuildRequest request;
    request.m_outlays.emplace_back(cw::TxOutlay{recipient, amount});

    return request;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::TransactionLog get_log(const cw::WalletStore &store, const rct::key &log_id)
{
    cw::TransactionLog log;
    CHECK_AND_ASSERT_THROW_MES(store.try_get_transaction_log(log_id, log), "get log: not found");

    return log;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_valid_tx(const cw::Tx &tx, const cw::MockLedgerContext &ledger)
{
    rct::xmr_amount minimum_fee;
    CHECK_AND_ASSERT_THROW_MES(ledger.try_get_minimum_fee(tx.m_prefix.m_fee_token_id, minimum_fee),
        "check valid tx: unknown fee token");
    CHECK_AND_ASSERT_THROW_MES(cw::validate_tx(tx, cw::default_tx_validation_config(), ledger, minimum_fee),
        "check valid tx: the tx is invalid");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, send_and_confirm)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys sender_keys, recipient_keys;
    cw::make_random_account_keys(sender_keys);
    cw::make_random_account_keys(recipient_keys);
    const rct::key sender_id{cw::create_account(sender_keys, 0, "sender", store)};
    const rct::key recipient_id{cw::create_account(recipient_keys, 0, "recipient", store)};

    add_decoy_block(30, ledger);
    fund_account(sender_keys, {cw::Amount{5*COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, sender_id, 10);
    EXPECT_EQ(cw::get_balance(store, sender_id, 0).m_unspent, 5*COIN);

    // build
    cw::PublicAddress recipient_address;
    cw::make_account_subaddress(recipient_keys, 0, recipient_address);

    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    const cw::TxProposal proposal{builder.build(sender_id, make_request(recipient_address, cw::Amount{COIN, 0}))};

    ASSERT_EQ(proposal.m_tx.m_prefix.m_inputs.size(), 1);
    EXPECT_EQ(proposal.m_tx.m_prefix.m_inputs[0].m_ring.size(), 11);
    ASSERT_EQ(proposal.m_tx.m_prefix.m_outputs.size(), 2);
    EXPECT_EQ(proposal.m_tx.m_prefix.m_fee, cw::config::CW_MINIMUM_FEE);
    EXPECT_EQ(proposal.m_tx.m_prefix.m_tombstone_block_index,
        ledger.num_blocks() + cw::config::CW_DEFAULT_NEW_TX_BLOCK_ATTEMPTS);
    ASSERT_EQ(proposal.m_payload_txos.size(), 1);
    ASSERT_EQ(proposal.m_change_txos.size(), 1);
    EXPECT_EQ(proposal.m_change_txos[0].m_amount.m_value, 4*COIN - cw::config::CW_MINIMUM_FEE);
    EXPECT_NO_THROW(check_valid_tx(proposal.m_tx, ledger));

    // submit
    const cw::TransactionLog submitted_log{cw::submit_tx_proposal(proposal, ledger, "rent", ledger, store)};
    EXPECT_TRUE(submitted_log.m_id == cw::get_tx_proposal_id(proposal));
    EXPECT_EQ(submitted_log.m_status, cw::TransactionLogStatus::PENDING);
    EXPECT_EQ(submitted_log.m_comment, "rent");
    EXPECT_EQ(ledger.num_unconfirmed_txs(), 1);

    const cw::Balance pending_balance{cw::get_balance(store, sender_id, 0)};
    EXPECT_EQ(pending_balance.m_unspent, 0);
    EXPECT_EQ(pending_balance.m_pending, 5*COIN);
    EXPECT_EQ(pending_balance.m_minted, 4*COIN - cw::config::CW_MINIMUM_FEE);

    // pending inputs cannot be spent again
    EXPECT_THROW(builder.build(sender_id, make_request(recipient_address, cw::Amount{COIN, 0})),
        cw::error::no_spendable_txos);

    // confirm
    ledger.commit_unconfirmed_txs({});
    cw::sync_account_to_tip(store, ledger, sender_id, 10);
    cw::sync_account_to_tip(store, ledger, recipient_id, 10);

    const cw::TransactionLog confirmed_log{get_log(store, submitted_log.m_id)};
    EXPECT_EQ(confirmed_log.m_status, cw::TransactionLogStatus::SUCCEEDED);
    ASSERT_TRUE(confirmed_log.m_finalized_block_index);
    EXPECT_EQ(*confirmed_log.m_finalized_block_index, ledger.num_blocks() - 1);

    const cw::Balance sender_balance{cw::get_balance(store, sender_id, 0)};
    EXPECT_EQ(sender_balance.m_unspent, 4*COIN - cw::config::CW_MINIMUM_FEE);
    EXPECT_EQ(sender_balance.m_pending, 0);
    EXPECT_EQ(sender_balance.m_minted, 0);
    EXPECT_EQ(sender_balance.m_spent, 5*COIN);

    const rct::key change_txo_id{cw::make_txo_id(proposal.m_change_txos[0].m_tx_out)};
    EXPECT_EQ(store.get_txo_status(change_txo_id), cw::TxoStatus::UNSPENT);

    // the recipient received the payment and can check the sender's confirmation number
    EXPECT_EQ(cw::get_balance(store, recipient_id, 0).m_unspent, COIN);

    const rct::key payload_txo_id{cw::make_txo_id(proposal.m_payload_txos[0].m_tx_out)};
    EXPECT_NO_THROW(cw::verify_txo_confirmation_number(store,
        recipient_id,
        payload_txo_id,
        proposal.m_payload_txos[0].m_confirmation_number));
    EXPECT_THROW(cw::verify_txo_confirmation_number(store, recipient_id, payload_txo_id, rct::skGen()),
        cw::error::invalid_confirmation_number);
    EXPECT_THROW(cw::verify_txo_confirmation_number(store,
            sender_id,
            payload_txo_id,
            proposal.m_payload_txos[0].m_confirmation_number),
        cw::error::txo_not_owned);

    // the change can be spent
    const cw::TxProposal second_proposal{
            builder.build(sender_id, make_request(recipient_address, cw::Amount{COIN, 0}))
        };
    ASSERT_EQ(second_proposal.m_input_txos.size(), 1);
    EXPECT_TRUE(second_proposal.m_input_txos[0].m_txo_id == change_txo_id);
    EXPECT_NO_THROW(check_valid_tx(second_proposal.m_tx, ledger));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, unsigned_proposals)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    const rct::key account_id{cw::create_account(keys, 0, "sender", store)};

    add_decoy_block(40, ledger);
    fund_account(keys, {cw::Amount{2*COIN, 0}, cw::Amount{2*COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    // needs both outputs
    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    const cw::UnsignedTxProposal unsigned_proposal{
            builder.build_unsigned(account_id, make_request(make_random_recipient(), cw::Amount{3*COIN, 0}))
        };
    ASSERT_EQ(unsigned_proposal.m_inputs.size(), 2);
    EXPECT_TRUE(memcmp(unsigned_proposal.m_inputs[0].m_txo_id.bytes,
        unsigned_proposal.m_inputs[1].m_txo_id.bytes,
        sizeof(rct::key)) < 0);

    for (const cw::UnsignedInput &input : unsigned_proposal.m_inputs)
    {
        EXPECT_EQ(input.m_ring.size(), 11);
        EXPECT_EQ(input.m_membership_proofs.size(), 11);
        ASSERT_LT(input.m_real_index, 11);

        cw::Txo input_txo;
        ASSERT_TRUE(store.try_get_txo(input.m_txo_id, input_txo));
        EXPECT_TRUE(input.m_ring[input.m_real_index] == input_txo.m_tx_out);
    }

    // signing is deterministic up to the signatures
    const cw::TxProposal proposal_a{cw::sign_tx_proposal(unsigned_proposal, keys)};
    const cw::TxProposal proposal_b{cw::sign_tx_proposal(unsigned_proposal, keys)};
    EXPECT_TRUE(cw::get_tx_proposal_id(proposal_a) == cw::get_tx_proposal_id(proposal_b));
    EXPECT_TRUE(proposal_a.m_tx.get_key_images() == proposal_b.m_tx.get_key_images());
    EXPECT_NO_THROW(check_valid_tx(proposal_a.m_tx, ledger));
    EXPECT_NO_THROW(check_valid_tx(proposal_b.m_tx, ledger));

    // the key images are the stored ones
    ASSERT_EQ(proposal_a.m_input_txos.size(), 2);
    for (const cw::InputTxo &input_txo : proposal_a.m_input_txos)
    {
        cw::Txo stored_txo;
        ASSERT_TRUE(store.try_get_txo(input_txo.m_txo_id, stored_txo));
        ASSERT_TRUE(stored_txo.m_key_image);
        EXPECT_TRUE(input_txo.m_key_image == *stored_txo.m_key_image);
    }

    // signing with another account's keys fails
    cw::AccountKeys other_keys;
    cw::make_random_account_keys(other_keys);
    EXPECT_ANY_THROW(cw::sign_tx_proposal(unsigned_proposal, other_keys));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, exact_change_and_fragmentation)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    const rct::key account_id{cw::create_account(keys, 0, "sender", store)};

    add_decoy_block(50, ledger);
    fund_account(keys, {cw::Amount{COIN, 0}, cw::Amount{COIN, 0}, cw::Amount{COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    // 3 inputs needed but only 2 allowed
    cw::TxBuilderConfig config;
    config.m_max_inputs = 2;
    const cw::TransactionBuilder limited_builder{store, ledger, ledger, config};
    EXPECT_THROW(limited_builder.build(account_id, make_request(make_random_recipient(), cw::Amount{2*COIN, 0})),
        cw::error::insufficient_funds_fragmented);

    // more than the balance
    EXPECT_THROW(limited_builder.build(account_id, make_request(make_random_recipient(), cw::Amount{3*COIN, 0})),
        cw::error::insufficient_funds);

    // spend exactly 2 inputs: no change output
    const cw::TxProposal proposal{
            limited_builder.build(account_id,
                make_request(make_random_recipient(), cw::Amount{2*COIN - cw::config::CW_MINIMUM_FEE, 0}))
        };
    EXPECT_EQ(proposal.m_input_txos.size(), 2);
    EXPECT_EQ(proposal.m_payload_txos.size(), 1);
    EXPECT_EQ(proposal.m_change_txos.size(), 0);
    ASSERT_EQ(proposal.m_tx.m_prefix.m_outputs.size(), 1);

    const cw::TransactionLog log{cw::submit_tx_proposal(proposal, ledger, "", ledger, store)};
    ledger.commit_unconfirmed_txs({});
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    // the log lands via its payload output
    EXPECT_EQ(get_log(store, log.m_id).m_status, cw::TransactionLogStatus::SUCCEEDED);

    const cw::Balance balance{cw::get_balance(store, account_id, 0)};
    EXPECT_EQ(balance.m_unspent, COIN);
    EXPECT_EQ(balance.m_spent, 2*COIN);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, tombstone_expiry)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    const rct::key account_id{cw::create_account(keys, 0, "sender", store)};

    add_decoy_block(30, ledger);
    fund_account(keys, {cw::Amount{5*COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    cw::TxBuildRequest request{make_request(make_random_recipient(), cw::Amount{COIN, 0})};
    request.m_tombstone_block_index = ledger.num_blocks() + 2;

    const cw::TxProposal proposal{builder.build(account_id, request)};
    const cw::TransactionLog log{cw::submit_tx_proposal(proposal, ledger, "", ledger, store)};
    const rct::key input_txo_id{proposal.m_input_txos[0].m_txo_id};
    EXPECT_EQ(store.get_txo_status(input_txo_id), cw::TxoStatus::PENDING);

    // the tx never lands
    ledger.clear_unconfirmed_cache();
    add_decoy_block(1, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);
    EXPECT_EQ(get_log(store, log.m_id).m_status, cw::TransactionLogStatus::PENDING);

    add_decoy_block(1, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);
    EXPECT_EQ(get_log(store, log.m_id).m_status, cw::TransactionLogStatus::FAILED);

    // the input is spendable again and the minted change is gone
    EXPECT_EQ(store.get_txo_status(input_txo_id), cw::TxoStatus::UNSPENT);

    const cw::Balance balance{cw::get_balance(store, account_id, 0)};
    EXPECT_EQ(balance.m_unspent, 5*COIN);
    EXPECT_EQ(balance.m_minted, 0);
    EXPECT_EQ(balance.m_pending, 0);

    cw::Txo change_txo;
    EXPECT_FALSE(store.try_get_txo(cw::make_txo_id(proposal.m_change_txos[0].m_tx_out), change_txo));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, rejected_submission)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    const rct::key account_id{cw::create_account(keys, 0, "sender", store)};

    add_decoy_block(30, ledger);
    fund_account(keys, {cw::Amount{5*COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    const cw::TxProposal proposal{builder.build(account_id, make_request(make_random_recipient(), cw::Amount{COIN, 0}))};

    // the tx reaches the network behind the wallet's back, so the wallet's submission is a duplicate
    ASSERT_TRUE(ledger.try_submit_transaction(proposal.m_tx));
    EXPECT_THROW(cw::submit_tx_proposal(proposal, ledger, "", ledger, store), cw::error::tx_rejected);

    const cw::TransactionLog log{get_log(store, cw::get_tx_proposal_id(proposal))};
    EXPECT_EQ(log.m_status, cw::TransactionLogStatus::FAILED);
    EXPECT_EQ(store.get_txo_status(proposal.m_input_txos[0].m_txo_id), cw::TxoStatus::UNSPENT);
    EXPECT_EQ(cw::get_balance(store, account_id, 0).m_minted, 0);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, view_only_account)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys full_keys, view_only_keys;
    cw::make_random_account_keys(full_keys);
    cw::make_view_only_account_keys(full_keys, view_only_keys);
    const rct::key account_id{cw::create_account(view_only_keys, 0, "watch", store)};

    add_decoy_block(30, ledger);
    fund_account(full_keys, {cw::Amount{5*COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);
    EXPECT_EQ(cw::get_balance(store, account_id, 0).m_unspent, 5*COIN);

    // view-only accounts can only build unsigned proposals
    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    const cw::TxBuildRequest request{make_request(make_random_recipient(), cw::Amount{COIN, 0})};
    EXPECT_THROW(builder.build(account_id, request), cw::error::missing_spend_key);

    const cw::UnsignedTxProposal unsigned_proposal{builder.build_unsigned(account_id, request)};
    EXPECT_THROW(cw::sign_tx_proposal(unsigned_proposal, view_only_keys), cw::error::missing_spend_key);

    // an offline signer holds the spend key
    const cw::TxProposal proposal{cw::sign_tx_proposal(unsigned_proposal, full_keys)};
    EXPECT_NO_THROW(check_valid_tx(proposal.m_tx, ledger));

    const cw::TransactionLog log{cw::submit_tx_proposal(proposal, ledger, "", ledger, store)};
    ledger.commit_unconfirmed_txs({});
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    // the submitted key image marks the input spent
    EXPECT_EQ(get_log(store, log.m_id).m_status, cw::TransactionLogStatus::SUCCEEDED);
    EXPECT_EQ(store.get_txo_status(proposal.m_input_txos[0].m_txo_id), cw::TxoStatus::SPENT);
    EXPECT_EQ(cw::get_balance(store, account_id, 0).m_unspent, 4*COIN - cw::config::CW_MINIMUM_FEE);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, authenticated_sender_memos)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys sender_keys, view_only_sender_keys, recipient_keys;
    cw::make_random_account_keys(sender_keys);
    cw::make_view_only_account_keys(sender_keys, view_only_sender_keys);
    cw::make_random_account_keys(recipient_keys);
    const rct::key sender_id{cw::create_account(sender_keys, 0, "sender", store)};

    add_decoy_block(30, ledger);
    fund_account(sender_keys, {cw::Amount{5*COIN, 0}}, ledger);
    cw::sync_account_to_tip(store, ledger, sender_id, 10);

    cw::PublicAddress recipient_address;
    cw::make_account_subaddress(recipient_keys, 0, recipient_address);
    const cw::subaddress_map_t recipient_subaddress_map{{recipient_address.m_spend_pubkey, 0}};

    crypto::secret_key recipient_view_privkey;
    cw::make_subaddress_view_privkey(*recipient_keys.m_spend_privkey,
        recipient_keys.m_view_privkey,
        0,
        recipient_view_privkey);

    // the memo names the sender's main subaddress
    cw::Account sender_account;
    ASSERT_TRUE(store.try_get_account(sender_id, sender_account));
    cw::PublicAddress sender_main_address, sender_change_address;
    cw::make_account_subaddress(sender_keys, sender_account.m_main_subaddress_index, sender_main_address);
    cw::make_account_subaddress(sender_keys, sender_account.m_change_subaddress_index, sender_change_address);

    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    cw::TxBuildRequest request{make_request(recipient_address, cw::Amount{COIN, 0})};
    request.m_memo_builder = cw::MemoBuilderVariant{cw::RTHMemoBuilder{}};
    boost::get<cw::RTHMemoBuilder>(*request.m_memo_builder).m_payment_request_id = 99;

    const cw::TxProposal proposal{builder.build(sender_id, request)};
    ASSERT_EQ(proposal.m_payload_txos.size(), 1);
    const cw::TxOut &payload_tx_out{proposal.m_payload_txos[0].m_tx_out};

    cw::TxoRecord record;
    ASSERT_TRUE(cw::try_view_scan_tx_out(payload_tx_out, recipient_keys, recipient_subaddress_map, record));
    EXPECT_TRUE(record.m_memo.m_type == cw::MemoType::AUTHENTICATED_SENDER_WITH_PAYMENT_REQUEST_ID);
    EXPECT_TRUE(cw::try_check_authenticated_sender_memo(record.m_memo,
        sender_main_address,
        recipient_view_privkey,
        payload_tx_out.m_ephemeral_pubkey));
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(record.m_memo,
        sender_change_address,
        recipient_view_privkey,
        payload_tx_out.m_ephemeral_pubkey));
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(record.m_memo,
        make_random_recipient(),
        recipient_view_privkey,
        payload_tx_out.m_ephemeral_pubkey));

    // view-only accounts cannot authenticate a memo
    cw::WalletStoreMockV1 view_only_store;
    const rct::key view_only_id{cw::create_account(view_only_sender_keys, 0, "watch", view_only_store)};
    cw::sync_account_to_tip(view_only_store, ledger, view_only_id, 10);

    const cw::TransactionBuilder view_only_builder{view_only_store, ledger, ledger, cw::TxBuilderConfig{}};
    const cw::UnsignedTxProposal unsigned_proposal{view_only_builder.build_unsigned(view_only_id, request)};
    ASSERT_EQ(unsigned_proposal.m_payload_txos.size(), 1);

    cw::TxoRecord view_only_record;
    ASSERT_TRUE(cw::try_view_scan_tx_out(unsigned_proposal.m_payload_txos[0].m_tx_out,
        recipient_keys,
        recipient_subaddress_map,
        view_only_record));
    EXPECT_TRUE(view_only_record.m_memo.m_type == cw::MemoType::UNUSED);
    EXPECT_FALSE(cw::try_check_authenticated_sender_memo(view_only_record.m_memo,
        sender_main_address,
        recipient_view_privkey,
        unsigned_proposal.m_payload_txos[0].m_tx_out.m_ephemeral_pubkey));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, mixed_token_fee)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;
    ledger.set_minimum_fee(1, 1000);

    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    const rct::key account_id{cw::create_account(keys, 0, "sender", store)};

    add_decoy_block(30, ledger);
    fund_account(keys, {cw::Amount{5*COIN, 0}, cw::Amount{2*COIN, 1}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    cw::TxBuildRequest request{make_request(make_random_recipient(), cw::Amount{COIN, 0})};
    request.m_fee_token_id = 1;

    // must be allowed explicitly
    EXPECT_THROW(builder.build(account_id, request), cw::error::mixed_token_fee_not_allowed);

    request.m_allow_mixed_token_fee = true;
    const cw::TxProposal proposal{builder.build(account_id, request)};
    EXPECT_EQ(proposal.m_tx.m_prefix.m_fee, 1000);
    EXPECT_EQ(proposal.m_tx.m_prefix.m_fee_token_id, 1);
    EXPECT_EQ(proposal.m_input_txos.size(), 2);
    ASSERT_EQ(proposal.m_change_txos.size(), 2);
    EXPECT_NO_THROW(check_valid_tx(proposal.m_tx, ledger));

    // outputs are committed per token: relabeling an output's token or the fee's token breaks the balance
    EXPECT_TRUE(cw::validate_tx_amount_balance(proposal.m_tx, true));

    cw::Tx relabeled_output_tx{proposal.m_tx};
    ASSERT_EQ(relabeled_output_tx.m_output_token_ids.size(), 3);
    for (cw::token_id_t &output_token_id : relabeled_output_tx.m_output_token_ids)
        output_token_id = output_token_id == 0 ? 1 : 0;
    EXPECT_FALSE(cw::validate_tx_amount_balance(relabeled_output_tx, true));

    cw::Tx relabeled_fee_tx{proposal.m_tx};
    relabeled_fee_tx.m_prefix.m_fee_token_id = 0;
    EXPECT_FALSE(cw::validate_tx_amount_balance(relabeled_fee_tx, true));

    cw::submit_tx_proposal(proposal, ledger, "", ledger, store);
    ledger.commit_unconfirmed_txs({});
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    EXPECT_EQ(cw::get_balance(store, account_id, 0).m_unspent, 4*COIN);
    EXPECT_EQ(cw::get_balance(store, account_id, 1).m_unspent, 2*COIN - 1000);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_tx_builder, request_errors)
{
    cw::MockLedgerContext ledger;
    cw::WalletStoreMockV1 store;

    cw::AccountKeys keys;
    cw::make_random_account_keys(keys);
    const rct::key account_id{cw::create_account(keys, 0, "sender", store)};

    fund_account(keys, {cw::Amount{5*COIN, 0}, cw::Amount{5*COIN, 1}}, ledger);
    cw::sync_account_to_tip(store, ledger, account_id, 10);

    const cw::TransactionBuilder builder{store, ledger, ledger, cw::TxBuilderConfig{}};
    const cw::PublicAddress recipient{make_random_recipient()};

    // unknown account
    EXPECT_THROW(builder.build_unsigned(rct::skGen(), make_request(recipient, cw::Amount{COIN, 0})),
        cw::error::account_not_found);

    // outlays
    EXPECT_THROW(builder.build_unsigned(account_id, cw::TxBuildRequest{}), cw::error::no_recipient);

    cw::TxBuildRequest two_outlays{make_request(recipient, cw::Amount{COIN, 0})};
    two_outlays.m_outlays.emplace_back(cw::TxOutlay{make_random_recipient(), cw::Amount{COIN, 1}});
    EXPECT_THROW(builder.build_unsigned(account_id, two_outlays), cw::error::multiple_recipients);

    two_outlays.m_allow_multiple_outlays = true;
    EXPECT_THROW(builder.build_unsigned(account_id, two_outlays), cw::error::mixed_token_outlays);

    cw::TxBuildRequest many_outlays{make_request(recipient, cw::Amount{1, 0})};
    many_outlays.m_allow_multiple_outlays = true;
    for (std::size_t outlay_index{1}; outlay_index < cw::config::CW_MAX_OUTPUTS; ++outlay_index)
        many_outlays.m_outlays.emplace_back(cw::TxOutlay{make_random_recipient(), cw::Amount{1, 0}});
    EXPECT_THROW(builder.build_unsigned(account_id, many_outlays), cw::error::too_many_outputs);

    // fees
    EXPECT_THROW(builder.build_unsigned(account_id, make_request(recipient, cw::Amount{COIN, 1})),
        cw::error::fee_not_found_for_token);

    cw::TxBuildRequest low_fee{make_request(recipient, cw::Amount{COIN, 0})};
    low_fee.m_fee_value = cw::config::CW_MINIMUM_FEE - 1;
    EXPECT_THROW(builder.build_unsigned(account_id, low_fee), cw::error::insufficient_fee);

    cw::TxBuildRequest mixed_fee{make_request(recipient, cw::Amount{COIN, 0})};
    mixed_fee.m_fee_token_id = 1;
    EXPECT_THROW(builder.build_unsigned(account_id, mixed_fee), cw::error::mixed_token_fee_not_allowed);

    // tombstone
    cw::TxBuildRequest old_tombstone{make_request(recipient, cw::Amount{COIN, 0})};
    old_tombstone.m_tombstone_block_index = ledger.num_blocks();
    EXPECT_THROW(builder.build_unsigned(account_id, old_tombstone), cw::error::invalid_tombstone);

    // the ledger is too small for a ring
    EXPECT_THROW(builder.build_unsigned(account_id, make_request(recipient, cw::Amount{COIN, 0})),
        cw::error::insufficient_tx_outs);

    // the builder's limits must be usable
    cw::TxBuilderConfig bad_config;
    bad_config.m_ring_size = 0;
    EXPECT_ANY_THROW(cw::TransactionBuilder bad_builder(store, ledger, ledger, bad_config));
}
//-------------------------------------------------------------------------------------------------------------------
