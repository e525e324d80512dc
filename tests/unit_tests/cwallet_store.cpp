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
#include "cwallet/tx_proposal_types.h"
#include "cwallet/wallet_errors.h"
#include "cwallet/wallet_service.h"
#include "cwallet/wallet_store.h"
#include "cwallet/wallet_store_mocks.h"
#include "cwallet/wallet_store_types.h"
#include "cwallet_core/account_keys.h"
#include "cwallet_core/tx_component_types.h"
#include "cwallet_core/txo_core_utils.h"
#include "cwallet_core/txo_recovery_utils.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"

#include "boost/none.hpp"
#include "gtest/gtest.h"

#include <cstdint>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static rct::key make_test_account(const bool view_only, cw::WalletStore &store_inout, cw::AccountKeys &keys_out)
{
    cw::AccountKeys full_keys;
    cw::make_random_account_keys(full_keys);

    if (view_only)
        cw::make_view_only_account_keys(full_keys, keys_out);
    else
        keys_out = full_keys;

    return cw::create_account(keys_out, 0, "test", store_inout);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::OutputTxo make_output_txo(const cw::AccountKeys &keys,
    const std::uint64_t subaddress_index,
    const cw::Amount &amount)
{
    cw::OutputTxo output_txo;
    cw::make_account_subaddress(keys, subaddress_index, output_txo.m_recipient);

    cw::TxOutSecrets secrets;
    cw::make_tx_out_secrets(output_txo.m_recipient, rct::rct2sk(rct::skGen()), secrets);

    cw::MemoPayload memo;
    memo.m_type = cw::MemoType::UNUSED;
    memo.m_data.fill(0);
    cw::make_tx_out(output_txo.m_recipient, amount, secrets, memo, output_txo.m_tx_out);

    output_txo.m_amount = amount;
    output_txo.m_amount_blinding_factor = secrets.m_amount_blinding_factor;
    cw::make_confirmation_number(secrets.m_derivation, output_txo.m_confirmation_number);
    output_txo.m_tx_out_index = 0;

    return output_txo;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::TxoRecord make_record(const cw::WalletStore &store,
    const rct::key &account_id,
    const cw::AccountKeys &keys,
    const std::uint64_t subaddress_index,
    const cw::Amount &amount)
{
    cw::TxoRecord record;
    CHECK_AND_ASSERT_THROW_MES(cw::try_view_scan_tx_out(make_output_txo(keys, subaddress_index, amount).m_tx_out,
            keys,
            store.get_subaddress_map(account_id),
            record),
        "make record: view scan failed");

    return record;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool apply_block(const rct::key &account_id,
    const std::uint64_t block_index,
    const std::vector<cw::TxoRecord> &records,
    const std::vector<crypto::key_image> &spent_key_images,
    const std::vector<rct::key> &ephemeral_pubkeys,
    cw::WalletStore &store_inout)
{
    cw::BlockSyncUpdate update;
    update.m_account_id = account_id;
    update.m_block_index = block_index;
    update.m_received_records = records;
    update.m_spent_key_images = spent_key_images;
    update.m_ephemeral_pubkeys = ephemeral_pubkeys;

    return store_inout.try_apply_block_sync_update(update);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::TransactionLog make_pending_log(const rct::key &account_id,
    const std::vector<cw::Txo> &inputs,
    const std::vector<cw::OutputTxo> &change_txos,
    const std::uint64_t tombstone_block_index)
{
    cw::TransactionLog log;
    log.m_id = rct::skGen();
    log.m_account_id = account_id;

    for (const cw::Txo &input : inputs)
    {
        CHECK_AND_ASSERT_THROW_MES(input.m_key_image, "make pending log: input without key image");
        log.m_inputs.emplace_back(cw::TransactionLogInput{input.m_id, *input.m_key_image});
    }

    log.m_change_txos = change_txos;
    log.m_fee = cw::Amount{1, 0};
    log.m_tombstone_block_index = tombstone_block_index;
    log.m_submitted_block_index = 0;
    log.m_status = cw::TransactionLogStatus::PENDING;

    return log;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static cw::Txo get_txo(const cw::WalletStore &store, const rct::key &txo_id)
{
    cw::Txo txo;
    CHECK_AND_ASSERT_THROW_MES(store.try_get_txo(txo_id, txo), "get txo: not found");

    return txo;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, accounts_and_subaddresses)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys;
    const rct::key account_id{make_test_account(false, store, keys)};

    cw::Account account;
    ASSERT_TRUE(store.try_get_account(account_id, account));
    EXPECT_TRUE(account.m_id == cw::make_account_id(keys));
    EXPECT_EQ(account.m_next_block_index, 0);
    EXPECT_EQ(account.m_next_subaddress_index, 2);
    EXPECT_EQ(store.get_account_ids().size(), 1);

    // the same keys cannot be added twice
    EXPECT_THROW(cw::create_account(keys, 0, "again", store), cw::error::account_already_exists);

    // main and change subaddresses are assigned at creation
    const std::vector<cw::AssignedSubaddress> subaddresses{store.get_subaddresses(account_id)};
    ASSERT_EQ(subaddresses.size(), 2);
    EXPECT_EQ(subaddresses[0].m_index, 0);
    EXPECT_EQ(subaddresses[1].m_index, 1);

    cw::PublicAddress change_address;
    cw::make_account_subaddress(keys, 1, change_address);
    EXPECT_TRUE(subaddresses[1].m_address == change_address);

    // next subaddress
    const cw::AssignedSubaddress new_subaddress{cw::assign_next_subaddress(account_id, "shop", store)};
    EXPECT_EQ(new_subaddress.m_index, 2);
    EXPECT_EQ(new_subaddress.m_comment, "shop");
    EXPECT_EQ(store.get_subaddress_map(account_id).size(), 3);

    // unknown accounts
    const rct::key unknown_account_id{rct::skGen()};
    EXPECT_FALSE(store.try_get_account(unknown_account_id, account));
    EXPECT_THROW(cw::assign_next_subaddress(unknown_account_id, "", store), cw::error::account_not_found);
    EXPECT_THROW(cw::get_balance(store, unknown_account_id, 0), cw::error::account_not_found);
    EXPECT_THROW(cw::reset_account_sync(unknown_account_id, store), cw::error::account_not_found);
    EXPECT_THROW(store.remove_account(unknown_account_id), cw::error::account_not_found);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, apply_block_sync_update)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys;
    const rct::key account_id{make_test_account(false, store, keys)};

    // block 0: two outputs
    const cw::TxoRecord record1{make_record(store, account_id, keys, 0, cw::Amount{100, 0})};
    const cw::TxoRecord record2{make_record(store, account_id, keys, 1, cw::Amount{200, 0})};
    ASSERT_TRUE(apply_block(account_id, 0, {record1, record2}, {}, {}, store));

    cw::Account account;
    ASSERT_TRUE(store.try_get_account(account_id, account));
    EXPECT_EQ(account.m_next_block_index, 1);
    EXPECT_EQ(store.get_txos(account_id).size(), 2);
    EXPECT_TRUE(get_txo(store, record1.m_txo_id).m_type == cw::TxoType::RECEIVED);
    EXPECT_TRUE(get_txo(store, record2.m_txo_id).m_type == cw::TxoType::CHANGE);
    EXPECT_TRUE(store.get_txo_status(record1.m_txo_id) == cw::TxoStatus::UNSPENT);

    cw::Balance balance{cw::get_balance(store, account_id, 0)};
    EXPECT_TRUE(balance.m_unspent == 300);
    EXPECT_TRUE(cw::get_balance(store, account_id, 1).m_unspent == 0);

    // a stale cursor is a conflict and changes nothing
    EXPECT_THROW(apply_block(account_id, 0, {}, {}, {}, store), cw::error::store_conflict);
    EXPECT_THROW(apply_block(account_id, 2, {}, {}, {}, store), cw::error::store_conflict);
    ASSERT_TRUE(store.try_get_account(account_id, account));
    EXPECT_EQ(account.m_next_block_index, 1);

    // block 1: spend the first output
    ASSERT_TRUE(apply_block(account_id, 1, {}, {*record1.m_key_image, rct::rct2ki(rct::pkGen())}, {}, store));
    EXPECT_TRUE(store.get_txo_status(record1.m_txo_id) == cw::TxoStatus::SPENT);
    EXPECT_TRUE(*get_txo(store, record1.m_txo_id).m_spent_block_index == 1);

    balance = cw::get_balance(store, account_id, 0);
    EXPECT_TRUE(balance.m_unspent == 200);
    EXPECT_TRUE(balance.m_spent == 100);

    // resync is idempotent on Txo ids
    cw::reset_account_sync(account_id, store);
    ASSERT_TRUE(apply_block(account_id, 0, {record1, record2}, {}, {}, store));
    ASSERT_TRUE(apply_block(account_id, 1, {}, {*record1.m_key_image}, {}, store));
    EXPECT_EQ(store.get_txos(account_id).size(), 2);

    balance = cw::get_balance(store, account_id, 0);
    EXPECT_TRUE(balance.m_unspent == 200);
    EXPECT_TRUE(balance.m_spent == 100);

    // removed accounts are skipped
    store.remove_account(account_id);
    EXPECT_FALSE(apply_block(account_id, 2, {}, {}, {}, store));
    EXPECT_EQ(store.get_txos(account_id).size(), 0);
    EXPECT_THROW(store.get_txo_status(record1.m_txo_id), cw::error::txo_not_found);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, orphaned_txos)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys;
    const rct::key account_id{make_test_account(false, store, keys)};

    // receive at subaddress 4 before it is assigned
    const cw::TxoRecord record{make_record(store, account_id, keys, 4, cw::Amount{500, 0})};
    ASSERT_FALSE(record.m_subaddress_index);
    ASSERT_TRUE(apply_block(account_id, 0, {record}, {}, {}, store));

    EXPECT_TRUE(store.get_txo_status(record.m_txo_id) == cw::TxoStatus::ORPHANED);
    EXPECT_TRUE(cw::get_balance(store, account_id, 0).m_orphaned == 500);
    EXPECT_TRUE(store.get_spendable_txos(account_id, 0, boost::none).empty());

    // assigning other subaddresses does not recover it
    EXPECT_EQ(cw::assign_next_subaddress(account_id, "", store).m_index, 2);
    EXPECT_EQ(cw::assign_next_subaddress(account_id, "", store).m_index, 3);
    EXPECT_TRUE(store.get_txo_status(record.m_txo_id) == cw::TxoStatus::ORPHANED);

    // assigning subaddress 4 does
    EXPECT_EQ(cw::assign_next_subaddress(account_id, "", store).m_index, 4);

    const cw::Txo recovered_txo{get_txo(store, record.m_txo_id)};
    EXPECT_TRUE(store.get_txo_status(record.m_txo_id) == cw::TxoStatus::UNSPENT);
    ASSERT_TRUE(recovered_txo.m_subaddress_index);
    EXPECT_EQ(*recovered_txo.m_subaddress_index, 4);
    EXPECT_TRUE(recovered_txo.m_key_image);
    EXPECT_EQ(store.get_spendable_txos(account_id, 0, boost::none).size(), 1);

    // the recovered key image is tracked: spending it is observed
    ASSERT_TRUE(apply_block(account_id, 1, {}, {*recovered_txo.m_key_image}, {}, store));
    EXPECT_TRUE(store.get_txo_status(record.m_txo_id) == cw::TxoStatus::SPENT);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, spendable_txos)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys;
    const rct::key account_id{make_test_account(false, store, keys)};

    ASSERT_TRUE(apply_block(account_id,
        0,
        {
            make_record(store, account_id, keys, 0, cw::Amount{10, 0}),
            make_record(store, account_id, keys, 0, cw::Amount{20, 0}),
            make_record(store, account_id, keys, 0, cw::Amount{30, 0}),
            make_record(store, account_id, keys, 0, cw::Amount{40, 1})
        },
        {},
        {},
        store));

    EXPECT_EQ(store.get_spendable_txos(account_id, 0, boost::none).size(), 3);
    EXPECT_EQ(store.get_spendable_txos(account_id, 1, boost::none).size(), 1);
    EXPECT_EQ(store.get_spendable_txos(account_id, 2, boost::none).size(), 0);
    EXPECT_EQ(store.get_spendable_txos(account_id, 0, rct::xmr_amount{20}).size(), 2);
    EXPECT_EQ(store.get_spendable_txos(rct::skGen(), 0, boost::none).size(), 0);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, pending_transaction_logs)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys;
    const rct::key account_id{make_test_account(false, store, keys)};

    const cw::TxoRecord record{make_record(store, account_id, keys, 0, cw::Amount{1000, 0})};
    ASSERT_TRUE(apply_block(account_id, 0, {record}, {}, {}, store));
    const cw::Txo input{get_txo(store, record.m_txo_id)};

    // change output of the log, minted at submission
    cw::Account account;
    ASSERT_TRUE(store.try_get_account(account_id, account));
    const cw::OutputTxo change_txo{make_output_txo(keys, 1, cw::Amount{600, 0})};
    cw::TxoRecord change_record;
    ASSERT_TRUE(cw::try_view_scan_tx_out(change_txo.m_tx_out, keys, store.get_subaddress_map(account_id), change_record));
    cw::Txo minted_txo;
    cw::make_txo(change_record, account, boost::none, minted_txo);

    // 1. first log: fails explicitly
    const cw::TransactionLog log1{make_pending_log(account_id, {input}, {change_txo}, 10)};
    store.add_pending_transaction_log(log1, {minted_txo});

    EXPECT_TRUE(store.get_txo_status(input.m_id) == cw::TxoStatus::PENDING);
    EXPECT_TRUE(store.get_txo_status(minted_txo.m_id) == cw::TxoStatus::MINTED);
    EXPECT_TRUE(store.get_spendable_txos(account_id, 0, boost::none).empty());

    cw::Balance balance{cw::get_balance(store, account_id, 0)};
    EXPECT_TRUE(balance.m_pending == 1000);
    EXPECT_TRUE(balance.m_minted == 600);
    EXPECT_TRUE(balance.m_unspent == 0);

    // the input cannot be claimed twice, and a log cannot be added twice
    EXPECT_THROW(store.add_pending_transaction_log(make_pending_log(account_id, {input}, {}, 10), {}),
        cw::error::txo_not_spendable);
    EXPECT_THROW(store.add_pending_transaction_log(log1, {}), cw::error::store_conflict);

    store.fail_transaction_log(log1.m_id);
    EXPECT_TRUE(store.get_txo_status(input.m_id) == cw::TxoStatus::UNSPENT);
    EXPECT_THROW(store.get_txo_status(minted_txo.m_id), cw::error::txo_not_found);
    EXPECT_THROW(store.fail_transaction_log(log1.m_id), cw::error::store_conflict);
    EXPECT_THROW(store.fail_transaction_log(rct::skGen()), cw::error::transaction_log_not_found);

    cw::TransactionLog stored_log;
    ASSERT_TRUE(store.try_get_transaction_log(log1.m_id, stored_log));
    EXPECT_TRUE(stored_log.m_status == cw::TransactionLogStatus::FAILED);

    // 2. second log: succeeds when its change lands
    const cw::TransactionLog log2{make_pending_log(account_id, {input}, {change_txo}, 10)};
    store.add_pending_transaction_log(log2, {minted_txo});

    ASSERT_TRUE(apply_block(account_id,
        1,
        {change_record},
        {*input.m_key_image},
        {rct::pkGen(), change_txo.m_tx_out.m_ephemeral_pubkey},
        store));

    ASSERT_TRUE(store.try_get_transaction_log(log2.m_id, stored_log));
    EXPECT_TRUE(stored_log.m_status == cw::TransactionLogStatus::SUCCEEDED);
    ASSERT_TRUE(stored_log.m_finalized_block_index);
    EXPECT_EQ(*stored_log.m_finalized_block_index, 1);

    EXPECT_TRUE(store.get_txo_status(input.m_id) == cw::TxoStatus::SPENT);
    EXPECT_TRUE(store.get_txo_status(minted_txo.m_id) == cw::TxoStatus::UNSPENT);
    EXPECT_EQ(*get_txo(store, minted_txo.m_id).m_received_block_index, 1);
    EXPECT_EQ(store.get_txos(account_id).size(), 2);

    balance = cw::get_balance(store, account_id, 0);
    EXPECT_TRUE(balance.m_unspent == 600);
    EXPECT_TRUE(balance.m_spent == 1000);
    EXPECT_TRUE(balance.m_minted == 0);
    EXPECT_EQ(store.get_transaction_logs(account_id).size(), 2);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, tombstone_sweep)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys;
    const rct::key account_id{make_test_account(false, store, keys)};

    const cw::TxoRecord record{make_record(store, account_id, keys, 0, cw::Amount{1000, 0})};
    ASSERT_TRUE(apply_block(account_id, 0, {record}, {}, {}, store));

    const cw::OutputTxo change_txo{make_output_txo(keys, 1, cw::Amount{600, 0})};
    const cw::TransactionLog log{make_pending_log(account_id, {get_txo(store, record.m_txo_id)}, {change_txo}, 3)};
    store.add_pending_transaction_log(log, {});

    // cursor 2: still pending
    ASSERT_TRUE(apply_block(account_id, 1, {}, {}, {rct::pkGen()}, store));
    cw::TransactionLog stored_log;
    ASSERT_TRUE(store.try_get_transaction_log(log.m_id, stored_log));
    EXPECT_TRUE(stored_log.m_status == cw::TransactionLogStatus::PENDING);

    // cursor 3 reaches the tombstone
    ASSERT_TRUE(apply_block(account_id, 2, {}, {}, {rct::pkGen()}, store));
    ASSERT_TRUE(store.try_get_transaction_log(log.m_id, stored_log));
    EXPECT_TRUE(stored_log.m_status == cw::TransactionLogStatus::FAILED);
    EXPECT_TRUE(store.get_txo_status(record.m_txo_id) == cw::TxoStatus::UNSPENT);

    // a late landing does not revive a failed log
    ASSERT_TRUE(apply_block(account_id, 3, {}, {}, {change_txo.m_tx_out.m_ephemeral_pubkey}, store));
    ASSERT_TRUE(store.try_get_transaction_log(log.m_id, stored_log));
    EXPECT_TRUE(stored_log.m_status == cw::TransactionLogStatus::FAILED);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, view_only_key_image_import)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys view_only_keys;
    const rct::key account_id{make_test_account(true, store, view_only_keys)};

    const cw::TxoRecord record1{make_record(store, account_id, view_only_keys, 0, cw::Amount{100, 0})};
    const cw::TxoRecord record2{make_record(store, account_id, view_only_keys, 0, cw::Amount{200, 0})};
    ASSERT_FALSE(record1.m_key_image);
    ASSERT_TRUE(apply_block(account_id, 0, {record1, record2}, {}, {}, store));

    // view-only Txos without key images are still unspent
    EXPECT_EQ(store.get_spendable_txos(account_id, 0, boost::none).size(), 2);

    const crypto::key_image key_image1{rct::rct2ki(rct::pkGen())};
    const crypto::key_image key_image2{rct::rct2ki(rct::pkGen())};

    // bad imports change nothing
    EXPECT_THROW(store.import_key_images(account_id, {cw::KeyImageImport{rct::skGen(), key_image1, boost::none}}),
        cw::error::txo_not_found);

    cw::AccountKeys other_keys;
    const rct::key other_account_id{make_test_account(false, store, other_keys)};
    EXPECT_THROW(store.import_key_images(other_account_id, {cw::KeyImageImport{record1.m_txo_id, key_image1, boost::none}}),
        cw::error::txo_not_owned);

    // import: the second key image was already spent in block 0
    store.import_key_images(account_id,
        {
            cw::KeyImageImport{record1.m_txo_id, key_image1, boost::none},
            cw::KeyImageImport{record2.m_txo_id, key_image2, std::uint64_t{0}}
        });

    EXPECT_TRUE(*get_txo(store, record1.m_txo_id).m_key_image == key_image1);
    EXPECT_TRUE(store.get_txo_status(record1.m_txo_id) == cw::TxoStatus::UNSPENT);
    EXPECT_TRUE(store.get_txo_status(record2.m_txo_id) == cw::TxoStatus::SPENT);

    // key images are stable
    EXPECT_THROW(store.import_key_images(account_id, {cw::KeyImageImport{record1.m_txo_id, key_image2, boost::none}}),
        cw::error::invalid_key_image);

    // later spends are observed through the imported key image
    ASSERT_TRUE(apply_block(account_id, 1, {}, {key_image1}, {}, store));
    EXPECT_TRUE(store.get_txo_status(record1.m_txo_id) == cw::TxoStatus::SPENT);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(cwallet_store, remove_account_cascades)
{
    cw::WalletStoreMockV1 store;
    cw::AccountKeys keys, other_keys;
    const rct::key account_id{make_test_account(false, store, keys)};
    const rct::key other_account_id{make_test_account(false, store, other_keys)};

    const cw::TxoRecord record{make_record(store, account_id, keys, 0, cw::Amount{1000, 0})};
    const cw::TxoRecord other_record{make_record(store, other_account_id, other_keys, 0, cw::Amount{5, 0})};
    ASSERT_TRUE(apply_block(account_id, 0, {record}, {}, {}, store));
    ASSERT_TRUE(apply_block(other_account_id, 0, {other_record}, {}, {}, store));

    const cw::TransactionLog log{make_pending_log(account_id, {get_txo(store, record.m_txo_id)}, {}, 10)};
    store.add_pending_transaction_log(log, {});

    store.remove_account(account_id);

    cw::TransactionLog stored_log;
    cw::Txo txo;
    EXPECT_FALSE(store.try_get_transaction_log(log.m_id, stored_log));
    EXPECT_FALSE(store.try_get_txo(record.m_txo_id, txo));
    EXPECT_TRUE(store.get_subaddresses(account_id).empty());
    EXPECT_EQ(store.get_account_ids().size(), 1);

    // the other account is untouched
    EXPECT_TRUE(store.try_get_txo(other_record.m_txo_id, txo));
    EXPECT_TRUE(cw::get_balance(store, other_account_id, 0).m_unspent == 5);
}
//-------------------------------------------------------------------------------------------------------------------
