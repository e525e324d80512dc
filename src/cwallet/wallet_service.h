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

// Wallet service operations: account lifecycle, key image import, balances, and tx submission.


#pragma once

//local headers
#include "crypto/crypto.h"
#include "cwallet_core/tx_component_types.h"
#include "ringct/rctTypes.h"
#include "tx_proposal_types.h"
#include "wallet_store_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <string>
#include <vector>

//forward declarations
namespace cw
{
    struct AccountKeys;
    class LedgerContext;
    class NetworkContext;
    class WalletStore;
}

namespace cw
{

////
// TxoKeyImage
// - a key image recovered by an offline signer for a view-only account's Txo
///
struct TxoKeyImage final
{
    rct::key m_txo_id;
    crypto::key_image m_key_image;
};

/**
* brief: create_account - add an account to the store with its main and change subaddresses
* param: keys -
* param: first_block_index - first block to scan
* param: name -
* inoutparam: store_inout -
* return: the account id
*/
rct::key create_account(const AccountKeys &keys,
    const std::uint64_t first_block_index,
    const std::string &name,
    WalletStore &store_inout);
/**
* brief: assign_next_subaddress - assign an account's next subaddress
*   - orphaned Txos received at the new subaddress are recovered
* param: account_id -
* param: comment -
* inoutparam: store_inout -
* return: the new subaddress
*/
AssignedSubaddress assign_next_subaddress(const rct::key &account_id,
    const std::string &comment,
    WalletStore &store_inout);
/**
* brief: import_key_images - attach key images to a view-only account's Txos
*   - a key image that already appeared in the ledger marks its Txo spent at that block
* param: ledger -
* param: account_id -
* param: key_images -
* inoutparam: store_inout -
*/
void import_key_images(const LedgerContext &ledger,
    const rct::key &account_id,
    const std::vector<TxoKeyImage> &key_images,
    WalletStore &store_inout);
/// sums of an account's Txo values by status (throws account_not_found)
Balance get_balance(const WalletStore &store, const rct::key &account_id, const token_id_t token_id);
/**
* brief: verify_txo_confirmation_number - check a sender's claim that it made one of an account's Txos
*   - throws invalid_confirmation_number if the claim is wrong
* param: store -
* param: account_id - the recipient
* param: txo_id -
* param: confirmation_number -
*/
void verify_txo_confirmation_number(const WalletStore &store,
    const rct::key &account_id,
    const rct::key &txo_id,
    const rct::key &confirmation_number);
/// move an account's sync cursor back to its first block
void reset_account_sync(const rct::key &account_id, WalletStore &store_inout);
/**
* brief: submit_tx_proposal - record a signed proposal as pending, then submit its tx
*   - the log and the minted change Txos are stored before the network call
*   - a rejected tx fails the log (releasing its inputs) and throws tx_rejected
* param: proposal -
* param: ledger - for the submission block index
* param: comment -
* inoutparam: network_inout -
* inoutparam: store_inout -
* return: the pending transaction log
*/
TransactionLog submit_tx_proposal(const TxProposal &proposal,
    const LedgerContext &ledger,
    const std::string &comment,
    NetworkContext &network_inout,
    WalletStore &store_inout);

} //namespace cw
