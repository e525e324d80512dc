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

// Mock ledger context: for testing
// - an in-memory append-only ledger of blocks (outputs + spent key images)
// - also a mock network: submitted txs are fully validated and kept in an unconfirmed cache until committed


#pragma once

//local headers
#include "crypto/crypto.h"
#include "ledger_context.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"
#include "tx_validators.h"

//third party headers
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <unordered_map>
#include <unordered_set>
#include <vector>

//forward declarations


namespace cw
{

class MockLedgerContext final : public LedgerContext, public NetworkContext
{
public:
//constructors
    /// normal constructor: the protocol's default validation rules and fee map {default token: minimum fee}
    MockLedgerContext();
    /// custom validation rules (e.g. small rings for tests)
    explicit MockLedgerContext(const TxValidationConfig &validation_config);

//member functions
    /// LedgerContext
    std::uint64_t num_blocks() const override;
    std::uint64_t num_tx_outs() const override;
    bool try_get_block_contents(const std::uint64_t block_index, BlockContents &block_contents_out) const override;
    void get_tx_outs(const std::vector<std::uint64_t> &indices, std::vector<TxOut> &tx_outs_out) const override;
    void get_tx_out_membership_proofs(const std::vector<std::uint64_t> &indices,
        std::vector<TxOutMembershipProof> &proofs_out) const override;
    bool try_get_tx_out_membership_root(const std::uint64_t highest_index, rct::key &root_out) const override;
    bool try_get_tx_out_index_by_public_key(const rct::key &ephemeral_pubkey,
        std::uint64_t &index_out) const override;
    bool try_get_key_image_block_index(const crypto::key_image &key_image,
        std::uint64_t &block_index_out) const override;

    /// NetworkContext
    bool try_get_minimum_fee(const token_id_t token_id, rct::xmr_amount &fee_out) const override;
    /**
    * brief: try_submit_transaction - try to add a tx to the unconfirmed cache
    *   - fails if the tx is invalid against the current ledger, or has key images in the unconfirmed cache
    * param: tx -
    * return: true if the tx was accepted
    */
    bool try_submit_transaction(const Tx &tx) override;

    /**
    * brief: set_minimum_fee - set the network fee for a token
    * param: token_id -
    * param: minimum_fee -
    */
    void set_minimum_fee(const token_id_t token_id, const rct::xmr_amount minimum_fee);
    /**
    * brief: add_block - append a block with the given contents (e.g. mock coinbase outputs)
    *   - outputs must have unique ephemeral pubkeys (w.r.t. the ledger too); key images must be unspent
    * param: outputs -
    * param: key_images -
    * return: index of the new block
    */
    std::uint64_t add_block(std::vector<TxOut> outputs, std::vector<crypto::key_image> key_images);
    /**
    * brief: commit_unconfirmed_txs - move all unconfirmed txs onto the chain in a new block
    *   - unconfirmed txs whose tombstone has passed are dropped
    *   - clears the unconfirmed tx cache
    * param: extra_outputs - extra outputs for the block (e.g. mock coinbase outputs)
    * return: index of the new block
    */
    std::uint64_t commit_unconfirmed_txs(std::vector<TxOut> extra_outputs);
    /**
    * brief: clear_unconfirmed_cache - drop all unconfirmed txs
    */
    void clear_unconfirmed_cache();
    /**
    * brief: num_unconfirmed_txs - number of txs in the unconfirmed cache
    * return: number of unconfirmed txs
    */
    std::size_t num_unconfirmed_txs() const;

private:
    /// implementations of the above, without internally locking the ledger mutex
    bool try_add_unconfirmed_tx_impl(const Tx &tx);
    std::uint64_t add_block_impl(std::vector<TxOut> outputs, std::vector<crypto::key_image> key_images);

    /// LedgerContext view of the ledger contents that does not lock the mutex
    /// - the public LedgerContext functions lock and forward to it
    /// - the tx validators use it while the mutex is already held
    class UnlockedLedgerView;

    /// context mutex (mutable for use in const member functions)
    mutable boost::shared_mutex m_context_mutex;

    /// tx validation rules
    TxValidationConfig m_validation_config;
    /// network fee map
    std::unordered_map<token_id_t, rct::xmr_amount> m_minimum_fees;


    //// UNCONFIRMED TXs

    /// key images of unconfirmed txs
    std::unordered_set<crypto::key_image> m_unconfirmed_key_images;
    /// unconfirmed txs (mapped to tx id)
    std::unordered_map<rct::key, Tx> m_unconfirmed_txs;


    //// ON-CHAIN BLOCKS

    /// block contents (mapped to block index)
    std::vector<BlockContents> m_blocks;
    /// all outputs in ledger order
    std::vector<TxOut> m_tx_outs;
    /// membership tree leaves of all outputs in ledger order
    rct::keyV m_tx_out_leaves;
    /// output indices (mapped to ephemeral pubkey)
    std::unordered_map<rct::key, std::uint64_t> m_tx_out_indices;
    /// spent key images (mapped to the block index where they were spent)
    std::unordered_map<crypto::key_image, std::uint64_t> m_key_image_block_indices;
};

} //namespace cw
