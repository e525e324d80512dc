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

// Interfaces for interacting with a ledger (append-only blocks of outputs and key images) and with the network.
// NOT FOR PRODUCTION

#pragma once

//local headers
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <vector>

//forward declarations


namespace cw
{

class LedgerContext
{
public:
//destructor
    virtual ~LedgerContext() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    LedgerContext& operator=(LedgerContext&&) = delete;

//member functions
    /**
    * brief: num_blocks - number of blocks in the ledger
    * return: number of blocks
    */
    virtual std::uint64_t num_blocks() const = 0;
    /**
    * brief: num_tx_outs - number of outputs in the ledger
    * return: number of outputs
    */
    virtual std::uint64_t num_tx_outs() const = 0;
    /**
    * brief: try_get_block_contents - get the outputs and key images of a block
    * param: block_index -
    * outparam: block_contents_out -
    * return: false if the block does not exist (i.e. the caller is caught up)
    */
    virtual bool try_get_block_contents(const std::uint64_t block_index, BlockContents &block_contents_out) const = 0;
    /**
    * brief: get_tx_outs - get outputs by ledger index
    *   - throws if an index is not in the ledger
    * param: indices -
    * outparam: tx_outs_out -
    */
    virtual void get_tx_outs(const std::vector<std::uint64_t> &indices, std::vector<TxOut> &tx_outs_out) const = 0;
    /**
    * brief: get_tx_out_membership_proofs - get membership proofs (against the current ledger) for outputs
    *   - throws if an index is not in the ledger
    * param: indices -
    * outparam: proofs_out -
    */
    virtual void get_tx_out_membership_proofs(const std::vector<std::uint64_t> &indices,
        std::vector<TxOutMembershipProof> &proofs_out) const = 0;
    /**
    * brief: try_get_tx_out_membership_root - get the root of the output tree over [0, highest_index]
    * param: highest_index -
    * outparam: root_out -
    * return: false if highest_index is not in the ledger
    */
    virtual bool try_get_tx_out_membership_root(const std::uint64_t highest_index, rct::key &root_out) const = 0;
    /**
    * brief: try_get_tx_out_index_by_public_key - find an output's ledger index from its ephemeral pubkey
    * param: ephemeral_pubkey - R
    * outparam: index_out -
    * return: false if no output in the ledger has this pubkey
    */
    virtual bool try_get_tx_out_index_by_public_key(const rct::key &ephemeral_pubkey,
        std::uint64_t &index_out) const = 0;
    /**
    * brief: try_get_key_image_block_index - find the block where a key image was spent
    * param: key_image -
    * outparam: block_index_out -
    * return: false if the key image is not spent in the ledger
    */
    virtual bool try_get_key_image_block_index(const crypto::key_image &key_image,
        std::uint64_t &block_index_out) const = 0;
};

class NetworkContext
{
public:
//destructor
    virtual ~NetworkContext() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    NetworkContext& operator=(NetworkContext&&) = delete;

//member functions
    /**
    * brief: try_get_minimum_fee - get the network's minimum fee for a token
    * param: token_id -
    * outparam: fee_out -
    * return: false if the network has no fee for the token
    */
    virtual bool try_get_minimum_fee(const token_id_t token_id, rct::xmr_amount &fee_out) const = 0;
    /**
    * brief: try_submit_transaction - submit a transaction to the network
    * param: tx -
    * return: false if the network rejected the transaction
    */
    virtual bool try_submit_transaction(const Tx &tx) = 0;
};

} //namespace cw
