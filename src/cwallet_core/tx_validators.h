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

// Transaction validators.
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
namespace cw { class LedgerContext; }


namespace cw
{

////
// TxValidationConfig
// - semantic rules for the shape of a tx
///
struct TxValidationConfig final
{
    std::size_t m_ring_size;
    std::size_t m_min_inputs;
    std::size_t m_max_inputs;
    std::size_t m_min_outputs;
    std::size_t m_max_outputs;
};

/// the protocol's semantic rules (cwallet_config.h)
TxValidationConfig default_tx_validation_config();

/**
* brief: validate_tx_semantics_component_counts - check that the number of tx components is consistent
*   - inputs and outputs within limits; one ring of 'ring size' members per input; one membership proof per ring
*     member; one pseudo-output commitment and one ring signature per input; one range commitment, token id
*     and generator link proof per output
* param: config -
* param: tx -
* return: true/false on validation result
*/
bool validate_tx_semantics_component_counts(const TxValidationConfig &config, const Tx &tx);
/**
* brief: validate_tx_semantics_sorting - check that outputs are sorted by ephemeral pubkey and unique
* param: outputs -
* return: true/false on validation result
*/
bool validate_tx_semantics_sorting(const std::vector<TxOut> &outputs);
/**
* brief: validate_tx_key_images - check that key images are unique and not spent in the ledger
* param: tx -
* param: ledger_context -
* return: true/false on validation result
*/
bool validate_tx_key_images(const Tx &tx, const LedgerContext &ledger_context);
/**
* brief: validate_tx_tombstone - check that a tx may still land in the next block
* param: tombstone_block_index -
* param: next_block_index -
* return: true if next_block_index < tombstone_block_index
*/
bool validate_tx_tombstone(const std::uint64_t tombstone_block_index, const std::uint64_t next_block_index);
/**
* brief: validate_tx_fee - check a tx's fee against a minimum
* param: fee -
* param: minimum_fee -
* return: true/false on validation result
*/
bool validate_tx_fee(const rct::xmr_amount fee, const rct::xmr_amount minimum_fee);
/**
* brief: validate_tx_membership_proofs - check that every ring member is an output of the ledger
*   - each proof must reproduce the ledger's output tree root at the proof's highest index
* param: inputs -
* param: ledger_context -
* return: true/false on validation result
*/
bool validate_tx_membership_proofs(const std::vector<TxIn> &inputs, const LedgerContext &ledger_context);
/**
* brief: validate_tx_amount_balance - check that amounts balance and are in range
*   - sum(pseudo-output commitments) == sum(output commitments) + fee H_fee (each token balances)
*   - each output commitment is linked to a range commitment of the BP+ under its declared token's generator
* param: tx -
* param: defer_batchable - skip the BP+ verification (for batch verification elsewhere)
* return: true/false on validation result
*/
bool validate_tx_amount_balance(const Tx &tx, const bool defer_batchable);
/**
* brief: validate_tx_ring_signatures - verify the CLSAG of each input over the tx prefix hash
* param: tx -
* return: true/false on validation result
*/
bool validate_tx_ring_signatures(const Tx &tx);
/**
* brief: validate_tx - validate a tx against a ledger (all of the above)
* param: tx -
* param: config -
* param: ledger_context -
* param: minimum_fee - minimum fee for the tx's fee token
* return: true/false on validation result
*/
bool validate_tx(const Tx &tx,
    const TxValidationConfig &config,
    const LedgerContext &ledger_context,
    const rct::xmr_amount minimum_fee);

} //namespace cw
