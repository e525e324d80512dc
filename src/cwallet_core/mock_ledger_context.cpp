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
#include "mock_ledger_context.h"

//local headers
#include "crypto/crypto.h"
#include "cwallet_config.h"
#include "ledger_context.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"
#include "tx_out_membership_utils.h"
#include "tx_validators.h"

//third party headers
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.ledger"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
class MockLedgerContext::UnlockedLedgerView final : public LedgerContext
{
public:
    explicit UnlockedLedgerView(const MockLedgerContext &ledger) : m_ledger{ledger} {}

    std::uint64_t num_blocks() const override
    {
        return m_ledger.m_blocks.size();
    }
    std::uint64_t num_tx_outs() const override
    {
        return m_ledger.m_tx_outs.size();
    }
    bool try_get_block_contents(const std::uint64_t block_index, BlockContents &block_contents_out) const override
    {
        if (block_index >= m_ledger.m_blocks.size())
            return false;

        block_contents_out = m_ledger.m_blocks[block_index];
        return true;
    }
    void get_tx_outs(const std::vector<std::uint64_t> &indices, std::vector<TxOut> &tx_outs_out) const override
    {
        tx_outs_out.clear();
        tx_outs_out.reserve(indices.size());

        for (const std::uint64_t index : indices)
        {
            CHECK_AND_ASSERT_THROW_MES(index < m_ledger.m_tx_outs.size(), "Tried to get tx out that doesn't exist.");
            tx_outs_out.emplace_back(m_ledger.m_tx_outs[index]);
        }
    }
    void get_tx_out_membership_proofs(const std::vector<std::uint64_t> &indices,
        std::vector<TxOutMembershipProof> &proofs_out) const override
    {
        proofs_out.clear();
        proofs_out.reserve(indices.size());

        for (const std::uint64_t index : indices)
        {
            CHECK_AND_ASSERT_THROW_MES(index < m_ledger.m_tx_out_leaves.size(),
                "Tried to get a membership proof for a tx out that doesn't exist.");

            proofs_out.emplace_back();
            make_tx_out_membership_proof(m_ledger.m_tx_out_leaves,
                index,
                m_ledger.m_tx_out_leaves.size() - 1,
                proofs_out.back());
        }
    }
    bool try_get_tx_out_membership_root(const std::uint64_t highest_index, rct::key &root_out) const override
    {
        if (highest_index >= m_ledger.m_tx_out_leaves.size())
            return false;

        root_out = compute_tx_out_membership_root(m_ledger.m_tx_out_leaves, highest_index);
        return true;
    }
    bool try_get_tx_out_index_by_public_key(const rct::key &ephemeral_pubkey,
        std::uint64_t &index_out) const override
    {
        const auto index_it = m_ledger.m_tx_out_indices.find(ephemeral_pubkey);
        if (index_it == m_ledger.m_tx_out_indices.end())
            return false;

        index_out = index_it->second;
        return true;
    }
    bool try_get_key_image_block_index(const crypto::key_image &key_image,
        std::uint64_t &block_index_out) const override
    {
        const auto key_image_it = m_ledger.m_key_image_block_indices.find(key_image);
        if (key_image_it == m_ledger.m_key_image_block_indices.end())
            return false;

        block_index_out = key_image_it->second;
        return true;
    }

private:
    const MockLedgerContext &m_ledger;
};
//-------------------------------------------------------------------------------------------------------------------
MockLedgerContext::MockLedgerContext() :
    MockLedgerContext{default_tx_validation_config()}
{}
//-------------------------------------------------------------------------------------------------------------------
MockLedgerContext::MockLedgerContext(const TxValidationConfig &validation_config) :
    m_validation_config{validation_config}
{
    CHECK_AND_ASSERT_THROW_MES(m_validation_config.m_ring_size > 0,
        "mock ledger context (constructor): ring size must be positive.");

    m_minimum_fees[config::CW_DEFAULT_TOKEN_ID] = config::CW_MINIMUM_FEE;
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockLedgerContext::num_blocks() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return UnlockedLedgerView{*this}.num_blocks();
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockLedgerContext::num_tx_outs() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return UnlockedLedgerView{*this}.num_tx_outs();
}
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_get_block_contents(const std::uint64_t block_index,
    BlockContents &block_contents_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return UnlockedLedgerView{*this}.try_get_block_contents(block_index, block_contents_out);
}
//-------------------------------------------------------------------------------------------------------------------
void MockLedgerContext::get_tx_outs(const std::vector<std::uint64_t> &indices, std::vector<TxOut> &tx_outs_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    UnlockedLedgerView{*this}.get_tx_outs(indices, tx_outs_out);
}
//-------------------------------------------------------------------------------------------------------------------
void MockLedgerContext::get_tx_out_membership_proofs(const std::vector<std::uint64_t> &indices,
    std::vector<TxOutMembershipProof> &proofs_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    UnlockedLedgerView{*this}.get_tx_out_membership_proofs(indices, proofs_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_get_tx_out_membership_root(const std::uint64_t highest_index, rct::key &root_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return UnlockedLedgerView{*this}.try_get_tx_out_membership_root(highest_index, root_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_get_tx_out_index_by_public_key(const rct::key &ephemeral_pubkey,
    std::uint64_t &index_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return UnlockedLedgerView{*this}.try_get_tx_out_index_by_public_key(ephemeral_pubkey, index_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_get_key_image_block_index(const crypto::key_image &key_image,
    std::uint64_t &block_index_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return UnlockedLedgerView{*this}.try_get_key_image_block_index(key_image, block_index_out);
}
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_get_minimum_fee(const token_id_t token_id, rct::xmr_amount &fee_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    const auto fee_it = m_minimum_fees.find(token_id);
    if (fee_it == m_minimum_fees.end())
        return false;

    fee_out = fee_it->second;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_submit_transaction(const Tx &tx)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    return try_add_unconfirmed_tx_impl(tx);
}
//-------------------------------------------------------------------------------------------------------------------
void MockLedgerContext::set_minimum_fee(const token_id_t token_id, const rct::xmr_amount minimum_fee)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_minimum_fees[token_id] = minimum_fee;
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockLedgerContext::add_block(std::vector<TxOut> outputs, std::vector<crypto::key_image> key_images)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    return add_block_impl(std::move(outputs), std::move(key_images));
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockLedgerContext::commit_unconfirmed_txs(std::vector<TxOut> extra_outputs)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    // 1. collect contents of unconfirmed txs that may still land in the next block
    std::vector<TxOut> block_outputs{std::move(extra_outputs)};
    std::vector<crypto::key_image> block_key_images;

    for (const auto &unconfirmed_tx : m_unconfirmed_txs)
    {
        const Tx &tx{unconfirmed_tx.second};

        if (!validate_tx_tombstone(tx.m_prefix.m_tombstone_block_index, m_blocks.size()))
        {
            MINFO("mock ledger: dropping unconfirmed tx past its tombstone block "
                << tx.m_prefix.m_tombstone_block_index << ".");
            continue;
        }

        block_outputs.insert(block_outputs.end(), tx.m_prefix.m_outputs.begin(), tx.m_prefix.m_outputs.end());

        const std::vector<crypto::key_image> tx_key_images{tx.get_key_images()};
        block_key_images.insert(block_key_images.end(), tx_key_images.begin(), tx_key_images.end());
    }

    // 2. clear the unconfirmed cache
    m_unconfirmed_txs.clear();
    m_unconfirmed_key_images.clear();

    // 3. add the block
    return add_block_impl(std::move(block_outputs), std::move(block_key_images));
}
//-------------------------------------------------------------------------------------------------------------------
void MockLedgerContext::clear_unconfirmed_cache()
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_unconfirmed_txs.clear();
    m_unconfirmed_key_images.clear();
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t MockLedgerContext::num_unconfirmed_txs() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return m_unconfirmed_txs.size();
}
//-------------------------------------------------------------------------------------------------------------------
// internal implementation details
//-------------------------------------------------------------------------------------------------------------------
bool MockLedgerContext::try_add_unconfirmed_tx_impl(const Tx &tx)
{
    // 1. fail if the fee token is unknown to the network
    const auto fee_it = m_minimum_fees.find(tx.m_prefix.m_fee_token_id);
    if (fee_it == m_minimum_fees.end())
    {
        MWARNING("mock ledger: rejecting tx with unknown fee token " << tx.m_prefix.m_fee_token_id << ".");
        return false;
    }

    // 2. fail if the tx is invalid against the ledger
    if (!validate_tx(tx, m_validation_config, UnlockedLedgerView{*this}, fee_it->second))
        return false;

    // 3. fail if new key images are in the unconfirmed cache already
    const std::vector<crypto::key_image> key_images{tx.get_key_images()};

    for (const crypto::key_image &key_image : key_images)
    {
        if (m_unconfirmed_key_images.find(key_image) != m_unconfirmed_key_images.end())
        {
            MWARNING("mock ledger: rejecting tx that double-spends an unconfirmed tx.");
            return false;
        }
    }

    // 4. fail if the tx is already cached
    rct::key tx_id;
    get_tx_prefix_hash(tx.m_prefix, tx_id);

    if (m_unconfirmed_txs.find(tx_id) != m_unconfirmed_txs.end())
        return false;

    // 5. add the tx
    m_unconfirmed_key_images.insert(key_images.begin(), key_images.end());
    m_unconfirmed_txs[tx_id] = tx;

    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockLedgerContext::add_block_impl(std::vector<TxOut> outputs, std::vector<crypto::key_image> key_images)
{
    const std::uint64_t block_index{m_blocks.size()};

    // 1. validate everything before mutating
    std::unordered_set<rct::key> new_ephemeral_pubkeys;
    for (const TxOut &output : outputs)
    {
        CHECK_AND_ASSERT_THROW_MES(m_tx_out_indices.find(output.m_ephemeral_pubkey) == m_tx_out_indices.end() &&
                new_ephemeral_pubkeys.insert(output.m_ephemeral_pubkey).second,
            "mock ledger context (add block): duplicate tx out ephemeral pubkey.");
    }

    std::unordered_set<crypto::key_image> new_key_images;
    for (const crypto::key_image &key_image : key_images)
    {
        CHECK_AND_ASSERT_THROW_MES(m_key_image_block_indices.find(key_image) == m_key_image_block_indices.end() &&
                new_key_images.insert(key_image).second,
            "mock ledger context (add block): key image is already spent.");
    }

    // 2. outputs
    for (const TxOut &output : outputs)
    {
        m_tx_out_indices[output.m_ephemeral_pubkey] = m_tx_outs.size();
        m_tx_out_leaves.emplace_back(make_tx_out_membership_leaf(output));
        m_tx_outs.emplace_back(output);
    }

    // 3. key images
    for (const crypto::key_image &key_image : key_images)
        m_key_image_block_indices[key_image] = block_index;

    // 4. block
    m_blocks.emplace_back();
    m_blocks.back().m_outputs = std::move(outputs);
    m_blocks.back().m_key_images = std::move(key_images);

    MDEBUG("mock ledger: added block " << block_index << " with " << m_blocks.back().m_outputs.size()
        << " outputs and " << m_blocks.back().m_key_images.size() << " key images.");

    return block_index;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
