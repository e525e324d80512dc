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

////
// Wallet errors
// - typed errors surfaced by the wallet store, sync engine and transaction builder
// - every error has a category:
//   - NOT_FOUND: expected transient states (account deleted, unknown id)
//   - INSUFFICIENT_RESOURCE: user-actionable (funds, fee, fragmentation)
//   - MALFORMED_INPUT: data-integrity problems (bad rings, bad confirmation numbers, decode failures)
//   - STORE_OR_LEDGER: store/ledger/network failures
///

#pragma once

//local headers
#include "crypto/crypto.h"
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "string_tools.h"

//third party headers

//standard headers
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>

//forward declarations


namespace cw
{
namespace error
{

enum class ErrorCategory : unsigned char
{
    NOT_FOUND,
    INSUFFICIENT_RESOURCE,
    MALFORMED_INPUT,
    STORE_OR_LEDGER
};

// wallet_error_base
//   wallet_runtime_error *
//     account_not_found
//     account_already_exists
//     txo_not_found
//     transaction_log_not_found
//     txo_not_owned
//     txo_not_spendable
//     duplicate_input_txo
//     no_spendable_txos
//     insufficient_funds
//     insufficient_funds_fragmented
//     no_recipient
//     multiple_recipients
//     mixed_token_outlays
//     mixed_token_fee_not_allowed
//     fee_not_found_for_token
//     insufficient_fee
//     outbound_value_too_large
//     too_many_inputs
//     too_many_outputs
//     insufficient_tx_outs
//     ring_size_mismatch
//     membership_proof_mismatch
//     invalid_confirmation_number
//     invalid_key_image
//     txo_decode_failed
//     missing_spend_key
//     invalid_tombstone
//     tx_rejected
//     store_conflict
//
// * - class with protected ctor

//----------------------------------------------------------------------------------------------------
template<typename Base>
struct wallet_error_base : public Base
{
    const std::string& location() const { return m_loc; }
    ErrorCategory category() const { return m_category; }

    std::string to_string() const
    {
        std::ostringstream ss;
        ss << m_loc << ':' << typeid(*this).name() << ": " << Base::what();
        return ss.str();
    }

protected:
    wallet_error_base(std::string&& loc, const ErrorCategory category, const std::string& message)
        : Base(message)
        , m_loc(loc)
        , m_category(category)
    {
    }

private:
    std::string m_loc;
    ErrorCategory m_category;
};
//----------------------------------------------------------------------------------------------------
typedef wallet_error_base<std::runtime_error> wallet_runtime_error;
//----------------------------------------------------------------------------------------------------
struct account_not_found : public wallet_runtime_error
{
    explicit account_not_found(std::string&& loc, const rct::key &account_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::NOT_FOUND,
            "account not found: " + epee::string_tools::pod_to_hex(account_id))
        , m_account_id(account_id)
    {
    }

    const rct::key& account_id() const { return m_account_id; }

private:
    rct::key m_account_id;
};
//----------------------------------------------------------------------------------------------------
struct account_already_exists : public wallet_runtime_error
{
    explicit account_already_exists(std::string&& loc, const rct::key &account_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "account already exists: " + epee::string_tools::pod_to_hex(account_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct txo_not_found : public wallet_runtime_error
{
    explicit txo_not_found(std::string&& loc, const rct::key &txo_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::NOT_FOUND,
            "txo not found: " + epee::string_tools::pod_to_hex(txo_id))
        , m_txo_id(txo_id)
    {
    }

    const rct::key& txo_id() const { return m_txo_id; }

private:
    rct::key m_txo_id;
};
//----------------------------------------------------------------------------------------------------
struct transaction_log_not_found : public wallet_runtime_error
{
    explicit transaction_log_not_found(std::string&& loc, const rct::key &transaction_log_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::NOT_FOUND,
            "transaction log not found: " + epee::string_tools::pod_to_hex(transaction_log_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct txo_not_owned : public wallet_runtime_error
{
    explicit txo_not_owned(std::string&& loc, const rct::key &txo_id, const rct::key &account_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "txo " + epee::string_tools::pod_to_hex(txo_id) +
            " is not owned by account " + epee::string_tools::pod_to_hex(account_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct txo_not_spendable : public wallet_runtime_error
{
    explicit txo_not_spendable(std::string&& loc, const rct::key &txo_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "txo is not spendable (spent, pending, orphaned or without key image): " +
            epee::string_tools::pod_to_hex(txo_id))
        , m_txo_id(txo_id)
    {
    }

    const rct::key& txo_id() const { return m_txo_id; }

private:
    rct::key m_txo_id;
};
//----------------------------------------------------------------------------------------------------
struct duplicate_input_txo : public wallet_runtime_error
{
    explicit duplicate_input_txo(std::string&& loc, const rct::key &txo_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "txo is requested as an input more than once: " + epee::string_tools::pod_to_hex(txo_id))
        , m_txo_id(txo_id)
    {
    }

    const rct::key& txo_id() const { return m_txo_id; }

private:
    rct::key m_txo_id;
};
//----------------------------------------------------------------------------------------------------
struct no_spendable_txos : public wallet_runtime_error
{
    explicit no_spendable_txos(std::string&& loc, const std::uint64_t token_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "no spendable txos for token " + std::to_string(token_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct insufficient_funds : public wallet_runtime_error
{
    explicit insufficient_funds(std::string&& loc,
        const std::uint64_t token_id,
        const std::string &available,
        const std::string &needed,
        const bool under_max_spendable_value)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "insufficient funds for token " + std::to_string(token_id) +
            ": available " + available + ", needed " + needed +
            (under_max_spendable_value ? " (counting txos under the max spendable value)" : ""))
        , m_under_max_spendable_value(under_max_spendable_value)
    {
    }

    bool under_max_spendable_value() const { return m_under_max_spendable_value; }

private:
    bool m_under_max_spendable_value;
};
//----------------------------------------------------------------------------------------------------
struct insufficient_funds_fragmented : public wallet_runtime_error
{
    explicit insufficient_funds_fragmented(std::string&& loc,
        const std::uint64_t token_id,
        const std::size_t max_inputs)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "funds for token " + std::to_string(token_id) + " are too fragmented: more than " +
            std::to_string(max_inputs) + " inputs are needed (consolidate txos first)")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct no_recipient : public wallet_runtime_error
{
    explicit no_recipient(std::string&& loc)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT, "no recipient")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct multiple_recipients : public wallet_runtime_error
{
    explicit multiple_recipients(std::string&& loc, const std::size_t num_recipients)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "multiple recipients are not allowed (got " + std::to_string(num_recipients) + ")")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct mixed_token_outlays : public wallet_runtime_error
{
    explicit mixed_token_outlays(std::string&& loc)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT, "outlays have mixed token ids")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct mixed_token_fee_not_allowed : public wallet_runtime_error
{
    explicit mixed_token_fee_not_allowed(std::string&& loc,
        const std::uint64_t fee_token_id,
        const std::uint64_t spend_token_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "fee token " + std::to_string(fee_token_id) + " differs from spend token " +
            std::to_string(spend_token_id) + " (mixed-token fees must be allowed explicitly)")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct fee_not_found_for_token : public wallet_runtime_error
{
    explicit fee_not_found_for_token(std::string&& loc, const std::uint64_t token_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "no fee given and the network has no fee for token " + std::to_string(token_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct insufficient_fee : public wallet_runtime_error
{
    explicit insufficient_fee(std::string&& loc, const std::uint64_t fee, const std::uint64_t minimum_fee)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "fee " + std::to_string(fee) + " is below the minimum fee " + std::to_string(minimum_fee))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct outbound_value_too_large : public wallet_runtime_error
{
    explicit outbound_value_too_large(std::string&& loc)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "outbound value (outlays + fee) does not fit in 64 bits")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct too_many_inputs : public wallet_runtime_error
{
    explicit too_many_inputs(std::string&& loc, const std::size_t num_inputs, const std::size_t max_inputs)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "too many inputs: " + std::to_string(num_inputs) + " > " + std::to_string(max_inputs))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct too_many_outputs : public wallet_runtime_error
{
    explicit too_many_outputs(std::string&& loc, const std::size_t num_outputs, const std::size_t max_outputs)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "too many outputs: " + std::to_string(num_outputs) + " > " + std::to_string(max_outputs))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct insufficient_tx_outs : public wallet_runtime_error
{
    explicit insufficient_tx_outs(std::string&& loc, const std::uint64_t num_tx_outs, const std::uint64_t needed)
        : wallet_runtime_error(std::move(loc), ErrorCategory::INSUFFICIENT_RESOURCE,
            "the ledger has " + std::to_string(num_tx_outs) + " outputs but rings need " + std::to_string(needed))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct ring_size_mismatch : public wallet_runtime_error
{
    explicit ring_size_mismatch(std::string&& loc, const std::size_t expected, const std::size_t actual)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "ring size mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct membership_proof_mismatch : public wallet_runtime_error
{
    explicit membership_proof_mismatch(std::string&& loc, const std::size_t ring_size, const std::size_t num_proofs)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "membership proofs do not match the ring: " + std::to_string(num_proofs) + " proofs for " +
            std::to_string(ring_size) + " ring members")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct invalid_confirmation_number : public wallet_runtime_error
{
    explicit invalid_confirmation_number(std::string&& loc, const std::string &reason)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT, "invalid confirmation number: " + reason)
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct invalid_key_image : public wallet_runtime_error
{
    explicit invalid_key_image(std::string&& loc, const rct::key &txo_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "key image does not match txo " + epee::string_tools::pod_to_hex(txo_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct txo_decode_failed : public wallet_runtime_error
{
    explicit txo_decode_failed(std::string&& loc, const rct::key &txo_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "failed to decode txo " + epee::string_tools::pod_to_hex(txo_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct missing_spend_key : public wallet_runtime_error
{
    explicit missing_spend_key(std::string&& loc, const rct::key &account_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "account " + epee::string_tools::pod_to_hex(account_id) + " has no spend key (view-only)")
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct invalid_tombstone : public wallet_runtime_error
{
    explicit invalid_tombstone(std::string&& loc, const std::uint64_t tombstone, const std::uint64_t num_blocks)
        : wallet_runtime_error(std::move(loc), ErrorCategory::MALFORMED_INPUT,
            "tombstone block " + std::to_string(tombstone) + " is not above the ledger height " +
            std::to_string(num_blocks))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct tx_rejected : public wallet_runtime_error
{
    explicit tx_rejected(std::string&& loc, const rct::key &tx_id)
        : wallet_runtime_error(std::move(loc), ErrorCategory::STORE_OR_LEDGER,
            "the network rejected tx " + epee::string_tools::pod_to_hex(tx_id))
    {
    }
};
//----------------------------------------------------------------------------------------------------
struct store_conflict : public wallet_runtime_error
{
    explicit store_conflict(std::string&& loc, const std::string &reason)
        : wallet_runtime_error(std::move(loc), ErrorCategory::STORE_OR_LEDGER, "store conflict: " + reason)
    {
    }
};
//----------------------------------------------------------------------------------------------------

template<typename TException, typename... TArgs>
void throw_wallet_ex(std::string&& loc, const TArgs&... args)
{
    TException e(std::move(loc), args...);

    switch (e.category())
    {
        case ErrorCategory::NOT_FOUND:             MDEBUG(e.to_string());   break;
        case ErrorCategory::INSUFFICIENT_RESOURCE: MWARNING(e.to_string()); break;
        default:                                   MERROR(e.to_string());   break;
    }

    throw e;
}

} //namespace error
} //namespace cw

#define CW_STRINGIZE_DETAIL(x) #x
#define CW_STRINGIZE(x) CW_STRINGIZE_DETAIL(x)

#define CW_THROW_WALLET_EXCEPTION(err_type, ...)                                                            \
    do {                                                                                                    \
        cw::error::throw_wallet_ex<err_type>(std::string(__FILE__ ":" CW_STRINGIZE(__LINE__)), ## __VA_ARGS__); \
    } while (0)

#define CW_THROW_WALLET_EXCEPTION_IF(cond, err_type, ...)                                                   \
    if (cond)                                                                                               \
    {                                                                                                       \
        MDEBUG(#cond << ". THROW EXCEPTION: " << #err_type);                                                \
        cw::error::throw_wallet_ex<err_type>(std::string(__FILE__ ":" CW_STRINGIZE(__LINE__)), ## __VA_ARGS__); \
    }
