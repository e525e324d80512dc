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

// Accounts currently being synced.
// - an account can be claimed by at most one sync task at a time
// - a claim is a move-only token that releases the account when destroyed


#pragma once

//local headers
#include "ringct/rctTypes.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/mutex.hpp>

//standard headers
#include <cstddef>
#include <unordered_set>

//forward declarations
namespace cw { class InFlightAccounts; }


namespace cw
{

////
// AccountClaim
// - exclusive right to sync one account
///
class AccountClaim final
{
    friend class InFlightAccounts;

public:
//constructors
    AccountClaim(AccountClaim &&other);
    AccountClaim(const AccountClaim&) = delete;

//destructor
    ~AccountClaim();

//overloaded operators
    AccountClaim& operator=(AccountClaim &&other);
    AccountClaim& operator=(const AccountClaim&) = delete;

//member functions
    const rct::key& account_id() const { return m_account_id; }

private:
    AccountClaim(InFlightAccounts &in_flight_accounts, const rct::key &account_id);

    /// release the account (no-op if already released or moved-from)
    void release();

//member variables
    /// owner of the claim (null after release/move)
    InFlightAccounts *m_in_flight_accounts;
    /// the claimed account
    rct::key m_account_id;
};

////
// InFlightAccounts
// - shared by the sync coordinator (claims) and workers (hold claims until done)
///
class InFlightAccounts final
{
    friend class AccountClaim;

public:
//constructors
    InFlightAccounts() = default;
    InFlightAccounts(const InFlightAccounts&) = delete;

//overloaded operators
    InFlightAccounts& operator=(const InFlightAccounts&) = delete;

//member functions
    /**
    * brief: try_claim - try to claim an account
    * param: account_id -
    * return: a claim, or none if the account is already claimed
    */
    boost::optional<AccountClaim> try_claim(const rct::key &account_id);
    /// check if an account is claimed
    bool is_claimed(const rct::key &account_id) const;
    /// number of claimed accounts
    std::size_t num_claimed() const;

private:
    void release(const rct::key &account_id);

//member variables
    mutable boost::mutex m_mutex;
    std::unordered_set<rct::key> m_claimed_account_ids;
};

} //namespace cw
