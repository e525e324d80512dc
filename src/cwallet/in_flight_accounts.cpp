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
#include "in_flight_accounts.h"

//local headers
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>

//standard headers
#include <utility>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.sync"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
AccountClaim::AccountClaim(InFlightAccounts &in_flight_accounts, const rct::key &account_id) :
    m_in_flight_accounts{&in_flight_accounts},
    m_account_id{account_id}
{}
//-------------------------------------------------------------------------------------------------------------------
AccountClaim::AccountClaim(AccountClaim &&other) :
    m_in_flight_accounts{other.m_in_flight_accounts},
    m_account_id{other.m_account_id}
{
    other.m_in_flight_accounts = nullptr;
}
//-------------------------------------------------------------------------------------------------------------------
AccountClaim::~AccountClaim()
{
    this->release();
}
//-------------------------------------------------------------------------------------------------------------------
AccountClaim& AccountClaim::operator=(AccountClaim &&other)
{
    if (this == &other)
        return *this;

    this->release();
    m_in_flight_accounts = other.m_in_flight_accounts;
    m_account_id = other.m_account_id;
    other.m_in_flight_accounts = nullptr;

    return *this;
}
//-------------------------------------------------------------------------------------------------------------------
void AccountClaim::release()
{
    if (m_in_flight_accounts == nullptr)
        return;

    m_in_flight_accounts->release(m_account_id);
    m_in_flight_accounts = nullptr;
}
//-------------------------------------------------------------------------------------------------------------------
boost::optional<AccountClaim> InFlightAccounts::try_claim(const rct::key &account_id)
{
    boost::lock_guard<boost::mutex> lock{m_mutex};

    if (!m_claimed_account_ids.insert(account_id).second)
        return boost::none;

    MDEBUG("Claimed account " << account_id << " for syncing.");
    return AccountClaim{*this, account_id};
}
//-------------------------------------------------------------------------------------------------------------------
bool InFlightAccounts::is_claimed(const rct::key &account_id) const
{
    boost::lock_guard<boost::mutex> lock{m_mutex};
    return m_claimed_account_ids.find(account_id) != m_claimed_account_ids.end();
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t InFlightAccounts::num_claimed() const
{
    boost::lock_guard<boost::mutex> lock{m_mutex};
    return m_claimed_account_ids.size();
}
//-------------------------------------------------------------------------------------------------------------------
void InFlightAccounts::release(const rct::key &account_id)
{
    boost::lock_guard<boost::mutex> lock{m_mutex};

    m_claimed_account_ids.erase(account_id);
    MDEBUG("Released account " << account_id << ".");
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
