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
// Account keys
// - a view privkey k^v and a spend privkey k^s (absent for view-only accounts)
// - subaddress i: K^{s,i} = (Hn(k^v, i) + k^s) G,  K^{v,i} = k^v K^{s,i}
///

#pragma once

//local headers
#include "crypto/crypto.h"
#include "ringct/rctTypes.h"
#include "tx_component_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>

//forward declarations


namespace cw
{

struct AccountKeys final
{
    crypto::secret_key m_view_privkey;                    //k^v
    boost::optional<crypto::secret_key> m_spend_privkey;  //k^s (none for view-only accounts)
    rct::key m_spend_pubkey;                              //K^s = k^s G
};

/// make a random set of account keys
void make_random_account_keys(AccountKeys &keys_out);
/// make account keys from existing privkeys
void make_account_keys(const crypto::secret_key &view_privkey,
    const crypto::secret_key &spend_privkey,
    AccountKeys &keys_out);
/// make view-only account keys from a full set of keys
void make_view_only_account_keys(const AccountKeys &keys, AccountKeys &view_only_keys_out);
/// check if the keys can spend (i.e. have a spend privkey)
bool can_spend(const AccountKeys &keys);
/// make the subaddress at index i
void make_account_subaddress(const AccountKeys &keys,
    const std::uint64_t subaddress_index,
    PublicAddress &subaddress_out);
/**
* brief: make_account_id - make a stable account id
*   - H32(K^{s,0}, K^{v,0})
* param: keys -
* return: account id
*/
rct::key make_account_id(const AccountKeys &keys);
/// compare two key structures (constant-time on the privkeys)
bool account_keys_equal(const AccountKeys &keys, const AccountKeys &other);

} //namespace cw
