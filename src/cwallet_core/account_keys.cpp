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
#include "account_keys.h"

//local headers
#include "crypto/crypto.h"
extern "C"
{
#include "crypto/crypto-ops.h"
}
#include "cw_hash_functions.h"
#include "cwallet_config.h"
#include "misc_log_ex.h"
#include "ringct/rctOps.h"
#include "ringct/rctTypes.h"
#include "transcript.h"
#include "txo_core_utils.h"

//third party headers
#include <sodium/crypto_verify_32.h>

//standard headers


#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
void make_random_account_keys(AccountKeys &keys_out)
{
    make_account_keys(rct::rct2sk(rct::skGen()), rct::rct2sk(rct::skGen()), keys_out);
}
//-------------------------------------------------------------------------------------------------------------------
void make_account_keys(const crypto::secret_key &view_privkey,
    const crypto::secret_key &spend_privkey,
    AccountKeys &keys_out)
{
    CHECK_AND_ASSERT_THROW_MES(sc_check(to_bytes(view_privkey)) == 0,
        "make account keys: view privkey is not a canonical scalar.");
    CHECK_AND_ASSERT_THROW_MES(sc_check(to_bytes(spend_privkey)) == 0,
        "make account keys: spend privkey is not a canonical scalar.");

    keys_out.m_view_privkey  = view_privkey;
    keys_out.m_spend_privkey = spend_privkey;
    rct::scalarmultBase(keys_out.m_spend_pubkey, rct::sk2rct(spend_privkey));
}
//-------------------------------------------------------------------------------------------------------------------
void make_view_only_account_keys(const AccountKeys &keys, AccountKeys &view_only_keys_out)
{
    view_only_keys_out.m_view_privkey  = keys.m_view_privkey;
    view_only_keys_out.m_spend_privkey = boost::none;
    view_only_keys_out.m_spend_pubkey  = keys.m_spend_pubkey;
}
//-------------------------------------------------------------------------------------------------------------------
bool can_spend(const AccountKeys &keys)
{
    return static_cast<bool>(keys.m_spend_privkey);
}
//-------------------------------------------------------------------------------------------------------------------
void make_account_subaddress(const AccountKeys &keys,
    const std::uint64_t subaddress_index,
    PublicAddress &subaddress_out)
{
    make_subaddress(keys.m_spend_pubkey, keys.m_view_privkey, subaddress_index, subaddress_out);
}
//-------------------------------------------------------------------------------------------------------------------
rct::key make_account_id(const AccountKeys &keys)
{
    PublicAddress main_address;
    make_account_subaddress(keys, config::CW_MAIN_SUBADDRESS_INDEX, main_address);

    CwTranscript transcript{TranscriptMode::LABELED, config::HASH_KEY_CW_ACCOUNT_ID, 2*sizeof(rct::key)};
    transcript.append("main_address", main_address);

    rct::key account_id;
    account_id = cw_hash_to_key(transcript);
    return account_id;
}
//-------------------------------------------------------------------------------------------------------------------
bool account_keys_equal(const AccountKeys &keys, const AccountKeys &other)
{
    if (can_spend(keys) != can_spend(other))
        return false;

    const bool view_privkeys_equal{
            crypto_verify_32(to_bytes(keys.m_view_privkey), to_bytes(other.m_view_privkey)) == 0
        };
    const bool spend_privkeys_equal{
            !can_spend(keys) ||
            crypto_verify_32(to_bytes(*keys.m_spend_privkey), to_bytes(*other.m_spend_privkey)) == 0
        };

    return view_privkeys_equal && spend_privkeys_equal && keys.m_spend_pubkey == other.m_spend_pubkey;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
