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
#include "cw_hash_functions.h"

//local headers
#include "crypto/blake2b.h"
extern "C"
{
#include "crypto/crypto-ops.h"
}
#include "misc_log_ex.h"
#include "ringct/rctTypes.h"
#include "transcript.h"

//third party headers

//standard headers
#include <cstddef>
#include <cstring>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "cwallet.core"

namespace cw
{
//-------------------------------------------------------------------------------------------------------------------
void cw_hash_to_bytes(const CwTranscript &transcript, const std::size_t num_bytes, unsigned char *hash_out)
{
    CHECK_AND_ASSERT_THROW_MES(num_bytes > 0 && num_bytes <= 64, "cw hash: unsupported output length.");

    blake2b(hash_out, num_bytes, transcript.data(), transcript.size(), nullptr, 0);
}
//-------------------------------------------------------------------------------------------------------------------
rct::key cw_hash_to_key(const CwTranscript &transcript)
{
    rct::key hash;
    cw_hash_to_bytes(transcript, sizeof(rct::key), hash.bytes);

    return hash;
}
//-------------------------------------------------------------------------------------------------------------------
rct::key cw_hash_to_scalar(const CwTranscript &transcript)
{
    // reduce 64 bytes so the scalar is close to uniform
    unsigned char hash[64];
    cw_hash_to_bytes(transcript, 64, hash);
    sc_reduce(hash);

    rct::key scalar;
    memcpy(scalar.bytes, hash, sizeof(rct::key));

    return scalar;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace cw
