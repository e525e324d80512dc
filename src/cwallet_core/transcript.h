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

// Transcripts: byte strings assembled from protocol objects for hashing.


#pragma once

//local headers
#include "common/varint.h"
#include "crypto/crypto.h"
#include "cwallet_config.h"
#include "ringct/rctTypes.h"
#include "wipeable_string.h"

//third party headers
#include <boost/utility/string_ref.hpp>

//standard headers
#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

//forward declarations


namespace cw
{

enum class TranscriptMode : unsigned char
{
    /// raw concatenation of values (key derivation inputs: fixed layouts only)
    KDF,
    /// every value is labeled and framed, so structured objects hash unambiguously
    LABELED
};

////
// CwTranscript
// - transcript = prefix || domain separator || value1 || value2 || ...
// - LABELED framing per value: varint(label size) || label || tag || body, where body is
//     - bytes: varint(size) || bytes
//     - unsigned integer: varint(value)
//     - object: appended members || OBJECT_END
//     - list: varint(count) || element1 || element2 || ...
// - KDF mode writes only the raw bytes/varints of each value
// - the contents are wiped on destruction (transcripts often hold secrets)
///
class CwTranscript final
{
    enum class Tag : unsigned char
    {
        BYTES = 0x10,
        UINT = 0x11,
        OBJECT = 0x12,
        OBJECT_END = 0x13,
        LIST = 0x14
    };

public:
    CwTranscript(const TranscriptMode mode, const boost::string_ref domain_separator, const std::size_t estimated_size) :
        m_mode{mode}
    {
        m_data.reserve(sizeof(config::CW_TRANSCRIPT_PREFIX) + domain_separator.size() + 2*estimated_size + 16);

        this->append("prefix", boost::string_ref{config::CW_TRANSCRIPT_PREFIX});
        this->append("domain_separator", domain_separator);
    }

    CwTranscript(const CwTranscript&) = delete;
    CwTranscript& operator=(const CwTranscript&) = delete;

    /// byte buffers
    void append(const boost::string_ref label, const boost::string_ref bytes)
    {
        this->begin_value(label, Tag::BYTES);
        this->write_bytes_framed(bytes.data(), bytes.size());
    }
    void append(const boost::string_ref label, const rct::key &key)
    {
        this->begin_value(label, Tag::BYTES);
        this->write_bytes_framed(key.bytes, sizeof(key));
    }
    void append(const boost::string_ref label, const crypto::secret_key &secret)
    {
        this->begin_value(label, Tag::BYTES);
        this->write_bytes_framed(secret.data, sizeof(secret));
    }
    void append(const boost::string_ref label, const crypto::key_derivation &derivation)
    {
        this->begin_value(label, Tag::BYTES);
        this->write_bytes_framed(derivation.data, sizeof(derivation));
    }
    template<std::size_t Sz>
    void append(const boost::string_ref label, const std::array<unsigned char, Sz> &bytes)
    {
        this->begin_value(label, Tag::BYTES);
        this->write_bytes_framed(bytes.data(), Sz);
    }

    /// unsigned integers (varint)
    template<typename T,
        std::enable_if_t<std::is_unsigned<T>::value, bool> = true>
    void append(const boost::string_ref label, const T value)
    {
        static_assert(sizeof(T) <= sizeof(std::uint64_t), "CwTranscript: unsigned integer wider than 64 bits.");
        this->begin_value(label, Tag::UINT);
        this->write_varint(static_cast<std::uint64_t>(value));
    }

    /// objects: need 'void append_to_transcript(const T&, CwTranscript&)' findable by ADL
    template<typename T,
        std::enable_if_t<!std::is_integral<T>::value, bool> = true>
    void append(const boost::string_ref label, const T &object)
    {
        this->begin_value(label, Tag::OBJECT);
        append_to_transcript(object, *this);
        this->write_tag(Tag::OBJECT_END);
    }

    /// lists
    template<typename T>
    void append(const boost::string_ref label, const std::vector<T> &list)
    {
        this->begin_value(label, Tag::LIST);
        this->write_length(list.size());
        for (const T &element : list)
            this->append("", element);
    }

    const void* data() const { return m_data.data(); }
    std::size_t size() const { return m_data.size(); }

private:
    void write_varint(const std::uint64_t value)
    {
        unsigned char buffer[(sizeof(std::uint64_t)*8 + 6)/7];
        unsigned char *buffer_end{buffer};
        tools::write_varint(buffer_end, value);
        m_data.append(reinterpret_cast<const char*>(buffer), buffer_end - buffer);
    }
    void write_length(const std::size_t length)
    {
        if (m_mode == TranscriptMode::LABELED)
            this->write_varint(length);
    }
    void write_tag(const Tag tag)
    {
        if (m_mode == TranscriptMode::LABELED)
            m_data.push_back(static_cast<char>(tag));
    }
    void write_bytes_framed(const void *bytes, const std::size_t size)
    {
        this->write_length(size);
        m_data.append(reinterpret_cast<const char*>(bytes), size);
    }
    void begin_value(const boost::string_ref label, const Tag tag)
    {
        if (m_mode != TranscriptMode::LABELED)
            return;

        this->write_varint(label.size());
        m_data.append(label.data(), label.size());
        this->write_tag(tag);
    }

    const TranscriptMode m_mode;
    epee::wipeable_string m_data;
};

} //namespace cw
