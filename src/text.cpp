// SPDX-FileCopyrightText: Copyright (c) 2024-2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "api/text.hpp"

#include <cstddef>
#include <cstring>
#include <string>

namespace fmbind::detail {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

// Decodes the sequence starting at s[0].
// Returns the sequence length when it is well-formed. Otherwise returns 0 and sets
// `invalid` to the length of the maximal ill-formed subpart (at least 1), which is
// replaced by a single U+FFFD. Bounds on the second byte exclude overlongs, surrogates
// and code points above U+10FFFF.
std::size_t sequence_length(const unsigned char* s, std::size_t remaining, std::size_t& invalid)
{
    invalid            = 1;
    unsigned char lead = s[0];
    if (lead < 0x80)
    {
        return 1;
    }

    std::size_t length = 0;
    unsigned char lo   = 0x80;
    unsigned char hi   = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF)
    {
        length = 2;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        length = 3;
        if (lead == 0xE0)
            lo = 0xA0;
        if (lead == 0xED)
            hi = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        length = 4;
        if (lead == 0xF0)
            lo = 0x90;
        if (lead == 0xF4)
            hi = 0x8F;
    }
    else
    {
        return 0;
    }

    if (remaining < 2 || s[1] < lo || s[1] > hi)
    {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i)
    {
        if (i >= remaining || !is_continuation(s[i]))
        {
            invalid = i;
            return 0;
        }
    }
    return length;
}

}  // namespace

std::string copy_foreign_text(const char* text)
{
    if (text == nullptr)
    {
        return {};
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(text);
    std::size_t size  = std::strlen(text);

    std::string out;
    out.reserve(size);

    std::size_t i = 0;
    while (i < size)
    {
        std::size_t invalid = 1;
        auto length         = sequence_length(bytes + i, size - i, invalid);
        if (length == 0)
        {
            out.append(kReplacement);
            i += invalid;
            continue;
        }
        out.append(text + i, length);
        i += length;
    }
    return out;
}

}  // namespace fmbind::detail
