/**
 * Copyright (c) 2026, The podlog Authors
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of the podlog authors nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file string_fragment.cc
 */

#include "string_fragment.hh"

#include "config.h"

static constexpr uint32_t REPLACEMENT_CHAR = 0xfffd;

std::optional<std::pair<uint32_t, string_fragment>>
string_fragment::consume_codepoint() const
{
    if (this->empty()) {
        return std::nullopt;
    }

    auto lead = (unsigned char) this->front();
    uint32_t cp;
    int ch_len;

    if (lead < 0x80) {
        return std::make_pair((uint32_t) lead, this->substr(1));
    }
    if ((lead & 0xe0) == 0xc0) {
        cp = lead & 0x1f;
        ch_len = 2;
    } else if ((lead & 0xf0) == 0xe0) {
        cp = lead & 0x0f;
        ch_len = 3;
    } else if ((lead & 0xf8) == 0xf0) {
        cp = lead & 0x07;
        ch_len = 4;
    } else {
        return std::make_pair(REPLACEMENT_CHAR, this->substr(1));
    }

    if (ch_len > this->length()) {
        return std::make_pair(REPLACEMENT_CHAR, this->substr(1));
    }
    for (int lpc = 1; lpc < ch_len; lpc++) {
        auto cont = (unsigned char) this->data()[lpc];

        if ((cont & 0xc0) != 0x80) {
            return std::make_pair(REPLACEMENT_CHAR, this->substr(1));
        }
        cp = (cp << 6) | (cont & 0x3f);
    }

    // overlong encodings, surrogates and out-of-range values
    if ((ch_len == 2 && cp < 0x80) || (ch_len == 3 && cp < 0x800)
        || (ch_len == 4 && cp < 0x10000) || (cp >= 0xd800 && cp <= 0xdfff)
        || cp > 0x10ffff)
    {
        return std::make_pair(REPLACEMENT_CHAR, this->substr(1));
    }

    return std::make_pair(cp, this->substr(ch_len));
}

string_fragment
string_fragment::trim(const char* tokens) const
{
    string_fragment retval = *this;

    while (retval.sf_begin < retval.sf_end) {
        auto ch = retval.sf_string[retval.sf_begin];

        if (ch == '\0' || strchr(tokens, ch) == nullptr) {
            break;
        }

        retval.sf_begin += 1;
    }
    while (retval.sf_begin < retval.sf_end) {
        auto ch = retval.sf_string[retval.sf_end - 1];

        if (ch == '\0' || strchr(tokens, ch) == nullptr) {
            break;
        }

        retval.sf_end -= 1;
    }

    return retval;
}

string_fragment
string_fragment::trim() const
{
    return this->trim(" \t\r\n\v\f");
}
