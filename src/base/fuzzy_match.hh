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
 * @file fuzzy_match.hh
 */

#ifndef podlog_fuzzy_match_hh
#define podlog_fuzzy_match_hh

#include <optional>
#include <string>
#include <vector>

#include "string_fragment.hh"

namespace podlog::fuzzy {

struct match {
    /** The index of the candidate in the input list. */
    size_t m_index{0};
    int m_score{0};
    /** Byte offsets of the matched characters, strictly increasing. */
    std::vector<int> m_positions;
};

/**
 * Check if the characters of the pattern appear, in order, in the given
 * string.  Letters are compared case-insensitively.  When a pattern
 * character occurs more than once before the next pattern character, the
 * occurrence with the best bonus (start of string, after a separator, at a
 * camel-case hump) is used.
 *
 * @return The match with score and positions, or nullopt if the pattern is
 *   empty or is not a subsequence of the string.
 */
std::optional<match> match_one(string_fragment pattern, string_fragment str);

/**
 * Match the pattern against every candidate.
 *
 * @return The matches, best score first.  Equal scores keep the candidate
 *   order.
 */
std::vector<match> find(string_fragment pattern,
                        const std::vector<std::string>& candidates);

}  // namespace podlog::fuzzy

#endif
