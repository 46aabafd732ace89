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
 * @file log_filter.hh
 */

#ifndef podlog_log_filter_hh
#define podlog_log_filter_hh

#include <string>
#include <vector>

#include "base/result.h"
#include "base/string_fragment.hh"
#include "pcrepp/pcre2pp.hh"
#include "podlog_config.hh"

namespace podlog {

struct filter_result {
    /** Indexes of the lines that passed the filter. */
    std::vector<size_t> fr_matches;
    /**
     * For each entry in fr_matches, the byte offsets in the line to
     * highlight.  Offsets are strictly increasing.
     */
    std::vector<std::vector<int>> fr_highlights;

    bool empty() const { return this->fr_matches.empty(); }

    size_t size() const { return this->fr_matches.size(); }
};

bool is_fuzzy_selector(string_fragment query,
                       const filter_config& fc = filter_config{});

bool is_inverse_selector(string_fragment query,
                         const filter_config& fc = filter_config{});

/**
 * Rank the lines that contain the pattern's characters in order.
 *
 * @return The matching lines, best first, with the offsets of the matched
 *   characters.
 */
filter_result fuzzy_filter(string_fragment pattern,
                           const std::vector<std::string>& lines);

/**
 * Keep the lines matching a case-insensitive regular expression or, if the
 * query starts with the inverse prefix, the lines that do not match.  For
 * plain queries, the bytes of the leftmost match are highlighted.
 */
Result<filter_result, pcre2pp::compile_error> regex_filter(
    string_fragment query,
    const std::vector<std::string>& lines,
    const filter_config& fc = filter_config{});

}  // namespace podlog

#endif
