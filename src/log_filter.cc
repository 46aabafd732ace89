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
 * @file log_filter.cc
 */

#include "log_filter.hh"

#include "base/fuzzy_match.hh"
#include "base/podlog_log.hh"
#include "config.h"

namespace podlog {

bool
is_fuzzy_selector(string_fragment query, const filter_config& fc)
{
    return !query.empty() && query.startswith(fc.fc_fuzzy_prefix);
}

bool
is_inverse_selector(string_fragment query, const filter_config& fc)
{
    return !query.empty() && query.startswith(fc.fc_inverse_prefix);
}

filter_result
fuzzy_filter(string_fragment pattern, const std::vector<std::string>& lines)
{
    filter_result retval;

    if (pattern.empty() || lines.empty()) {
        return retval;
    }

    auto matches = fuzzy::find(pattern, lines);
    retval.fr_matches.reserve(matches.size());
    retval.fr_highlights.reserve(matches.size());
    for (auto& m : matches) {
        retval.fr_matches.emplace_back(m.m_index);
        retval.fr_highlights.emplace_back(std::move(m.m_positions));
    }

    log_debug("fuzzy filter \"%.*s\" matched %zu of %zu lines",
              pattern.length(),
              pattern.data(),
              retval.size(),
              lines.size());

    return retval;
}

Result<filter_result, pcre2pp::compile_error>
regex_filter(string_fragment query,
             const std::vector<std::string>& lines,
             const filter_config& fc)
{
    auto inverse = is_inverse_selector(query, fc);
    if (inverse) {
        query = query.substr(fc.fc_inverse_prefix.length());
    }

    auto compile_res = pcre2pp::code::from(query, PCRE2_CASELESS);
    if (compile_res.isErr()) {
        return Err(compile_res.unwrapErr());
    }

    auto co = compile_res.unwrap();
    filter_result retval;

    for (size_t index = 0; index < lines.size(); index++) {
        auto line = string_fragment::from_str(lines[index]);
        std::vector<int> positions;
        bool found = false;

        auto find_res = co.find_in(line);
        if (find_res.isErr()) {
            log_warning("unable to match line %zu: %s",
                        index,
                        find_res.unwrapErr().get_message().c_str());
        } else {
            auto match = find_res.unwrap();
            if (match) {
                found = true;
                if (!inverse) {
                    auto all = match->f_all;
                    for (auto pos = all.sf_begin; pos < all.sf_end; pos++) {
                        positions.emplace_back(pos);
                    }
                }
            }
        }

        if (found != inverse) {
            retval.fr_matches.emplace_back(index);
            retval.fr_highlights.emplace_back(std::move(positions));
        }
    }

    return Ok(std::move(retval));
}

}  // namespace podlog
