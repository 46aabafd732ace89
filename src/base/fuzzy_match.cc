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
 * @file fuzzy_match.cc
 */

#include <algorithm>

#include "fuzzy_match.hh"

#include <ctype.h>

#include "config.h"

namespace podlog::fuzzy {

static constexpr int FIRST_CHAR_BONUS = 10;
static constexpr int SEPARATOR_BONUS = 20;
static constexpr int CAMEL_BONUS = 20;
static constexpr int ADJACENT_BONUS = 5;
static constexpr int LEADING_CHAR_PENALTY = -5;
static constexpr int MAX_LEADING_CHAR_PENALTY = -15;
static constexpr int UNMATCHED_CHAR_PENALTY = -1;

static bool
is_separator(char ch)
{
    switch (ch) {
        case ' ':
        case '_':
        case '-':
        case '/':
        case '\\':
        case '.':
        case ':':
        case '=':
            return true;
        default:
            return false;
    }
}

static bool
same_char(char lhs, char rhs)
{
    return ::tolower((unsigned char) lhs) == ::tolower((unsigned char) rhs);
}

static int
position_bonus(string_fragment str, int index)
{
    if (index == 0) {
        return FIRST_CHAR_BONUS;
    }

    auto prev = str[index - 1];
    auto curr = str[index];

    if (is_separator(prev)) {
        return SEPARATOR_BONUS;
    }
    if (::islower((unsigned char) prev) && ::isupper((unsigned char) curr)) {
        return CAMEL_BONUS;
    }

    return 0;
}

std::optional<match>
match_one(string_fragment pattern, string_fragment str)
{
    if (pattern.empty() || pattern.length() > str.length()) {
        return std::nullopt;
    }

    match retval;
    int str_index = 0;

    retval.m_positions.reserve(pattern.length());
    for (int pat_index = 0; pat_index < pattern.length(); pat_index++) {
        auto pat_ch = pattern[pat_index];

        while (str_index < str.length() && !same_char(pat_ch, str[str_index]))
        {
            str_index += 1;
        }
        if (str_index == str.length()) {
            return std::nullopt;
        }

        // look for a better placed occurrence of the same character before
        // the next pattern character shows up.
        auto best_index = str_index;
        auto best_bonus = position_bonus(str, str_index);
        auto has_next = pat_index + 1 < pattern.length();
        for (int look = str_index + 1; look < str.length(); look++) {
            if (has_next && same_char(pattern[pat_index + 1], str[look])) {
                break;
            }
            if (same_char(pat_ch, str[look])) {
                auto bonus = position_bonus(str, look);

                if (bonus > best_bonus) {
                    best_index = look;
                    best_bonus = bonus;
                }
            }
        }

        retval.m_score += best_bonus;
        if (!retval.m_positions.empty()
            && retval.m_positions.back() + 1 == best_index)
        {
            retval.m_score += ADJACENT_BONUS;
        }
        retval.m_positions.push_back(best_index);
        str_index = best_index + 1;
    }

    auto leading_penalty = std::max(
        LEADING_CHAR_PENALTY * retval.m_positions.front(),
        MAX_LEADING_CHAR_PENALTY);
    retval.m_score += leading_penalty;
    retval.m_score += UNMATCHED_CHAR_PENALTY
        * (str.length() - (int) retval.m_positions.size());

    return retval;
}

std::vector<match>
find(string_fragment pattern, const std::vector<std::string>& candidates)
{
    std::vector<match> retval;

    if (pattern.empty()) {
        return retval;
    }

    for (size_t index = 0; index < candidates.size(); index++) {
        auto match_opt
            = match_one(pattern, string_fragment::from_str(candidates[index]));

        if (match_opt) {
            match_opt->m_index = index;
            retval.emplace_back(std::move(match_opt.value()));
        }
    }

    std::stable_sort(
        retval.begin(), retval.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.m_score > rhs.m_score;
        });

    return retval;
}

}  // namespace podlog::fuzzy
