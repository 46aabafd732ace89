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
 */

#include <vector>

#include "base/fuzzy_match.hh"

#include "config.h"
#include "doctest/doctest.h"

using podlog::fuzzy::find;
using podlog::fuzzy::match_one;

TEST_CASE("fuzzy::match_one")
{
    {
        auto m = match_one("abc"_frag, "xaxbxc"_frag);

        REQUIRE(m.has_value());
        CHECK(m->m_positions == std::vector<int>{1, 3, 5});
    }
    {
        // only in-order subsequences match
        CHECK_FALSE(match_one("abc"_frag, "acb"_frag).has_value());
        CHECK_FALSE(match_one("abc"_frag, "ab"_frag).has_value());
        CHECK_FALSE(match_one(""_frag, "abc"_frag).has_value());
    }
    {
        auto m = match_one("ABC"_frag, "abc"_frag);

        REQUIRE(m.has_value());
        CHECK(m->m_positions == std::vector<int>{0, 1, 2});
    }
}

TEST_CASE("fuzzy::match_one separators")
{
    {
        auto m = match_one("fb"_frag, "foo-bar"_frag);

        REQUIRE(m.has_value());
        CHECK(m->m_positions == std::vector<int>{0, 4});
    }
    {
        // a later occurrence after a separator is preferred
        auto m = match_one("b"_frag, "abc_b"_frag);

        REQUIRE(m.has_value());
        CHECK(m->m_positions == std::vector<int>{4});
    }
}

TEST_CASE("fuzzy::find")
{
    std::vector<std::string> candidates = {
        "xxaxbxc",
        "abc",
        "nothing",
    };

    auto matches = find("abc"_frag, candidates);
    REQUIRE(matches.size() == 2);
    CHECK(matches[0].m_index == 1);
    CHECK(matches[1].m_index == 0);
    CHECK(matches[0].m_score > matches[1].m_score);
    CHECK(matches[1].m_positions == std::vector<int>{2, 4, 6});

    CHECK(find(""_frag, candidates).empty());
}

TEST_CASE("fuzzy::find ties")
{
    std::vector<std::string> candidates = {
        "abc",
        "zzz",
        "abc",
    };

    auto matches = find("abc"_frag, candidates);
    REQUIRE(matches.size() == 2);
    CHECK(matches[0].m_index == 0);
    CHECK(matches[1].m_index == 2);
}
