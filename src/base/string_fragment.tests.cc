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

#include "base/string_fragment.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("string_fragment::consume_codepoint")
{
    {
        auto sf = string_fragment::from_const("a\xc3\xa9");
        auto cp1 = sf.consume_codepoint();

        REQUIRE(cp1.has_value());
        CHECK(cp1->first == 'a');

        auto cp2 = cp1->second.consume_codepoint();
        REQUIRE(cp2.has_value());
        CHECK(cp2->first == 0xe9);
        CHECK(cp2->second.empty());
        CHECK_FALSE(cp2->second.consume_codepoint().has_value());
    }
    {
        auto sf = string_fragment::from_const("\xff" "b");
        auto cp = sf.consume_codepoint();

        REQUIRE(cp.has_value());
        CHECK(cp->first == 0xfffd);
        CHECK(cp->second == "b");
    }
    {
        // truncated sequence
        auto sf = string_fragment::from_const("\xe2\x82");
        auto cp = sf.consume_codepoint();

        REQUIRE(cp.has_value());
        CHECK(cp->first == 0xfffd);
        CHECK(cp->second.length() == 1);
    }
}

TEST_CASE("string_fragment::split_when")
{
    auto sf = string_fragment::from_const("ts msg1 msg2");
    auto pair = sf.split_when(string_fragment::tag1{' '});

    CHECK(pair.first == "ts");
    CHECK(pair.second == "msg1 msg2");
    CHECK(pair.second.sf_begin == 3);

    auto none = string_fragment::from_const("nospace").split_when(
        string_fragment::tag1{' '});
    CHECK(none.first == "nospace");
    CHECK(none.second.empty());
}

TEST_CASE("string_fragment::trim")
{
    auto sf = string_fragment::from_const("  abc \t");

    CHECK(sf.trim() == "abc");
    CHECK(sf.trim().sf_begin == 2);
    CHECK(string_fragment::from_const("xxaxx").trim("x") == "a");
    CHECK(string_fragment::from_const("   ").trim().empty());
}

TEST_CASE("string_fragment::misc")
{
    auto sf = string_fragment::from_const("-f needle");

    CHECK(sf.startswith("-f"));
    CHECK(sf.startswith(std::string("-f ")));
    CHECK_FALSE(sf.startswith("!"));
    CHECK(sf.find('n') == 3);
    CHECK_FALSE(sf.find('z').has_value());
    CHECK(sf.substr(2).to_string() == " needle");
    CHECK(sf.sub_range(3, 100) == "needle");
    CHECK_FALSE(string_fragment::invalid().is_valid());
    CHECK("abc"_frag == std::string("abc"));
}
