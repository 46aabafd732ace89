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

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "pcre2pp.hh"

using podlog::pcre2pp::code;
using podlog::pcre2pp::ignore_error;

TEST_CASE("bad pattern")
{
    auto compile_res = code::from(string_fragment::from_const("[abc"));

    CHECK(compile_res.isErr());
    auto ce = compile_res.unwrapErr();
    CHECK(ce.ce_offset == 4);
    CHECK(ce.ce_pattern == "[abc");
    CHECK_FALSE(ce.get_message().empty());
}

TEST_CASE("caseless")
{
    auto co = code::from(string_fragment::from_const("error"), PCRE2_CASELESS)
                  .unwrap();

    auto find_res = ignore_error(
        co.find_in(string_fragment::from_const("an ERROR occurred")));
    REQUIRE(find_res.has_value());
    CHECK(find_res->f_all.sf_begin == 3);
    CHECK(find_res->f_all.sf_end == 8);
}

TEST_CASE("matches")
{
    static const char INPUT[] = "key1=1234;key2=5678;";

    auto co = code::from_const(R"((\w+)=([^;]+);)");
    auto md = co.create_match_data();
    std::vector<std::pair<int, int>> spans;
    std::vector<std::string> values;

    auto in = string_fragment::from_const(INPUT);
    auto remaining = in;
    while (remaining.is_valid()) {
        auto find_res = co.capture_from(in).at(remaining).into(md).matches();
        REQUIRE(find_res.isOk());
        auto found = find_res.unwrap();
        if (!found) {
            break;
        }
        spans.emplace_back(found->f_all.sf_begin, found->f_all.sf_end);
        values.emplace_back(md[2]->to_string());
        remaining = found->f_remaining;
    }

    REQUIRE(spans.size() == 2);
    CHECK(spans[0] == std::make_pair(0, 10));
    CHECK(spans[1] == std::make_pair(10, 20));
    CHECK(values[0] == "1234");
    CHECK(values[1] == "5678");
}

TEST_CASE("find_in-sub-fragment")
{
    static const char INPUT[] = "xxab ab";

    auto co = code::from_const("ab");
    auto in = string_fragment::from_const(INPUT).substr(2);

    auto find_res = ignore_error(co.find_in(in));
    REQUIRE(find_res.has_value());
    CHECK(find_res->f_all.sf_begin == 2);
    CHECK(find_res->f_remaining.sf_begin == 4);
}

TEST_CASE("invalid utf-8 subject")
{
    static const char INPUT[] = "caf\xe9 [warn] disk full";

    auto co = code::from(string_fragment::from_const("warn"), PCRE2_CASELESS)
                  .unwrap();

    auto find_res = co.find_in(string_fragment::from_const(INPUT));
    REQUIRE(find_res.isOk());
    auto found = find_res.unwrap();
    REQUIRE(found.has_value());
    CHECK(found->f_all.sf_begin == 6);
    CHECK(found->f_all.sf_end == 10);
}

TEST_CASE("replace-invalid-utf-8")
{
    static const char INPUT[] = "\xff\xfe [a] \xc3";

    auto co = code::from_const(R"((\[\w+)\])");

    CHECK(co.replace(string_fragment::from_const(INPUT), R"(\1[])")
          == "\xff\xfe [a[]] \xc3");
}

TEST_CASE("capture_count")
{
    auto co = code::from_const(R"(^(\w+)=([^;]+);)");

    CHECK(co.get_capture_count() == 2);
}

TEST_CASE("replace")
{
    static const char INPUT[] = "test 1 2 3";

    auto co = code::from_const(R"(\w*)");
    auto in = string_fragment::from_const(INPUT);

    auto res = co.replace(in, R"({\0})");
    CHECK(res == "{test}{} {1}{} {2}{} {3}{}");
}

TEST_CASE("replace-empty")
{
    static const char INPUT[] = "";

    auto co = code::from_const(R"(\w*)");
    auto in = string_fragment::from_const(INPUT);

    auto res = co.replace(in, R"({\0})");
    CHECK(res == "{}");
}

TEST_CASE("replace-capture")
{
    static const char INPUT[] = "a [b] c [d]";

    auto co = code::from_const(R"((\[\w+)\])");
    auto in = string_fragment::from_const(INPUT);

    CHECK(co.replace(in, R"(\1[])") == "a [b[]] c [d[]]");
}

TEST_CASE("replace-no-match")
{
    static const char INPUT[] = "nothing to see";

    auto co = code::from_const(R"(\d+)");

    CHECK(co.replace(string_fragment::from_const(INPUT), "#")
          == "nothing to see");
}

TEST_CASE("anchored")
{
    auto re = code::from_const("abc", PCRE2_ANCHORED | PCRE2_ENDANCHORED);

    const auto sub1 = string_fragment::from_const("abc");
    const auto sub2 = string_fragment::from_const("abcd");
    const auto sub3 = string_fragment::from_const("0abc");

    CHECK(ignore_error(re.find_in(sub1)).has_value());
    CHECK_FALSE(ignore_error(re.find_in(sub2)).has_value());
    CHECK_FALSE(ignore_error(re.find_in(sub3)).has_value());
}
