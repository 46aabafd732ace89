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

#include <string>
#include <vector>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/string_util.hh"
#include "doctest/doctest.h"
#include "log_item.hh"
#include "pcrepp/pcre2pp.hh"

using podlog::log_item;
using podlog::log_modifier_registry;

#define FG(code) "\x1b[38;5;" #code "m"
#define NORM "\x1b[0m"

TEST_CASE("log_item::from_line")
{
    {
        auto li = log_item::from_line("TS msg1 msg2\n"_frag);

        CHECK(li.li_timestamp == "TS");
        CHECK(li.li_bytes == "msg1 msg2");
        CHECK(li.li_pod.empty());
        CHECK(li.li_container.empty());
        CHECK_FALSE(li.li_single_container);
    }
    {
        auto li = log_item::from_line(
            "2024-01-01T00:00:00.000000001Z GET /health 200"_frag);

        CHECK(li.li_timestamp == "2024-01-01T00:00:00.000000001Z");
        CHECK(li.li_bytes == "GET /health 200");
    }
    {
        // consecutive spaces are part of the message
        auto li = log_item::from_line("TS  two  spaces\n"_frag);

        CHECK(li.li_timestamp == "TS");
        CHECK(li.li_bytes == " two  spaces");
    }
}

TEST_CASE("log_item::from_line without a message")
{
    auto li = log_item::from_line("onlytimestamp\n"_frag);

    CHECK(li.li_timestamp == "onlytimestamp");
    CHECK(li.li_bytes.empty());
    CHECK(li.is_empty());

    auto blank = log_item::from_line("\n"_frag);
    CHECK(blank.li_timestamp.empty());
    CHECK(blank.is_empty());
}

TEST_CASE("log_item::from_string")
{
    auto li = log_item::from_string("synthetic entry");

    CHECK(li.li_bytes == "synthetic entry");
    CHECK(li.li_timestamp.size() == 32);
    CHECK_FALSE(li.is_empty());
}

TEST_CASE("log_item::id")
{
    log_item li;

    CHECK(li.id().empty());
    li.li_container = "app";
    CHECK(li.id() == "app");
    li.li_pod = "web-1";
    CHECK(li.id() == "web-1");
}

TEST_CASE("log_item::info")
{
    log_item li;

    li.li_pod = "web-1";
    li.li_container = "app";
    CHECK(li.info() == R"("web-1"::"app")");

    li.li_pod = "quote\"d";
    li.li_container.clear();
    CHECK(li.info() == R"("quote\"d"::"")");
}

TEST_CASE("log_item::clone")
{
    auto li = log_item::from_line("TS hello\n"_frag);
    li.li_pod = "p";
    li.li_container = "c";
    li.li_single_container = true;

    auto copy = li.clone();
    CHECK(copy.li_pod == li.li_pod);
    CHECK(copy.li_container == li.li_container);
    CHECK(copy.li_timestamp == li.li_timestamp);
    CHECK(copy.li_single_container == li.li_single_container);
    CHECK(copy.li_bytes == li.li_bytes);
    CHECK(copy.li_bytes.data() != li.li_bytes.data());

    copy.li_bytes[0] = 'j';
    CHECK(li.li_bytes == "hello");
}

TEST_CASE("escape_tags")
{
    CHECK(podlog::escape_tags("no tags here"_frag) == "no tags here");
    CHECK(podlog::escape_tags("[warn] disk"_frag) == "[warn[]] disk");
    CHECK(podlog::escape_tags("[a] and [b]"_frag) == "[a[]] and [b[]]");
    CHECK(podlog::escape_tags("[level: info] ok"_frag)
          == "[level: info[]] ok");
    CHECK(podlog::escape_tags("[a-b.c]"_frag) == "[a-b.c[]]");
    CHECK(podlog::escape_tags("empty [] brackets"_frag)
          == "empty [] brackets");
}

TEST_CASE("escape_tags invalid utf-8")
{
    CHECK(podlog::escape_tags("caf\xe9 [warn] disk full"_frag)
          == "caf\xe9 [warn[]] disk full");
    CHECK(podlog::escape_tags("[a] \xff [b]"_frag) == "[a[]] \xff [b[]]");
}

TEST_CASE("escape_tags rescan")
{
    auto tag_re = podlog::pcre2pp::code::from_const(
        R"((\[[a-zA-Z0-9_,;: \-\."#]+\[*)\])");

    auto escaped = podlog::escape_tags("[warn]"_frag);
    auto in = string_fragment::from_str(escaped);
    auto md = tag_re.create_match_data();
    auto remaining = in;
    std::vector<std::string> tags;

    while (remaining.is_valid()) {
        auto find_res
            = tag_re.capture_from(in).at(remaining).into(md).matches();
        REQUIRE(find_res.isOk());
        auto found = find_res.unwrap();
        if (!found) {
            break;
        }
        tags.emplace_back(found->f_all.to_string());
        remaining = found->f_remaining;
    }

    CHECK(escaped.find("[warn]") == std::string::npos);
    for (const auto& tag : tags) {
        CHECK(tag != "[warn]");
    }
}

TEST_CASE("log_item::render")
{
    log_modifier_registry mods;
    log_item li;

    li.li_pod = "p1";
    li.li_container = "c1";
    li.li_timestamp = "TS";
    li.li_bytes = "hello [warn] x";

    SUBCASE("with timestamp")
    {
        auto expected = std::string(FG(106) "TS") + std::string(28, ' ')
            + NORM " " FG(5) "p1" NORM ":" FG(5) "c1" NORM " hello [warn[]] x";

        CHECK(li.render(5, true, "", mods) == expected);
    }

    SUBCASE("without timestamp")
    {
        auto line = li.render(5, false, "", mods);

        CHECK(line == FG(5) "p1" NORM ":" FG(5) "c1" NORM " hello [warn[]] x");
        CHECK(line.find("TS") == std::string::npos);
    }

    SUBCASE("single container")
    {
        li.li_single_container = true;

        CHECK(li.render(5, false, "", mods)
              == FG(5) "p1" NORM ":hello [warn[]] x");
    }

    SUBCASE("container only")
    {
        li.li_pod.clear();

        CHECK(li.render(7, false, "", mods) == FG(7) "c1" NORM " hello [warn[]] x");
    }

    SUBCASE("no identity")
    {
        li.li_pod.clear();
        li.li_container.clear();

        CHECK(li.render(7, false, "", mods) == "hello [warn[]] x");
    }
}

TEST_CASE("log_item::render timestamp column")
{
    log_modifier_registry mods;
    podlog::render_config rc;
    log_item li;

    li.li_timestamp = "TS";
    li.li_bytes = "m";

    rc.rc_timestamp_color = 1;
    rc.rc_timestamp_width = 10;
    CHECK(li.render(0, true, "", mods, rc)
          == FG(1) "TS        " NORM " m");

    li.li_timestamp = std::string(35, '9');
    CHECK(li.render(0, true, "", mods)
          == FG(106) + std::string(35, '9') + NORM " m");
}

TEST_CASE("log_item::render with modifier")
{
    log_modifier_registry mods;
    log_item li;

    li.li_bytes = "abc";
    mods.register_modifier("upper", [](string_fragment line) {
        return toupper(line.to_string());
    });

    CHECK(li.render(0, false, "upper", mods) == "ABC");
    CHECK(li.render(0, false, "unknown", mods) == "abc");
    CHECK(li.render(0, false, "", mods) == "abc");
}
