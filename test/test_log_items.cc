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

#include <ctype.h>
#include <set>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "log_items.hh"

using podlog::log_item;
using podlog::log_items;
using podlog::log_modifier_registry;

static log_item
make_item(const char* pod, const char* msg)
{
    log_item retval;

    retval.li_pod = pod;
    retval.li_timestamp = "2024-01-01T00:00:00Z";
    retval.li_bytes = msg;

    return retval;
}

static log_items
make_items()
{
    log_items retval;

    retval.push_back(make_item("api", "GET /health 200"));
    retval.push_back(make_item("api", "POST /login 500 error"));
    retval.push_back(make_item("db", "connection ERROR timeout"));
    retval.push_back(make_item("db", "ready"));

    return retval;
}

TEST_CASE("log_items::container")
{
    log_items items;

    CHECK(items.empty());
    items.emplace_back(log_item::from_line("TS one\n"_frag));
    items.push_back(log_item::from_line("TS two\n"_frag));
    REQUIRE(items.size() == 2);
    CHECK(items[1].li_bytes == "two");

    size_t count = 0;
    for (const auto& li : items) {
        CHECK(li.li_timestamp == "TS");
        count += 1;
    }
    CHECK(count == 2);

    items.clear();
    CHECK(items.empty());
}

TEST_CASE("log_items::lines")
{
    auto items = make_items();
    auto lines = items.lines(false, "");

    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "\x1b[38;5;0mapi\x1b[0m:GET /health 200");
    CHECK(lines[3] == "\x1b[38;5;0mdb\x1b[0m:ready");
    CHECK(items.str_lines(false, "") == lines);

    auto with_time = items.lines(true, "");
    CHECK(with_time[0].find("2024-01-01T00:00:00Z") != std::string::npos);
    CHECK(lines[0].find("2024-01-01T00:00:00Z") == std::string::npos);
}

TEST_CASE("log_items::render")
{
    auto items = make_items();
    std::vector<std::string> out(10);

    items.render(false, "", out);
    REQUIRE(out.size() == 4);
    // 'a' + 'p' + 'i' == 314
    CHECK(out[0] == "\x1b[38;5;58mapi\x1b[0m:GET /health 200");
    CHECK(out[1] == "\x1b[38;5;58mapi\x1b[0m:POST /login 500 error");
    // 'd' + 'b' == 198
    CHECK(out[2] == "\x1b[38;5;198mdb\x1b[0m:connection ERROR timeout");

    items.clear();
    items.render(false, "", out);
    CHECK(out.empty());
}

TEST_CASE("log_items::filter empty")
{
    auto items = make_items();
    auto res = items.filter(""_frag, false, "");

    REQUIRE(res.isOk());
    auto fr = res.unwrap();
    CHECK(fr.empty());
    CHECK(fr.fr_highlights.empty());
}

TEST_CASE("log_items::filter regex")
{
    auto items = make_items();
    auto lines = items.lines(false, "");
    auto res = items.filter("error"_frag, false, "");

    REQUIRE(res.isOk());
    auto fr = res.unwrap();
    REQUIRE(fr.fr_matches == std::vector<size_t>{1, 2});
    REQUIRE(fr.fr_highlights.size() == 2);

    auto start = (int) lines[1].find("error");
    CHECK(fr.fr_highlights[0]
          == std::vector<int>{start, start + 1, start + 2, start + 3, start + 4});

    start = (int) lines[2].find("ERROR");
    CHECK(fr.fr_highlights[1].size() == 5);
    CHECK(fr.fr_highlights[1].front() == start);
}

TEST_CASE("log_items::filter highlights the leftmost match")
{
    auto items = make_items();
    auto lines = items.lines(false, "");
    auto res = items.filter("o"_frag, false, "");

    REQUIRE(res.isOk());
    auto fr = res.unwrap();
    REQUIRE(fr.fr_matches == std::vector<size_t>{1, 2});

    // "POST /login 500 error" has three o's, only the first is marked
    auto first = (int) lines[1].find_first_of("oO");
    CHECK(fr.fr_highlights[0] == std::vector<int>{first});

    first = (int) lines[2].find_first_of("oO");
    CHECK(fr.fr_highlights[1] == std::vector<int>{first});
}

TEST_CASE("log_items::filter invalid utf-8")
{
    auto items = make_items();
    items.push_back(make_item("db", "caf\xe9 [warn] disk full"));
    auto lines = items.lines(false, "");

    auto plain = items.filter("warn"_frag, false, "").unwrap();
    REQUIRE(plain.fr_matches == std::vector<size_t>{4});
    auto start = (int) lines[4].find("warn");
    CHECK(plain.fr_highlights[0]
          == std::vector<int>{start, start + 1, start + 2, start + 3});

    auto inverse = items.filter("!warn"_frag, false, "").unwrap();
    CHECK(inverse.fr_matches == std::vector<size_t>{0, 1, 2, 3});
}

TEST_CASE("log_items::filter inverse")
{
    auto items = make_items();
    auto res = items.filter("!error"_frag, false, "");

    REQUIRE(res.isOk());
    auto fr = res.unwrap();
    CHECK(fr.fr_matches == std::vector<size_t>{0, 3});
    REQUIRE(fr.fr_highlights.size() == 2);
    CHECK(fr.fr_highlights[0].empty());
    CHECK(fr.fr_highlights[1].empty());

    // plain and inverted results partition the items
    auto plain = items.filter("error"_frag, false, "").unwrap();
    std::set<size_t> all(plain.fr_matches.begin(), plain.fr_matches.end());
    all.insert(fr.fr_matches.begin(), fr.fr_matches.end());
    CHECK(all.size() == items.size());
    CHECK(plain.size() + fr.size() == items.size());
}

TEST_CASE("log_items::filter bad regex")
{
    auto items = make_items();
    auto res = items.filter("(unclosed"_frag, false, "");

    REQUIRE(res.isErr());
    auto err = res.unwrapErr();
    CHECK(err.ce_pattern == "(unclosed");
    CHECK_FALSE(err.get_message().empty());
}

TEST_CASE("log_items::filter fuzzy")
{
    auto items = make_items();
    auto lines = items.str_lines(false, "");
    auto res = items.filter("-f  gh "_frag, false, "");

    REQUIRE(res.isOk());
    auto fr = res.unwrap();
    REQUIRE(fr.fr_matches == std::vector<size_t>{0});

    const auto& hl = fr.fr_highlights[0];
    REQUIRE(hl.size() == 2);
    CHECK(hl[0] < hl[1]);
    CHECK(tolower(lines[0][hl[0]]) == 'g');
    CHECK(tolower(lines[0][hl[1]]) == 'h');

    auto empty_res = items.filter("-f"_frag, false, "");
    REQUIRE(empty_res.isOk());
    CHECK(empty_res.unwrap().empty());
}

TEST_CASE("log_items::filter fuzzy ranking")
{
    log_items items;

    items.push_back(make_item("", "xxaxbxc"));
    items.push_back(make_item("", "abc"));
    items.push_back(make_item("", "zzz"));

    auto fr = items.filter("-fabc"_frag, false, "").unwrap();
    CHECK(fr.fr_matches == std::vector<size_t>{1, 0});
}

TEST_CASE("log_items::filter custom prefixes")
{
    podlog::config cfg;

    cfg.c_filter.fc_fuzzy_prefix = "~";
    cfg.c_filter.fc_inverse_prefix = "^!";

    log_items items(log_modifier_registry::builtin(), cfg);
    items.push_back(make_item("api", "GET /health 200"));
    items.push_back(make_item("api", "POST /login 500 error"));

    auto fuzzy = items.filter("~gh"_frag, false, "").unwrap();
    CHECK(fuzzy.fr_matches == std::vector<size_t>{0});

    auto inverse = items.filter("^!error"_frag, false, "").unwrap();
    CHECK(inverse.fr_matches == std::vector<size_t>{0});

    // the default inverse prefix is now a literal
    auto literal = items.filter("!error"_frag, false, "").unwrap();
    CHECK(literal.empty());
}

TEST_CASE("log_items::filter through a modifier")
{
    auto mods = std::make_shared<log_modifier_registry>();

    mods->register_modifier("tag", [](string_fragment line) {
        return line.to_string() + " [tagged]";
    });

    log_items items(mods);
    items.push_back(make_item("", "plain"));

    auto fr = items.filter("tagged"_frag, false, "tag").unwrap();
    CHECK(fr.fr_matches == std::vector<size_t>{0});

    auto none = items.filter("tagged"_frag, false, "").unwrap();
    CHECK(none.empty());
}

TEST_CASE("log_items::zap-pretty")
{
    log_items items;

    items.push_back(
        make_item("api", R"({"level":"info","msg":"listening","port":8080})"));

    auto lines = items.lines(false, "zap-pretty");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "\x1b[38;5;0mapi\x1b[0m:INFO listening {\"port\": 8080}");
}
