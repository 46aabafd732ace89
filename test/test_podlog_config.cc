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

#include <fstream>

#include "config.h"

#include <stdlib.h>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "podlog_config.hh"

using podlog::config;

TEST_CASE("config defaults")
{
    auto cfg = config::load_string("{}"_frag).unwrap();

    CHECK(cfg.c_log_level == podlog_log_level_t::INFO);
    CHECK(cfg.c_render.rc_timestamp_color == 106);
    CHECK(cfg.c_render.rc_timestamp_width == 30);
    CHECK(cfg.c_filter.fc_fuzzy_prefix == "-f");
    CHECK(cfg.c_filter.fc_inverse_prefix == "!");
}

TEST_CASE("config::load_string")
{
    static const char JSON[] = R"(
{
    "log": { "level": "debug" },
    "render": { "timestamp-color": 42, "timestamp-width": 12 },
    "filter": { "fuzzy-prefix": "~", "inverse-prefix": "^" },
    "unknown": { "ignored": true }
}
)";

    auto res = config::load_string(string_fragment::from_const(JSON));
    REQUIRE(res.isOk());

    auto cfg = res.unwrap();
    CHECK(cfg.c_log_level == podlog_log_level_t::DEBUG);
    CHECK(cfg.c_render.rc_timestamp_color == 42);
    CHECK(cfg.c_render.rc_timestamp_width == 12);
    CHECK(cfg.c_filter.fc_fuzzy_prefix == "~");
    CHECK(cfg.c_filter.fc_inverse_prefix == "^");
}

TEST_CASE("config::load_string errors")
{
    {
        auto res = config::load_string("{"_frag);

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().ce_path == "<string>");
    }
    {
        auto res = config::load_string(
            R"({"render": {"timestamp-color": 300}})"_frag, "test.json");

        REQUIRE(res.isErr());
        auto err = res.unwrapErr();
        CHECK(err.ce_path == "test.json");
        CHECK(err.ce_message.find("timestamp-color") != std::string::npos);
    }
    CHECK(config::load_string(R"({"render": {"timestamp-color": "red"}})"_frag)
              .isErr());
    CHECK(config::load_string(R"({"render": {"timestamp-width": -1}})"_frag)
              .isErr());
    CHECK(config::load_string(R"({"filter": {"fuzzy-prefix": ""}})"_frag)
              .isErr());
    CHECK(config::load_string(R"({"log": {"level": "loud"}})"_frag).isErr());
    CHECK(config::load_string(R"({"render": 1})"_frag).isErr());
    CHECK(config::load_string("[1]"_frag).isErr());
}

TEST_CASE("config::load_file")
{
    {
        auto res = config::load_file("/non-existent/podlog.json");

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().ce_path == "/non-existent/podlog.json");
    }
    {
        const char* path = "podlog_config_test.json";

        std::ofstream(path) << R"({"render": {"timestamp-width": 8}})";

        auto res = config::load_file(path);
        REQUIRE(res.isOk());
        CHECK(res.unwrap().c_render.rc_timestamp_width == 8);
        remove(path);
    }
}

TEST_CASE("config::default_path")
{
    setenv("PODLOG_CONFIG", "/tmp/explicit.json", 1);
    CHECK(config::default_path() == "/tmp/explicit.json");

    unsetenv("PODLOG_CONFIG");
    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    CHECK(config::default_path() == "/tmp/xdg/podlog/config.json");

    unsetenv("XDG_CONFIG_HOME");
    setenv("HOME", "/home/tester", 1);
    CHECK(config::default_path() == "/home/tester/.config/podlog/config.json");
}

TEST_CASE("config::load_default")
{
    setenv("PODLOG_CONFIG", "/non-existent/podlog.json", 1);

    auto res = config::load_default();
    REQUIRE(res.isOk());
    CHECK(res.unwrap().c_render.rc_timestamp_width == 30);

    unsetenv("PODLOG_CONFIG");
}

TEST_CASE("config::apply_log_level")
{
    auto saved = podlog_log_level;
    auto cfg = config::load_string(R"({"log": {"level": "error"}})"_frag)
                   .unwrap();

    cfg.apply_log_level();
    CHECK(podlog_log_level == podlog_log_level_t::ERROR);
    podlog_log_level = saved;
}
