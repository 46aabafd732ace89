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

#include "base/podlog_log.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("log_level_from_name")
{
    CHECK(log_level_from_name("debug"_frag) == podlog_log_level_t::DEBUG);
    CHECK(log_level_from_name("warn"_frag) == podlog_log_level_t::WARNING);
    CHECK(log_level_from_name("warning"_frag) == podlog_log_level_t::WARNING);
    CHECK_FALSE(log_level_from_name("loud"_frag).has_value());
    CHECK(std::string(log_level_to_name(podlog_log_level_t::ERROR))
          == "error");
}

TEST_CASE("log ring")
{
    auto saved = podlog_log_level;

    podlog_log_level = podlog_log_level_t::INFO;
    log_info("ring test %d", 42);
    log_debug("hidden %d", 43);

    auto contents = log_ring_contents();
    CHECK(contents.find("ring test 42\n") != std::string::npos);
    CHECK(contents.find(" I t") != std::string::npos);
    CHECK(contents.find("hidden 43") == std::string::npos);

    podlog_log_level = saved;
}
