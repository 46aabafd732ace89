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

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "log_color.hh"

using podlog::color_for;
using podlog::color_map;
using podlog::color_random_source;

TEST_CASE("color_for")
{
    color_random_source rng{1};

    // 'a' + 'p' + 'i' == 314
    CHECK(color_for("api"_frag, rng) == 58);
    CHECK(color_for("api"_frag, rng) == 58);
    CHECK(color_for("db"_frag, rng) == 198);
    // code points, not bytes: U+00E9 == 233
    CHECK(color_for("\xc3\xa9"_frag, rng) == 233);
    // invalid bytes count as U+FFFD
    CHECK(color_for("\xff"_frag, rng) == 0xfffd % 256);
}

TEST_CASE("color_for reserved")
{
    color_random_source rng1{42};
    color_random_source rng2{42};

    for (int lpc = 0; lpc < 50; lpc++) {
        auto color = color_for(""_frag, rng1);

        CHECK(color >= podlog::RESERVED_COLOR_BASE);
        CHECK(color < podlog::RESERVED_COLOR_BASE
                  + podlog::RESERVED_COLOR_SPREAD);
        CHECK(color == color_for(""_frag, rng2));
    }

    // U+0100 sums to a multiple of 256
    auto color = color_for("\xc4\x80"_frag, rng1);
    CHECK(color >= podlog::RESERVED_COLOR_BASE);
    CHECK(color < podlog::RESERVED_COLOR_BASE + podlog::RESERVED_COLOR_SPREAD);
}

TEST_CASE("color_map")
{
    color_random_source rng{7};
    color_map cm(rng);

    auto first = cm.color_for("");
    for (int lpc = 0; lpc < 20; lpc++) {
        CHECK(cm.color_for("") == first);
    }
    CHECK(cm.color_for("api") == 58);
    CHECK(cm.size() == 2);
}
