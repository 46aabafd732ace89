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
 * @file log_color.cc
 */

#include "log_color.hh"

#include "config.h"

namespace podlog {

color_random_source&
default_color_random_source()
{
    static color_random_source retval{std::random_device{}()};

    return retval;
}

int
color_for(string_fragment id, color_random_source& rng)
{
    uint32_t sum = 0;
    auto remaining = id;

    while (true) {
        auto cp_opt = remaining.consume_codepoint();
        if (!cp_opt) {
            break;
        }

        sum += cp_opt->first;
        remaining = cp_opt->second;
    }

    auto retval = (int) (sum % 256);
    if (retval == 0) {
        std::uniform_int_distribution<int> dist(0, RESERVED_COLOR_SPREAD - 1);

        retval = RESERVED_COLOR_BASE + dist(rng);
    }

    return retval;
}

int
color_map::color_for(const std::string& id)
{
    auto iter = this->cm_colors.find(id);
    if (iter != this->cm_colors.end()) {
        return iter->second;
    }

    auto retval = podlog::color_for(id, this->cm_random);
    this->cm_colors.emplace(id, retval);

    return retval;
}

}  // namespace podlog
