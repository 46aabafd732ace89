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
 * @file log_color.hh
 */

#ifndef podlog_log_color_hh
#define podlog_log_color_hh

#include <random>
#include <string>
#include <unordered_map>

#include "base/string_fragment.hh"

namespace podlog {

/** The color used when rendering lines for scanning instead of display. */
constexpr int NEUTRAL_COLOR = 0;

/**
 * Identities whose character sum is a multiple of 256 would get the
 * neutral color.  They are given a color from this band instead.
 */
constexpr int RESERVED_COLOR_BASE = 207;
constexpr int RESERVED_COLOR_SPREAD = 10;

using color_random_source = std::mt19937;

/**
 * @return A process-wide random source seeded from std::random_device.
 */
color_random_source& default_color_random_source();

/**
 * Map an identity, a pod or container name, to a 256-color palette index.
 * The index is the sum of the identity's code points modulo 256.  A sum of
 * zero picks a value in [RESERVED_COLOR_BASE, RESERVED_COLOR_BASE +
 * RESERVED_COLOR_SPREAD) using the given random source.
 */
int color_for(string_fragment id, color_random_source& rng);

inline int
color_for(string_fragment id)
{
    return color_for(id, default_color_random_source());
}

/**
 * Remembers the color picked for each identity so that every line from the
 * same pod or container is painted the same within a single rendering.
 */
class color_map {
public:
    explicit color_map(color_random_source& rng
                       = default_color_random_source())
        : cm_random(rng)
    {
    }

    int color_for(const std::string& id);

    size_t size() const { return this->cm_colors.size(); }

private:
    color_random_source& cm_random;
    std::unordered_map<std::string, int> cm_colors;
};

}  // namespace podlog

#endif
