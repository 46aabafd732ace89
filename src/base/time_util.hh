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
 * @file time_util.hh
 */

#ifndef podlog_time_util_hh
#define podlog_time_util_hh

#include <cstdint>
#include <string>

#include <sys/time.h>
#include <sys/types.h>
#include <time.h>

namespace podlog {

using time64_t = uint64_t;

ssize_t strftime_rfc3339(
    char* buffer, size_t buffer_size, time64_t tim, int millis, char sep = ' ');

std::string to_rfc3339_string(time64_t tim, int millis, char sep = ' ');

inline std::string
to_rfc3339_string(struct timeval tv, char sep = ' ')
{
    return to_rfc3339_string(tv.tv_sec, tv.tv_usec / 1000, sep);
}

/**
 * Render a local wall-clock time with microseconds and the UTC offset, for
 * example "2026-10-19 14:03:27.123456 +0200".
 */
std::string to_local_string(struct timeval tv);

/**
 * @return The current time rendered by to_local_string().
 */
std::string current_local_time_string();

}  // namespace podlog

#endif
