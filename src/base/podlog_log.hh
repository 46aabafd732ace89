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
 * @file podlog_log.hh
 */

#ifndef podlog_log_hh
#define podlog_log_hh

#include <cstdint>
#include <optional>
#include <string>

#include <stdio.h>
#include <string.h>

#include "string_fragment.hh"

#ifndef podlog_dead2
#    define podlog_dead2 __attribute__((noreturn))
#endif

enum class podlog_log_level_t : uint32_t {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

#if defined(__GNUC__) || defined(__clang__)
#    define PODLOG_ATTR_FORMAT_PRINTF(a, b) \
        __attribute__((format(printf, a, b)))
#else
#    define PODLOG_ATTR_FORMAT_PRINTF(a, b)
#endif

void log_msg(enum podlog_log_level_t level,
             const char* src_file,
             int line_number,
             const char* fmt,
             ...) PODLOG_ATTR_FORMAT_PRINTF(4, 5);
void log_abort() podlog_dead2;

/**
 * Open the debug log file named by the PODLOG_LOG_PATH environment variable
 * and apply the PODLOG_LOG_LEVEL threshold, if they are set.
 */
void log_init_from_env();

/**
 * Append log messages to the given file.  The log does not take ownership
 * of the file.  Pass nullptr to stop writing to a file.
 */
void log_set_file(FILE* file);

/**
 * Write the contents of the in-memory ring buffer to a file descriptor.
 */
void log_write_ring_to(int fd);

/**
 * @return The contents of the in-memory ring buffer, oldest first.
 */
std::string log_ring_contents();

std::optional<podlog_log_level_t> log_level_from_name(string_fragment name);

const char* log_level_to_name(podlog_log_level_t level);

extern enum podlog_log_level_t podlog_log_level;

#define log_msg_wrapper(level, fmt...) \
    do { \
        if (podlog_log_level <= level) { \
            log_msg(level, __FILE__, __LINE__, fmt); \
        } \
    } while (false)

#define log_error(fmt...) log_msg_wrapper(podlog_log_level_t::ERROR, fmt);

#define log_warning(fmt...) log_msg_wrapper(podlog_log_level_t::WARNING, fmt);

#define log_info(fmt...) log_msg_wrapper(podlog_log_level_t::INFO, fmt);

#define log_debug(fmt...) log_msg_wrapper(podlog_log_level_t::DEBUG, fmt);

#define log_trace(fmt...) log_msg_wrapper(podlog_log_level_t::TRACE, fmt);

#define require(e) ((void) ((e) ? 0 : podlog_require(#e, __FILE__, __LINE__)))
#define podlog_require(e, file, line) \
    (log_msg(podlog_log_level_t::ERROR, \
             file, \
             line, \
             "failed precondition `%s'", \
             e), \
     log_abort(), \
     1)

#define ensure(e) ((void) ((e) ? 0 : podlog_ensure(#e, __FILE__, __LINE__)))
#define podlog_ensure(e, file, line) \
    (log_msg(podlog_log_level_t::ERROR, \
             file, \
             line, \
             "failed postcondition `%s'", \
             e), \
     log_abort(), \
     1)

#endif
