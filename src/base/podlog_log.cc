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
 * @file podlog_log.cc
 */

#include <mutex>

#include "podlog_log.hh"

#include <signal.h>
#include <stdarg.h>
#include <stdlib.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include "config.h"

static constexpr size_t BUFFER_SIZE = 256 * 1024;
static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

podlog_log_level_t podlog_log_level = podlog_log_level_t::INFO;

static FILE* podlog_log_file = nullptr;
static FILE* podlog_env_log_file = nullptr;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
podlog_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

struct thid {
    static uint32_t COUNTER;

    thid() noexcept : t_id(COUNTER++) {}

    uint32_t t_id;
};

uint32_t thid::COUNTER = 0;

thread_local thid current_thid;

/**
 * The ring keeps the most recent messages.  When the write position reaches
 * the end of the buffer, writing restarts at the front and the tail of the
 * previous pass is remembered as a fragment that is shrunk, one line at a
 * time, as new messages overwrite it.
 */
static struct {
    size_t lr_length;
    off_t lr_frag_start;
    off_t lr_frag_end;
    char lr_data[BUFFER_SIZE];
} log_ring = {0, BUFFER_SIZE, 0, {}};

static const char* LEVEL_NAMES[] = {
    "T",
    "D",
    "I",
    "W",
    "E",
};

static const char* LEVEL_LONG_NAMES[] = {
    "trace",
    "debug",
    "info",
    "warning",
    "error",
};

static char*
log_alloc()
{
    off_t data_end = log_ring.lr_length + MAX_LOG_LINE_SIZE;

    if (data_end >= (off_t) BUFFER_SIZE) {
        const char* new_start = &log_ring.lr_data[MAX_LOG_LINE_SIZE];

        new_start = (const char*) memchr(
            new_start, '\n', log_ring.lr_length - MAX_LOG_LINE_SIZE);
        if (new_start == nullptr) {
            log_ring.lr_frag_start = BUFFER_SIZE;
            log_ring.lr_frag_end = 0;
        } else {
            log_ring.lr_frag_start = new_start - log_ring.lr_data;
            log_ring.lr_frag_end = log_ring.lr_length;
        }
        log_ring.lr_length = 0;
    } else if (data_end >= log_ring.lr_frag_start) {
        const char* new_start = &log_ring.lr_data[log_ring.lr_frag_start];

        new_start = (const char*) memchr(
            new_start, '\n', log_ring.lr_frag_end - log_ring.lr_frag_start);
        if (new_start == nullptr) {
            log_ring.lr_frag_start = BUFFER_SIZE;
            log_ring.lr_frag_end = 0;
        } else {
            log_ring.lr_frag_start = new_start - log_ring.lr_data;
        }
    }

    return &log_ring.lr_data[log_ring.lr_length];
}

std::optional<podlog_log_level_t>
log_level_from_name(string_fragment name)
{
    for (size_t lpc = 0; lpc < sizeof(LEVEL_LONG_NAMES) / sizeof(char*); lpc++)
    {
        if (name == std::string(LEVEL_LONG_NAMES[lpc])) {
            return static_cast<podlog_log_level_t>(lpc);
        }
    }

    if (name == "warn") {
        return podlog_log_level_t::WARNING;
    }

    return std::nullopt;
}

const char*
log_level_to_name(podlog_log_level_t level)
{
    return LEVEL_LONG_NAMES[static_cast<uint32_t>(level)];
}

void
log_set_file(FILE* file)
{
    std::lock_guard<std::mutex> log_lock(*podlog_log_mutex());

    podlog_log_file = file;
}

void
log_init_from_env()
{
    const char* log_path = getenv("PODLOG_LOG_PATH");
    const char* log_level = getenv("PODLOG_LOG_LEVEL");

    if (log_level != nullptr) {
        auto level_opt = log_level_from_name(string_fragment::from_c_str(log_level));

        if (level_opt) {
            podlog_log_level = level_opt.value();
        }
    }

    if (log_path != nullptr && podlog_env_log_file == nullptr) {
        podlog_env_log_file = fopen(log_path, "ae");
        if (podlog_env_log_file != nullptr) {
            log_set_file(podlog_env_log_file);
        }
    }

    log_info("log initialized: level=%s; path=%s",
             log_level_to_name(podlog_log_level),
             log_path != nullptr ? log_path : "<none>");
}

void
log_msg(podlog_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    struct timeval curr_time;
    struct tm localtm;
    ssize_t prefix_size;
    va_list args;
    ssize_t rc;

    if (level < podlog_log_level) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*podlog_log_mutex());

    {
        // get the base name of the file.  NB: can't use basename() since it
        // can modify its argument
        const char* last_slash = src_file;

        for (int lpc = 0; src_file[lpc]; lpc++) {
            if (src_file[lpc] == '/' || src_file[lpc] == '\\') {
                last_slash = &src_file[lpc + 1];
            }
        }

        src_file = last_slash;
    }

    va_start(args, fmt);
    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    auto line = log_alloc();
    auto gmtoff = std::abs(localtm.tm_gmtoff) / 60;
    prefix_size
        = snprintf(line,
                   MAX_LOG_LINE_SIZE,
                   "%4d-%02d-%02dT%02d:%02d:%02d.%03d%c%02d:%02d %s t%u %s:%d ",
                   localtm.tm_year + 1900,
                   localtm.tm_mon + 1,
                   localtm.tm_mday,
                   localtm.tm_hour,
                   localtm.tm_min,
                   localtm.tm_sec,
                   (int) (curr_time.tv_usec / 1000),
                   localtm.tm_gmtoff < 0 ? '-' : '+',
                   (int) gmtoff / 60,
                   (int) gmtoff % 60,
                   LEVEL_NAMES[static_cast<uint32_t>(level)],
                   current_thid.t_id,
                   src_file,
                   line_number);
    rc = vsnprintf(
        &line[prefix_size], MAX_LOG_LINE_SIZE - prefix_size, fmt, args);
    if (rc >= (ssize_t) (MAX_LOG_LINE_SIZE - prefix_size)) {
        rc = MAX_LOG_LINE_SIZE - prefix_size - 1;
    }
    line[prefix_size + rc] = '\n';
    log_ring.lr_length += prefix_size + rc + 1;
    if (podlog_log_file != nullptr) {
        fwrite(line, 1, prefix_size + rc + 1, podlog_log_file);
        fflush(podlog_log_file);
    }
    va_end(args);
}

std::string
log_ring_contents()
{
    std::lock_guard<std::mutex> log_lock(*podlog_log_mutex());
    std::string retval;

    if (log_ring.lr_frag_start < (off_t) BUFFER_SIZE) {
        retval.append(&log_ring.lr_data[log_ring.lr_frag_start],
                      log_ring.lr_frag_end - log_ring.lr_frag_start);
    }
    retval.append(log_ring.lr_data, log_ring.lr_length);

    return retval;
}

void
log_write_ring_to(int fd)
{
    auto contents = log_ring_contents();
    const char* curr = contents.data();
    size_t remaining = contents.size();

    while (remaining > 0) {
        auto rc = write(fd, curr, remaining);

        if (rc <= 0) {
            break;
        }
        curr += rc;
        remaining -= rc;
    }
}

void
log_abort()
{
    raise(SIGABRT);
    _exit(1);
}
