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
 * @file log_modifier.zap_pretty.cc
 */

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

#include <string.h>

#include "log_modifier.zap_pretty.hh"

#include <yajl/yajl_gen.h>
#include <yajl/yajl_tree.h>

#include "base/auto_mem.hh"
#include "base/podlog_log.hh"
#include "base/string_util.hh"
#include "base/time_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace podlog {

namespace {

using tree_ptr = std::unique_ptr<yajl_val_s, decltype(&yajl_tree_free)>;

bool
gen_value(yajl_gen gen, yajl_val val)
{
    if (YAJL_IS_STRING(val)) {
        const auto* str = YAJL_GET_STRING(val);

        return yajl_gen_string(
                   gen, (const unsigned char*) str, strlen(str))
            == yajl_gen_status_ok;
    }
    if (YAJL_IS_NUMBER(val)) {
        const auto* raw = YAJL_GET_NUMBER(val);

        return yajl_gen_number(gen, raw, strlen(raw)) == yajl_gen_status_ok;
    }
    if (YAJL_IS_TRUE(val)) {
        return yajl_gen_bool(gen, 1) == yajl_gen_status_ok;
    }
    if (YAJL_IS_FALSE(val)) {
        return yajl_gen_bool(gen, 0) == yajl_gen_status_ok;
    }
    if (YAJL_IS_OBJECT(val)) {
        yajl_gen_map_open(gen);
        for (size_t lpc = 0; lpc < val->u.object.len; lpc++) {
            const auto* key = val->u.object.keys[lpc];

            yajl_gen_string(gen, (const unsigned char*) key, strlen(key));
            if (!gen_value(gen, val->u.object.values[lpc])) {
                return false;
            }
        }
        return yajl_gen_map_close(gen) == yajl_gen_status_ok;
    }
    if (YAJL_IS_ARRAY(val)) {
        yajl_gen_array_open(gen);
        for (size_t lpc = 0; lpc < val->u.array.len; lpc++) {
            if (!gen_value(gen, val->u.array.values[lpc])) {
                return false;
            }
        }
        return yajl_gen_array_close(gen) == yajl_gen_status_ok;
    }

    return yajl_gen_null(gen) == yajl_gen_status_ok;
}

std::string
to_json(yajl_val val)
{
    auto_mem<yajl_gen_t> gen(yajl_gen_free);
    const unsigned char* buf;
    size_t len;

    gen = yajl_gen_alloc(nullptr);
    if (!gen_value(gen.in(), val)) {
        return "null";
    }
    yajl_gen_get_buf(gen.in(), &buf, &len);

    return std::string((const char*) buf, len);
}

std::string
json_quote(const char* str)
{
    auto_mem<yajl_gen_t> gen(yajl_gen_free);
    const unsigned char* buf;
    size_t len;

    gen = yajl_gen_alloc(nullptr);
    yajl_gen_string(gen.in(), (const unsigned char*) str, strlen(str));
    yajl_gen_get_buf(gen.in(), &buf, &len);

    return std::string((const char*) buf, len);
}

std::string
format_ts(yajl_val val)
{
    if (YAJL_IS_STRING(val)) {
        return YAJL_GET_STRING(val);
    }

    double secs;
    if (YAJL_IS_DOUBLE(val)) {
        secs = YAJL_GET_DOUBLE(val);
    } else if (YAJL_IS_INTEGER(val)) {
        secs = (double) YAJL_GET_INTEGER(val);
    } else {
        return to_json(val);
    }

    auto whole = std::floor(secs);
    auto millis = (int) std::min(std::lround((secs - whole) * 1000.0), 999L);

    return fmt::format(FMT_STRING("{} UTC"),
                       to_rfc3339_string((time64_t) whole, millis, ' '));
}

}  // namespace

std::string
zap_pretty_modifier::modify(string_fragment line) const
{
    auto brace_opt = line.find('{');
    if (!brace_opt) {
        return line.to_string();
    }

    auto prefix = line.sub_range(0, brace_opt.value());
    auto body = line.substr(brace_opt.value()).to_string();
    char error_buffer[1024];
    auto tree = tree_ptr(
        yajl_tree_parse(body.c_str(), error_buffer, sizeof(error_buffer)),
        yajl_tree_free);

    if (tree == nullptr) {
        log_trace("zap-pretty: not JSON -- %s", error_buffer);
        return line.to_string();
    }
    if (!YAJL_IS_OBJECT(tree.get())) {
        return line.to_string();
    }

    yajl_val ts = nullptr;
    yajl_val level = nullptr;
    yajl_val caller = nullptr;
    yajl_val msg = nullptr;
    yajl_val stacktrace = nullptr;
    std::vector<std::string> fields;

    const auto& obj = tree->u.object;
    for (size_t lpc = 0; lpc < obj.len; lpc++) {
        auto key = string_fragment::from_c_str(obj.keys[lpc]);
        auto* val = obj.values[lpc];

        if (key == "ts") {
            ts = val;
        } else if (key == "level") {
            level = val;
        } else if (key == "caller") {
            caller = val;
        } else if (key == "msg") {
            msg = val;
        } else if (key == "stacktrace" && YAJL_IS_STRING(val)) {
            stacktrace = val;
        } else {
            fields.emplace_back(fmt::format(
                FMT_STRING("{}: {}"), json_quote(obj.keys[lpc]), to_json(val)));
        }
    }

    if (msg == nullptr && level == nullptr) {
        return line.to_string();
    }

    std::vector<std::string> parts;

    if (ts != nullptr) {
        parts.emplace_back(fmt::format(FMT_STRING("[{}]"), format_ts(ts)));
    }
    if (level != nullptr) {
        parts.emplace_back(toupper(YAJL_IS_STRING(level)
                                       ? std::string(YAJL_GET_STRING(level))
                                       : to_json(level)));
    }
    if (caller != nullptr) {
        parts.emplace_back(fmt::format(
            FMT_STRING("({})"),
            YAJL_IS_STRING(caller) ? std::string(YAJL_GET_STRING(caller))
                                   : to_json(caller)));
    }
    if (msg != nullptr) {
        parts.emplace_back(YAJL_IS_STRING(msg)
                               ? std::string(YAJL_GET_STRING(msg))
                               : to_json(msg));
    }
    if (!fields.empty()) {
        parts.emplace_back(
            fmt::format(FMT_STRING("{{{}}}"), fmt::join(fields, ", ")));
    }

    auto retval = prefix.to_string();
    retval.append(fmt::format(FMT_STRING("{}"), fmt::join(parts, " ")));
    if (stacktrace != nullptr) {
        retval.push_back('\n');
        retval.append(YAJL_GET_STRING(stacktrace));
    }

    return retval;
}

}  // namespace podlog
