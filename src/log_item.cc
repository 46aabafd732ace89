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
 * @file log_item.cc
 */

#include "log_item.hh"

#include "base/ansi_colorize.hh"
#include "base/string_util.hh"
#include "base/time_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace podlog {

log_item
log_item::from_line(string_fragment raw)
{
    log_item retval;

    if (!raw.empty() && raw.back() == '\n') {
        raw = raw.sub_range(0, raw.length() - 1);
    }

    auto split_pair = raw.split_when(string_fragment::tag1{' '});
    retval.li_timestamp = split_pair.first.to_string();
    retval.li_bytes = split_pair.second.to_string();

    return retval;
}

log_item
log_item::from_string(std::string msg)
{
    log_item retval;

    retval.li_timestamp = current_local_time_string();
    retval.li_bytes = std::move(msg);

    return retval;
}

std::string
log_item::info() const
{
    return fmt::format(
        FMT_STRING("{:?}::{:?}"), this->li_pod, this->li_container);
}

std::string
escape_tags(string_fragment msg)
{
    static const auto TAG_RE = pcre2pp::code::from_const(
        R"((\[[a-zA-Z0-9_,;: \-\."#]+\[*)\])");

    return TAG_RE.replace(msg, R"(\1[])");
}

std::string
log_item::render(int color,
                 bool show_time,
                 const std::string& modifier,
                 const log_modifier_registry& mods,
                 const render_config& rc) const
{
    std::string retval;

    if (show_time) {
        ansi::append_colorized(
            retval,
            pad_right(this->li_timestamp, rc.rc_timestamp_width),
            rc.rc_timestamp_color);
        retval.push_back(' ');
    }
    if (!this->li_pod.empty()) {
        ansi::append_colorized(retval, this->li_pod, color);
        retval.push_back(':');
    }
    if (!this->li_single_container && !this->li_container.empty()) {
        ansi::append_colorized(retval, this->li_container, color);
        retval.push_back(' ');
    }
    retval.append(escape_tags(this->li_bytes));

    return mods.apply(modifier, std::move(retval));
}

}  // namespace podlog
