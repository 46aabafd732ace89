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
 * @file log_items.cc
 */

#include "log_items.hh"

#include "base/podlog_log.hh"
#include "config.h"
#include "log_color.hh"

namespace podlog {

std::vector<std::string>
log_items::lines(bool show_time, const std::string& modifier) const
{
    std::vector<std::string> retval;

    retval.reserve(this->li_items.size());
    for (const auto& item : this->li_items) {
        retval.emplace_back(item.render(NEUTRAL_COLOR,
                                        show_time,
                                        modifier,
                                        *this->li_modifiers,
                                        this->li_render_config));
    }

    return retval;
}

std::vector<std::string>
log_items::str_lines(bool show_time, const std::string& modifier) const
{
    return this->lines(show_time, modifier);
}

void
log_items::render(bool show_time,
                  const std::string& modifier,
                  std::vector<std::string>& out) const
{
    color_map colors;

    out.resize(this->li_items.size());
    for (size_t index = 0; index < this->li_items.size(); index++) {
        const auto& item = this->li_items[index];

        out[index] = item.render(colors.color_for(item.id()),
                                 show_time,
                                 modifier,
                                 *this->li_modifiers,
                                 this->li_render_config);
    }
}

Result<filter_result, pcre2pp::compile_error>
log_items::filter(string_fragment query,
                  bool show_time,
                  const std::string& modifier) const
{
    if (query.empty()) {
        return Ok(filter_result{});
    }

    if (is_fuzzy_selector(query, this->li_filter_config)) {
        auto pattern
            = query.substr(this->li_filter_config.fc_fuzzy_prefix.length())
                  .trim();

        return Ok(fuzzy_filter(pattern, this->str_lines(show_time, modifier)));
    }

    auto res = regex_filter(
        query, this->lines(show_time, modifier), this->li_filter_config);
    if (res.isErr()) {
        auto err = res.unwrapErr();

        log_error("logs filter failed: %s", err.get_message().c_str());
        return Err(err);
    }

    return res;
}

void
log_items::dump_debug(const char* label) const
{
    log_debug("%s: %zu items", label, this->li_items.size());
    for (const auto& item : this->li_items) {
        log_debug("  %s %s", item.info().c_str(), item.li_bytes.c_str());
    }
}

}  // namespace podlog
