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
 * @file log_items.hh
 */

#ifndef podlog_log_items_hh
#define podlog_log_items_hh

#include <memory>
#include <string>
#include <vector>

#include "base/result.h"
#include "log_filter.hh"
#include "log_item.hh"
#include "log_modifier.hh"
#include "pcrepp/pcre2pp.hh"
#include "podlog_config.hh"

namespace podlog {

/**
 * The ordered collection of lines shown in a log view.  The collection owns
 * its items and renders or filters them in bulk.
 */
class log_items {
public:
    using container_type = std::vector<log_item>;
    using iterator = container_type::iterator;
    using const_iterator = container_type::const_iterator;

    explicit log_items(std::shared_ptr<const log_modifier_registry> mods
                       = log_modifier_registry::builtin(),
                       const config& cfg = config{})
        : li_modifiers(std::move(mods)), li_render_config(cfg.c_render),
          li_filter_config(cfg.c_filter)
    {
    }

    void push_back(log_item item)
    {
        this->li_items.emplace_back(std::move(item));
    }

    template<typename... Args>
    log_item& emplace_back(Args&&... args)
    {
        return this->li_items.emplace_back(std::forward<Args>(args)...);
    }

    size_t size() const { return this->li_items.size(); }

    bool empty() const { return this->li_items.empty(); }

    void clear() { this->li_items.clear(); }

    log_item& operator[](size_t index) { return this->li_items[index]; }

    const log_item& operator[](size_t index) const
    {
        return this->li_items[index];
    }

    iterator begin() { return this->li_items.begin(); }
    iterator end() { return this->li_items.end(); }
    const_iterator begin() const { return this->li_items.begin(); }
    const_iterator end() const { return this->li_items.end(); }

    /**
     * Render every item without color, for scanning by the regex filter.
     */
    std::vector<std::string> lines(bool show_time,
                                   const std::string& modifier) const;

    /**
     * Render every item without color, for fuzzy matching.
     */
    std::vector<std::string> str_lines(bool show_time,
                                       const std::string& modifier) const;

    /**
     * Render every item for display into out, which is resized to the
     * number of items.  Items with the same pod or container get the same
     * color.
     */
    void render(bool show_time,
                const std::string& modifier,
                std::vector<std::string>& out) const;

    /**
     * Find the lines that match the query.  An empty query matches nothing.
     * A query starting with the fuzzy prefix is a fuzzy search, anything
     * else is a regular expression that can be inverted with the inverse
     * prefix.
     */
    Result<filter_result, pcre2pp::compile_error> filter(
        string_fragment query,
        bool show_time,
        const std::string& modifier) const;

    /**
     * Write the message of every item to the debug log.
     */
    void dump_debug(const char* label) const;

private:
    std::shared_ptr<const log_modifier_registry> li_modifiers;
    render_config li_render_config;
    filter_config li_filter_config;
    container_type li_items;
};

}  // namespace podlog

#endif
