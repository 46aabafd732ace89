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
 * @file log_item.hh
 */

#ifndef podlog_log_item_hh
#define podlog_log_item_hh

#include <string>

#include "base/string_fragment.hh"
#include "log_modifier.hh"
#include "podlog_config.hh"

namespace podlog {

/**
 * A single line received from a container.  The first space-delimited token
 * of the raw line is the timestamp, the rest is the message.
 */
struct log_item {
    /**
     * Parse a raw line.  A trailing newline is dropped.  A line without a
     * space is taken to be all timestamp with an empty message.
     */
    static log_item from_line(string_fragment raw);

    /**
     * Wrap a message generated locally, stamped with the current time.
     */
    static log_item from_string(std::string msg);

    /**
     * @return The pod name, or the container name if there is no pod.  Used
     *   for grouping and coloring.
     */
    const std::string& id() const
    {
        return this->li_pod.empty() ? this->li_container : this->li_pod;
    }

    /**
     * @return The pod and container names, quoted, for diagnostics.
     */
    std::string info() const;

    log_item clone() const { return *this; }

    bool is_empty() const { return this->li_bytes.empty(); }

    /**
     * Produce the display line for this item:
     *
     *   [timestamp ]pod:container message
     *
     * The timestamp is padded to the configured width and the pod and
     * container names are drawn in the given 256-color palette index.
     * Bracketed tokens in the message are escaped so the terminal widget
     * does not treat them as style tags, and the named modifier, if it is
     * registered, gets the final say.
     */
    std::string render(int color,
                       bool show_time,
                       const std::string& modifier,
                       const log_modifier_registry& mods,
                       const render_config& rc = render_config{}) const;

    std::string li_pod;
    std::string li_container;
    std::string li_timestamp;
    bool li_single_container{false};
    std::string li_bytes;
};

/**
 * Insert "[]" before the closing bracket of every tag-like bracketed token,
 * so "[warn]" becomes "[warn[]]".
 */
std::string escape_tags(string_fragment msg);

}  // namespace podlog

#endif
