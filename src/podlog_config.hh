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
 * @file podlog_config.hh
 */

#ifndef podlog_config_hh
#define podlog_config_hh

#include <filesystem>
#include <string>

#include "base/podlog_log.hh"
#include "base/result.h"
#include "base/string_fragment.hh"

namespace podlog {

constexpr int DEFAULT_TIMESTAMP_COLOR = 106;
constexpr size_t DEFAULT_TIMESTAMP_WIDTH = 30;
constexpr size_t MAX_TIMESTAMP_WIDTH = 256;

struct render_config {
    /** 256-color palette index used for the timestamp column. */
    int rc_timestamp_color{DEFAULT_TIMESTAMP_COLOR};
    /** Minimum width of the timestamp column, shorter stamps are padded. */
    size_t rc_timestamp_width{DEFAULT_TIMESTAMP_WIDTH};
};

struct filter_config {
    std::string fc_fuzzy_prefix{"-f"};
    std::string fc_inverse_prefix{"!"};
};

struct config_error {
    std::string ce_path;
    std::string ce_message;
};

struct config {
    podlog_log_level_t c_log_level{podlog_log_level_t::INFO};
    render_config c_render;
    filter_config c_filter;

    static Result<config, config_error> load_string(
        string_fragment json, const std::string& src = "<string>");

    static Result<config, config_error> load_file(
        const std::filesystem::path& path);

    /**
     * Load the file at default_path(), falling back to the defaults if it
     * does not exist.
     */
    static Result<config, config_error> load_default();

    /**
     * @return $PODLOG_CONFIG if it is set, otherwise config.json in the
     *   "podlog" directory under $XDG_CONFIG_HOME or ~/.config.
     */
    static std::filesystem::path default_path();

    /**
     * Set the debug log threshold to c_log_level.
     */
    void apply_log_level() const;
};

}  // namespace podlog

#endif
