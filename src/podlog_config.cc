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
 * @file podlog_config.cc
 */

#include <fstream>
#include <memory>
#include <sstream>

#include "podlog_config.hh"

#include <errno.h>
#include <stdlib.h>
#include <yajl/yajl_tree.h>

#include "config.h"
#include "fmt/format.h"

namespace podlog {

namespace {

using tree_ptr = std::unique_ptr<yajl_val_s, decltype(&yajl_tree_free)>;

Result<void, std::string>
read_string(yajl_val parent, const char* name, std::string& dst)
{
    const char* path[] = {name, nullptr};
    auto* val = yajl_tree_get(parent, path, yajl_t_any);

    if (val == nullptr) {
        return Ok();
    }
    if (!YAJL_IS_STRING(val)) {
        return Err(fmt::format(FMT_STRING("expecting a string for \"{}\""),
                               name));
    }
    if (YAJL_GET_STRING(val)[0] == '\0') {
        return Err(fmt::format(FMT_STRING("\"{}\" cannot be empty"), name));
    }

    dst = YAJL_GET_STRING(val);
    return Ok();
}

Result<void, std::string>
read_integer(yajl_val parent,
             const char* name,
             long long min_value,
             long long max_value,
             long long& dst)
{
    const char* path[] = {name, nullptr};
    auto* val = yajl_tree_get(parent, path, yajl_t_any);

    if (val == nullptr) {
        return Ok();
    }
    if (!YAJL_IS_INTEGER(val)) {
        return Err(fmt::format(FMT_STRING("expecting an integer for \"{}\""),
                               name));
    }

    auto value = YAJL_GET_INTEGER(val);
    if (value < min_value || value > max_value) {
        return Err(
            fmt::format(FMT_STRING("\"{}\" must be between {} and {}, got {}"),
                        name,
                        min_value,
                        max_value,
                        value));
    }

    dst = value;
    return Ok();
}

Result<yajl_val, std::string>
get_section(yajl_val root, const char* name)
{
    const char* path[] = {name, nullptr};
    auto* val = yajl_tree_get(root, path, yajl_t_any);

    if (val != nullptr && !YAJL_IS_OBJECT(val)) {
        return Err(
            fmt::format(FMT_STRING("expecting an object for \"{}\""), name));
    }

    return Ok(val);
}

Result<void, std::string>
load_tree(yajl_val root, config& cfg)
{
    if (!YAJL_IS_OBJECT(root)) {
        return Err(std::string("expecting an object at the top level"));
    }

    auto log_sec = TRY(get_section(root, "log"));
    if (log_sec != nullptr) {
        std::string level_name;

        TRY(read_string(log_sec, "level", level_name));
        if (!level_name.empty()) {
            auto level_opt = log_level_from_name(level_name);

            if (!level_opt) {
                return Err(fmt::format(
                    FMT_STRING("unknown log level \"{}\""), level_name));
            }
            cfg.c_log_level = level_opt.value();
        }
    }

    auto render_sec = TRY(get_section(root, "render"));
    if (render_sec != nullptr) {
        long long color = cfg.c_render.rc_timestamp_color;
        long long width = cfg.c_render.rc_timestamp_width;

        TRY(read_integer(render_sec, "timestamp-color", 0, 255, color));
        TRY(read_integer(
            render_sec, "timestamp-width", 0, MAX_TIMESTAMP_WIDTH, width));
        cfg.c_render.rc_timestamp_color = (int) color;
        cfg.c_render.rc_timestamp_width = (size_t) width;
    }

    auto filter_sec = TRY(get_section(root, "filter"));
    if (filter_sec != nullptr) {
        TRY(read_string(
            filter_sec, "fuzzy-prefix", cfg.c_filter.fc_fuzzy_prefix));
        TRY(read_string(
            filter_sec, "inverse-prefix", cfg.c_filter.fc_inverse_prefix));
    }

    return Ok();
}

}  // namespace

Result<config, config_error>
config::load_string(string_fragment json, const std::string& src)
{
    auto content = json.to_string();
    char error_buffer[1024];
    auto tree = tree_ptr(
        yajl_tree_parse(content.c_str(), error_buffer, sizeof(error_buffer)),
        yajl_tree_free);

    if (tree == nullptr) {
        log_error("%s: invalid configuration -- %s", src.c_str(), error_buffer);
        return Err(config_error{
            src,
            fmt::format(FMT_STRING("JSON parsing failed -- {}"),
                        error_buffer),
        });
    }

    config retval;
    auto load_res = load_tree(tree.get(), retval);
    if (load_res.isErr()) {
        auto msg = load_res.unwrapErr();

        log_error("%s: invalid configuration -- %s", src.c_str(), msg.c_str());
        return Err(config_error{src, msg});
    }

    return Ok(retval);
}

Result<config, config_error>
config::load_file(const std::filesystem::path& path)
{
    std::ifstream in(path);

    log_info("loading configuration from %s", path.c_str());
    if (!in) {
        return Err(config_error{
            path.string(),
            fmt::format(FMT_STRING("unable to open file -- {}"),
                        strerror(errno)),
        });
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    return load_string(buffer.str(), path.string());
}

Result<config, config_error>
config::load_default()
{
    auto path = default_path();
    std::error_code ec;

    if (!std::filesystem::exists(path, ec)) {
        log_debug("no configuration file at %s, using defaults", path.c_str());
        return Ok(config{});
    }

    return load_file(path);
}

std::filesystem::path
config::default_path()
{
    const auto* env_path = getenv("PODLOG_CONFIG");
    if (env_path != nullptr && env_path[0] != '\0') {
        return env_path;
    }

    std::filesystem::path base;
    const auto* xdg_home = getenv("XDG_CONFIG_HOME");
    if (xdg_home != nullptr && xdg_home[0] != '\0') {
        base = xdg_home;
    } else {
        const auto* home = getenv("HOME");

        base = std::filesystem::path(home != nullptr ? home : ".") / ".config";
    }

    return base / "podlog" / "config.json";
}

void
config::apply_log_level() const
{
    podlog_log_level = this->c_log_level;
}

}  // namespace podlog
