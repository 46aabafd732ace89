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
 * @file log_modifier.hh
 */

#ifndef podlog_log_modifier_hh
#define podlog_log_modifier_hh

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "base/string_fragment.hh"

namespace podlog {

/**
 * A post-processing step applied to a fully assembled display line, for
 * example a reformatter for structured JSON logs.  Implementations must not
 * fail: if the line cannot be handled, it is returned unchanged.
 */
class log_modifier {
public:
    virtual ~log_modifier() = default;

    virtual std::string modify(string_fragment line) const = 0;
};

/**
 * Adapter for modifiers written as a plain function.
 */
class func_log_modifier : public log_modifier {
public:
    using func_t = std::function<std::string(string_fragment)>;

    explicit func_log_modifier(func_t func) : flm_func(std::move(func)) {}

    std::string modify(string_fragment line) const override
    {
        return this->flm_func(line);
    }

private:
    func_t flm_func;
};

/**
 * Maps modifier names to implementations.  The registry is filled in while
 * it is being built and then shared read-only, usually through a
 * std::shared_ptr<const log_modifier_registry>.
 */
class log_modifier_registry {
public:
    /**
     * @return The registry with the modifiers shipped with the library,
     *   currently "zap-pretty".
     */
    static std::shared_ptr<const log_modifier_registry> builtin();

    /**
     * @return An empty registry with the built-in modifiers added to it, for
     *   callers that want to register their own on top.
     */
    static log_modifier_registry with_builtins();

    /**
     * Add a modifier, replacing any previous one with the same name.
     */
    log_modifier_registry& register_modifier(
        const std::string& name, std::shared_ptr<const log_modifier> mod);

    log_modifier_registry& register_modifier(const std::string& name,
                                             func_log_modifier::func_t func);

    const log_modifier* find(const std::string& name) const;

    /**
     * Run the named modifier over the line.  A name with no modifier
     * registered under it leaves the line as it is.
     */
    std::string apply(const std::string& name, std::string line) const;

    /**
     * @return The registered names in sorted order.
     */
    std::vector<std::string> names() const;

    size_t size() const { return this->lmr_modifiers.size(); }

private:
    std::map<std::string, std::shared_ptr<const log_modifier>> lmr_modifiers;
};

}  // namespace podlog

#endif
