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
 * @file log_modifier.cc
 */

#include "log_modifier.hh"

#include "base/podlog_log.hh"
#include "config.h"
#include "log_modifier.zap_pretty.hh"

namespace podlog {

std::shared_ptr<const log_modifier_registry>
log_modifier_registry::builtin()
{
    static const std::shared_ptr<const log_modifier_registry> retval
        = std::make_shared<log_modifier_registry>(with_builtins());

    return retval;
}

log_modifier_registry
log_modifier_registry::with_builtins()
{
    log_modifier_registry retval;

    retval.register_modifier(zap_pretty_modifier::NAME,
                             std::make_shared<zap_pretty_modifier>());

    return retval;
}

log_modifier_registry&
log_modifier_registry::register_modifier(
    const std::string& name, std::shared_ptr<const log_modifier> mod)
{
    require(mod != nullptr);

    log_debug("registering log modifier: %s", name.c_str());
    this->lmr_modifiers[name] = std::move(mod);

    return *this;
}

log_modifier_registry&
log_modifier_registry::register_modifier(const std::string& name,
                                         func_log_modifier::func_t func)
{
    return this->register_modifier(
        name, std::make_shared<func_log_modifier>(std::move(func)));
}

const log_modifier*
log_modifier_registry::find(const std::string& name) const
{
    auto iter = this->lmr_modifiers.find(name);
    if (iter == this->lmr_modifiers.end()) {
        return nullptr;
    }

    return iter->second.get();
}

std::string
log_modifier_registry::apply(const std::string& name, std::string line) const
{
    const auto* mod = this->find(name);
    if (mod == nullptr) {
        log_trace("no log modifier named: %s", name.c_str());
        return line;
    }

    return mod->modify(line);
}

std::vector<std::string>
log_modifier_registry::names() const
{
    std::vector<std::string> retval;

    retval.reserve(this->lmr_modifiers.size());
    for (const auto& pair : this->lmr_modifiers) {
        retval.emplace_back(pair.first);
    }

    return retval;
}

}  // namespace podlog
