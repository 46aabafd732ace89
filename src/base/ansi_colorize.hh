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
 * @file ansi_colorize.hh
 */

#ifndef podlog_ansi_colorize_hh
#define podlog_ansi_colorize_hh

#include <string>

#include "string_fragment.hh"

#define ANSI_CSI       "\x1b["
#define ANSI_CHAR_ATTR "m"
#define ANSI_FG_256    ANSI_CSI "38;5;"
#define ANSI_NORM      ANSI_CSI "0" ANSI_CHAR_ATTR

namespace podlog::ansi {

/**
 * Wrap text in a 256-color foreground escape and a trailing reset.
 *
 * @param text The text to colorize.
 * @param code The xterm 256-color palette index.
 * @return ESC "[38;5;" code "m" text ESC "[0m"
 */
std::string colorize(string_fragment text, int code);

/**
 * Same as colorize(), but append to an existing buffer.
 */
void append_colorized(std::string& dst, string_fragment text, int code);

}  // namespace podlog::ansi

#endif
