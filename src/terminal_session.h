//
// Terminal session: shell, parser and screen buffer together.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#ifndef TERMINAL_SESSION_H
#define TERMINAL_SESSION_H

#include <gtest/gtest_prod.h>

#include <memory>
#include <string>
#include <vector>

#include "escape_parser.h"
#include "key_input.h"
#include "pty_session.h"
#include "screen_buffer.h"

//
// One terminal tab. The host calls tick() once per frame to
// apply pending shell output, then renders get_buffer().
//
class TerminalSession {
public:
    // Throws SpawnError when neither shell nor fallback_shell can be started.
    TerminalSession(const std::string &shell, int cols, int rows,
                    size_t max_scrollback     = ScreenBuffer::default_scrollback,
                    const std::string &fallback_shell = "/bin/sh");

    std::vector<int> tick();
    bool write(const std::string &text);
    bool send_key(KeyCode key);
    bool send_input(const KeyInput &key);
    void resize(int cols, int rows);
    bool is_alive();
    void close();

    const ScreenBuffer &get_buffer() const { return buffer; }
    ScreenSnapshot snapshot() const { return buffer.snapshot(); }
    const std::string &get_shell_name() const { return pty->get_shell_name(); }

    // Diagnostic of a failed shell start, empty if none
    const std::string &get_error() const { return error; }

private:
    FRIEND_TEST(TerminalSessionTest, ExitIsObservedOnce);

    ScreenBuffer buffer;
    EscapeParser parser;
    std::unique_ptr<PtySession> pty;
    std::string error;
    bool ended{};

    void apply_output();
};

#endif // TERMINAL_SESSION_H
