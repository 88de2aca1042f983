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
#include "terminal_session.h"

#include <iostream>

TerminalSession::TerminalSession(const std::string &shell, int cols, int rows,
                                 size_t max_scrollback, const std::string &fallback_shell)
    : buffer(cols, rows, max_scrollback)
{
    try {
        pty = PtySession::open(shell, buffer.get_cols(), buffer.get_rows());
    } catch (const SpawnError &e) {
        if (fallback_shell.empty() || fallback_shell == shell) {
            throw;
        }
        error = e.what();
        std::cerr << error << ", falling back to " << fallback_shell << std::endl;
        pty = PtySession::open(fallback_shell, buffer.get_cols(), buffer.get_rows());
    }
}

void TerminalSession::apply_output()
{
    std::string output = pty->read_available();
    if (!output.empty()) {
        parser.process(output, buffer);
    }
}

std::vector<int> TerminalSession::tick()
{
    if (!ended) {
        apply_output();
    }
    return buffer.take_dirty_rows();
}

bool TerminalSession::write(const std::string &text)
{
    if (ended) {
        return false;
    }
    try {
        pty->write(text);
    } catch (const WriteError &e) {
        std::cerr << e.what() << std::endl;
        return false;
    }
    return true;
}

bool TerminalSession::send_key(KeyCode key)
{
    return write(key_sequence(key));
}

bool TerminalSession::send_input(const KeyInput &key)
{
    std::string input = translate_key(key);
    if (input.empty()) {
        return true;
    }
    return write(input);
}

void TerminalSession::resize(int cols, int rows)
{
    buffer.resize(cols, rows);
    if (ended) {
        return;
    }
    try {
        pty->resize(buffer.get_cols(), buffer.get_rows());
    } catch (const ResizeError &e) {
        std::cerr << e.what() << std::endl;
    }
}

bool TerminalSession::is_alive()
{
    if (ended) {
        return false;
    }
    if (pty->is_alive()) {
        return true;
    }

    // Shell has exited: tear down, then keep its last words.
    pty->close();
    apply_output();
    ended = true;
    return false;
}

void TerminalSession::close()
{
    pty->close();
    ended = true;
}
