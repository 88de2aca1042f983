//
// ANSI escape sequence parser of the terminal emulator.
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
#include "escape_parser.h"

#include <algorithm>

const size_t EscapeParser::max_params;
const int EscapeParser::max_param_value;

void EscapeParser::process(const char *data, size_t length, ScreenBuffer &buffer)
{
    for (size_t i = 0; i < length; ++i) {
        advance(static_cast<unsigned char>(data[i]), buffer);
    }
}

void EscapeParser::reset()
{
    state = AnsiState::NORMAL;
    clear_sequence();
    string_escape  = false;
    utf8_remaining = 0;
}

void EscapeParser::clear_sequence()
{
    params.clear();
    current_param  = 0;
    param_started  = false;
    private_marker = 0;
}

void EscapeParser::finish_param()
{
    if (params.size() < max_params) {
        params.push_back(current_param);
    }
    current_param = 0;
}

int EscapeParser::get_param(size_t index, int default_value) const
{
    // Missing or zero parameter selects the default.
    if (params.size() > index && params[index] != 0) {
        return params[index];
    }
    return default_value;
}

void EscapeParser::advance(unsigned char c, ScreenBuffer &buffer)
{
    bool in_string = state == AnsiState::OSC_STRING || state == AnsiState::DCS_STRING ||
                     state == AnsiState::IGNORE_STRING;

    if (in_string && string_escape) {
        string_escape = false;
        if (c == '\\') {
            // String Terminator
            state = AnsiState::NORMAL;
            return;
        }
        // The string was cut short by a new escape sequence.
        state = AnsiState::ESCAPE;
        clear_sequence();
        in_string = false;
    }

    // Transitions valid from any state
    switch (c) {
    case 0x18: // CAN
    case 0x1a: // SUB
        state          = AnsiState::NORMAL;
        utf8_remaining = 0;
        return;
    case 0x1b: // ESC
        if (in_string) {
            string_escape = true;
        } else {
            state          = AnsiState::ESCAPE;
            utf8_remaining = 0;
            clear_sequence();
        }
        return;
    }

    if (c >= 0x80 && !in_string && state != AnsiState::NORMAL) {
        // Not part of any escape sequence: abandon it.
        state = AnsiState::NORMAL;
    }

    switch (state) {
    case AnsiState::NORMAL:
        advance_normal(c, buffer);
        break;

    case AnsiState::ESCAPE:
        if (c < 0x20) {
            execute(c, buffer);
        } else if (c == '[') {
            state = AnsiState::CSI_ENTRY;
            clear_sequence();
        } else if (c == ']') {
            state = AnsiState::OSC_STRING;
        } else if (c == 'P') {
            state = AnsiState::DCS_STRING;
        } else if (c == 'X' || c == '^' || c == '_') {
            state = AnsiState::IGNORE_STRING;
        } else if (c < 0x30) {
            state = AnsiState::ESCAPE_INTERMEDIATE;
        } else if (c < 0x7f) {
            state = AnsiState::NORMAL;
            esc_dispatch(c, buffer);
        }
        break;

    case AnsiState::ESCAPE_INTERMEDIATE:
        if (c < 0x20) {
            execute(c, buffer);
        } else if (c >= 0x30 && c < 0x7f) {
            // Charset designation and the like: nothing to do.
            state = AnsiState::NORMAL;
        }
        break;

    case AnsiState::CSI_ENTRY:
    case AnsiState::CSI_PARAM:
        if (c < 0x20) {
            execute(c, buffer);
        } else if (c >= '0' && c <= '9') {
            current_param = std::min(current_param * 10 + (c - '0'), max_param_value);
            param_started = true;
            state         = AnsiState::CSI_PARAM;
        } else if (c == ';' || c == ':') {
            finish_param();
            param_started = true;
            state         = AnsiState::CSI_PARAM;
        } else if (c >= '<' && c <= '?') {
            if (state == AnsiState::CSI_ENTRY) {
                private_marker = c;
                state          = AnsiState::CSI_PARAM;
            } else {
                state = AnsiState::CSI_IGNORE;
            }
        } else if (c < 0x30) {
            state = AnsiState::CSI_INTERMEDIATE;
        } else if (c < 0x7f) {
            state = AnsiState::NORMAL;
            csi_dispatch(c, buffer);
        }
        break;

    case AnsiState::CSI_INTERMEDIATE:
        if (c < 0x20) {
            execute(c, buffer);
        } else if (c >= 0x30 && c < 0x40) {
            state = AnsiState::CSI_IGNORE;
        } else if (c >= 0x40 && c < 0x7f) {
            // Sequences with intermediates are not supported.
            state = AnsiState::NORMAL;
        }
        break;

    case AnsiState::CSI_IGNORE:
        if (c < 0x20) {
            execute(c, buffer);
        } else if (c >= 0x40 && c < 0x7f) {
            state = AnsiState::NORMAL;
        }
        break;

    case AnsiState::OSC_STRING:
        if (c == 0x07) {
            state = AnsiState::NORMAL;
        }
        break;

    case AnsiState::DCS_STRING:
    case AnsiState::IGNORE_STRING:
        break;
    }
}

void EscapeParser::advance_normal(unsigned char c, ScreenBuffer &buffer)
{
    if (utf8_remaining > 0) {
        if ((c & 0xc0) == 0x80) {
            utf8_char = (utf8_char << 6) | (c & 0x3f);
            if (--utf8_remaining == 0 && utf8_char >= utf8_min && utf8_char <= 0x10ffff &&
                (utf8_char < 0xd800 || utf8_char > 0xdfff)) {
                buffer.put(static_cast<wchar_t>(utf8_char));
            }
            return;
        }
        // Truncated sequence: drop it and look at this byte afresh.
        utf8_remaining = 0;
    }

    if (c < 0x20) {
        execute(c, buffer);
    } else if (c < 0x7f) {
        buffer.put(static_cast<wchar_t>(c));
    } else if (c >= 0xc2 && c <= 0xdf) { // 2-byte
        utf8_char      = c & 0x1f;
        utf8_remaining = 1;
        utf8_min       = 0x80;
    } else if (c >= 0xe0 && c <= 0xef) { // 3-byte
        utf8_char      = c & 0x0f;
        utf8_remaining = 2;
        utf8_min       = 0x800;
    } else if (c >= 0xf0 && c <= 0xf4) { // 4-byte
        utf8_char      = c & 0x07;
        utf8_remaining = 3;
        utf8_min       = 0x10000;
    }
    // DEL, stray continuation bytes and invalid leads are skipped.
}

void EscapeParser::execute(unsigned char c, ScreenBuffer &buffer)
{
    switch (c) {
    case '\a':
        break;
    case '\b':
        buffer.backspace();
        break;
    case '\t':
        buffer.tab();
        break;
    case '\n':
    case '\v':
    case '\f':
        buffer.newline();
        break;
    case '\r':
        buffer.carriage_return();
        break;
    }
}

void EscapeParser::esc_dispatch(unsigned char final_char, ScreenBuffer &buffer)
{
    switch (final_char) {
    case '7': // DECSC
        buffer.save_cursor();
        break;
    case '8': // DECRC
        buffer.restore_cursor();
        break;
    case 'D': // IND
        buffer.index();
        break;
    case 'E': // NEL
        buffer.index();
        buffer.carriage_return();
        break;
    case 'M': // RI
        buffer.reverse_index();
        break;
    case 'c': // RIS
        reset();
        buffer.reset();
        break;
    }
}

void EscapeParser::csi_dispatch(unsigned char final_char, ScreenBuffer &buffer)
{
    if (param_started) {
        finish_param();
    }
    if (private_marker != 0) {
        // DECSET, DECRST and other private sequences are consumed.
        return;
    }

    const Cursor &cursor = buffer.get_cursor();
    int n                = get_param(0, 1);

    switch (final_char) {
    case 'A':
        buffer.move_cursor(-n, 0);
        break;
    case 'B':
        buffer.move_cursor(n, 0);
        break;
    case 'C':
        buffer.move_cursor(0, n);
        break;
    case 'D':
        buffer.move_cursor(0, -n);
        break;
    case 'E':
        buffer.move_cursor(n, 0);
        buffer.carriage_return();
        break;
    case 'F':
        buffer.move_cursor(-n, 0);
        buffer.carriage_return();
        break;
    case 'G':
    case '`':
        buffer.set_cursor(cursor.row, n - 1);
        break;
    case 'd':
        buffer.set_cursor(n - 1, cursor.col);
        break;
    case 'H':
    case 'f':
        buffer.set_cursor(get_param(0, 1) - 1, get_param(1, 1) - 1);
        break;
    case 'J':
        buffer.erase_display(get_param(0, 0));
        break;
    case 'K':
        buffer.erase_line(get_param(0, 0));
        break;
    case 'L':
        buffer.insert_lines(n);
        break;
    case 'M':
        buffer.delete_lines(n);
        break;
    case 'X':
        buffer.erase_chars(n);
        break;
    case '@':
        buffer.insert_chars(n);
        break;
    case 'P':
        buffer.delete_chars(n);
        break;
    case 'S':
        // Scrolled-off lines are not archived on this path.
        buffer.scroll_up(n, false);
        break;
    case 'T':
        buffer.scroll_down(n);
        break;
    case 'm':
        handle_sgr(buffer);
        break;
    case 's':
        buffer.save_cursor();
        break;
    case 'u':
        buffer.restore_cursor();
        break;
    case 'r':
        if (params.empty()) {
            buffer.reset_scroll_region();
        } else {
            buffer.set_scroll_region(get_param(0, 1) - 1, get_param(1, buffer.get_rows()) - 1);
        }
        break;
    }
}

void EscapeParser::handle_sgr(ScreenBuffer &buffer)
{
    CharAttr &attr = buffer.pending_attr();

    if (params.empty()) {
        attr = CharAttr();
        return;
    }
    for (size_t i = 0; i < params.size(); ++i) {
        int p = params[i];
        if (p == 0) {
            attr = CharAttr();
        } else if (p == 1) {
            attr.bold = true;
        } else if (p == 3) {
            attr.italic = true;
        } else if (p == 4) {
            attr.underline = true;
        } else if (p == 7) {
            attr.inverse = true;
        } else if (p == 9) {
            attr.strikethrough = true;
        } else if (p == 22) {
            attr.bold = false;
        } else if (p == 23) {
            attr.italic = false;
        } else if (p == 24) {
            attr.underline = false;
        } else if (p == 27) {
            attr.inverse = false;
        } else if (p == 29) {
            attr.strikethrough = false;
        } else if (p >= 30 && p <= 37) {
            attr.fg = ansi_colors[p - 30];
        } else if (p == 38) {
            parse_extended_color(i, attr.fg);
        } else if (p == 39) {
            attr.fg = default_foreground;
        } else if (p >= 40 && p <= 47) {
            attr.bg = ansi_colors[p - 40];
        } else if (p == 48) {
            parse_extended_color(i, attr.bg);
        } else if (p == 49) {
            attr.bg = default_background;
        } else if (p >= 90 && p <= 97) {
            attr.fg = ansi_colors[p - 90 + 8];
        } else if (p >= 100 && p <= 107) {
            attr.bg = ansi_colors[p - 100 + 8];
        }
    }
}

//
// Parse 38;5;n or 38;2;r;g;b (and the 48 forms) starting at params[i].
// On success advance i past the consumed parameters, otherwise leave
// the color unchanged.
//
void EscapeParser::parse_extended_color(size_t &i, RgbColor &color) const
{
    if (i + 1 >= params.size()) {
        return;
    }
    switch (params[i + 1]) {
    case 5:
        if (i + 2 < params.size() && params[i + 2] <= 255) {
            color = color_256_to_rgb(params[i + 2]);
            i += 2;
        }
        break;
    case 2:
        if (i + 4 < params.size()) {
            color.r = static_cast<uint8_t>(std::min(params[i + 2], 255));
            color.g = static_cast<uint8_t>(std::min(params[i + 3], 255));
            color.b = static_cast<uint8_t>(std::min(params[i + 4], 255));
            i += 4;
        }
        break;
    }
}
