//
// Keyboard input of the terminal emulator.
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
#include "key_input.h"

#include <unicode/uchar.h>

#include <cctype>
#include <cstdint>
#include <map>

std::string wchar_to_utf8(wchar_t ch)
{
    std::string utf8;
    uint32_t wc = static_cast<uint32_t>(ch);
    if (wc > 0x10FFFF) {
        // Not a Unicode code point.
        return utf8;
    }
    if (wc <= 0x7F) {
        utf8 += static_cast<char>(wc);
    } else if (wc <= 0x7FF) {
        utf8 += static_cast<char>(0xC0 | ((wc >> 6) & 0x1F));
        utf8 += static_cast<char>(0x80 | (wc & 0x3F));
    } else if (wc <= 0xFFFF) {
        utf8 += static_cast<char>(0xE0 | ((wc >> 12) & 0x0F));
        utf8 += static_cast<char>(0x80 | ((wc >> 6) & 0x3F));
        utf8 += static_cast<char>(0x80 | (wc & 0x3F));
    } else {
        utf8 += static_cast<char>(0xF0 | ((wc >> 18) & 0x07));
        utf8 += static_cast<char>(0x80 | ((wc >> 12) & 0x3F));
        utf8 += static_cast<char>(0x80 | ((wc >> 6) & 0x3F));
        utf8 += static_cast<char>(0x80 | (wc & 0x3F));
    }
    return utf8;
}

std::string key_sequence(KeyCode code)
{
    switch (code) {
    case KeyCode::UNKNOWN:
    case KeyCode::CHARACTER:
        // No input.
        break;
    case KeyCode::ENTER:
        return "\r";
    case KeyCode::BACKSPACE:
        return "\177";
    case KeyCode::TAB:
        return "\t";
    case KeyCode::ESCAPE:
        return "\033";
    case KeyCode::UP:
        return "\033[A";
    case KeyCode::DOWN:
        return "\033[B";
    case KeyCode::RIGHT:
        return "\033[C";
    case KeyCode::LEFT:
        return "\033[D";
    case KeyCode::HOME:
        return "\033[H";
    case KeyCode::END:
        return "\033[F";
    case KeyCode::INSERT:
        return "\033[2~";
    case KeyCode::DELETE:
        return "\033[3~";
    case KeyCode::PAGEUP:
        return "\033[5~";
    case KeyCode::PAGEDOWN:
        return "\033[6~";
    case KeyCode::F1:
        return "\033OP";
    case KeyCode::F2:
        return "\033OQ";
    case KeyCode::F3:
        return "\033OR";
    case KeyCode::F4:
        return "\033OS";
    case KeyCode::F5:
        return "\033[15~";
    case KeyCode::F6:
        return "\033[17~";
    case KeyCode::F7:
        return "\033[18~";
    case KeyCode::F8:
        return "\033[19~";
    case KeyCode::F9:
        return "\033[20~";
    case KeyCode::F10:
        return "\033[21~";
    case KeyCode::F11:
        return "\033[23~";
    case KeyCode::F12:
        return "\033[24~";
    case KeyCode::CTRL_C:
        return "\003";
    case KeyCode::CTRL_D:
        return "\004";
    case KeyCode::CTRL_Z:
        return "\032";
    case KeyCode::CTRL_L:
        return "\014";
    }
    return std::string();
}

std::string translate_key(const KeyInput &key)
{
    if (key.code != KeyCode::CHARACTER) {
        return key_sequence(key.code);
    }

    if (key.mod_ctrl && ((key.character >= '@' && key.character <= '_') ||
                         (key.character >= 'a' && key.character <= 'z'))) {
        //
        // Ctrl modifier is pressed.
        //
        return std::string(1, key.character & 0x1f);
    }
    if (key.mod_ctrl) {
        // No control code for this character: send it as is.
        return wchar_to_utf8(key.character);
    }
    if (key.mod_shift) {
        //
        // Shift modifier is pressed.
        //
        if (key.character <= 0x7f) {
            // ASCII symbol.
            char ch = key.character;
            if (key.character >= 'a' && key.character <= 'z') {
                // Convert ASCII character to uppercase.
                ch = std::toupper(ch);
            } else {
                static const std::map<char, char> shift_map = {
                    { '1', '!' },  { '2', '@' }, { '3', '#' }, { '4', '$' }, { '5', '%' },
                    { '6', '^' },  { '7', '&' }, { '8', '*' }, { '9', '(' }, { '0', ')' },
                    { '-', '_' },  { '=', '+' }, { '[', '{' }, { ']', '}' }, { ';', ':' },
                    { '\'', '"' }, { ',', '<' }, { '.', '>' }, { '/', '?' }, { '`', '~' }
                };
                auto it = shift_map.find(ch);
                if (it != shift_map.end()) {
                    ch = it->second;
                }
            }
            return std::string(1, ch);
        }
        // Convert Unicode character to uppercase.
        return wchar_to_utf8(u_toupper(key.character));
    }
    return wchar_to_utf8(key.character);
}
