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
#ifndef KEY_INPUT_H
#define KEY_INPUT_H

#include <cwchar>
#include <string>

// Device-independent keycodes
enum class KeyCode {
    // clang-format off
    UNKNOWN,
    ENTER,
    BACKSPACE,
    TAB,
    ESCAPE,
    UP, DOWN, RIGHT, LEFT,
    HOME, END,
    INSERT, DELETE,
    PAGEUP, PAGEDOWN,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    CTRL_C, CTRL_D, CTRL_Z, CTRL_L,
    CHARACTER, // For printable characters
    // clang-format on
};

// Structure for key input
struct KeyInput {
    KeyCode code{ KeyCode::UNKNOWN };
    wchar_t character{};
    bool mod_shift{};
    bool mod_ctrl{};

    KeyInput() = default;
    explicit KeyInput(KeyCode c) : code(c) {}
    KeyInput(unsigned c, bool shift, bool ctrl)
        : code(KeyCode::CHARACTER), character(c), mod_shift(shift), mod_ctrl(ctrl) {}
};

//
// Byte sequence sent to the shell for a named key.
// Returns an empty string for CHARACTER and UNKNOWN.
//
std::string key_sequence(KeyCode code);

//
// Translate a key press, applying Shift and Ctrl modifiers
// to printable characters. Result is UTF-8.
//
std::string translate_key(const KeyInput &key);

// Encode one character as UTF-8
std::string wchar_to_utf8(wchar_t wc);

#endif // KEY_INPUT_H
