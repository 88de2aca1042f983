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
#ifndef ESCAPE_PARSER_H
#define ESCAPE_PARSER_H

#include <gtest/gtest_prod.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "screen_buffer.h"

// ANSI parsing states
enum class AnsiState {
    NORMAL,
    ESCAPE,
    ESCAPE_INTERMEDIATE,
    CSI_ENTRY,
    CSI_PARAM,
    CSI_INTERMEDIATE,
    CSI_IGNORE,
    OSC_STRING,    // Terminated by BEL or ST
    DCS_STRING,    // Terminated by ST
    IGNORE_STRING, // SOS, PM, APC: terminated by ST
};

//
// Incremental parser of the VT500 escape sequence grammar.
// State persists between calls to process(), so a sequence
// may be split at any byte boundary.
//
class EscapeParser {
public:
    void process(const char *data, size_t length, ScreenBuffer &buffer);
    void process(const std::string &data, ScreenBuffer &buffer)
    {
        process(data.data(), data.size(), buffer);
    }
    void reset();
    AnsiState get_state() const { return state; }

private:
    FRIEND_TEST(EscapeParserTest, ParamsSaturate);
    FRIEND_TEST(EscapeParserTest, Utf8SplitAcrossCalls);

    static const size_t max_params = 32;
    static const int max_param_value = 65535;

    AnsiState state{ AnsiState::NORMAL };

    // CSI sequence being collected
    std::vector<int> params;
    int current_param{};
    bool param_started{};
    char private_marker{};

    // ESC seen inside a control string, may start ST
    bool string_escape{};

    // UTF-8 decoder
    uint32_t utf8_char{};
    int utf8_remaining{};
    uint32_t utf8_min{};

    void advance(unsigned char c, ScreenBuffer &buffer);
    void advance_normal(unsigned char c, ScreenBuffer &buffer);
    void execute(unsigned char c, ScreenBuffer &buffer);
    void clear_sequence();
    void finish_param();
    int get_param(size_t index, int default_value) const;

    void esc_dispatch(unsigned char final_char, ScreenBuffer &buffer);
    void csi_dispatch(unsigned char final_char, ScreenBuffer &buffer);
    void handle_sgr(ScreenBuffer &buffer);
    void parse_extended_color(size_t &i, RgbColor &color) const;
};

#endif // ESCAPE_PARSER_H
