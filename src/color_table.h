//
// Color palette of the terminal emulator.
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
#ifndef COLOR_TABLE_H
#define COLOR_TABLE_H

#include <cstdint>

// 24-bit color
struct RgbColor {
    uint8_t r = 0, g = 0, b = 0;

    bool operator==(const RgbColor &other) const
    {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const RgbColor &other) const { return !(*this == other); }
};

// Colors used when no SGR color is in effect
const RgbColor default_foreground = { 160, 160, 160 }; // Light gray
const RgbColor default_background = { 0, 0, 0 };       // Black

//
// Standard ANSI palette: indices 0-7 are the normal colors,
// indices 8-15 are the bright variants.
//
extern const RgbColor ansi_colors[16];

//
// Map index of the xterm 256-color palette to RGB.
//   0-15    ANSI palette
//   16-231  6x6x6 cube, component c maps to 0 if c == 0, else 55 + 40*c
//   232-255 grayscale ramp, index i maps to 8 + 10*i
//
RgbColor color_256_to_rgb(int index);

#endif // COLOR_TABLE_H
