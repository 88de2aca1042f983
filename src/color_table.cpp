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
#include "color_table.h"

const RgbColor ansi_colors[16] = {
    { 0, 0, 0 },       // Black
    { 205, 49, 49 },   // Red
    { 13, 188, 121 },  // Green
    { 229, 229, 16 },  // Yellow
    { 36, 114, 200 },  // Blue
    { 188, 63, 188 },  // Magenta
    { 17, 168, 205 },  // Cyan
    { 229, 229, 229 }, // White
    { 102, 102, 102 }, // Bright Black (Gray)
    { 241, 76, 76 },   // Bright Red
    { 35, 209, 139 },  // Bright Green
    { 245, 245, 67 },  // Bright Yellow
    { 59, 142, 234 },  // Bright Blue
    { 214, 112, 214 }, // Bright Magenta
    { 41, 184, 219 },  // Bright Cyan
    { 255, 255, 255 }, // Bright White
};

static uint8_t cube_component(int c)
{
    return c == 0 ? 0 : 55 + 40 * c;
}

RgbColor color_256_to_rgb(int index)
{
    if (index < 0 || index > 255) {
        return default_foreground;
    }
    if (index < 16) {
        return ansi_colors[index];
    }
    if (index < 232) {
        int i = index - 16;
        return { cube_component(i / 36 % 6), cube_component(i / 6 % 6), cube_component(i % 6) };
    }
    uint8_t gray = 8 + 10 * (index - 232);
    return { gray, gray, gray };
}
