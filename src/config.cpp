//
// Start-up settings of the terminal emulator.
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
#include "config.h"

#include <cstdlib>

Config Config::from_environment()
{
    Config config;
#ifdef __APPLE__
    config.font_path = "/System/Library/Fonts/Menlo.ttc";
#else
    config.font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";
#endif

    const char *shell = std::getenv("SHELL");
    if (shell && *shell) {
        config.shell = shell;
    }
    const char *font = std::getenv("PTYTERM_FONT");
    if (font && *font) {
        config.font_path = font;
    }
    return config;
}

void Config::apply_args(int argc, char *argv[])
{
    if (argc > 1 && argv[1][0] != '\0') {
        shell = argv[1];
    }
}
