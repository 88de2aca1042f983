//
// Set of terminal sessions shown as tabs.
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
#ifndef TERMINAL_TABS_H
#define TERMINAL_TABS_H

#include <memory>
#include <string>
#include <vector>

#include "config.h"
#include "terminal_session.h"

class TerminalTabs {
public:
    explicit TerminalTabs(const Config &config) : config(config) {}

    // Open a tab with the configured shell, or the given one. Throws SpawnError.
    TerminalSession &new_tab();
    TerminalSession &new_tab(const std::string &shell);

    void close_tab(size_t index);
    void close_current_tab() { close_tab(active); }
    void switch_tab(size_t index);

    TerminalSession *current() { return tabs.empty() ? nullptr : tabs[active].get(); }
    size_t count() const { return tabs.size(); }
    size_t get_active() const { return active; }
    bool empty() const { return tabs.empty(); }

    //
    // Apply pending output of every tab and close the tabs whose
    // shell has exited. Returns rows of the active tab to redraw.
    //
    std::vector<int> tick_all();
    void resize_all(int cols, int rows);

private:
    Config config;
    std::vector<std::unique_ptr<TerminalSession>> tabs;
    size_t active{};
    bool active_changed{};
};

#endif // TERMINAL_TABS_H
