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
#include "terminal_tabs.h"

#include <iostream>

TerminalSession &TerminalTabs::new_tab()
{
    return new_tab(config.shell);
}

TerminalSession &TerminalTabs::new_tab(const std::string &shell)
{
    std::unique_ptr<TerminalSession> session(new TerminalSession(
        shell, config.cols, config.rows, config.scrollback_lines, config.fallback_shell));
    tabs.push_back(std::move(session));
    active         = tabs.size() - 1;
    active_changed = true;
    return *tabs.back();
}

void TerminalTabs::close_tab(size_t index)
{
    if (index >= tabs.size()) {
        return;
    }
    tabs.erase(tabs.begin() + index);
    if (index < active || active >= tabs.size()) {
        active = active > 0 ? active - 1 : 0;
    }
    active_changed = true;
}

void TerminalTabs::switch_tab(size_t index)
{
    if (index < tabs.size() && index != active) {
        active         = index;
        active_changed = true;
    }
}

std::vector<int> TerminalTabs::tick_all()
{
    std::vector<int> dirty_rows;
    for (size_t i = 0; i < tabs.size(); ++i) {
        auto rows = tabs[i]->tick();
        if (i == active) {
            dirty_rows = rows;
        }
    }

    for (size_t i = tabs.size(); i-- > 0;) {
        if (!tabs[i]->is_alive()) {
            std::cerr << "Shell " << tabs[i]->get_shell_name() << " exited" << std::endl;
            close_tab(i);
        }
    }

    if (active_changed && !tabs.empty()) {
        // Whole screen of the newly shown tab
        active_changed = false;
        tabs[active]->tick();
        dirty_rows.clear();
        for (int r = 0; r < tabs[active]->get_buffer().get_rows(); ++r) {
            dirty_rows.push_back(r);
        }
    }
    return dirty_rows;
}

void TerminalTabs::resize_all(int cols, int rows)
{
    config.cols = cols;
    config.rows = rows;
    for (auto &tab : tabs) {
        tab->resize(cols, rows);
    }
}
