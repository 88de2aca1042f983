//
// Screen buffer of the terminal emulator.
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
#include "screen_buffer.h"

#include <algorithm>
#include <utility>

const size_t ScreenBuffer::default_scrollback;

std::wstring Line::text() const
{
    std::wstring result;
    for (const auto &c : cells) {
        result += c.ch;
    }
    size_t end = result.find_last_not_of(L' ');
    result.erase(end == std::wstring::npos ? 0 : end + 1);
    return result;
}

ScreenBuffer::ScreenBuffer(int cols, int rows, size_t max_scrollback)
    : term_cols(std::max(cols, 1)), term_rows(std::max(rows, 1)), max_scrollback(max_scrollback)
{
    lines.resize(term_rows, Line(term_cols));
    scroll_bottom = term_rows - 1;
    dirty_lines.resize(term_rows, true);
}

ScreenSnapshot ScreenBuffer::snapshot() const
{
    ScreenSnapshot snap;
    snap.cols   = term_cols;
    snap.rows   = term_rows;
    snap.lines  = lines;
    snap.cursor = cursor;
    return snap;
}

void ScreenBuffer::put(wchar_t ch)
{
    if (wrap_pending) {
        // Previous character filled the last column.
        wrap_pending = false;
        bool advanced = true;
        if (cursor.row == scroll_bottom) {
            scroll_up(1);
        } else if (cursor.row < term_rows - 1) {
            cursor.row++;
        } else {
            advanced = false;
        }
        cursor.col = 0;
        if (advanced) {
            lines[cursor.row].wrapped = true;
        }
    }

    lines[cursor.row].cells[cursor.col] = { ch, current_attr };
    mark_dirty(cursor.row);

    if (cursor.col == term_cols - 1) {
        wrap_pending = true;
    } else {
        cursor.col++;
    }
}

void ScreenBuffer::newline()
{
    carriage_return();
    index();
}

void ScreenBuffer::index()
{
    wrap_pending = false;
    if (cursor.row == scroll_bottom) {
        scroll_up(1);
    } else if (cursor.row < term_rows - 1) {
        cursor.row++;
    }
    // Text that follows starts a new logical line.
    lines[cursor.row].wrapped = false;
}

void ScreenBuffer::reverse_index()
{
    wrap_pending = false;
    if (cursor.row == scroll_top) {
        scroll_down(1);
    } else if (cursor.row > 0) {
        cursor.row--;
    }
}

void ScreenBuffer::carriage_return()
{
    cursor.col   = 0;
    wrap_pending = false;
}

void ScreenBuffer::backspace()
{
    if (cursor.col > 0) {
        cursor.col--;
    }
    wrap_pending = false;
}

void ScreenBuffer::tab()
{
    cursor.col   = std::min((cursor.col / 8 + 1) * 8, term_cols - 1);
    wrap_pending = false;
}

void ScreenBuffer::set_cursor(int row, int col)
{
    cursor.row   = std::max(0, std::min(row, term_rows - 1));
    cursor.col   = std::max(0, std::min(col, term_cols - 1));
    wrap_pending = false;
}

void ScreenBuffer::move_cursor(int drow, int dcol)
{
    set_cursor(cursor.row + drow, cursor.col + dcol);
}

void ScreenBuffer::save_cursor()
{
    saved_cursor     = cursor;
    has_saved_cursor = true;
}

void ScreenBuffer::restore_cursor()
{
    if (has_saved_cursor) {
        set_cursor(saved_cursor.row, saved_cursor.col);
    } else {
        set_cursor(0, 0);
    }
}

void ScreenBuffer::scroll_up(int n, bool to_scrollback)
{
    int height = scroll_bottom - scroll_top + 1;
    n          = std::min(n, height);
    if (n <= 0) {
        return;
    }

    auto first = lines.begin() + scroll_top;
    auto last  = lines.begin() + scroll_bottom + 1;
    if (to_scrollback) {
        for (int i = 0; i < n; ++i) {
            push_scrollback(std::move(first[i]));
        }
    }
    std::rotate(first, first + n, last);
    for (int r = scroll_bottom - n + 1; r <= scroll_bottom; ++r) {
        lines[r] = Line(term_cols);
    }
    mark_dirty(scroll_top, scroll_bottom);
}

void ScreenBuffer::scroll_down(int n)
{
    int height = scroll_bottom - scroll_top + 1;
    n          = std::min(n, height);
    if (n <= 0) {
        return;
    }

    auto first = lines.begin() + scroll_top;
    auto last  = lines.begin() + scroll_bottom + 1;
    std::rotate(first, last - n, last);
    for (int r = scroll_top; r < scroll_top + n; ++r) {
        lines[r] = Line(term_cols);
    }
    mark_dirty(scroll_top, scroll_bottom);
}

void ScreenBuffer::set_scroll_region(int top, int bottom)
{
    top    = std::max(0, std::min(top, term_rows - 1));
    bottom = std::max(0, std::min(bottom, term_rows - 1));
    if (top >= bottom) {
        return;
    }
    scroll_top    = top;
    scroll_bottom = bottom;
}

void ScreenBuffer::reset_scroll_region()
{
    scroll_top    = 0;
    scroll_bottom = term_rows - 1;
}

void ScreenBuffer::erase_display(int mode)
{
    switch (mode) {
    case 0:
        // Clear from cursor to end of screen
        clear_cells(cursor.row, cursor.col, term_cols - 1);
        lines[cursor.row].wrapped = false;
        for (int r = cursor.row + 1; r < term_rows; ++r) {
            lines[r] = Line(term_cols);
        }
        mark_dirty(cursor.row, term_rows - 1);
        break;
    case 1:
        // Clear from start of screen to cursor
        for (int r = 0; r < cursor.row; ++r) {
            lines[r] = Line(term_cols);
        }
        clear_cells(cursor.row, 0, cursor.col);
        mark_dirty(0, cursor.row);
        break;
    case 2:
    case 3:
        clear_screen();
        break;
    }
}

void ScreenBuffer::erase_line(int mode)
{
    switch (mode) {
    case 0:
        clear_cells(cursor.row, cursor.col, term_cols - 1);
        lines[cursor.row].wrapped = false;
        break;
    case 1:
        clear_cells(cursor.row, 0, cursor.col);
        break;
    case 2:
        lines[cursor.row] = Line(term_cols);
        mark_dirty(cursor.row);
        break;
    }
}

void ScreenBuffer::erase_chars(int n)
{
    n = std::max(n, 1);
    clear_cells(cursor.row, cursor.col, std::min(cursor.col + n, term_cols) - 1);
}

void ScreenBuffer::insert_lines(int n)
{
    if (cursor.row < scroll_top || cursor.row > scroll_bottom) {
        return;
    }
    n = std::min(std::max(n, 1), scroll_bottom - cursor.row + 1);

    auto first = lines.begin() + cursor.row;
    auto last  = lines.begin() + scroll_bottom + 1;
    std::rotate(first, last - n, last);
    for (int r = cursor.row; r < cursor.row + n; ++r) {
        lines[r] = Line(term_cols);
    }
    wrap_pending = false;
    mark_dirty(cursor.row, scroll_bottom);
}

void ScreenBuffer::delete_lines(int n)
{
    if (cursor.row < scroll_top || cursor.row > scroll_bottom) {
        return;
    }
    n = std::min(std::max(n, 1), scroll_bottom - cursor.row + 1);

    auto first = lines.begin() + cursor.row;
    auto last  = lines.begin() + scroll_bottom + 1;
    std::rotate(first, first + n, last);
    for (int r = scroll_bottom - n + 1; r <= scroll_bottom; ++r) {
        lines[r] = Line(term_cols);
    }
    wrap_pending = false;
    mark_dirty(cursor.row, scroll_bottom);
}

void ScreenBuffer::insert_chars(int n)
{
    auto &cells = lines[cursor.row].cells;
    n           = std::min(std::max(n, 1), term_cols - cursor.col);

    std::rotate(cells.begin() + cursor.col, cells.end() - n, cells.end());
    std::fill(cells.begin() + cursor.col, cells.begin() + cursor.col + n, Char());
    wrap_pending = false;
    mark_dirty(cursor.row);
}

void ScreenBuffer::delete_chars(int n)
{
    auto &cells = lines[cursor.row].cells;
    n           = std::min(std::max(n, 1), term_cols - cursor.col);

    std::rotate(cells.begin() + cursor.col, cells.begin() + cursor.col + n, cells.end());
    std::fill(cells.end() - n, cells.end(), Char());
    wrap_pending = false;
    mark_dirty(cursor.row);
}

void ScreenBuffer::clear_screen()
{
    for (auto &line : lines) {
        line = Line(term_cols);
    }
    mark_dirty(0, term_rows - 1);
}

void ScreenBuffer::reset()
{
    clear_screen();
    set_cursor(0, 0);
    reset_attr();
    reset_scroll_region();
    has_saved_cursor = false;
}

void ScreenBuffer::resize(int new_cols, int new_rows)
{
    new_cols = std::max(new_cols, 1);
    new_rows = std::max(new_rows, 1);

    bool full_region = scroll_top == 0 && scroll_bottom == term_rows - 1;

    // No reflow: lines are cut or padded in place.
    for (auto &line : lines) {
        line.cells.resize(new_cols);
    }
    for (auto &line : scrollback) {
        line.cells.resize(new_cols);
    }
    lines.resize(new_rows, Line(new_cols));
    term_cols = new_cols;
    term_rows = new_rows;

    if (full_region) {
        reset_scroll_region();
    } else {
        scroll_bottom = std::min(scroll_bottom, term_rows - 1);
        scroll_top    = std::min(scroll_top, scroll_bottom);
    }

    set_cursor(cursor.row, cursor.col);
    saved_cursor.row = std::min(saved_cursor.row, term_rows - 1);
    saved_cursor.col = std::min(saved_cursor.col, term_cols - 1);
    dirty_lines.assign(term_rows, true);
}

std::vector<int> ScreenBuffer::take_dirty_rows()
{
    std::vector<int> rows;
    for (int r = 0; r < term_rows; ++r) {
        if (dirty_lines[r]) {
            rows.push_back(r);
            dirty_lines[r] = false;
        }
    }
    return rows;
}

void ScreenBuffer::mark_dirty(int row)
{
    if (row >= 0 && row < term_rows) {
        dirty_lines[row] = true;
    }
}

void ScreenBuffer::mark_dirty(int first, int last)
{
    for (int r = first; r <= last; ++r) {
        mark_dirty(r);
    }
}

void ScreenBuffer::clear_cells(int row, int first, int last)
{
    auto &cells = lines[row].cells;
    for (int c = first; c <= last; ++c) {
        cells[c] = Char();
    }
    mark_dirty(row);
}

void ScreenBuffer::push_scrollback(Line &&line)
{
    if (max_scrollback == 0) {
        return;
    }
    scrollback.push_back(std::move(line));
    while (scrollback.size() > max_scrollback) {
        scrollback.pop_front();
    }
}
