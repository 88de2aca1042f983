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
#ifndef SCREEN_BUFFER_H
#define SCREEN_BUFFER_H

#include <gtest/gtest_prod.h>

#include <cstddef>
#include <cwchar>
#include <deque>
#include <string>
#include <vector>

#include "color_table.h"

// Structure for character attributes
struct CharAttr {
    RgbColor fg = default_foreground;
    RgbColor bg = default_background;
    bool bold{};
    bool italic{};
    bool underline{};
    bool strikethrough{};
    bool inverse{};

    // Colors to display: inverse swaps them, stored colors stay intact.
    const RgbColor &effective_fg() const { return inverse ? bg : fg; }
    const RgbColor &effective_bg() const { return inverse ? fg : bg; }

    bool operator==(const CharAttr &other) const
    {
        return fg == other.fg && bg == other.bg && bold == other.bold &&
               italic == other.italic && underline == other.underline &&
               strikethrough == other.strikethrough && inverse == other.inverse;
    }
    bool operator!=(const CharAttr &other) const { return !(*this == other); }
};

// Structure for a single character with attributes
struct Char {
    wchar_t ch = L' '; // Use wchar_t for Unicode
    CharAttr attr;

    bool operator==(const Char &other) const { return ch == other.ch && attr == other.attr; }
    bool operator!=(const Char &other) const { return !(*this == other); }
};

// One row of the screen
struct Line {
    std::vector<Char> cells;
    bool wrapped{}; // Continuation of the previous line

    Line() = default;
    explicit Line(int cols) : cells(cols) {}

    // Content with trailing blanks removed
    std::wstring text() const;

    bool operator==(const Line &other) const
    {
        return wrapped == other.wrapped && cells == other.cells;
    }
};

// Cursor position
struct Cursor {
    int row = 0;
    int col = 0;

    bool operator==(const Cursor &other) const { return row == other.row && col == other.col; }
};

// Immutable copy of the visible screen, handed to the renderer
struct ScreenSnapshot {
    int cols = 0;
    int rows = 0;
    std::vector<Line> lines;
    Cursor cursor;
};

//
// Grid of styled cells with cursor, scroll region and scrollback.
// Every line always has exactly get_cols() cells, the grid always has
// get_rows() lines, and the cursor always lies inside the grid.
//
class ScreenBuffer {
public:
    static const size_t default_scrollback = 10000;

    ScreenBuffer(int cols, int rows, size_t max_scrollback = default_scrollback);

    int get_cols() const { return term_cols; }
    int get_rows() const { return term_rows; }
    const Cursor &get_cursor() const { return cursor; }
    int get_scroll_top() const { return scroll_top; }
    int get_scroll_bottom() const { return scroll_bottom; }
    const std::vector<Line> &get_lines() const { return lines; }
    const Line &get_line(int row) const { return lines[row]; }
    const std::deque<Line> &get_scrollback() const { return scrollback; }
    size_t get_max_scrollback() const { return max_scrollback; }
    ScreenSnapshot snapshot() const;

    // Printable characters and C0 controls
    void put(wchar_t ch);
    void newline();
    void index();
    void reverse_index();
    void carriage_return();
    void backspace();
    void tab();

    // Cursor positioning, clamped to the grid
    void set_cursor(int row, int col);
    void move_cursor(int drow, int dcol);
    void save_cursor();
    void restore_cursor();

    // Scrolling within the scroll region
    void scroll_up(int n, bool to_scrollback = true);
    void scroll_down(int n);
    void set_scroll_region(int top, int bottom);
    void reset_scroll_region();

    // Erasing, in terms of the default cell
    void erase_display(int mode);
    void erase_line(int mode);
    void erase_chars(int n);
    void insert_lines(int n);
    void delete_lines(int n);
    void insert_chars(int n);
    void delete_chars(int n);
    void clear_screen();

    // Style applied to subsequent writes
    CharAttr &pending_attr() { return current_attr; }
    const CharAttr &pending_attr() const { return current_attr; }
    void reset_attr() { current_attr = CharAttr(); }

    void reset();
    void resize(int new_cols, int new_rows);

    // Rows modified since the previous call, sorted
    std::vector<int> take_dirty_rows();

private:
    FRIEND_TEST(ScreenBufferTest, PendingWrapKeepsCursorInside);
    FRIEND_TEST(ScreenBufferTest, ScrollbackEviction);
    FRIEND_TEST(ScreenBufferTest, ResizeClampsScrollRegionAndSavedCursor);
    FRIEND_TEST(EscapeParserTest, EscCResetsStateAndClearsScreen);
    FRIEND_TEST(EscapeParserTest, TextBufferInsertion);

    // Terminal state
    int term_cols;
    int term_rows;
    std::vector<Line> lines;
    std::deque<Line> scrollback;
    size_t max_scrollback;
    Cursor cursor;
    Cursor saved_cursor;
    bool has_saved_cursor{};
    bool wrap_pending{};
    int scroll_top{};
    int scroll_bottom;
    CharAttr current_attr;
    std::vector<bool> dirty_lines;

    void mark_dirty(int row);
    void mark_dirty(int first, int last);
    void clear_cells(int row, int first, int last);
    void push_scrollback(Line &&line);
};

#endif // SCREEN_BUFFER_H
