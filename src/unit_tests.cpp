//
// Unit tests for the escape parser and screen buffer.
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
#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

#include "color_table.h"
#include "escape_parser.h"
#include "key_input.h"
#include "screen_buffer.h"

// Test fixture for EscapeParser driving a ScreenBuffer
class EscapeParserTest : public ::testing::Test {
protected:
    ScreenBuffer buffer{ 80, 24 };
    EscapeParser parser;

    void feed(const std::string &input) { parser.process(input, buffer); }

    std::wstring row_text(int row) const { return buffer.get_line(row).text(); }

    // Fill the whole screen with one character
    void fill_screen(wchar_t ch)
    {
        for (int r = 0; r < buffer.get_rows(); ++r) {
            buffer.set_cursor(r, 0);
            for (int c = 0; c < buffer.get_cols(); ++c) {
                buffer.put(ch);
            }
        }
    }

    // Put letters a, b, c... at the start of the rows
    void label_rows()
    {
        for (int r = 0; r < buffer.get_rows(); ++r) {
            buffer.set_cursor(r, 0);
            buffer.put(static_cast<wchar_t>(L'a' + r));
        }
    }

    static std::vector<int> all_rows(int rows)
    {
        std::vector<int> result;
        for (int r = 0; r < rows; ++r) {
            result.push_back(r);
        }
        return result;
    }
};

// Test ESC c (reset and clear screen)
TEST_F(EscapeParserTest, EscCResetsStateAndClearsScreen)
{
    buffer.current_attr.fg    = { 255, 0, 0 }; // Red foreground
    buffer.cursor             = { 5, 10 };
    buffer.lines[5].cells[10] = { L'x', buffer.current_attr };
    buffer.set_scroll_region(2, 10);
    buffer.take_dirty_rows();

    feed("\033c");

    EXPECT_TRUE(buffer.pending_attr() == CharAttr());
    EXPECT_EQ(buffer.cursor.row, 0);
    EXPECT_EQ(buffer.cursor.col, 0);
    EXPECT_EQ(buffer.get_scroll_top(), 0);
    EXPECT_EQ(buffer.get_scroll_bottom(), 23);
    for (int r = 0; r < buffer.get_rows(); ++r) {
        for (int c = 0; c < buffer.get_cols(); ++c) {
            EXPECT_EQ(buffer.lines[r].cells[c].ch, L' ');
        }
    }
    EXPECT_EQ(buffer.take_dirty_rows(), all_rows(24));
    EXPECT_EQ(parser.get_state(), AnsiState::NORMAL);
}

// Test ESC [ K (erase in line)
TEST_F(EscapeParserTest, EscKClearsLine)
{
    fill_screen(L'x');

    // Test mode 0: clear from cursor to end
    buffer.set_cursor(5, 10);
    buffer.take_dirty_rows();
    feed("\033[0K");
    EXPECT_EQ(row_text(5), std::wstring(10, L'x'));
    EXPECT_EQ(buffer.take_dirty_rows(), std::vector<int>({ 5 }));

    // Test mode 1: clear from start to cursor
    fill_screen(L'x');
    buffer.set_cursor(5, 10);
    buffer.take_dirty_rows();
    feed("\033[1K");
    for (int c = 0; c <= 10; ++c) {
        EXPECT_EQ(buffer.get_line(5).cells[c].ch, L' ');
    }
    for (int c = 11; c < buffer.get_cols(); ++c) {
        EXPECT_EQ(buffer.get_line(5).cells[c].ch, L'x');
    }
    EXPECT_EQ(buffer.take_dirty_rows(), std::vector<int>({ 5 }));

    // Test mode 2: clear entire line
    fill_screen(L'x');
    buffer.set_cursor(5, 10);
    buffer.take_dirty_rows();
    feed("\033[2K");
    EXPECT_EQ(row_text(5), L"");
    EXPECT_EQ(row_text(4), std::wstring(80, L'x'));
    EXPECT_EQ(buffer.take_dirty_rows(), std::vector<int>({ 5 }));

    // Cursor stays
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 5, 10 }));
}

// Test ESC [ m (SGR)
TEST_F(EscapeParserTest, EscMSetsColors)
{
    buffer.take_dirty_rows();

    feed("\033[31m"); // Red foreground
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 205, 49, 49 }));
    EXPECT_TRUE(buffer.take_dirty_rows().empty());

    feed("\033[41m"); // Red background
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 205, 49, 49 }));
    EXPECT_EQ(buffer.pending_attr().bg, (RgbColor{ 205, 49, 49 }));

    feed("\033[0m"); // Reset
    EXPECT_EQ(buffer.pending_attr().fg, default_foreground);
    EXPECT_EQ(buffer.pending_attr().bg, default_background);

    feed("\033[92;104m"); // Bright colors
    EXPECT_EQ(buffer.pending_attr().fg, ansi_colors[10]);
    EXPECT_EQ(buffer.pending_attr().bg, ansi_colors[12]);

    feed("\033[39;49m"); // Default colors
    EXPECT_EQ(buffer.pending_attr().fg, default_foreground);
    EXPECT_EQ(buffer.pending_attr().bg, default_background);
    EXPECT_TRUE(buffer.take_dirty_rows().empty());
}

TEST_F(EscapeParserTest, ExtendedColors)
{
    feed("\033[38;5;196m");
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 255, 0, 0 }));

    feed("\033[48;5;232m");
    EXPECT_EQ(buffer.pending_attr().bg, (RgbColor{ 8, 8, 8 }));

    feed("\033[38;2;1;2;3m");
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 1, 2, 3 }));

    feed("\033[48;2;10;300;30;1m"); // Components clamp, trailing bold applies
    EXPECT_EQ(buffer.pending_attr().bg, (RgbColor{ 10, 255, 30 }));
    EXPECT_TRUE(buffer.pending_attr().bold);

    // Incomplete and out-of-range forms leave the color alone
    feed("\033[38;5m");
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 1, 2, 3 }));
    feed("\033[38;5;300m");
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 1, 2, 3 }));
    feed("\033[38;2;1;2m");
    EXPECT_EQ(buffer.pending_attr().fg, (RgbColor{ 1, 2, 3 }));
}

TEST_F(EscapeParserTest, TextAttributes)
{
    feed("\033[1;3;4;7;9m");
    EXPECT_TRUE(buffer.pending_attr().bold);
    EXPECT_TRUE(buffer.pending_attr().italic);
    EXPECT_TRUE(buffer.pending_attr().underline);
    EXPECT_TRUE(buffer.pending_attr().inverse);
    EXPECT_TRUE(buffer.pending_attr().strikethrough);

    feed("\033[2m"); // Faint is not supported
    EXPECT_TRUE(buffer.pending_attr().bold);

    feed("\033[22;23;24;27;29m");
    EXPECT_TRUE(buffer.pending_attr() == CharAttr());

    feed("\033[1;31m\033[m"); // No parameters means reset
    EXPECT_TRUE(buffer.pending_attr() == CharAttr());
}

TEST_F(EscapeParserTest, InverseSwapsEffectiveColors)
{
    feed("\033[31;7mX");
    const CharAttr &attr = buffer.get_line(0).cells[0].attr;
    EXPECT_EQ(attr.fg, ansi_colors[1]);
    EXPECT_TRUE(attr.inverse);
    EXPECT_EQ(attr.effective_fg(), default_background);
    EXPECT_EQ(attr.effective_bg(), ansi_colors[1]);
}

TEST_F(EscapeParserTest, RedTextThenReset)
{
    feed("\033[31mR\033[0mN");
    EXPECT_EQ(buffer.get_line(0).cells[0].ch, L'R');
    EXPECT_EQ(buffer.get_line(0).cells[0].attr.fg, (RgbColor{ 205, 49, 49 }));
    EXPECT_EQ(buffer.get_line(0).cells[1].ch, L'N');
    EXPECT_EQ(buffer.get_line(0).cells[1].attr.fg, default_foreground);
    EXPECT_TRUE(buffer.pending_attr() == CharAttr());
}

// Test cursor movement
TEST_F(EscapeParserTest, CursorMovement)
{
    buffer.set_cursor(5, 10);

    feed("\033[3;5H"); // Move to row 3, col 5
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 2, 4 }));

    feed("\033[2A"); // Up 2
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 4 }));

    feed("\033[3B"); // Down 3
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 3, 4 }));

    feed("\033[5C"); // Right 5
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 3, 9 }));

    feed("\033[2D"); // Left 2
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 3, 7 }));

    feed("\033[E"); // Next line
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 4, 0 }));

    feed("\033[F"); // Previous line
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 3, 0 }));

    feed("\033[10G"); // Column 10
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 3, 9 }));

    feed("\033[5d"); // Row 5
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 4, 9 }));

    feed("\033[0A"); // Zero counts as one
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 3, 9 }));

    feed("\033[H"); // Home
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 0 }));

    feed("\033[;7f"); // Missing row defaults to 1
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 6 }));
}

TEST_F(EscapeParserTest, CursorMovementClamps)
{
    feed("\033[200;300H");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 23, 79 }));

    feed("\033[100A");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 79 }));

    feed("\033[100C");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 79 }));

    feed("\033[100D\033[100B");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 23, 0 }));
}

// Test text buffer insertion
TEST_F(EscapeParserTest, TextBufferInsertion)
{
    buffer.cursor             = { 5, 10 };
    buffer.lines[5].cells[10] = { L'x', buffer.current_attr };

    feed("y");

    EXPECT_EQ(buffer.lines[5].cells[10].ch, L'y');
    EXPECT_EQ(buffer.cursor.col, 11);
    EXPECT_EQ(buffer.take_dirty_rows(), all_rows(24)); // Initially everything is dirty
    feed("z");
    EXPECT_EQ(buffer.take_dirty_rows(), std::vector<int>({ 5 }));
    EXPECT_TRUE(buffer.take_dirty_rows().empty());
}

TEST_F(EscapeParserTest, ClearThenHomeThenCharacter)
{
    fill_screen(L'x');
    feed("\033[2J\033[HA");

    EXPECT_EQ(buffer.get_line(0).cells[0].ch, L'A');
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 1 }));
    EXPECT_EQ(row_text(0), L"A");
    for (int r = 1; r < buffer.get_rows(); ++r) {
        EXPECT_EQ(row_text(r), L"");
    }
}

// Test scroll up
TEST_F(EscapeParserTest, ScrollUp)
{
    buffer.set_cursor(0, 0);
    feed(std::string(80, 'a'));
    buffer.set_cursor(23, 0);
    feed(std::string(80, 'b'));
    buffer.take_dirty_rows();

    // Process a newline to trigger scroll
    feed("\n");

    // First row is gone, last row is blank
    EXPECT_EQ(row_text(0), L"");
    EXPECT_EQ(row_text(22), std::wstring(80, L'b'));
    EXPECT_EQ(row_text(23), L"");
    ASSERT_EQ(buffer.get_scrollback().size(), 1u);
    EXPECT_EQ(buffer.get_scrollback()[0].text(), std::wstring(80, L'a'));

    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 23, 0 }));
    EXPECT_EQ(buffer.take_dirty_rows(), all_rows(24));
}

TEST_F(EscapeParserTest, WrapAtBottomScrollsOnce)
{
    buffer.set_cursor(23, 0);
    feed(std::string(80, 'x') + "y");

    ASSERT_EQ(buffer.get_scrollback().size(), 1u);
    EXPECT_EQ(buffer.get_scrollback()[0].text(), L"");
    EXPECT_EQ(row_text(22), std::wstring(80, L'x'));
    EXPECT_EQ(row_text(23), L"y");
    EXPECT_TRUE(buffer.get_line(23).wrapped);
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 23, 1 }));
}

TEST_F(EscapeParserTest, CarriageReturnCancelsPendingWrap)
{
    feed(std::string(80, 'x') + "\rZ");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 1 }));
    EXPECT_EQ(buffer.get_line(0).cells[0].ch, L'Z');
    EXPECT_EQ(row_text(1), L"");
}

TEST_F(EscapeParserTest, ScrollRegionConfinesLinefeeds)
{
    label_rows();
    feed("\033[2;5r"); // Rows 1-4
    EXPECT_EQ(buffer.get_scroll_top(), 1);
    EXPECT_EQ(buffer.get_scroll_bottom(), 4);

    feed("\033[5;1H\n\n");
    EXPECT_EQ(row_text(0), L"a");
    EXPECT_EQ(row_text(1), L"d");
    EXPECT_EQ(row_text(2), L"e");
    EXPECT_EQ(row_text(3), L"");
    EXPECT_EQ(row_text(4), L"");
    for (int r = 5; r < buffer.get_rows(); ++r) {
        EXPECT_EQ(row_text(r), std::wstring(1, static_cast<wchar_t>(L'a' + r)));
    }
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 4, 0 }));
}

TEST_F(EscapeParserTest, TenLinefeedsInsideRegion)
{
    label_rows();
    feed("\033[2;5r\033[2;1H");
    feed(std::string(10, '\n'));

    EXPECT_EQ(row_text(0), L"a");
    for (int r = 1; r <= 4; ++r) {
        EXPECT_EQ(row_text(r), L"");
    }
    for (int r = 5; r < buffer.get_rows(); ++r) {
        EXPECT_EQ(row_text(r), std::wstring(1, static_cast<wchar_t>(L'a' + r)));
    }
    EXPECT_EQ(buffer.get_cursor().row, 4);
}

TEST_F(EscapeParserTest, WrapRespectsScrollRegion)
{
    label_rows();
    feed("\033[1;3r\033[3;1H");
    feed(std::string(80, 'x') + "y");

    EXPECT_EQ(row_text(0), L"b");
    EXPECT_EQ(row_text(1), std::wstring(80, L'x'));
    EXPECT_EQ(row_text(2), L"y");
    EXPECT_EQ(row_text(3), L"d");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 2, 1 }));
}

TEST_F(EscapeParserTest, InvalidScrollRegionIsIgnored)
{
    feed("\033[3;10r");
    feed("\033[5;5r");
    EXPECT_EQ(buffer.get_scroll_top(), 2);
    EXPECT_EQ(buffer.get_scroll_bottom(), 9);

    feed("\033[10;5r");
    EXPECT_EQ(buffer.get_scroll_top(), 2);

    feed("\033[5;100r"); // Bottom clamps to the screen
    EXPECT_EQ(buffer.get_scroll_top(), 4);
    EXPECT_EQ(buffer.get_scroll_bottom(), 23);

    feed("\033[r");
    EXPECT_EQ(buffer.get_scroll_top(), 0);
    EXPECT_EQ(buffer.get_scroll_bottom(), 23);
}

TEST_F(EscapeParserTest, MissingAndZeroParametersUseDefaults)
{
    struct CursorCase {
        const char *input;
        Cursor expected;
    };
    static const CursorCase cursor_cases[] = {
        { "\033[5H", { 4, 0 } },    { "\033[5;H", { 4, 0 } },  { "\033[;5H", { 0, 4 } },
        { "\033[0;0H", { 0, 0 } },  { "\033[H", { 0, 0 } },    { "\033[3;4f", { 2, 3 } },
        { "\033[0G", { 10, 0 } },   { "\033[G", { 10, 0 } },   { "\033[3G", { 10, 2 } },
        { "\033[0`", { 10, 0 } },   { "\033[0d", { 0, 10 } },  { "\033[d", { 0, 10 } },
        { "\033[3d", { 2, 10 } },   { "\033[0A", { 9, 10 } },  { "\033[A", { 9, 10 } },
        { "\033[0B", { 11, 10 } },  { "\033[0C", { 10, 11 } }, { "\033[0D", { 10, 9 } },
        { "\033[0E", { 11, 0 } },   { "\033[0F", { 9, 0 } },   { "\033[2A", { 8, 10 } },
    };
    for (const auto &test : cursor_cases) {
        ScreenBuffer screen(80, 24);
        EscapeParser sequence;
        screen.set_cursor(10, 10);
        sequence.process(test.input, screen);
        EXPECT_EQ(screen.get_cursor(), test.expected) << "input ESC" << (test.input + 1);
    }

    struct RegionCase {
        const char *input;
        int top;
        int bottom;
    };
    static const RegionCase region_cases[] = {
        { "\033[2;5r", 1, 4 },  { "\033[2r", 1, 23 },   { "\033[;5r", 0, 4 },
        { "\033[0;0r", 0, 23 }, { "\033[r", 0, 23 },    { "\033[5;2r", 0, 23 },
        { "\033[1;24r", 0, 23 }, { "\033[3;30r", 2, 23 }, { "\033[23;24r", 22, 23 },
    };
    for (const auto &test : region_cases) {
        ScreenBuffer screen(80, 24);
        EscapeParser sequence;
        sequence.process(test.input, screen);
        EXPECT_EQ(screen.get_scroll_top(), test.top) << "input ESC" << (test.input + 1);
        EXPECT_EQ(screen.get_scroll_bottom(), test.bottom) << "input ESC" << (test.input + 1);
    }

    // Erase with no parameter or 0 clears from the cursor on
    static const char *const erase_cases[] = { "\033[K", "\033[0K", "\033[J", "\033[0J" };
    for (const char *input : erase_cases) {
        fill_screen(L'x');
        buffer.set_cursor(5, 10);
        feed(input);
        EXPECT_EQ(row_text(5), std::wstring(10, L'x')) << "input ESC" << (input + 1);
        EXPECT_EQ(row_text(4), std::wstring(80, L'x')) << "input ESC" << (input + 1);
    }
}

// Test ESC [0J (clear from cursor to end of screen)
TEST_F(EscapeParserTest, ClearScreenEsc0J)
{
    fill_screen(L'x');
    buffer.set_cursor(5, 10);
    buffer.take_dirty_rows();

    feed("\033[0J");

    for (int r = 0; r < 5; ++r) {
        EXPECT_EQ(row_text(r), std::wstring(80, L'x'));
    }
    EXPECT_EQ(row_text(5), std::wstring(10, L'x'));
    for (int r = 6; r < buffer.get_rows(); ++r) {
        EXPECT_EQ(row_text(r), L"");
    }
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 5, 10 }));

    std::vector<int> expected_dirty_rows;
    for (int r = 5; r < buffer.get_rows(); ++r) {
        expected_dirty_rows.push_back(r);
    }
    EXPECT_EQ(buffer.take_dirty_rows(), expected_dirty_rows);
}

// Test ESC [1J (clear from start of screen to cursor)
TEST_F(EscapeParserTest, ClearScreenEsc1J)
{
    fill_screen(L'x');
    buffer.set_cursor(5, 10);
    buffer.take_dirty_rows();

    feed("\033[1J");

    for (int r = 0; r < 5; ++r) {
        EXPECT_EQ(row_text(r), L"");
    }
    for (int c = 0; c <= 10; ++c) {
        EXPECT_EQ(buffer.get_line(5).cells[c].ch, L' ');
    }
    for (int c = 11; c < buffer.get_cols(); ++c) {
        EXPECT_EQ(buffer.get_line(5).cells[c].ch, L'x');
    }
    for (int r = 6; r < buffer.get_rows(); ++r) {
        EXPECT_EQ(row_text(r), std::wstring(80, L'x'));
    }
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 5, 10 }));
    EXPECT_EQ(buffer.take_dirty_rows(), all_rows(6));
}

// Test ESC [2J (clear entire screen)
TEST_F(EscapeParserTest, ClearScreenEsc2J)
{
    fill_screen(L'x');
    buffer.set_cursor(5, 10);
    buffer.take_dirty_rows();

    feed("\033[2J");

    for (int r = 0; r < buffer.get_rows(); ++r) {
        EXPECT_EQ(row_text(r), L"");
    }
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 5, 10 }));
    EXPECT_EQ(buffer.take_dirty_rows(), all_rows(24));
    EXPECT_TRUE(buffer.get_scrollback().empty());
}

TEST_F(EscapeParserTest, EraseUsesDefaultStyle)
{
    feed("\033[41mabc\033[1;1H\033[2K");
    EXPECT_TRUE(buffer.get_line(0).cells[0].attr == CharAttr());
    EXPECT_EQ(buffer.pending_attr().bg, ansi_colors[1]);

    feed("\033[2;1Hdef\033[2;1H\033[X");
    EXPECT_EQ(row_text(1), L" ef");
    EXPECT_TRUE(buffer.get_line(1).cells[0].attr == CharAttr());
}

TEST_F(EscapeParserTest, InsertAndDeleteLines)
{
    label_rows();

    feed("\033[3;1H\033[2L");
    EXPECT_EQ(row_text(1), L"b");
    EXPECT_EQ(row_text(2), L"");
    EXPECT_EQ(row_text(3), L"");
    EXPECT_EQ(row_text(4), L"c");
    EXPECT_EQ(row_text(23), L"v");

    feed("\033[2M");
    EXPECT_EQ(row_text(2), L"c");
    EXPECT_EQ(row_text(21), L"v");
    EXPECT_EQ(row_text(22), L"");
    EXPECT_EQ(row_text(23), L"");
    EXPECT_TRUE(buffer.get_scrollback().empty());
}

TEST_F(EscapeParserTest, InsertLinesWithinRegion)
{
    label_rows();

    feed("\033[1;5r\033[3;1H\033[L");
    EXPECT_EQ(row_text(2), L"");
    EXPECT_EQ(row_text(3), L"c");
    EXPECT_EQ(row_text(4), L"d");
    EXPECT_EQ(row_text(5), L"f");

    // Outside the region nothing happens
    feed("\033[10;1H\033[L");
    EXPECT_EQ(row_text(9), L"j");
}

TEST_F(EscapeParserTest, InsertDeleteAndEraseCharacters)
{
    feed("abcdef");

    feed("\033[1;3H\033[2@");
    EXPECT_EQ(row_text(0), L"ab  cdef");

    feed("\033[2P");
    EXPECT_EQ(row_text(0), L"abcdef");

    feed("\033[1;2H\033[3X");
    EXPECT_EQ(row_text(0), L"a   ef");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 1 }));
}

TEST_F(EscapeParserTest, ScrollCommandsDoNotArchive)
{
    label_rows();

    feed("\033[2S");
    EXPECT_EQ(row_text(0), L"c");
    EXPECT_EQ(row_text(21), L"x");
    EXPECT_EQ(row_text(22), L"");
    EXPECT_TRUE(buffer.get_scrollback().empty());

    feed("\033[T");
    EXPECT_EQ(row_text(0), L"");
    EXPECT_EQ(row_text(1), L"c");
}

TEST_F(EscapeParserTest, IndexAndReverseIndex)
{
    feed("abc\033D");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 1, 3 }));

    feed("\033E");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 2, 0 }));

    feed("\033M\033M");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 0 }));

    // At the top row the screen moves down
    feed("\033M");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 0 }));
    EXPECT_EQ(row_text(0), L"");
    EXPECT_EQ(row_text(1), L"abc");
}

TEST_F(EscapeParserTest, SaveAndRestoreCursor)
{
    // Restore without save goes home
    feed("\033[5;5H\033[u");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 0 }));

    feed("\033[5;10H\033[s\033[H\033[u");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 4, 9 }));

    feed("\033[7;3H\0337\033[20;20H\0338");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 6, 2 }));
}

TEST_F(EscapeParserTest, ControlCharacters)
{
    feed("ab\bc");
    EXPECT_EQ(row_text(0), L"ac");

    feed("\r\tX");
    EXPECT_EQ(buffer.get_line(0).cells[8].ch, L'X');

    feed("\a\nnext");
    EXPECT_EQ(row_text(1), L"next"); // Line feed also returns the carriage

    feed("\r\b");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 1, 0 }));

    buffer.set_cursor(2, 78);
    feed("\t");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 2, 79 }));
    feed("\t");
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 2, 79 }));
}

TEST_F(EscapeParserTest, CancelAndRestartSequences)
{
    feed("\033[31\030X");
    EXPECT_EQ(buffer.get_line(0).cells[0].ch, L'X');
    EXPECT_EQ(buffer.get_line(0).cells[0].attr.fg, default_foreground);

    feed("\033[3\033[32mY");
    EXPECT_EQ(buffer.get_line(0).cells[1].ch, L'Y');
    EXPECT_EQ(buffer.get_line(0).cells[1].attr.fg, ansi_colors[2]);

    feed("\033[1\032Z");
    EXPECT_EQ(row_text(0), L"XYZ");
}

TEST_F(EscapeParserTest, ControlStringsAreSkipped)
{
    feed("\033]0;window title\aA");
    feed("\033]2;other title\033\\B");
    feed("\033P1$r\033\\C");
    feed("\033_application\033\\D");
    feed("\033Xstring\033\\E");
    EXPECT_EQ(row_text(0), L"ABCDE");

    // A new sequence cuts an unterminated string short
    feed("\033]0;title\033[31mF");
    EXPECT_EQ(row_text(0), L"ABCDEF");
    EXPECT_EQ(buffer.get_line(0).cells[5].attr.fg, ansi_colors[1]);
    EXPECT_EQ(parser.get_state(), AnsiState::NORMAL);
}

TEST_F(EscapeParserTest, UnsupportedSequencesAreConsumed)
{
    feed("\033[?25l\033[?1049h\033[4h\033[20lA");
    feed("\033(B\033)0\033#8B");
    feed("\033[ q\033[>0c\033[!pC");
    feed("\033=\033>D");
    EXPECT_EQ(row_text(0), L"ABCD");
    EXPECT_EQ(parser.get_state(), AnsiState::NORMAL);
}

TEST_F(EscapeParserTest, ParamsSaturate)
{
    buffer.set_cursor(10, 0);

    feed("\033[99999999");
    EXPECT_EQ(parser.current_param, 65535);
    EXPECT_EQ(parser.get_state(), AnsiState::CSI_PARAM);

    feed(std::string(40, ';'));
    EXPECT_EQ(parser.params.size(), 32u);
    EXPECT_EQ(parser.params[0], 65535);

    feed("A");
    EXPECT_EQ(parser.get_state(), AnsiState::NORMAL);
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 0, 0 }));
}

TEST_F(EscapeParserTest, Utf8SplitAcrossCalls)
{
    feed("\xE2\x82");
    EXPECT_EQ(parser.utf8_remaining, 1);
    EXPECT_EQ(buffer.get_line(0).cells[0].ch, L' ');
    EXPECT_EQ(buffer.get_cursor().col, 0);

    feed("\xAC");
    EXPECT_EQ(parser.utf8_remaining, 0);
    EXPECT_EQ(buffer.get_line(0).cells[0].ch, 0x20AC); // €
    EXPECT_EQ(buffer.get_cursor().col, 1);
}

// Test UTF-8 input decoding
TEST_F(EscapeParserTest, Utf8Input)
{
    // Test ASCII
    buffer.set_cursor(5, 10);
    feed("a");
    EXPECT_EQ(buffer.get_line(5).cells[10].ch, L'a');

    // Test 2-byte UTF-8 (Cyrillic 'Я')
    feed("\xD0\xAF");
    EXPECT_EQ(buffer.get_line(5).cells[11].ch, 0x042F);

    // Test 3-byte UTF-8 (Euro symbol '€')
    feed("\xE2\x82\xAC");
    EXPECT_EQ(buffer.get_line(5).cells[12].ch, 0x20AC);

    // Test 4-byte UTF-8 (emoji '😀')
    feed("\xF0\x9F\x98\x80");
    EXPECT_EQ(buffer.get_line(5).cells[13].ch, 0x1F600);
}

TEST_F(EscapeParserTest, InvalidUtf8IsDropped)
{
    feed("\xC0\xAF");     // Overlong, invalid lead
    feed("\xE0\x80\xAF"); // Overlong 3-byte form
    feed("\xED\xA0\x80"); // Surrogate
    feed("\x80\xBF\xFF"); // Stray bytes
    feed("A");
    EXPECT_EQ(row_text(0), L"A");

    // Truncated sequence: the interrupting byte still counts
    feed("\xD0" "B");
    EXPECT_EQ(row_text(0), L"AB");

    // Escape inside a multibyte sequence
    feed("\xE2\x82\033[1mC");
    EXPECT_EQ(row_text(0), L"ABC");
    EXPECT_TRUE(buffer.get_line(0).cells[2].attr.bold);
}

TEST_F(EscapeParserTest, SplitAtEveryBoundary)
{
    const std::string input =
        "hello\r\n\033[31mred\033[0m \033[1;4mbold\033[m\n"
        "\xD0\xAF\xE2\x82\xAC\xF0\x9F\x98\x80\n"
        "\033[5;10Hxy\033[2K\033[3;1H\033[38;2;10;20;30mrgb\033[48;5;123m\033[K"
        "\033]0;window title\a\033[?25l\033(B"
        "\033[2;6r\033[6;1H\n\n\n\033[r\033[1;1H\033[2@\033[P\033[3X"
        "\033P1$r\033\\\0337\033[10;10H\0338z\033M\033D\033E\033[S\033[T\tend";

    ScreenBuffer expected(20, 8);
    EscapeParser whole;
    whole.process(input, expected);

    for (size_t split = 0; split <= input.size(); ++split) {
        ScreenBuffer actual(20, 8);
        EscapeParser pieces;
        pieces.process(input.data(), split, actual);
        pieces.process(input.data() + split, input.size() - split, actual);

        EXPECT_TRUE(actual.get_lines() == expected.get_lines()) << "split at " << split;
        EXPECT_EQ(actual.get_cursor(), expected.get_cursor()) << "split at " << split;
        EXPECT_TRUE(actual.pending_attr() == expected.pending_attr()) << "split at " << split;
        EXPECT_EQ(pieces.get_state(), whole.get_state()) << "split at " << split;
    }

    // One byte at a time
    ScreenBuffer bytewise(20, 8);
    EscapeParser single;
    for (char c : input) {
        single.process(&c, 1, bytewise);
    }
    EXPECT_TRUE(bytewise.get_lines() == expected.get_lines());
    EXPECT_EQ(bytewise.get_cursor(), expected.get_cursor());
}

TEST_F(EscapeParserTest, RandomInputKeepsBufferConsistent)
{
    static const char alphabet[] = "\033\033\033[[[;;;0123456789?>!$ \"'(#mHJKLMPSTXr@dfABCDEGsuc78\r\n\b\t"
                                   "\x18\x1a\a\x80\xC3\xE2\xF0\x9F\xAC]P_\\xyz";
    std::mt19937 rng(12345);
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);
    std::uniform_int_distribution<int> length(1, 64);
    std::uniform_int_distribution<int> dimension(1, 30);

    ScreenBuffer fuzzed(20, 10, 50);
    EscapeParser fuzzer;
    for (int round = 0; round < 2000; ++round) {
        std::string chunk;
        for (int i = length(rng); i > 0; --i) {
            chunk += alphabet[pick(rng)];
        }
        fuzzer.process(chunk, fuzzed);
        if (round % 100 == 99) {
            fuzzed.resize(dimension(rng), dimension(rng));
        }

        ASSERT_EQ(static_cast<int>(fuzzed.get_lines().size()), fuzzed.get_rows());
        for (const auto &line : fuzzed.get_lines()) {
            ASSERT_EQ(static_cast<int>(line.cells.size()), fuzzed.get_cols());
        }
        const Cursor &cursor = fuzzed.get_cursor();
        ASSERT_GE(cursor.row, 0);
        ASSERT_LT(cursor.row, fuzzed.get_rows());
        ASSERT_GE(cursor.col, 0);
        ASSERT_LT(cursor.col, fuzzed.get_cols());
        ASSERT_LE(fuzzed.get_scroll_top(), fuzzed.get_scroll_bottom());
        ASSERT_LT(fuzzed.get_scroll_bottom(), fuzzed.get_rows());
        ASSERT_LE(fuzzed.get_scrollback().size(), 50u);
    }
}

// Test fixture for ScreenBuffer on its own
class ScreenBufferTest : public ::testing::Test {
protected:
    ScreenBuffer buffer{ 5, 3 };

    void write(const std::wstring &text)
    {
        for (wchar_t ch : text) {
            buffer.put(ch);
        }
    }
};

TEST_F(ScreenBufferTest, PendingWrapKeepsCursorInside)
{
    write(L"abcde");
    EXPECT_EQ(buffer.cursor.row, 0);
    EXPECT_EQ(buffer.cursor.col, 4);
    EXPECT_TRUE(buffer.wrap_pending);

    write(L"f");
    EXPECT_FALSE(buffer.wrap_pending);
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 1, 1 }));
    EXPECT_EQ(buffer.get_line(1).text(), L"f");
    EXPECT_TRUE(buffer.get_line(1).wrapped);
    EXPECT_FALSE(buffer.get_line(0).wrapped);

    write(L"ghij");
    EXPECT_TRUE(buffer.wrap_pending);
    buffer.move_cursor(0, -1);
    EXPECT_FALSE(buffer.wrap_pending);
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 1, 3 }));
}

TEST_F(ScreenBufferTest, ScrollbackEviction)
{
    ScreenBuffer small(10, 3, 2);
    EscapeParser parser;
    parser.process("1\n2\n3\n4\n5\n", small);

    ASSERT_EQ(small.scrollback.size(), 2u);
    EXPECT_EQ(small.scrollback[0].text(), L"2");
    EXPECT_EQ(small.scrollback[1].text(), L"3");
    EXPECT_EQ(small.get_line(0).text(), L"4");
    EXPECT_EQ(small.get_line(1).text(), L"5");
    EXPECT_EQ(small.get_line(2).text(), L"");
    EXPECT_EQ(small.get_max_scrollback(), 2u);
}

TEST_F(ScreenBufferTest, ScrollbackNeverExceedsLimit)
{
    ScreenBuffer bounded(10, 5, 100);
    EscapeParser parser;
    for (int i = 0; i < 1000; ++i) {
        parser.process("line\n", bounded);
        ASSERT_LE(bounded.get_scrollback().size(), 100u);
    }
    EXPECT_EQ(bounded.get_scrollback().size(), 100u);

    ScreenBuffer disabled(10, 3, 0);
    parser.process("a\nb\nc\nd\n", disabled);
    EXPECT_TRUE(disabled.get_scrollback().empty());
}

TEST_F(ScreenBufferTest, ResizeTruncatesColumns)
{
    ScreenBuffer wide(80, 24);
    wide.set_cursor(0, 0);
    std::wstring digits;
    for (int c = 0; c < 80; ++c) {
        digits += static_cast<wchar_t>(L'0' + c % 10);
    }
    for (wchar_t ch : digits) {
        wide.put(ch);
    }
    wide.set_cursor(10, 70);

    wide.resize(40, 24);

    EXPECT_EQ(wide.get_cols(), 40);
    EXPECT_EQ(wide.get_rows(), 24);
    for (const auto &line : wide.get_lines()) {
        EXPECT_EQ(line.cells.size(), 40u);
    }
    EXPECT_EQ(wide.get_line(0).text(), digits.substr(0, 40));
    EXPECT_EQ(wide.get_cursor(), (Cursor{ 10, 39 }));

    // Growing back pads with blanks, no reflow
    wide.resize(80, 24);
    EXPECT_EQ(wide.get_line(0).text(), digits.substr(0, 40));
    EXPECT_EQ(wide.get_line(0).cells.size(), 80u);
}

TEST_F(ScreenBufferTest, ResizeTrimsRows)
{
    ScreenBuffer tall(80, 24);
    tall.set_cursor(20, 5);
    tall.put(L'q');
    tall.set_cursor(3, 0);
    tall.put(L'p');
    tall.set_cursor(20, 5);

    tall.resize(80, 10);

    EXPECT_EQ(tall.get_rows(), 10);
    EXPECT_EQ(tall.get_lines().size(), 10u);
    EXPECT_EQ(tall.get_line(3).text(), L"p");
    EXPECT_EQ(tall.get_cursor(), (Cursor{ 9, 5 }));
    EXPECT_EQ(tall.get_scroll_top(), 0);
    EXPECT_EQ(tall.get_scroll_bottom(), 9);
    EXPECT_EQ(tall.take_dirty_rows().size(), 10u);
}

TEST_F(ScreenBufferTest, ResizeClampsScrollRegionAndSavedCursor)
{
    ScreenBuffer big(80, 24);
    big.set_scroll_region(2, 20);
    big.set_cursor(15, 70);
    big.save_cursor();

    big.resize(40, 10);
    EXPECT_EQ(big.scroll_top, 2);
    EXPECT_EQ(big.scroll_bottom, 9);
    EXPECT_EQ(big.saved_cursor.row, 9);
    EXPECT_EQ(big.saved_cursor.col, 39);
    EXPECT_EQ(big.get_cursor(), (Cursor{ 9, 39 }));

    // Full-screen region follows the new height
    ScreenBuffer full(80, 24);
    full.resize(80, 30);
    EXPECT_EQ(full.scroll_top, 0);
    EXPECT_EQ(full.scroll_bottom, 29);
    EXPECT_EQ(full.get_line(29).cells.size(), 80u);
}

TEST_F(ScreenBufferTest, WrappedFlagClearedForNewLogicalLine)
{
    // Linefeed onto a continuation row
    write(L"abcdef");
    EXPECT_TRUE(buffer.get_line(1).wrapped);
    buffer.set_cursor(0, 0);
    buffer.newline();
    EXPECT_EQ(buffer.get_cursor(), (Cursor{ 1, 0 }));
    EXPECT_FALSE(buffer.get_line(1).wrapped);

    // Erase to end of line
    buffer.reset();
    write(L"abcdef");
    EXPECT_TRUE(buffer.get_line(1).wrapped);
    buffer.set_cursor(1, 0);
    buffer.erase_line(0);
    EXPECT_FALSE(buffer.get_line(1).wrapped);

    // Erase to end of screen
    buffer.reset();
    write(L"abcdef");
    buffer.set_cursor(1, 0);
    buffer.erase_display(0);
    EXPECT_FALSE(buffer.get_line(1).wrapped);

    // Wrapping still marks the continuation
    buffer.reset();
    write(L"abcdefgh");
    EXPECT_TRUE(buffer.get_line(1).wrapped);
    EXPECT_EQ(buffer.get_line(1).text(), L"fgh");
}

TEST_F(ScreenBufferTest, SnapshotIsACopy)
{
    write(L"ab");
    ScreenSnapshot snap = buffer.snapshot();
    write(L"c");

    EXPECT_EQ(snap.cols, 5);
    EXPECT_EQ(snap.rows, 3);
    EXPECT_EQ(snap.cursor, (Cursor{ 0, 2 }));
    EXPECT_EQ(snap.lines[0].text(), L"ab");
    EXPECT_EQ(buffer.get_line(0).text(), L"abc");
}

TEST_F(ScreenBufferTest, LineTextTrimsTrailingBlanks)
{
    Line line(6);
    EXPECT_EQ(line.text(), L"");
    line.cells[1].ch = L'x';
    line.cells[3].ch = L'y';
    EXPECT_EQ(line.text(), L" x y");
}

TEST_F(ScreenBufferTest, MinimumSize)
{
    ScreenBuffer tiny(0, -3);
    EXPECT_EQ(tiny.get_cols(), 1);
    EXPECT_EQ(tiny.get_rows(), 1);

    tiny.put(L'a');
    tiny.put(L'b');
    EXPECT_EQ(tiny.get_line(0).text(), L"b");
    EXPECT_EQ(tiny.get_scrollback().size(), 1u);
}

TEST(ColorTableTest, Palette)
{
    EXPECT_EQ(color_256_to_rgb(1), (RgbColor{ 205, 49, 49 }));
    EXPECT_EQ(color_256_to_rgb(15), (RgbColor{ 255, 255, 255 }));
    EXPECT_EQ(color_256_to_rgb(16), (RgbColor{ 0, 0, 0 }));
    EXPECT_EQ(color_256_to_rgb(21), (RgbColor{ 0, 0, 255 }));
    EXPECT_EQ(color_256_to_rgb(67), (RgbColor{ 95, 135, 175 }));
    EXPECT_EQ(color_256_to_rgb(231), (RgbColor{ 255, 255, 255 }));
    EXPECT_EQ(color_256_to_rgb(232), (RgbColor{ 8, 8, 8 }));
    EXPECT_EQ(color_256_to_rgb(255), (RgbColor{ 238, 238, 238 }));
    EXPECT_EQ(color_256_to_rgb(256), default_foreground);
}

// Test Shift modifier
TEST(KeyInputTest, ShiftModifier)
{
    EXPECT_EQ(translate_key(KeyInput('a', true, false)), "A");  // Shift+A
    EXPECT_EQ(translate_key(KeyInput('1', true, false)), "!");  // Shift+1
    EXPECT_EQ(translate_key(KeyInput('/', true, false)), "?");  // Shift+/
    EXPECT_EQ(translate_key(KeyInput(0x044F, true, false)), "\xD0\xAF"); // я -> Я
}

// Test Control modifier
TEST(KeyInputTest, ControlModifier)
{
    EXPECT_EQ(translate_key(KeyInput('a', false, true)), std::string(1, 0x01)); // Ctrl+A
    EXPECT_EQ(translate_key(KeyInput('z', false, true)), std::string(1, 0x1A)); // Ctrl+Z
    EXPECT_EQ(translate_key(KeyInput('@', false, true)), std::string(1, '\0')); // Ctrl+@
    EXPECT_EQ(translate_key(KeyInput('[', false, true)), "\033");              // Ctrl+[
    EXPECT_EQ(translate_key(KeyInput('_', false, true)), std::string(1, 0x1F)); // Ctrl+_

    // Characters without a control code are sent unchanged
    EXPECT_EQ(translate_key(KeyInput('1', false, true)), "1");
    EXPECT_EQ(translate_key(KeyInput(0x00E9, false, true)), "\xC3\xA9"); // Ctrl+é
    EXPECT_EQ(translate_key(KeyInput(0x044F, true, true)), "\xD1\x8F");  // Ctrl+Shift+я
}

TEST(KeyInputTest, InvalidCodePointsAreDropped)
{
    EXPECT_EQ(wchar_to_utf8(static_cast<wchar_t>(-1)), "");
    EXPECT_EQ(wchar_to_utf8(static_cast<wchar_t>(0x110000)), "");
    EXPECT_EQ(wchar_to_utf8(static_cast<wchar_t>(0x10FFFF)), "\xF4\x8F\xBF\xBF");
    EXPECT_EQ(wchar_to_utf8(L'A'), "A");
}

TEST(KeyInputTest, PlainCharacters)
{
    EXPECT_EQ(translate_key(KeyInput('q', false, false)), "q");
    EXPECT_EQ(translate_key(KeyInput(0x20AC, false, false)), "\xE2\x82\xAC");
    EXPECT_EQ(translate_key(KeyInput()), "");
}

TEST(KeyInputTest, NamedKeys)
{
    EXPECT_EQ(key_sequence(KeyCode::UP), "\033[A");
    EXPECT_EQ(key_sequence(KeyCode::DOWN), "\033[B");
    EXPECT_EQ(key_sequence(KeyCode::RIGHT), "\033[C");
    EXPECT_EQ(key_sequence(KeyCode::LEFT), "\033[D");
    EXPECT_EQ(key_sequence(KeyCode::HOME), "\033[H");
    EXPECT_EQ(key_sequence(KeyCode::END), "\033[F");
    EXPECT_EQ(key_sequence(KeyCode::PAGEUP), "\033[5~");
    EXPECT_EQ(key_sequence(KeyCode::PAGEDOWN), "\033[6~");
    EXPECT_EQ(key_sequence(KeyCode::INSERT), "\033[2~");
    EXPECT_EQ(key_sequence(KeyCode::DELETE), "\033[3~");
    EXPECT_EQ(key_sequence(KeyCode::BACKSPACE), "\177");
    EXPECT_EQ(key_sequence(KeyCode::TAB), "\t");
    EXPECT_EQ(key_sequence(KeyCode::ENTER), "\r");
    EXPECT_EQ(key_sequence(KeyCode::ESCAPE), "\033");
    EXPECT_EQ(key_sequence(KeyCode::CTRL_C), "\003");
    EXPECT_EQ(key_sequence(KeyCode::CTRL_D), "\004");
    EXPECT_EQ(key_sequence(KeyCode::CTRL_Z), "\032");
    EXPECT_EQ(key_sequence(KeyCode::CTRL_L), "\014");
    EXPECT_EQ(key_sequence(KeyCode::F1), "\033OP");
    EXPECT_EQ(key_sequence(KeyCode::F12), "\033[24~");
    EXPECT_EQ(key_sequence(KeyCode::CHARACTER), "");
    EXPECT_EQ(translate_key(KeyInput(KeyCode::UP)), "\033[A");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
