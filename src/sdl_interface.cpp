//
// Terminal emulator: graphical host based on SDL2.
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
#include "sdl_interface.h"

#include <algorithm>
#include <iostream>

SdlInterface::SdlInterface(const Config &config)
    : term_cols(config.cols), term_rows(config.rows), font_size(config.font_size),
      font_path(config.font_path), tabs(config)
{
}

SdlInterface::~SdlInterface()
{
    clear_texture_cache();
    if (renderer)
        SDL_DestroyRenderer(renderer);
    if (window)
        SDL_DestroyWindow(window);
    if (font)
        TTF_CloseFont(font);
    TTF_Quit();
    SDL_Quit();
}

bool SdlInterface::initialize()
{
    if (!initialize_sdl())
        return false;

    try {
        tabs.new_tab();
    } catch (const SpawnError &e) {
        std::cerr << e.what() << std::endl;
        return false;
    }

    texture_cache.resize(term_rows);
    dirty_lines.resize(term_rows, true);
    update_title();
    return true;
}

bool SdlInterface::initialize_sdl()
{
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
        return false;
    }
    if (TTF_Init() < 0) {
        std::cerr << "TTF_Init failed: " << TTF_GetError() << std::endl;
        return false;
    }

    font = TTF_OpenFont(font_path.c_str(), font_size);
    if (!font) {
        std::cerr << "Failed to load font " << font_path << ": " << TTF_GetError() << std::endl;
        return false;
    }

    TTF_SizeText(font, "M", &char_width, &char_height);
    if (char_width == 0 || char_height == 0) {
        std::cerr << "Failed to get font metrics" << std::endl;
        return false;
    }

    window = SDL_CreateWindow("Terminal Emulator", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              term_cols * char_width, term_rows * char_height,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "Cannot access GUI display.\n";
        std::cerr << "Please ensure a graphical environment is available.\n";
        return false;
    }

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
        return false;
    }

    return true;
}

void SdlInterface::run()
{
    while (running) {
        handle_events();
        process_shell_output();
        if (!running)
            break;
        render_text();
        SDL_Delay(10);
    }
}

void SdlInterface::process_shell_output()
{
    size_t count_before = tabs.count();
    auto dirty_rows     = tabs.tick_all();
    if (tabs.empty()) {
        running = false;
        return;
    }
    if (tabs.count() != count_before)
        update_title();

    for (int row : dirty_rows) {
        if (row >= 0 && static_cast<size_t>(row) < dirty_lines.size()) {
            dirty_lines[row] = true;
        }
    }
}

void SdlInterface::update_title()
{
    TerminalSession *session = tabs.current();
    if (!session)
        return;

    std::string title = "Terminal Emulator - " + session->get_shell_name();
    if (tabs.count() > 1) {
        title += " [" + std::to_string(tabs.get_active() + 1) + "/" +
                 std::to_string(tabs.count()) + "]";
    }
    SDL_SetWindowTitle(window, title.c_str());
}

void SdlInterface::render_text()
{
    TerminalSession *session = tabs.current();
    if (!session)
        return;

    Uint32 current_time = SDL_GetTicks();
    if (current_time - last_cursor_toggle >= cursor_blink_interval) {
        cursor_visible     = !cursor_visible;
        last_cursor_toggle = current_time;
    }

    const ScreenBuffer &buffer = session->get_buffer();
    update_texture_cache(buffer);
    render_spans();
    render_cursor(buffer);

    SDL_RenderPresent(renderer);
}

void SdlInterface::clear_texture_cache()
{
    for (auto &line_spans : texture_cache) {
        for (auto &span : line_spans) {
            if (span.texture)
                SDL_DestroyTexture(span.texture);
        }
        line_spans.clear();
    }
}

void SdlInterface::add_span(int row, const std::wstring &text, const CharAttr &attr,
                            int start_col)
{
    TextSpan span;
    span.text      = text;
    span.attr      = attr;
    span.start_col = start_col;

    // Blank spans need only the background
    bool blank = text.find_first_not_of(L' ') == std::wstring::npos;
    if (!blank || attr.underline || attr.strikethrough) {
        int style = TTF_STYLE_NORMAL;
        if (attr.bold)
            style |= TTF_STYLE_BOLD;
        if (attr.italic)
            style |= TTF_STYLE_ITALIC;
        if (attr.underline)
            style |= TTF_STYLE_UNDERLINE;
        if (attr.strikethrough)
            style |= TTF_STYLE_STRIKETHROUGH;
        TTF_SetFontStyle(font, style);

        std::string utf8;
        for (wchar_t wc : text)
            utf8 += wchar_to_utf8(wc);

        const RgbColor &fg   = attr.effective_fg();
        SDL_Color color      = { fg.r, fg.g, fg.b, 255 };
        SDL_Surface *surface = TTF_RenderUTF8_Blended(font, utf8.c_str(), color);
        if (surface) {
            span.texture = SDL_CreateTextureFromSurface(renderer, surface);
            SDL_FreeSurface(surface);
        }
    }
    texture_cache[row].push_back(span);
}

void SdlInterface::update_texture_cache(const ScreenBuffer &buffer)
{
    int rows = std::min(buffer.get_rows(), static_cast<int>(texture_cache.size()));

    for (int i = 0; i < rows; ++i) {
        if (!dirty_lines[i])
            continue;

        for (auto &span : texture_cache[i]) {
            if (span.texture)
                SDL_DestroyTexture(span.texture);
        }
        texture_cache[i].clear();

        const auto &cells = buffer.get_line(i).cells;
        if (!cells.empty()) {
            std::wstring current_text;
            CharAttr current_span_attr = cells[0].attr;
            int start_col              = 0;

            for (size_t j = 0; j < cells.size(); ++j) {
                if (cells[j].attr != current_span_attr) {
                    add_span(i, current_text, current_span_attr, start_col);
                    current_text.clear();
                    current_span_attr = cells[j].attr;
                    start_col         = static_cast<int>(j);
                }
                current_text += cells[j].ch;
            }
            add_span(i, current_text, current_span_attr, start_col);
        }
        dirty_lines[i] = false;
    }
    TTF_SetFontStyle(font, TTF_STYLE_NORMAL);
}

void SdlInterface::render_spans()
{
    SDL_SetRenderDrawColor(renderer, default_background.r, default_background.g,
                           default_background.b, 255);
    SDL_RenderClear(renderer);

    for (size_t i = 0; i < texture_cache.size() && i < static_cast<size_t>(term_rows); ++i) {
        for (const auto &span : texture_cache[i]) {
            const RgbColor &bg = span.attr.effective_bg();
            SDL_SetRenderDrawColor(renderer, bg.r, bg.g, bg.b, 255);
            SDL_Rect bg_rect = { span.start_col * char_width, static_cast<int>(i * char_height),
                                 static_cast<int>(span.text.length() * char_width), char_height };
            SDL_RenderFillRect(renderer, &bg_rect);

            if (!span.texture)
                continue;

            int w, h;
            SDL_QueryTexture(span.texture, nullptr, nullptr, &w, &h);
            SDL_Rect dst = { span.start_col * char_width, static_cast<int>(i * char_height), w, h };
            SDL_RenderCopy(renderer, span.texture, nullptr, &dst);
        }
    }
}

void SdlInterface::render_cursor(const ScreenBuffer &buffer)
{
    if (cursor_visible) {
        const auto &cursor = buffer.get_cursor();
        if (cursor.row < term_rows && cursor.col < term_cols) {
            SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
            SDL_Rect cursor_rect = { cursor.col * char_width, cursor.row * char_height, char_width,
                                     char_height };
            SDL_RenderFillRect(renderer, &cursor_rect);
        }
    }
}

void SdlInterface::resize_terminal(int new_cols, int new_rows)
{
    term_cols = new_cols;
    term_rows = new_rows;
    tabs.resize_all(term_cols, term_rows);

    clear_texture_cache();
    texture_cache.resize(term_rows);
    dirty_lines.assign(term_rows, true);
}

void SdlInterface::handle_events()
{
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_QUIT:
            running = false;
            break;
        case SDL_KEYDOWN:
            handle_key_event(event.key);
            break;
        case SDL_WINDOWEVENT:
            if (event.window.event == SDL_WINDOWEVENT_RESIZED) {
                int new_cols = std::max(event.window.data1 / char_width, 1);
                int new_rows = std::max(event.window.data2 / char_height, 1);
                resize_terminal(new_cols, new_rows);
            }
            break;
        }
    }
}

//
// Ctrl+Shift+T opens a tab, Ctrl+Shift+W closes it,
// Ctrl+PageUp and Ctrl+PageDown switch between tabs.
//
bool SdlInterface::handle_tab_key(const SDL_Keysym &keysym)
{
    if (!(keysym.mod & KMOD_CTRL))
        return false;

    if (keysym.mod & KMOD_SHIFT) {
        if (keysym.sym == SDLK_t) {
            try {
                tabs.new_tab();
                tabs.resize_all(term_cols, term_rows);
            } catch (const SpawnError &e) {
                std::cerr << e.what() << std::endl;
            }
            update_title();
            return true;
        }
        if (keysym.sym == SDLK_w) {
            tabs.close_current_tab();
            if (tabs.empty())
                running = false;
            else
                update_title();
            return true;
        }
    }
    if (tabs.count() > 1) {
        if (keysym.sym == SDLK_PAGEDOWN) {
            tabs.switch_tab((tabs.get_active() + 1) % tabs.count());
            update_title();
            return true;
        }
        if (keysym.sym == SDLK_PAGEUP) {
            tabs.switch_tab((tabs.get_active() + tabs.count() - 1) % tabs.count());
            update_title();
            return true;
        }
    }
    return false;
}

void SdlInterface::handle_key_event(const SDL_KeyboardEvent &key)
{
    // Handle font size changes
#ifdef __APPLE__
    if (key.keysym.mod & KMOD_GUI) {
        if (key.keysym.sym == SDLK_EQUALS) {
            change_font_size(1); // Cmd+=
            return;
        } else if (key.keysym.sym == SDLK_MINUS) {
            change_font_size(-1); // Cmd+-
            return;
        }
    }
#else
    if (key.keysym.mod & KMOD_CTRL) {
        if (key.keysym.sym == SDLK_EQUALS) {
            change_font_size(1); // Ctrl+=
            return;
        } else if (key.keysym.sym == SDLK_MINUS) {
            change_font_size(-1); // Ctrl+-
            return;
        }
    }
#endif
    if (handle_tab_key(key.keysym))
        return;

    TerminalSession *session = tabs.current();
    if (session) {
        session->send_input(keysym_to_key_input(key.keysym));
    }
}

KeyInput SdlInterface::keysym_to_key_input(const SDL_Keysym &keysym)
{
    KeyInput key;

    // Map SDL2 keycodes to KeyCode enum
    switch (keysym.sym) {
    case SDLK_RETURN:
        key.code = KeyCode::ENTER;
        break;
    case SDLK_BACKSPACE:
        key.code = KeyCode::BACKSPACE;
        break;
    case SDLK_TAB:
        key.code = KeyCode::TAB;
        break;
    case SDLK_ESCAPE:
        key.code = KeyCode::ESCAPE;
        break;
    case SDLK_UP:
        key.code = KeyCode::UP;
        break;
    case SDLK_DOWN:
        key.code = KeyCode::DOWN;
        break;
    case SDLK_RIGHT:
        key.code = KeyCode::RIGHT;
        break;
    case SDLK_LEFT:
        key.code = KeyCode::LEFT;
        break;
    case SDLK_HOME:
        key.code = KeyCode::HOME;
        break;
    case SDLK_END:
        key.code = KeyCode::END;
        break;
    case SDLK_INSERT:
        key.code = KeyCode::INSERT;
        break;
    case SDLK_DELETE:
        key.code = KeyCode::DELETE;
        break;
    case SDLK_PAGEUP:
        key.code = KeyCode::PAGEUP;
        break;
    case SDLK_PAGEDOWN:
        key.code = KeyCode::PAGEDOWN;
        break;
    case SDLK_F1:
        key.code = KeyCode::F1;
        break;
    case SDLK_F2:
        key.code = KeyCode::F2;
        break;
    case SDLK_F3:
        key.code = KeyCode::F3;
        break;
    case SDLK_F4:
        key.code = KeyCode::F4;
        break;
    case SDLK_F5:
        key.code = KeyCode::F5;
        break;
    case SDLK_F6:
        key.code = KeyCode::F6;
        break;
    case SDLK_F7:
        key.code = KeyCode::F7;
        break;
    case SDLK_F8:
        key.code = KeyCode::F8;
        break;
    case SDLK_F9:
        key.code = KeyCode::F9;
        break;
    case SDLK_F10:
        key.code = KeyCode::F10;
        break;
    case SDLK_F11:
        key.code = KeyCode::F11;
        break;
    case SDLK_F12:
        key.code = KeyCode::F12;
        break;
    default:
        // Modifier and other non-character keys produce nothing
        if (keysym.sym & SDLK_SCANCODE_MASK)
            return key;
        key.code      = KeyCode::CHARACTER;
        key.character = static_cast<wchar_t>(keysym.sym);
        break;
    }

    key.mod_shift = keysym.mod & KMOD_SHIFT;
    key.mod_ctrl  = keysym.mod & KMOD_CTRL;
    return key;
}

void SdlInterface::change_font_size(int delta)
{
    int new_size = font_size + delta;
    if (new_size < 8 || new_size > 72) {
        return;
    }

    if (font) {
        TTF_CloseFont(font);
        font = nullptr;
    }

    font_size = new_size;
    font      = TTF_OpenFont(font_path.c_str(), font_size);
    if (!font) {
        std::cerr << "Failed to load font at size " << font_size << ": " << TTF_GetError()
                  << std::endl;
        font_size = 16;
        font      = TTF_OpenFont(font_path.c_str(), font_size);
        if (!font) {
            std::cerr << "Failed to revert to default font: " << TTF_GetError() << std::endl;
            running = false;
            return;
        }
    }

    TTF_SizeText(font, "M", &char_width, &char_height);
    if (char_width == 0 || char_height == 0) {
        std::cerr << "Failed to get font metrics for size " << font_size << std::endl;
        running = false;
        return;
    }

    SDL_SetWindowSize(window, term_cols * char_width, term_rows * char_height);

    int win_width, win_height;
    SDL_GetWindowSize(window, &win_width, &win_height);
    resize_terminal(std::max(win_width / char_width, 1), std::max(win_height / char_height, 1));
}
