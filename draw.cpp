#include "draw.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "text.h"

Renderer::Renderer(Terminal& terminal)
    : _terminal(terminal)
{
}

const ui_palette& Renderer::palette() const
{
    return _palette;
}

glm::ivec2 Renderer::get_terminal_size() const
{
    return _terminal.get_size();
}

int Renderer::draw_string(const std::string& text, const glm::ivec2& location)
{
    return draw_string_coloured(text, location, _palette.text_fg, _palette.background);
}

int Renderer::draw_string_selected(const std::string& text, const glm::ivec2& location)
{
    return draw_string_coloured(text, location, _palette.selected_fg, _palette.selected_bg);
}

int Renderer::draw_string_coloured(
    const std::string& text,
    const glm::ivec2& location,
    const glm::u8vec3& foreground,
    const glm::u8vec3& background)
{
    spdlog::trace("Renderer::draw_string_coloured()");

    if (text.empty())
    {
        return 0;
    }

    glm::ivec2 terminal_size = _terminal.get_size();
    if (terminal_size.x <= 0 || terminal_size.y <= 0)
    {
        return 0;
    }

    int y = location.y;
    if (y < 0 || y >= terminal_size.y)
    {
        return 0;
    }

    int x = location.x;
    if (x >= terminal_size.x)
    {
        return 0;
    }

    std::u32string glyphs = decode_utf8(text);
    int start_x = std::max(0, x);
    std::size_t skip = (x < 0) ? static_cast<std::size_t>(-x) : 0u;

    int written = 0;
    for (std::size_t i = skip; i < glyphs.size() && start_x < terminal_size.x; ++i, ++start_x)
    {
        char32_t glyph = glyphs[i];
        if (glyph < 0x20)
        {
            glyph = U' ';
        }
        _terminal.set_glyph(glm::ivec2(start_x, y), glyph, foreground, background);
        ++written;
    }
    return written;
}

void Renderer::draw_horizontal_line(int row, char32_t glyph)
{
    glm::ivec2 terminal_size = _terminal.get_size();
    for (int x = 0; x < terminal_size.x; ++x)
    {
        _terminal.set_glyph(glm::ivec2(x, row), glyph, _palette.dim_fg, _palette.background);
    }
}

void Renderer::fill_row(int row, const glm::u8vec3& background)
{
    glm::ivec2 terminal_size = _terminal.get_size();
    for (int x = 0; x < terminal_size.x; ++x)
    {
        _terminal.set_glyph(glm::ivec2(x, row), U' ', _palette.text_fg, background);
    }
}

void Renderer::clear()
{
    _terminal.clear();
}

void Renderer::present()
{
    _terminal.update();
}
