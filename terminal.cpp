#include "terminal.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "input.h"
#include "text.h"

static glm::ivec2 query_terminal_size_vec()
{
    glm::ivec2 size(0, 0);

    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0)
    {
        size.x = static_cast<int>(w.ws_col);
        size.y = static_cast<int>(w.ws_row);
    }

    return size;
}

static bool u8vec3_equal(const glm::u8vec3& a, const glm::u8vec3& b)
{
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

static std::string to_ansi_channel(const glm::u8vec3& colour, bool background)
{
    std::string sequence;
    sequence.reserve(24);
    sequence += "\x1b[";
    sequence += background ? "48" : "38";
    sequence += ";2;";
    sequence += std::to_string(colour.r);
    sequence += ";";
    sequence += std::to_string(colour.g);
    sequence += ";";
    sequence += std::to_string(colour.b);
    sequence += "m";
    return sequence;
}

static bool write_stdout(const char* data, std::size_t size)
{
    std::size_t written = std::fwrite(data, 1, size, stdout);
    bool flushed = std::fflush(stdout) == 0;
    return written == size && flushed;
}

Terminal::Character8::Character8()
    : _glyph(U' '),
      _glyph_colour(glm::u8vec3(255)),
      _background_colour(glm::u8vec3(0))
{
}

Terminal::Character8::Character8(char32_t glyph, const glm::u8vec3& foreground, const glm::u8vec3& background)
    : _glyph(glyph),
      _glyph_colour(foreground),
      _background_colour(background)
{
}

void Terminal::Character8::set_glyph(char32_t glyph)
{
    _glyph = glyph;
}

char32_t Terminal::Character8::get_glyph() const
{
    return _glyph;
}

void Terminal::Character8::set_glyph_colour(const glm::u8vec3& colour)
{
    _glyph_colour = colour;
}

void Terminal::Character8::set_background_colour(const glm::u8vec3& colour)
{
    _background_colour = colour;
}

const glm::u8vec3& Terminal::Character8::get_glyph_colour() const
{
    return _glyph_colour;
}

const glm::u8vec3& Terminal::Character8::get_background_colour() const
{
    return _background_colour;
}

bool Terminal::Character8::operator==(const Character8& other) const
{
    return _glyph == other._glyph
        && u8vec3_equal(_glyph_colour, other._glyph_colour)
        && u8vec3_equal(_background_colour, other._background_colour);
}

bool Terminal::Character8::operator!=(const Character8& other) const
{
    return !(*this == other);
}

Terminal::Terminal() = default;

void Terminal::init()
{
    if (_active)
    {
        return;
    }

    const char* sequence = "\x1b[?1049h\x1b[?25l";
    if (!write_stdout(sequence, std::strlen(sequence)))
    {
        spdlog::warn("terminal: could not enter the alternate screen");
    }
    _active = true;
    resize(query_terminal_size_vec());
    clear_screen();
    spdlog::debug("terminal: {}x{}", _size.x, _size.y);
}

void Terminal::shutdown()
{
    if (!_active)
    {
        return;
    }

    clear_screen();
    const char* sequence = "\x1b[0m\x1b[?25h\x1b[?1049l";
    if (!write_stdout(sequence, std::strlen(sequence)))
    {
        spdlog::warn("terminal: could not restore the screen");
    }
    _active = false;
}

bool Terminal::on_terminal_resize()
{
    glm::ivec2 size = query_terminal_size_vec();
    if (size == _size)
    {
        return false;
    }

    resize(size);
    clear_screen();
    return true;
}

void Terminal::resize(const glm::ivec2& size)
{
    _size = glm::ivec2(std::max(0, size.x), std::max(0, size.y));
    std::size_t count = static_cast<std::size_t>(_size.x) * static_cast<std::size_t>(_size.y);
    _pending_frame.assign(count, Character8{});
    _previous_frame.assign(count, Character8{});
    mark_all_dirty();
}

void Terminal::set_size_for_testing(const glm::ivec2& size)
{
    resize(size);
}

glm::ivec2 Terminal::get_size() const
{
    return _size;
}

glm::ivec2 Terminal::get_location(std::size_t buffer_index) const
{
    if (_size.x <= 0)
    {
        return glm::ivec2(0);
    }

    std::size_t width = static_cast<std::size_t>(_size.x);
    return glm::ivec2(static_cast<int>(buffer_index % width), static_cast<int>(buffer_index / width));
}

std::size_t Terminal::get_index(const glm::ivec2& location) const
{
    if (_size.x <= 0)
    {
        return 0;
    }

    return static_cast<std::size_t>(location.y * _size.x + location.x);
}

bool Terminal::in_bounds(const glm::ivec2& location) const
{
    return location.x >= 0 && location.y >= 0 && location.x < _size.x && location.y < _size.y;
}

void Terminal::set_glyph(const glm::ivec2& location, char32_t glyph, const glm::u8vec3& foreground, const glm::u8vec3& background)
{
    if (!in_bounds(location))
    {
        return;
    }

    Character8& cell = _pending_frame[get_index(location)];
    cell.set_glyph(glyph);
    cell.set_glyph_colour(foreground);
    cell.set_background_colour(background);
}

void Terminal::clear()
{
    std::fill(_pending_frame.begin(), _pending_frame.end(), Character8{});
}

void Terminal::mark_all_dirty()
{
    // NUL never appears in a pending frame, so every cell compares unequal.
    std::fill(_previous_frame.begin(), _previous_frame.end(), Character8(U'\0', glm::u8vec3(0), glm::u8vec3(0)));
}

std::string Terminal::flush_sequence()
{
    std::size_t total = _pending_frame.size();
    std::string sequence;
    if (total == 0 || _previous_frame.size() != total)
    {
        return sequence;
    }

    sequence.reserve(64);

    bool have_fg = false;
    bool have_bg = false;
    glm::u8vec3 current_fg(0);
    glm::u8vec3 current_bg(0);
    std::size_t cursor = total;

    for (std::size_t index = 0; index < total; ++index)
    {
        const Character8& next = _pending_frame[index];
        const Character8& prev = _previous_frame[index];
        if (next == prev)
        {
            continue;
        }

        if (cursor != index)
        {
            glm::ivec2 location = get_location(index);
            sequence += "\x1b[" + std::to_string(location.y + 1) + ";" + std::to_string(location.x + 1) + "H";
        }

        const glm::u8vec3& fg = next.get_glyph_colour();
        const glm::u8vec3& bg = next.get_background_colour();

        if (!have_fg || !u8vec3_equal(fg, current_fg))
        {
            sequence += to_ansi_channel(fg, false);
            current_fg = fg;
            have_fg = true;
        }

        if (!have_bg || !u8vec3_equal(bg, current_bg))
        {
            sequence += to_ansi_channel(bg, true);
            current_bg = bg;
            have_bg = true;
        }

        sequence += encode_utf8(next.get_glyph());
        _previous_frame[index] = next;
        cursor = index + 1;
    }

    return sequence;
}

void Terminal::update()
{
    if (_size.x <= 0 || _size.y <= 0)
    {
        return;
    }

    std::string sequence = flush_sequence();
    if (!sequence.empty())
    {
        if (!write_stdout(sequence.data(), sequence.size()))
        {
            // Part of the frame never reached the tty; repaint everything next time.
            std::clearerr(stdout);
            mark_all_dirty();
        }
    }
}

void Terminal::clear_screen()
{
    const char* sequence = "\x1b[2J\x1b[H\x1b[0m";
    if (!write_stdout(sequence, std::strlen(sequence)))
    {
        std::clearerr(stdout);
        mark_all_dirty();
    }
}

TerminalSession::TerminalSession(Terminal& terminal)
    : _terminal(terminal)
{
    input_init();
    _terminal.init();
}

TerminalSession::~TerminalSession()
{
    _terminal.shutdown();
    input_shutdown();
}
