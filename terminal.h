#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/ext/vector_uint3_sized.hpp>

class Terminal
{
public:
    class Character8
    {
    public:
        Character8();
        Character8(char32_t glyph, const glm::u8vec3& foreground, const glm::u8vec3& background);

        void set_glyph(char32_t glyph);
        char32_t get_glyph() const;

        void set_glyph_colour(const glm::u8vec3& colour);
        void set_background_colour(const glm::u8vec3& colour);
        const glm::u8vec3& get_glyph_colour() const;
        const glm::u8vec3& get_background_colour() const;

        bool operator==(const Character8& other) const;
        bool operator!=(const Character8& other) const;

    private:
        char32_t _glyph = U' ';
        glm::u8vec3 _glyph_colour = glm::u8vec3(255);
        glm::u8vec3 _background_colour = glm::u8vec3(0);
    };

    Terminal();

    void init();
    void shutdown();

    // Returns true when the size changed since the last call.
    bool on_terminal_resize();

    // Writes only the cells that differ from the previous frame.
    void update();
    void mark_all_dirty();

    glm::ivec2 get_size() const;
    glm::ivec2 get_location(std::size_t buffer_index) const;
    std::size_t get_index(const glm::ivec2& location) const;

    void set_glyph(const glm::ivec2& location, char32_t glyph, const glm::u8vec3& foreground, const glm::u8vec3& background);
    void clear();

    // Renders the pending frame to a string without touching stdout.
    std::string flush_sequence();

    void set_size_for_testing(const glm::ivec2& size);

private:
    void resize(const glm::ivec2& size);
    void clear_screen();
    bool in_bounds(const glm::ivec2& location) const;

private:
    glm::ivec2 _size = glm::ivec2(0);
    std::vector<Character8> _pending_frame;
    std::vector<Character8> _previous_frame;
    bool _active = false;
};

// Raw input plus alternate screen for the lifetime of the object.
class TerminalSession
{
public:
    explicit TerminalSession(Terminal& terminal);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

private:
    Terminal& _terminal;
};
