#pragma once

#include <string>

#include <glm/vec2.hpp>
#include <glm/ext/vector_uint3_sized.hpp>

#include "terminal.h"

struct ui_palette
{
    glm::u8vec3 text_fg = glm::u8vec3(220, 220, 220);
    glm::u8vec3 background = glm::u8vec3(0, 0, 0);
    glm::u8vec3 highlight_fg = glm::u8vec3(90, 150, 255);
    glm::u8vec3 selected_fg = glm::u8vec3(0, 0, 0);
    glm::u8vec3 selected_bg = glm::u8vec3(220, 220, 220);
    glm::u8vec3 header_fg = glm::u8vec3(255, 255, 255);
    glm::u8vec3 dim_fg = glm::u8vec3(140, 140, 140);
    glm::u8vec3 error_fg = glm::u8vec3(255, 110, 110);
};

class Renderer
{
public:
    explicit Renderer(Terminal& terminal);

    const ui_palette& palette() const;
    glm::ivec2 get_terminal_size() const;

    // Each returns the number of cells written; text is clipped at the right edge.
    int draw_string(const std::string& text, const glm::ivec2& location);
    int draw_string_selected(const std::string& text, const glm::ivec2& location);
    int draw_string_coloured(const std::string& text, const glm::ivec2& location, const glm::u8vec3& foreground, const glm::u8vec3& background);

    void draw_horizontal_line(int row, char32_t glyph);
    void fill_row(int row, const glm::u8vec3& background);
    void clear();
    void present();

private:
    Terminal& _terminal;
    ui_palette _palette;
};
