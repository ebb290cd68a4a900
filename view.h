#pragma once

#include <cstddef>
#include <string>

#include "app_state.h"
#include "draw.h"

// Rows left for the list once header, rules, page line, status and instruction bar are placed.
std::size_t page_size_for_height(int rows);

std::string header_text(const app_state& state, steady_time now, int width);
std::string instruction_text(const app_state& state, char quit_key);

void render_view(Renderer& renderer, const app_state& state, steady_time now, char quit_key);
