#include "view.h"

#include <algorithm>

#include "paging.h"
#include "text.h"

namespace
{
constexpr int chrome_rows = 6;
constexpr int list_top = 2;
}

std::size_t page_size_for_height(int rows)
{
    return static_cast<std::size_t>(std::max(1, rows - chrome_rows));
}

std::string header_text(const app_state& state, steady_time now, int width)
{
    if (!state.playing && !state.paused)
    {
        return mode_title(state.mode);
    }

    std::string marker = state.paused ? "⏸" : "▶";
    if (state.queue.is_shuffle())
    {
        marker += "~";
    }

    std::string times = " - " + display_time(elapsed_playback(state, now)) + " / " + display_time(state.song_duration);
    int room = width - static_cast<int>(utf8_length(marker)) - 1 - static_cast<int>(utf8_length(times));
    std::string title = truncate(state.now_playing.title, static_cast<std::size_t>(std::max(1, room)));
    return marker + " " + title + times;
}

std::string instruction_text(const app_state& state, char quit_key)
{
    if (state.loading)
    {
        return "Loading...";
    }

    switch (state.mode)
    {
    case AppMode::playing:
        return std::string("[/] Search  [x] Remove  [Enter] Play  [n/p] Next/Prev  [s] Shuffle ")
            + (state.queue.is_shuffle() ? "ON" : "OFF")
            + "  [Space] Pause  [Tab] Back to search  [" + quit_key + "] Quit";
    case AppMode::search_input:
        return "Search: " + state.keyword + "█";
    case AppMode::search_browse:
        return "[j/k] Up/Down    [<] Previous page    [>] Next page    [/] Search    [Enter] Add    [Esc] Back";
    }
    return std::string();
}

static bool is_highlighted(const app_state& state, std::size_t index)
{
    if (state.mode == AppMode::playing)
    {
        return state.playing_index && *state.playing_index == index;
    }
    return contains_id(state.playlist, state.search_results[index].id);
}

void render_view(Renderer& renderer, const app_state& state, steady_time now, char quit_key)
{
    const ui_palette& palette = renderer.palette();
    glm::ivec2 size = renderer.get_terminal_size();
    if (size.x <= 0 || size.y <= 0)
    {
        return;
    }

    renderer.clear();

    renderer.draw_string_coloured(header_text(state, now, size.x), glm::ivec2(0, 0), palette.header_fg, palette.background);
    renderer.draw_horizontal_line(1, U'─');

    const std::vector<playlist_entry>& list = active_list(state);
    std::size_t pages = total_pages(list.size(), state.page_size);
    if (list.empty())
    {
        renderer.draw_string("Nothing to show. Hit search and add something here.", glm::ivec2(0, list_top));
    }
    else
    {
        page_range range = page_bounds(list.size(), state.current_page, state.page_size);
        for (std::size_t index = range.begin; index < range.end; ++index)
        {
            int row = list_top + static_cast<int>(index - range.begin);
            std::string prefix = std::to_string(index + 1) + ". ";
            int room = size.x - static_cast<int>(prefix.size());
            std::string text = prefix + truncate(list[index].title, static_cast<std::size_t>(std::max(1, room)));

            bool selected = state.mode != AppMode::search_input && index - range.begin == state.selected_index;
            if (selected)
            {
                renderer.fill_row(row, palette.selected_bg);
                renderer.draw_string_selected(text, glm::ivec2(0, row));
            }
            else if (is_highlighted(state, index))
            {
                renderer.draw_string_coloured(text, glm::ivec2(0, row), palette.highlight_fg, palette.background);
            }
            else
            {
                renderer.draw_string(text, glm::ivec2(0, row));
            }
        }
    }

    std::string page_line = "Page: " + std::to_string(state.current_page + 1) + "/" + std::to_string(std::max<std::size_t>(1, pages));
    renderer.draw_string_coloured(page_line, glm::ivec2(0, size.y - 4), palette.dim_fg, palette.background);

    if (!state.status.empty())
    {
        const glm::u8vec3& colour = state.backend_lost ? palette.error_fg : palette.text_fg;
        renderer.draw_string_coloured(truncate(state.status, static_cast<std::size_t>(size.x)), glm::ivec2(0, size.y - 3), colour, palette.background);
    }

    renderer.draw_horizontal_line(size.y - 2, U'─');
    renderer.draw_string(instruction_text(state, quit_key), glm::ivec2(0, size.y - 1));
}
