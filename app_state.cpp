#include "app_state.h"

#include <algorithm>
#include <type_traits>

#include <spdlog/spdlog.h>

#include "input.h"
#include "paging.h"
#include "text.h"

template <typename T>
inline constexpr bool always_false_message = false;

const char* mode_title(AppMode mode)
{
    switch (mode)
    {
    case AppMode::playing:
        return "Now Playing";
    case AppMode::search_input:
    case AppMode::search_browse:
        return "Song Search";
    }
    return "";
}

app_state make_initial_state(std::vector<playlist_entry> playlist, bool dedup_playlist)
{
    app_state state;
    state.playlist = std::move(playlist);
    state.dedup_playlist = dedup_playlist;
    state.song_start_time = std::chrono::steady_clock::now();
    state.queue.rebuild(state.playlist.size());
    return state;
}

const std::vector<playlist_entry>& active_list(const app_state& state)
{
    return state.mode == AppMode::playing ? state.playlist : state.search_results;
}

std::size_t items_on_current_page(const app_state& state)
{
    return page_bounds(active_list(state).size(), state.current_page, state.page_size).size();
}

std::optional<std::size_t> selected_absolute_index(const app_state& state)
{
    if (state.selected_index >= items_on_current_page(state))
    {
        return std::nullopt;
    }
    return state.current_page * state.page_size + state.selected_index;
}

std::chrono::seconds elapsed_playback(const app_state& state, steady_time now)
{
    steady_time end = state.paused ? state.paused_at : now;
    if (end < state.song_start_time)
    {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(end - state.song_start_time);
}

static void clamp_cursors(app_state& state)
{
    std::size_t pages = total_pages(active_list(state).size(), state.page_size);
    if (pages == 0)
    {
        state.current_page = 0;
    }
    else if (state.current_page >= pages)
    {
        state.current_page = pages - 1;
    }

    std::size_t items = items_on_current_page(state);
    if (items == 0)
    {
        state.selected_index = 0;
    }
    else if (state.selected_index >= items)
    {
        state.selected_index = items - 1;
    }
}

void set_page_size(app_state& state, std::size_t page_size)
{
    state.page_size = std::max<std::size_t>(1, page_size);
    clamp_cursors(state);
}

static void switch_mode(app_state& state, AppMode mode)
{
    spdlog::debug("state: mode {} -> {}", static_cast<int>(state.mode), static_cast<int>(mode));
    state.mode = mode;
    state.selected_index = 0;
    state.current_page = 0;
}

static void play_index(app_state& state, std::size_t index, update_result& result)
{
    if (index >= state.playlist.size())
    {
        return;
    }

    state.playing_index = index;
    state.now_playing = state.playlist[index];
    state.paused = false;
    state.status = "Loading " + state.now_playing.title;
    result.commands.push_back(play_command{state.now_playing.id});
}

static void play_next(app_state& state, update_result& result)
{
    std::optional<std::size_t> index = state.queue.next();
    if (index)
    {
        play_index(state, *index, result);
    }
}

static void play_previous(app_state& state, update_result& result)
{
    std::optional<std::size_t> index = state.queue.previous();
    if (index)
    {
        play_index(state, *index, result);
    }
}

static void request_save(app_state& state, update_result& result)
{
    state.save_pending = false;
    result.commands.push_back(save_playlist_command{state.playlist});
}

static void pop_last_char(std::string& text)
{
    while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80)
    {
        text.pop_back();
    }
    if (!text.empty())
    {
        text.pop_back();
    }
}

key_action map_key(AppMode mode, int key, char quit_key)
{
    key_action result;
    if (key == input_key_none)
    {
        return result;
    }

    if (mode != AppMode::search_input)
    {
        switch (key)
        {
        case input_key_up:
            key = 'k';
            break;
        case input_key_down:
            key = 'j';
            break;
        case input_key_left:
            key = '<';
            break;
        case input_key_right:
            key = '>';
            break;
        default:
            break;
        }
    }

    switch (mode)
    {
    case AppMode::playing:
        if (key == static_cast<unsigned char>(quit_key))
        {
            result.action = Action::quit;
            return result;
        }
        switch (key)
        {
        case input_key_enter:
            result.action = Action::play_selected;
            break;
        case '/':
            result.action = Action::go_to_search;
            break;
        case input_key_tab:
            result.action = Action::go_to_search_browse;
            break;
        case 'j':
            result.action = Action::next_item;
            break;
        case 'k':
            result.action = Action::prev_item;
            break;
        case 'x':
            result.action = Action::remove_song;
            break;
        case '>':
            result.action = Action::next_page;
            break;
        case '<':
            result.action = Action::prev_page;
            break;
        case 'n':
            result.action = Action::next_song;
            break;
        case 'p':
            result.action = Action::prev_song;
            break;
        case 's':
            result.action = Action::toggle_shuffle;
            break;
        case ' ':
            result.action = Action::toggle_pause;
            break;
        default:
            break;
        }
        break;

    case AppMode::search_input:
        if (key == input_key_escape)
        {
            result.action = Action::go_to_playlist;
        }
        else if (key == input_key_backspace)
        {
            result.action = Action::delete_text;
        }
        else if (key == input_key_enter)
        {
            result.action = Action::search_song;
        }
        else if (key >= 0x20 && key <= 0xFF && key != 0x7F)
        {
            result.action = Action::input_text;
            result.ch = static_cast<char>(key);
        }
        break;

    case AppMode::search_browse:
        switch (key)
        {
        case input_key_escape:
        case 'q':
            result.action = Action::go_to_playlist;
            break;
        case '/':
            result.action = Action::go_to_search;
            break;
        case '>':
            result.action = Action::next_page;
            break;
        case '<':
            result.action = Action::prev_page;
            break;
        case 'j':
            result.action = Action::next_item;
            break;
        case 'k':
            result.action = Action::prev_item;
            break;
        case input_key_enter:
            result.action = Action::add_selected_to_playlist;
            break;
        default:
            break;
        }
        break;
    }

    return result;
}

update_result apply_action(app_state& state, const key_action& action)
{
    update_result result;

    switch (action.action)
    {
    case Action::none:
        break;

    case Action::go_to_search:
        switch_mode(state, AppMode::search_input);
        state.keyword.clear();
        break;

    case Action::go_to_search_browse:
        switch_mode(state, AppMode::search_browse);
        break;

    case Action::go_to_playlist:
        switch_mode(state, AppMode::playing);
        break;

    case Action::search_song:
    {
        if (state.mode != AppMode::search_input)
        {
            break;
        }
        std::string keyword = trim_copy(state.keyword);
        if (keyword.empty())
        {
            break;
        }
        ++state.search_generation;
        state.loading = true;
        state.status.clear();
        result.commands.push_back(search_command{keyword, state.search_generation});
        break;
    }

    case Action::add_selected_to_playlist:
    {
        if (state.mode != AppMode::search_browse)
        {
            break;
        }
        std::optional<std::size_t> index = selected_absolute_index(state);
        if (!index)
        {
            break;
        }
        const playlist_entry& entry = state.search_results[*index];
        if (state.dedup_playlist && contains_id(state.playlist, entry.id))
        {
            state.status = "Already in playlist: " + entry.title;
            break;
        }
        state.playlist.push_back(entry);
        state.queue.rebuild(state.playlist.size());
        state.status = "Added: " + entry.title;
        request_save(state, result);
        break;
    }

    case Action::remove_song:
    {
        if (state.mode != AppMode::playing)
        {
            break;
        }
        std::optional<std::size_t> index = selected_absolute_index(state);
        if (!index)
        {
            break;
        }
        state.status = "Removed: " + state.playlist[*index].title;
        state.playlist.erase(state.playlist.begin() + static_cast<std::ptrdiff_t>(*index));
        if (state.playing_index)
        {
            if (*state.playing_index == *index)
            {
                state.playing_index.reset();
            }
            else if (*state.playing_index > *index)
            {
                --*state.playing_index;
            }
        }
        state.queue.rebuild(state.playlist.size());
        clamp_cursors(state);
        request_save(state, result);
        break;
    }

    case Action::next_item:
        if (state.selected_index + 1 < items_on_current_page(state))
        {
            ++state.selected_index;
        }
        break;

    case Action::prev_item:
        if (state.selected_index > 0)
        {
            --state.selected_index;
        }
        break;

    case Action::next_page:
    {
        std::size_t pages = total_pages(active_list(state).size(), state.page_size);
        if (state.current_page + 1 < pages)
        {
            ++state.current_page;
        }
        state.selected_index = 0;
        break;
    }

    case Action::prev_page:
        if (state.current_page > 0)
        {
            --state.current_page;
        }
        state.selected_index = 0;
        break;

    case Action::play_selected:
    {
        if (state.mode != AppMode::playing)
        {
            break;
        }
        std::optional<std::size_t> index = selected_absolute_index(state);
        if (!index)
        {
            break;
        }
        state.queue.seek_to(*index);
        play_index(state, *index, result);
        break;
    }

    case Action::next_song:
        play_next(state, result);
        break;

    case Action::prev_song:
        play_previous(state, result);
        break;

    case Action::toggle_shuffle:
        state.queue.set_shuffle(!state.queue.is_shuffle(), state.playlist.size());
        state.status = state.queue.is_shuffle() ? "Shuffle on" : "Shuffle off";
        break;

    case Action::toggle_pause:
    {
        if (!state.playing)
        {
            break;
        }
        steady_time now = std::chrono::steady_clock::now();
        if (state.paused)
        {
            state.song_start_time += now - state.paused_at;
        }
        else
        {
            state.paused_at = now;
        }
        state.paused = !state.paused;
        result.commands.push_back(pause_command{state.paused});
        break;
    }

    case Action::input_text:
        if (state.mode == AppMode::search_input)
        {
            state.keyword.push_back(action.ch);
        }
        break;

    case Action::delete_text:
        if (state.mode == AppMode::search_input)
        {
            pop_last_char(state.keyword);
        }
        break;

    case Action::quit:
        result.quit = true;
        break;
    }

    return result;
}

update_result apply_message(app_state& state, const Message& message)
{
    update_result result;

    std::visit([&](const auto& value)
    {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, search_results_message>)
        {
            if (value.generation != state.search_generation)
            {
                spdlog::debug("state: discarding stale results (gen {} != {})", value.generation, state.search_generation);
                return;
            }
            state.search_results = value.results;
            switch_mode(state, AppMode::search_browse);
            state.loading = false;
            state.status = std::to_string(state.search_results.size()) + " results";
        }
        else if constexpr (std::is_same_v<T, search_failed_message>)
        {
            if (value.generation != state.search_generation)
            {
                return;
            }
            state.loading = false;
            state.status = "Search failed: " + value.reason;
        }
        else if constexpr (std::is_same_v<T, song_started_message>)
        {
            state.playing = true;
            state.paused = false;
            state.song_start_time = value.started;
            state.status.clear();
        }
        else if constexpr (std::is_same_v<T, song_stopped_message>)
        {
            state.playing = false;
            state.paused = false;
            if (value.reason == "eof")
            {
                play_next(state, result);
            }
        }
        else if constexpr (std::is_same_v<T, song_duration_message>)
        {
            state.song_duration = value.duration;
        }
        else if constexpr (std::is_same_v<T, play_failed_message>)
        {
            if (value.id != state.now_playing.id)
            {
                return;
            }
            state.playing = false;
            state.paused = false;
            if (!state.backend_lost)
            {
                state.status = "Could not play " + state.now_playing.title + ": " + value.reason;
            }
        }
        else if constexpr (std::is_same_v<T, playback_lost_message>)
        {
            state.backend_lost = true;
            state.playing = false;
            state.status = "Playback backend disconnected (" + value.reason + ")";
        }
        else
        {
            static_assert(always_false_message<T>, "unhandled message");
        }
    }, message);

    return result;
}

void on_command_dropped(app_state& state, const Command& command)
{
    if (const auto* search = std::get_if<search_command>(&command))
    {
        if (search->generation == state.search_generation)
        {
            state.loading = false;
        }
        state.status = "Busy, search not sent";
    }
    else if (std::holds_alternative<play_command>(command))
    {
        state.status = "Busy, press again";
    }
    else if (std::holds_alternative<save_playlist_command>(command))
    {
        state.save_pending = true;
    }
}
