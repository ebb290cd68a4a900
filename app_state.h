#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "messages.h"
#include "play_queue.h"
#include "playlist.h"

enum class AppMode
{
    playing,
    search_input,
    search_browse
};

const char* mode_title(AppMode mode);

enum class Action
{
    none,
    go_to_search,
    go_to_search_browse,
    go_to_playlist,
    search_song,
    add_selected_to_playlist,
    remove_song,
    next_item,
    prev_item,
    next_page,
    prev_page,
    play_selected,
    next_song,
    prev_song,
    toggle_shuffle,
    toggle_pause,
    input_text,
    delete_text,
    quit
};

struct key_action
{
    Action action = Action::none;
    char ch = 0;
};

struct app_state
{
    AppMode mode = AppMode::playing;
    std::vector<playlist_entry> playlist;
    std::vector<playlist_entry> search_results;
    std::size_t current_page = 0;
    std::size_t page_size = 1;
    std::size_t selected_index = 0;
    std::string keyword;
    bool loading = false;
    std::uint64_t search_generation = 0;

    bool playing = false;
    bool paused = false;
    std::optional<std::size_t> playing_index;
    playlist_entry now_playing;
    steady_time song_start_time;
    steady_time paused_at;
    std::chrono::seconds song_duration{0};
    PlayQueue queue;

    bool dedup_playlist = false;
    // A save was dropped by a full mailbox and must be re-sent.
    bool save_pending = false;
    bool backend_lost = false;
    std::string status;
};

struct update_result
{
    std::vector<Command> commands;
    bool quit = false;
};

app_state make_initial_state(std::vector<playlist_entry> playlist, bool dedup_playlist);

// Keyboard binding table for the active mode.
key_action map_key(AppMode mode, int key, char quit_key);

update_result apply_action(app_state& state, const key_action& action);
update_result apply_message(app_state& state, const Message& message);

// The command mailbox was full and the command was discarded.
void on_command_dropped(app_state& state, const Command& command);

// Page size follows the terminal height; cursors are re-clamped.
void set_page_size(app_state& state, std::size_t page_size);

const std::vector<playlist_entry>& active_list(const app_state& state);
std::size_t items_on_current_page(const app_state& state);
std::optional<std::size_t> selected_absolute_index(const app_state& state);

// Playback time of the current song, frozen while paused.
std::chrono::seconds elapsed_playback(const app_state& state, steady_time now);
