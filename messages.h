#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "playlist.h"

using steady_time = std::chrono::steady_clock::time_point;

// UI -> coordinator.

struct search_command
{
    std::string keyword;
    std::uint64_t generation = 0;
};

struct play_command
{
    std::string id;
};

struct save_playlist_command
{
    std::vector<playlist_entry> entries;
};

struct pause_command
{
    bool paused = false;
};

using Command = std::variant<search_command, play_command, save_playlist_command, pause_command>;

// Coordinator -> UI.

struct search_results_message
{
    std::uint64_t generation = 0;
    std::vector<playlist_entry> results;
};

struct search_failed_message
{
    std::uint64_t generation = 0;
    std::string reason;
};

struct song_started_message
{
    steady_time started;
};

struct song_stopped_message
{
    std::string reason;
};

struct song_duration_message
{
    std::chrono::seconds duration{0};
};

// The track could not be resolved or loaded.
struct play_failed_message
{
    std::string id;
    std::string reason;
};

struct playback_lost_message
{
    std::string reason;
};

using Message = std::variant<
    search_results_message,
    search_failed_message,
    song_started_message,
    song_stopped_message,
    song_duration_message,
    play_failed_message,
    playback_lost_message>;

std::string describe(const Command& command);
std::string describe(const Message& message);
