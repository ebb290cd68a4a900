#include "messages.h"

#include <type_traits>

template <typename T>
inline constexpr bool always_false = false;

std::string describe(const Command& command)
{
    return std::visit([](const auto& value) -> std::string
    {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, search_command>)
        {
            return "search('" + value.keyword + "', gen " + std::to_string(value.generation) + ")";
        }
        else if constexpr (std::is_same_v<T, play_command>)
        {
            return "play(" + value.id + ")";
        }
        else if constexpr (std::is_same_v<T, save_playlist_command>)
        {
            return "save_playlist(" + std::to_string(value.entries.size()) + " entries)";
        }
        else if constexpr (std::is_same_v<T, pause_command>)
        {
            return value.paused ? "pause(yes)" : "pause(no)";
        }
        else
        {
            static_assert(always_false<T>, "unhandled command");
        }
    }, command);
}

std::string describe(const Message& message)
{
    return std::visit([](const auto& value) -> std::string
    {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, search_results_message>)
        {
            return "search_results(" + std::to_string(value.results.size()) + ", gen " + std::to_string(value.generation) + ")";
        }
        else if constexpr (std::is_same_v<T, search_failed_message>)
        {
            return "search_failed(" + value.reason + ")";
        }
        else if constexpr (std::is_same_v<T, song_started_message>)
        {
            return "song_started";
        }
        else if constexpr (std::is_same_v<T, song_stopped_message>)
        {
            return "song_stopped(" + value.reason + ")";
        }
        else if constexpr (std::is_same_v<T, song_duration_message>)
        {
            return "song_duration(" + std::to_string(value.duration.count()) + "s)";
        }
        else if constexpr (std::is_same_v<T, play_failed_message>)
        {
            return "play_failed(" + value.id + ": " + value.reason + ")";
        }
        else if constexpr (std::is_same_v<T, playback_lost_message>)
        {
            return "playback_lost(" + value.reason + ")";
        }
        else
        {
            static_assert(always_false<T>, "unhandled message");
        }
    }, message);
}
