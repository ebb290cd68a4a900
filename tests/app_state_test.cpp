#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "app_state.h"
#include "input.h"

namespace
{
std::vector<playlist_entry> two_songs()
{
    return {{"a", "Song A"}, {"b", "Song B"}};
}

std::vector<playlist_entry> numbered(std::size_t count, const std::string& prefix)
{
    std::vector<playlist_entry> entries;
    for (std::size_t i = 0; i < count; ++i)
    {
        entries.push_back({prefix + std::to_string(i), "Title " + std::to_string(i)});
    }
    return entries;
}

update_result press(app_state& state, int key, char quit_key = 'q')
{
    return apply_action(state, map_key(state.mode, key, quit_key));
}

void type(app_state& state, const std::string& text)
{
    for (unsigned char ch : text)
    {
        press(state, ch);
    }
}

std::vector<std::string> played_ids(const update_result& result)
{
    std::vector<std::string> ids;
    for (const Command& command : result.commands)
    {
        if (const auto* play = std::get_if<play_command>(&command))
        {
            ids.push_back(play->id);
        }
    }
    return ids;
}
}

TEST(AppState, StartsInPlayingMode)
{
    app_state state = make_initial_state(two_songs(), false);
    EXPECT_EQ(state.mode, AppMode::playing);
    EXPECT_EQ(state.queue.order(), (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(std::string(mode_title(state.mode)), "Now Playing");
}

TEST(AppState, NextThreeTimesWrapsInOrder)
{
    app_state state = make_initial_state(two_songs(), false);
    set_page_size(state, 10);

    std::vector<std::string> ids;
    ids.push_back(played_ids(press(state, input_key_enter)).at(0));
    for (int i = 0; i < 3; ++i)
    {
        ids.push_back(played_ids(press(state, 'n')).at(0));
    }

    EXPECT_EQ(ids, (std::vector<std::string>{"a", "b", "a", "b"}));
    EXPECT_EQ(state.queue.cursor(), 1u);
    EXPECT_EQ(state.now_playing.id, "b");
}

TEST(AppState, PreviousAtFrontReplaysFirst)
{
    app_state state = make_initial_state(two_songs(), false);
    EXPECT_EQ(played_ids(press(state, 'p')), std::vector<std::string>{"a"});
}

TEST(AppState, WhitespaceKeywordIssuesNoSearch)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    ASSERT_EQ(state.mode, AppMode::search_input);
    type(state, "  ");

    update_result result = press(state, input_key_enter);
    EXPECT_TRUE(result.commands.empty());
    EXPECT_FALSE(state.loading);
}

TEST(AppState, SearchIssuesTrimmedKeywordAndSetsLoading)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    type(state, " lofi beats ");

    update_result result = press(state, input_key_enter);
    ASSERT_EQ(result.commands.size(), 1u);
    const auto& search = std::get<search_command>(result.commands[0]);
    EXPECT_EQ(search.keyword, "lofi beats");
    EXPECT_EQ(search.generation, state.search_generation);
    EXPECT_TRUE(state.loading);
}

TEST(AppState, KeywordEditing)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    type(state, "abé");
    press(state, input_key_backspace);
    EXPECT_EQ(state.keyword, "ab");

    press(state, input_key_escape);
    EXPECT_EQ(state.mode, AppMode::playing);
    EXPECT_EQ(state.keyword, "ab");

    press(state, '/');
    EXPECT_TRUE(state.keyword.empty());
}

TEST(AppState, QuitKeyOnlyQuitsFromPlaying)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    EXPECT_FALSE(press(state, 'q').quit);
    EXPECT_EQ(state.keyword, "q");

    press(state, input_key_escape);
    EXPECT_TRUE(press(state, 'q').quit);
}

TEST(AppState, ResultsSwitchToBrowseAndClearLoading)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    type(state, "x");
    press(state, input_key_enter);

    apply_message(state, search_results_message{state.search_generation, numbered(3, "r")});
    EXPECT_EQ(state.mode, AppMode::search_browse);
    EXPECT_FALSE(state.loading);
    EXPECT_EQ(state.search_results.size(), 3u);
    EXPECT_EQ(state.selected_index, 0u);
}

TEST(AppState, StaleResultsAreDiscarded)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    type(state, "old");
    press(state, input_key_enter);
    std::uint64_t old_generation = state.search_generation;

    press(state, input_key_escape);
    press(state, '/');
    type(state, "new");
    press(state, input_key_enter);

    apply_message(state, search_results_message{old_generation, numbered(2, "old")});
    EXPECT_EQ(state.mode, AppMode::search_input);
    EXPECT_TRUE(state.loading);
    EXPECT_TRUE(state.search_results.empty());

    apply_message(state, search_results_message{state.search_generation, numbered(1, "new")});
    EXPECT_EQ(state.mode, AppMode::search_browse);
    EXPECT_EQ(state.search_results[0].id, "new0");
}

TEST(AppState, SearchFailureClearsLoading)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    type(state, "x");
    press(state, input_key_enter);

    apply_message(state, search_failed_message{state.search_generation, "quota exceeded"});
    EXPECT_FALSE(state.loading);
    EXPECT_NE(state.status.find("quota exceeded"), std::string::npos);
}

TEST(AppState, DroppedSearchClearsLoading)
{
    app_state state = make_initial_state({}, false);
    press(state, '/');
    type(state, "x");
    update_result result = press(state, input_key_enter);
    ASSERT_EQ(result.commands.size(), 1u);

    on_command_dropped(state, result.commands[0]);
    EXPECT_FALSE(state.loading);
}

TEST(AppState, DroppedSaveIsMarkedPending)
{
    app_state state = make_initial_state(two_songs(), false);
    set_page_size(state, 5);
    update_result result = press(state, 'x');
    ASSERT_EQ(result.commands.size(), 1u);

    on_command_dropped(state, result.commands[0]);
    EXPECT_TRUE(state.save_pending);
}

TEST(AppState, EofOnLastEntryAdvancesOnce)
{
    app_state state = make_initial_state(two_songs(), false);
    set_page_size(state, 5);
    press(state, 'j');
    update_result start = press(state, input_key_enter);
    ASSERT_EQ(played_ids(start), std::vector<std::string>{"b"});
    apply_message(state, song_started_message{std::chrono::steady_clock::now()});
    EXPECT_TRUE(state.playing);

    update_result result = apply_message(state, song_stopped_message{"eof"});
    EXPECT_FALSE(state.playing);
    ASSERT_EQ(result.commands.size(), 1u);
    EXPECT_EQ(std::get<play_command>(result.commands[0]).id, "a");
}

TEST(AppState, ManualStopDoesNotAdvance)
{
    app_state state = make_initial_state(two_songs(), false);
    apply_message(state, song_started_message{std::chrono::steady_clock::now()});
    update_result result = apply_message(state, song_stopped_message{"stop"});
    EXPECT_TRUE(result.commands.empty());
    EXPECT_FALSE(state.playing);
}

TEST(AppState, AddFromBrowsePersistsAndRebuilds)
{
    app_state state = make_initial_state(two_songs(), false);
    set_page_size(state, 5);
    apply_message(state, search_results_message{0, numbered(3, "r")});
    press(state, 'j');

    update_result result = press(state, input_key_enter);
    ASSERT_EQ(state.playlist.size(), 3u);
    EXPECT_EQ(state.playlist.back().id, "r1");
    EXPECT_EQ(state.queue.size(), 3u);
    ASSERT_EQ(result.commands.size(), 1u);
    EXPECT_EQ(std::get<save_playlist_command>(result.commands[0]).entries.size(), 3u);

    press(state, input_key_enter);
    EXPECT_EQ(state.playlist.size(), 4u);
}

TEST(AppState, DedupRejectsKnownId)
{
    app_state state = make_initial_state({{"r0", "Already"}}, true);
    set_page_size(state, 5);
    apply_message(state, search_results_message{0, numbered(2, "r")});

    update_result result = press(state, input_key_enter);
    EXPECT_TRUE(result.commands.empty());
    EXPECT_EQ(state.playlist.size(), 1u);
    EXPECT_FALSE(state.status.empty());
}

TEST(AppState, RemoveAdjustsPlayingIndex)
{
    app_state state = make_initial_state(numbered(3, "p"), false);
    set_page_size(state, 5);
    press(state, 'j');
    press(state, 'j');
    press(state, input_key_enter);
    ASSERT_EQ(state.playing_index, std::optional<std::size_t>(2));

    press(state, 'k');
    press(state, 'k');
    update_result result = press(state, 'x');
    EXPECT_EQ(state.playlist.size(), 2u);
    EXPECT_EQ(state.playing_index, std::optional<std::size_t>(1));
    EXPECT_EQ(state.queue.size(), 2u);
    EXPECT_EQ(state.queue.cursor(), 0u);
    ASSERT_EQ(result.commands.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<save_playlist_command>(result.commands[0]));
}

TEST(AppState, RemoveLastItemOnPageClampsSelection)
{
    app_state state = make_initial_state(numbered(3, "p"), false);
    set_page_size(state, 2);
    press(state, '>');
    ASSERT_EQ(state.current_page, 1u);

    press(state, 'x');
    EXPECT_EQ(state.playlist.size(), 2u);
    EXPECT_EQ(state.current_page, 0u);
    EXPECT_EQ(state.selected_index, 0u);
}

TEST(AppState, EmptyListOperationsAreNoOps)
{
    app_state state = make_initial_state({}, false);
    set_page_size(state, 4);
    const int keys[] = {'j', 'k', '>', '<', 'x', 'n', 'p', input_key_enter, ' '};
    for (int key : keys)
    {
        update_result result = press(state, key);
        EXPECT_TRUE(result.commands.empty()) << "key " << key;
    }
    EXPECT_EQ(state.current_page, 0u);
    EXPECT_EQ(state.selected_index, 0u);
}

TEST(AppState, PagingIsClampedAndResetsSelection)
{
    app_state state = make_initial_state(numbered(5, "p"), false);
    set_page_size(state, 2);

    press(state, 'j');
    EXPECT_EQ(state.selected_index, 1u);
    press(state, 'j');
    EXPECT_EQ(state.selected_index, 1u);

    press(state, '>');
    EXPECT_EQ(state.current_page, 1u);
    EXPECT_EQ(state.selected_index, 0u);
    press(state, '>');
    press(state, '>');
    EXPECT_EQ(state.current_page, 2u);
    EXPECT_EQ(items_on_current_page(state), 1u);

    press(state, 'j');
    EXPECT_EQ(state.selected_index, 0u);

    press(state, input_key_left);
    EXPECT_EQ(state.current_page, 1u);
    press(state, '<');
    press(state, '<');
    EXPECT_EQ(state.current_page, 0u);
}

TEST(AppState, ArrowKeysNavigateLists)
{
    EXPECT_EQ(map_key(AppMode::playing, input_key_down, 'q').action, Action::next_item);
    EXPECT_EQ(map_key(AppMode::search_browse, input_key_up, 'q').action, Action::prev_item);
    EXPECT_EQ(map_key(AppMode::search_browse, input_key_right, 'q').action, Action::next_page);
    EXPECT_EQ(map_key(AppMode::search_input, input_key_down, 'q').action, Action::none);
}

TEST(AppState, ModeSwitchResetsCursors)
{
    app_state state = make_initial_state(numbered(6, "p"), false);
    set_page_size(state, 2);
    press(state, '>');
    press(state, 'j');

    press(state, input_key_tab);
    EXPECT_EQ(state.mode, AppMode::search_browse);
    EXPECT_EQ(state.current_page, 0u);
    EXPECT_EQ(state.selected_index, 0u);

    press(state, input_key_escape);
    EXPECT_EQ(state.mode, AppMode::playing);
}

TEST(AppState, ShuffleToggleRebuildsQueue)
{
    app_state state = make_initial_state(numbered(4, "p"), false);
    press(state, 'n');
    press(state, 's');
    EXPECT_TRUE(state.queue.is_shuffle());
    EXPECT_EQ(state.queue.cursor(), 0u);
    EXPECT_EQ(state.queue.size(), 4u);
}

TEST(AppState, PauseOnlyWhilePlaying)
{
    app_state state = make_initial_state(two_songs(), false);
    EXPECT_TRUE(press(state, ' ').commands.empty());

    apply_message(state, song_started_message{std::chrono::steady_clock::now()});
    update_result result = press(state, ' ');
    ASSERT_EQ(result.commands.size(), 1u);
    EXPECT_TRUE(std::get<pause_command>(result.commands[0]).paused);
    EXPECT_TRUE(state.paused);

    result = press(state, ' ');
    EXPECT_FALSE(std::get<pause_command>(result.commands[0]).paused);
}

TEST(AppState, NextTrackAfterPauseIsUnpaused)
{
    app_state state = make_initial_state(two_songs(), false);
    press(state, input_key_enter);
    apply_message(state, song_started_message{std::chrono::steady_clock::now()});
    press(state, ' ');
    ASSERT_TRUE(state.paused);

    update_result result = press(state, 'n');
    EXPECT_EQ(played_ids(result), std::vector<std::string>{"b"});
    EXPECT_FALSE(state.paused);
}

TEST(AppState, StopWhilePausedClearsPause)
{
    app_state state = make_initial_state(two_songs(), false);
    press(state, input_key_enter);
    apply_message(state, song_started_message{std::chrono::steady_clock::now()});
    press(state, ' ');

    update_result result = apply_message(state, song_stopped_message{"stop"});
    EXPECT_TRUE(result.commands.empty());
    EXPECT_FALSE(state.playing);
    EXPECT_FALSE(state.paused);
    EXPECT_TRUE(press(state, ' ').commands.empty());
}

TEST(AppState, PlayFailureReplacesLoadingStatus)
{
    app_state state = make_initial_state(two_songs(), false);
    press(state, input_key_enter);
    EXPECT_EQ(state.status, "Loading Song A");

    apply_message(state, play_failed_message{"b", "resolver failed"});
    EXPECT_EQ(state.status, "Loading Song A");

    apply_message(state, play_failed_message{"a", "resolver failed"});
    EXPECT_EQ(state.status, "Could not play Song A: resolver failed");
    EXPECT_FALSE(state.playing);
}

TEST(AppState, ElapsedFreezesWhilePaused)
{
    app_state state = make_initial_state(two_songs(), false);
    steady_time start = std::chrono::steady_clock::now();
    apply_message(state, song_started_message{start});

    EXPECT_EQ(elapsed_playback(state, start + std::chrono::seconds(30)), std::chrono::seconds(30));

    state.paused = true;
    state.paused_at = start + std::chrono::seconds(10);
    EXPECT_EQ(elapsed_playback(state, start + std::chrono::seconds(30)), std::chrono::seconds(10));
}

TEST(AppState, PlaybackLossIsPersistent)
{
    app_state state = make_initial_state(two_songs(), false);
    apply_message(state, song_started_message{std::chrono::steady_clock::now()});
    apply_message(state, playback_lost_message{"connection closed"});
    EXPECT_TRUE(state.backend_lost);
    EXPECT_FALSE(state.playing);
    EXPECT_FALSE(state.status.empty());
}

TEST(AppState, DurationIsStored)
{
    app_state state = make_initial_state({}, false);
    apply_message(state, song_duration_message{std::chrono::seconds(201)});
    EXPECT_EQ(state.song_duration, std::chrono::seconds(201));
}
