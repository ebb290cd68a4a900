#include <algorithm>
#include <numeric>
#include <vector>

#include <gtest/gtest.h>

#include "play_queue.h"

static std::vector<std::size_t> identity(std::size_t n)
{
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    return order;
}

TEST(BuildQueue, SequentialIsIdentity)
{
    for (std::size_t n = 0; n < 20; ++n)
    {
        EXPECT_EQ(build_queue(n, false), identity(n)) << "n=" << n;
    }
}

TEST(BuildQueue, ShuffleIsPermutation)
{
    for (std::size_t n = 0; n < 40; ++n)
    {
        for (int round = 0; round < 5; ++round)
        {
            std::vector<std::size_t> order = build_queue(n, true);
            ASSERT_EQ(order.size(), n);
            std::sort(order.begin(), order.end());
            EXPECT_EQ(order, identity(n)) << "n=" << n;
        }
    }
}

TEST(BuildQueue, SeededShuffleIsReproducible)
{
    std::mt19937 a(42);
    std::mt19937 b(42);
    EXPECT_EQ(build_queue(30, true, a), build_queue(30, true, b));
}

TEST(PlayQueue, EmptyQueueNeverAdvances)
{
    PlayQueue queue(1);
    queue.rebuild(0);
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.current().has_value());
    EXPECT_FALSE(queue.next().has_value());
    EXPECT_FALSE(queue.previous().has_value());
}

TEST(PlayQueue, NextWrapsByRebuilding)
{
    PlayQueue queue(1);
    queue.rebuild(2);
    ASSERT_EQ(queue.cursor(), 0u);

    std::vector<std::size_t> played;
    for (int i = 0; i < 3; ++i)
    {
        std::optional<std::size_t> index = queue.next();
        ASSERT_TRUE(index.has_value());
        played.push_back(*index);
    }

    EXPECT_EQ(played, (std::vector<std::size_t>{1, 0, 1}));
    EXPECT_EQ(queue.cursor(), 1u);
}

TEST(PlayQueue, NextReachesEndWithinLengthCalls)
{
    PlayQueue queue(7);
    queue.set_shuffle(true, 9);
    for (std::size_t start = 0; start < 9; ++start)
    {
        queue.rebuild(9);
        for (std::size_t i = 0; i < start; ++i)
        {
            queue.next();
        }
        ASSERT_EQ(queue.cursor(), start);

        std::size_t previous_cursor = queue.cursor();
        bool reset = false;
        for (std::size_t i = 0; i < 9 && !reset; ++i)
        {
            queue.next();
            if (queue.cursor() == 0)
            {
                reset = true;
            }
            else
            {
                EXPECT_EQ(queue.cursor(), previous_cursor + 1);
            }
            previous_cursor = queue.cursor();
        }
        EXPECT_TRUE(reset) << "start=" << start;
    }
}

TEST(PlayQueue, PreviousStopsAtFront)
{
    PlayQueue queue(1);
    queue.rebuild(3);
    queue.next();
    EXPECT_EQ(queue.previous(), std::optional<std::size_t>(0));
    EXPECT_EQ(queue.previous(), std::optional<std::size_t>(0));
    EXPECT_EQ(queue.cursor(), 0u);
}

TEST(PlayQueue, ShuffleToggleRebuildsAndResets)
{
    PlayQueue queue(3);
    queue.rebuild(5);
    queue.next();
    queue.next();

    queue.set_shuffle(true, 5);
    EXPECT_TRUE(queue.is_shuffle());
    EXPECT_EQ(queue.cursor(), 0u);
    EXPECT_EQ(queue.size(), 5u);

    queue.set_shuffle(false, 5);
    EXPECT_EQ(queue.order(), identity(5));
}

TEST(PlayQueue, SeekToFindsPlaylistPosition)
{
    PlayQueue queue(11);
    queue.set_shuffle(true, 6);
    ASSERT_TRUE(queue.seek_to(4));
    EXPECT_EQ(queue.current(), std::optional<std::size_t>(4));
    EXPECT_FALSE(queue.seek_to(6));
}
