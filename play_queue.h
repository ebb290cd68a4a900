#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <vector>

// Identity order when shuffle is off, otherwise a uniform permutation of 0..length.
std::vector<std::size_t> build_queue(std::size_t length, bool shuffle);
std::vector<std::size_t> build_queue(std::size_t length, bool shuffle, std::mt19937& rng);

// Traversal order over playlist positions plus a cursor into it.
class PlayQueue
{
public:
    PlayQueue();
    explicit PlayQueue(unsigned int seed);

    // Rebuilds for a playlist of the given length; the cursor returns to the front.
    void rebuild(std::size_t length);
    void set_shuffle(bool shuffle, std::size_t length);
    bool is_shuffle() const;

    bool empty() const;
    std::size_t size() const;
    std::size_t cursor() const;
    const std::vector<std::size_t>& order() const;

    std::optional<std::size_t> current() const;
    std::optional<std::size_t> next();
    std::optional<std::size_t> previous();

    // Moves the cursor onto the queue slot holding this playlist position.
    bool seek_to(std::size_t playlist_index);

private:
    std::vector<std::size_t> _order;
    std::size_t _cursor = 0;
    bool _shuffle = false;
    std::mt19937 _rng;
};
