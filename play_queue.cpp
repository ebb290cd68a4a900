#include "play_queue.h"

#include <algorithm>
#include <iterator>
#include <numeric>

#include <spdlog/spdlog.h>

std::vector<std::size_t> build_queue(std::size_t length, bool shuffle, std::mt19937& rng)
{
    std::vector<std::size_t> order(length);
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (shuffle && length > 1)
    {
        std::shuffle(order.begin(), order.end(), rng);
    }
    return order;
}

std::vector<std::size_t> build_queue(std::size_t length, bool shuffle)
{
    static thread_local std::mt19937 rng(std::random_device{}());
    return build_queue(length, shuffle, rng);
}

PlayQueue::PlayQueue()
    : _rng(std::random_device{}())
{
}

PlayQueue::PlayQueue(unsigned int seed)
    : _rng(seed)
{
}

void PlayQueue::rebuild(std::size_t length)
{
    _order = build_queue(length, _shuffle, _rng);
    _cursor = 0;
    spdlog::debug("queue: rebuilt {} entries (shuffle {})", length, _shuffle ? "on" : "off");
}

void PlayQueue::set_shuffle(bool shuffle, std::size_t length)
{
    _shuffle = shuffle;
    rebuild(length);
}

bool PlayQueue::is_shuffle() const
{
    return _shuffle;
}

bool PlayQueue::empty() const
{
    return _order.empty();
}

std::size_t PlayQueue::size() const
{
    return _order.size();
}

std::size_t PlayQueue::cursor() const
{
    return _cursor;
}

const std::vector<std::size_t>& PlayQueue::order() const
{
    return _order;
}

std::optional<std::size_t> PlayQueue::current() const
{
    if (_cursor >= _order.size())
    {
        return std::nullopt;
    }
    return _order[_cursor];
}

std::optional<std::size_t> PlayQueue::next()
{
    if (_order.empty())
    {
        return std::nullopt;
    }

    if (_cursor + 1 < _order.size())
    {
        ++_cursor;
    }
    else
    {
        // Exhausted: start a fresh pass, reshuffled when shuffle is on.
        rebuild(_order.size());
    }
    return current();
}

std::optional<std::size_t> PlayQueue::previous()
{
    if (_order.empty())
    {
        return std::nullopt;
    }

    if (_cursor > 0)
    {
        --_cursor;
    }
    return current();
}

bool PlayQueue::seek_to(std::size_t playlist_index)
{
    auto it = std::find(_order.begin(), _order.end(), playlist_index);
    if (it == _order.end())
    {
        return false;
    }
    _cursor = static_cast<std::size_t>(std::distance(_order.begin(), it));
    return true;
}
