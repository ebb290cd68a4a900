#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

// Bounded single-direction mailbox shared by two threads.
//
// try_send never blocks and drops the value when the mailbox is full.
// send blocks until there is room, so a slow reader throttles the writer.
template <typename T>
class Channel
{
public:
    explicit Channel(std::size_t capacity)
        : _capacity(capacity == 0 ? 1 : capacity)
    {
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool try_send(T value)
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_closed || _items.size() >= _capacity)
            {
                return false;
            }
            _items.push_back(std::move(value));
        }
        _not_empty.notify_one();
        return true;
    }

    bool send(T value)
    {
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _not_full.wait(lock, [this]()
            {
                return _closed || _items.size() < _capacity;
            });
            if (_closed)
            {
                return false;
            }
            _items.push_back(std::move(value));
        }
        _not_empty.notify_one();
        return true;
    }

    std::optional<T> try_recv()
    {
        std::optional<T> value;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_items.empty())
            {
                return value;
            }
            value.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _not_full.notify_one();
        return value;
    }

    template <typename Rep, typename Period>
    std::optional<T> recv_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        std::optional<T> value;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            _not_empty.wait_for(lock, timeout, [this]()
            {
                return _closed || !_items.empty();
            });
            if (_items.empty())
            {
                return value;
            }
            value.emplace(std::move(_items.front()));
            _items.pop_front();
        }
        _not_full.notify_one();
        return value;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _closed = true;
        }
        _not_empty.notify_all();
        _not_full.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _closed;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    std::size_t capacity() const
    {
        return _capacity;
    }

private:
    const std::size_t _capacity;
    std::deque<T> _items;
    bool _closed = false;
    mutable std::mutex _mutex;
    std::condition_variable _not_empty;
    std::condition_variable _not_full;
};
