#pragma once

#include <cstddef>
#include <vector>

std::size_t total_pages(std::size_t length, std::size_t page_size);

struct page_range
{
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const
    {
        return end - begin;
    }

    bool empty() const
    {
        return begin == end;
    }
};

// Half-open index range of one page; empty when the page lies past the list.
page_range page_bounds(std::size_t length, std::size_t page, std::size_t page_size);

template <typename T>
std::vector<T> paginate(const std::vector<T>& list, std::size_t page, std::size_t page_size)
{
    page_range range = page_bounds(list.size(), page, page_size);
    return std::vector<T>(list.begin() + static_cast<std::ptrdiff_t>(range.begin),
                          list.begin() + static_cast<std::ptrdiff_t>(range.end));
}
