#include "paging.h"

#include <algorithm>

std::size_t total_pages(std::size_t length, std::size_t page_size)
{
    if (page_size == 0)
    {
        return 0;
    }
    return length / page_size + (length % page_size == 0 ? 0 : 1);
}

page_range page_bounds(std::size_t length, std::size_t page, std::size_t page_size)
{
    page_range range;
    if (page_size == 0)
    {
        return range;
    }

    std::size_t start = page * page_size;
    if (start >= length)
    {
        return range;
    }

    range.begin = start;
    range.end = std::min(length, start + page_size);
    return range;
}
