#include "text.h"

#include <cstdio>

static bool is_continuation(unsigned char ch)
{
    return (ch & 0xC0) == 0x80;
}

std::size_t utf8_length(const std::string& text)
{
    std::size_t count = 0;
    for (unsigned char ch : text)
    {
        if (!is_continuation(ch))
        {
            ++count;
        }
    }
    return count;
}

std::string truncate(const std::string& text, std::size_t max_chars)
{
    if (utf8_length(text) <= max_chars)
    {
        return text;
    }

    std::size_t seen = 0;
    std::size_t cut = 0;
    for (; cut < text.size(); ++cut)
    {
        if (!is_continuation(static_cast<unsigned char>(text[cut])))
        {
            if (seen == max_chars)
            {
                break;
            }
            ++seen;
        }
    }
    return text.substr(0, cut) + "…";
}

std::string display_time(std::chrono::seconds duration)
{
    long long total = duration.count();
    if (total < 0)
    {
        total = 0;
    }

    long long sec = total % 60;
    long long min = (total / 60) % 60;
    long long hrs = total / 3600;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld", hrs, min, sec);
    return buffer;
}

std::string trim_copy(const std::string& text)
{
    const char* whitespace = " \t\r\n\f\v";
    std::size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos)
    {
        return std::string();
    }
    std::size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::u32string decode_utf8(const std::string& text)
{
    std::u32string output;
    output.reserve(text.size());

    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(text.data());
    std::size_t size = text.size();
    std::size_t i = 0;
    while (i < size)
    {
        unsigned char c = bytes[i];
        std::size_t extra = 0;
        char32_t value = 0;
        if (c < 0x80)
        {
            value = c;
        }
        else if ((c >> 5) == 0x6)
        {
            extra = 1;
            value = c & 0x1F;
        }
        else if ((c >> 4) == 0xE)
        {
            extra = 2;
            value = c & 0x0F;
        }
        else if ((c >> 3) == 0x1E)
        {
            extra = 3;
            value = c & 0x07;
        }
        else
        {
            output.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        bool valid = true;
        for (std::size_t k = 1; k <= extra; ++k)
        {
            if (i + k >= size || !is_continuation(bytes[i + k]))
            {
                valid = false;
                break;
            }
            value = (value << 6) | (bytes[i + k] & 0x3F);
        }

        if (!valid)
        {
            output.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        output.push_back(value);
        i += extra + 1;
    }
    return output;
}

std::string encode_utf8(char32_t value)
{
    std::string output;
    if (value <= 0x7F)
    {
        output.push_back(static_cast<char>(value));
        return output;
    }
    if (value <= 0x7FF)
    {
        output.push_back(static_cast<char>(0xC0 | ((value >> 6) & 0x1F)));
        output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
        return output;
    }
    if (value <= 0xFFFF)
    {
        output.push_back(static_cast<char>(0xE0 | ((value >> 12) & 0x0F)));
        output.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
        output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
        return output;
    }
    output.push_back(static_cast<char>(0xF0 | ((value >> 18) & 0x07)));
    output.push_back(static_cast<char>(0x80 | ((value >> 12) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | ((value >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (value & 0x3F)));
    return output;
}
