#pragma once

#include <chrono>
#include <cstddef>
#include <string>

// Cuts to at most max_chars code points, appending "…" when anything was dropped.
std::string truncate(const std::string& text, std::size_t max_chars);
std::size_t utf8_length(const std::string& text);
std::string display_time(std::chrono::seconds duration);
std::string trim_copy(const std::string& text);

// Invalid sequences decode to U+FFFD.
std::u32string decode_utf8(const std::string& text);
std::string encode_utf8(char32_t value);
