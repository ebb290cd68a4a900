#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "playlist.h"

std::string build_search_url(const std::string& api_key, const std::string& keyword, int max_results);
std::string build_duration_url(const std::string& api_key, const std::string& video_id);
std::string watch_url(const std::string& video_id);

bool parse_search_response(const std::string& body, std::vector<playlist_entry>& out, std::string& error);
std::optional<std::chrono::seconds> parse_duration_response(const std::string& body);
std::optional<std::chrono::seconds> parse_iso8601_duration(const std::string& text);
std::string html_unescape(const std::string& text);

// YouTube Data API v3 access. Every call blocks on the network.
class YoutubeClient
{
public:
    YoutubeClient(std::string api_key, int max_results, long timeout_s);

    bool search(const std::string& keyword, std::vector<playlist_entry>& out, std::string& error) const;

    // Zero on any failure.
    std::chrono::seconds lookup_duration(const std::string& video_id) const;

private:
    std::string _api_key;
    int _max_results;
    long _timeout_s;
};

// Asks the resolver tool for a directly playable media URL.
std::optional<std::string> resolve_stream_url(const std::string& resolver_binary, const std::string& video_id, std::string& error);
