#pragma once

#include <string>
#include <vector>

struct playlist_entry
{
    std::string id;
    std::string title;

    bool operator==(const playlist_entry& other) const
    {
        return id == other.id;
    }
};

bool contains_id(const std::vector<playlist_entry>& entries, const std::string& id);

// One "<id> - <title>" line per entry. Lines without the separator are skipped,
// a missing file reads as an empty playlist.
std::vector<playlist_entry> load_playlist(const std::string& path);
bool save_playlist(const std::string& path, const std::vector<playlist_entry>& entries);
