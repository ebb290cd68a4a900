#include "playlist.h"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "text.h"

static const std::string kSeparator = " - ";

bool contains_id(const std::vector<playlist_entry>& entries, const std::string& id)
{
    return std::any_of(entries.begin(), entries.end(), [&](const playlist_entry& entry)
    {
        return entry.id == id;
    });
}

std::vector<playlist_entry> load_playlist(const std::string& path)
{
    std::vector<playlist_entry> entries;

    std::ifstream file(path);
    if (!file)
    {
        spdlog::info("playlist: no file at '{}', starting empty", path);
        return entries;
    }

    std::string line;
    size_t skipped = 0;
    while (std::getline(file, line))
    {
        size_t sep = line.find(kSeparator);
        if (sep == std::string::npos)
        {
            if (!trim_copy(line).empty())
            {
                ++skipped;
            }
            continue;
        }

        playlist_entry entry;
        entry.id = line.substr(0, sep);
        entry.title = trim_copy(line.substr(sep + kSeparator.size()));
        entries.push_back(std::move(entry));
    }

    spdlog::info("playlist: loaded {} entries from '{}' ({} skipped)", entries.size(), path, skipped);
    return entries;
}

bool save_playlist(const std::string& path, const std::vector<playlist_entry>& entries)
{
    std::ofstream file(path, std::ios::trunc);
    if (!file)
    {
        spdlog::warn("playlist: cannot open '{}' for writing", path);
        return false;
    }

    for (const playlist_entry& entry : entries)
    {
        file << entry.id << kSeparator << entry.title << "\n";
    }

    file.flush();
    if (!file)
    {
        spdlog::warn("playlist: write to '{}' failed", path);
        return false;
    }
    return true;
}
