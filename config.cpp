#include "config.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "text.h"

static std::string strip_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

static bool parse_bool(const std::string& value, bool fallback)
{
    if (value == "true" || value == "1" || value == "yes")
    {
        return true;
    }
    if (value == "false" || value == "0" || value == "no")
    {
        return false;
    }
    return fallback;
}

static int parse_int(app_config& config, const std::string& key, const std::string& value, int fallback)
{
    try
    {
        return std::stoi(value);
    }
    catch (const std::exception&)
    {
        config.warnings.push_back("'" + key + "' has non-numeric value '" + value + "', keeping " + std::to_string(fallback));
        return fallback;
    }
}

static std::string home_path(const std::string& leaf)
{
    const char* home = std::getenv("HOME");
    if (!home)
    {
        return leaf;
    }
    return std::string(home) + "/" + leaf;
}

app_config default_config()
{
    app_config config;
    config.mpv_binary = "mpv";
    config.mpv_socket_path = "/tmp/mpv-socket";
    config.resolver_binary = "youtube-dl";
    config.playlist_path = home_path(".xaudio-playlist");
    config.log_level = "info";
    config.log_path = "xaudio.log";
    config.quit_key = 'q';
    config.search_max_results = 50;
    config.poll_interval_ms = 200;
    config.connect_attempts = 10;
    config.connect_retry_ms = 200;
    config.http_timeout_s = 10;
    config.dedup_playlist = false;
    return config;
}

app_config load_config(const std::string& path)
{
    app_config config = default_config();

    std::ifstream file(path);
    if (file)
    {
        std::string raw_line;
        while (std::getline(file, raw_line))
        {
            std::string line = trim_copy(raw_line);
            if (line.empty() || line[0] == '#')
            {
                continue;
            }

            size_t eq = line.find('=');
            if (eq == std::string::npos)
            {
                continue;
            }

            std::string key = trim_copy(line.substr(0, eq));
            std::string value = strip_quotes(trim_copy(line.substr(eq + 1)));

            if (key == "api_key")
            {
                config.api_key = value;
            }
            else if (key == "mpv_binary")
            {
                config.mpv_binary = value;
            }
            else if (key == "mpv_socket_path")
            {
                config.mpv_socket_path = value;
            }
            else if (key == "resolver_binary")
            {
                config.resolver_binary = value;
            }
            else if (key == "playlist_path")
            {
                config.playlist_path = value;
            }
            else if (key == "log_level")
            {
                config.log_level = value;
            }
            else if (key == "log_path")
            {
                config.log_path = value;
            }
            else if (key == "quit_key")
            {
                if (!value.empty())
                {
                    config.quit_key = value[0];
                }
            }
            else if (key == "search_max_results")
            {
                config.search_max_results = std::clamp(parse_int(config, key, value, config.search_max_results), 1, 50);
            }
            else if (key == "poll_interval_ms")
            {
                config.poll_interval_ms = parse_int(config, key, value, config.poll_interval_ms);
            }
            else if (key == "connect_attempts")
            {
                config.connect_attempts = std::max(1, parse_int(config, key, value, config.connect_attempts));
            }
            else if (key == "connect_retry_ms")
            {
                config.connect_retry_ms = std::max(0, parse_int(config, key, value, config.connect_retry_ms));
            }
            else if (key == "http_timeout_s")
            {
                config.http_timeout_s = std::max(1, parse_int(config, key, value, config.http_timeout_s));
            }
            else if (key == "dedup_playlist")
            {
                config.dedup_playlist = parse_bool(value, config.dedup_playlist);
            }
        }
    }

    // Coarse enough not to spin, fine enough for the progress clock.
    config.poll_interval_ms = std::clamp(config.poll_interval_ms, 100, 300);

    if (config.api_key.empty())
    {
        const char* env_key = std::getenv("YOUTUBE_API_KEY");
        if (env_key)
        {
            config.api_key = env_key;
        }
    }

    return config;
}

int load_dotenv(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        return 0;
    }

    int applied = 0;
    std::string raw_line;
    while (std::getline(file, raw_line))
    {
        std::string line = trim_copy(raw_line);
        if (line.empty() || line[0] == '#')
        {
            continue;
        }
        if (line.rfind("export ", 0) == 0)
        {
            line = trim_copy(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            continue;
        }

        std::string key = trim_copy(line.substr(0, eq));
        std::string value = strip_quotes(trim_copy(line.substr(eq + 1)));
        if (std::getenv(key.c_str()))
        {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 1) == 0)
        {
            ++applied;
        }
    }
    return applied;
}
