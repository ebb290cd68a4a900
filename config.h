#pragma once

#include <string>
#include <vector>

struct app_config
{
    std::string api_key;
    std::string mpv_binary;
    std::string mpv_socket_path;
    std::string resolver_binary;
    std::string playlist_path;
    std::string log_level;
    std::string log_path;
    char quit_key;
    int search_max_results;
    int poll_interval_ms;
    int connect_attempts;
    int connect_retry_ms;
    int http_timeout_s;
    bool dedup_playlist;

    // Problems found while parsing; logged once logging is up.
    std::vector<std::string> warnings;
};

app_config default_config();
app_config load_config(const std::string& path);

// Copies KEY=VALUE pairs from a dotenv file into the environment.
// Variables that are already set win.
int load_dotenv(const std::string& path);
