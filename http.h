#pragma once

#include <string>

struct http_response
{
    long status = 0;
    std::string body;
    std::string error;
};

bool http_get(const std::string& url, long timeout_s, http_response& response);
std::string url_encode(const std::string& value);
bool http_init();
void http_cleanup();
