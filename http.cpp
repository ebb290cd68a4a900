#include "http.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

static bool g_http_ready = false;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

bool http_get(const std::string& url, long timeout_s, http_response& response)
{
    response = http_response{};

    if (!g_http_ready)
    {
        response.error = "http not initialised";
        return false;
    }

    CURL* curl = curl_easy_init();
    if (!curl)
    {
        response.error = "curl_easy_init failed";
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "xaudio/1.0");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode result = curl_easy_perform(curl);
    if (result == CURLE_OK)
    {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    else
    {
        response.error = curl_easy_strerror(result);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (result != CURLE_OK)
    {
        spdlog::warn("http: GET failed: {}", response.error);
        return false;
    }
    if (response.status < 200 || response.status >= 300)
    {
        response.error = "HTTP " + std::to_string(response.status);
        spdlog::warn("http: GET returned {}", response.status);
        return false;
    }
    return true;
}

std::string url_encode(const std::string& value)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char ch : value)
    {
        if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
            ch == '-' || ch == '_' || ch == '.' || ch == '~')
        {
            out.push_back(static_cast<char>(ch));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[(ch >> 4) & 0xF]);
            out.push_back(hex[ch & 0xF]);
        }
    }
    return out;
}

bool http_init()
{
    CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
    g_http_ready = (result == CURLE_OK);
    if (!g_http_ready)
    {
        spdlog::error("http: curl_global_init failed: {}", curl_easy_strerror(result));
    }
    return g_http_ready;
}

void http_cleanup()
{
    if (g_http_ready)
    {
        curl_global_cleanup();
        g_http_ready = false;
    }
}
