#include "youtube.h"

#include <cctype>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "http.h"
#include "process.h"

using json = nlohmann::json;

static const std::string kApiBase = "https://youtube.googleapis.com/youtube/v3/";

std::string build_search_url(const std::string& api_key, const std::string& keyword, int max_results)
{
    std::ostringstream url;
    url << kApiBase << "search?part=snippet&order=relevance&type=video"
        << "&q=" << url_encode(keyword)
        << "&key=" << url_encode(api_key)
        << "&maxResults=" << max_results;
    return url.str();
}

std::string build_duration_url(const std::string& api_key, const std::string& video_id)
{
    std::ostringstream url;
    url << kApiBase << "videos?part=contentDetails"
        << "&id=" << url_encode(video_id)
        << "&key=" << url_encode(api_key);
    return url.str();
}

std::string watch_url(const std::string& video_id)
{
    return "https://www.youtube.com/watch?v=" + video_id;
}

std::string html_unescape(const std::string& text)
{
    static const std::pair<const char*, const char*> kEntities[] = {
        {"&amp;", "&"},
        {"&quot;", "\""},
        {"&#39;", "'"},
        {"&apos;", "'"},
        {"&lt;", "<"},
        {"&gt;", ">"},
    };

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();)
    {
        bool replaced = false;
        if (text[i] == '&')
        {
            for (const auto& entity : kEntities)
            {
                if (text.compare(i, std::char_traits<char>::length(entity.first), entity.first) == 0)
                {
                    out += entity.second;
                    i += std::char_traits<char>::length(entity.first);
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced)
        {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

static std::string api_error_message(const json& parsed)
{
    if (parsed.is_object() && parsed.contains("error"))
    {
        const json& err = parsed["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string())
        {
            return err["message"].get<std::string>();
        }
        return "API error";
    }
    return std::string();
}

bool parse_search_response(const std::string& body, std::vector<playlist_entry>& out, std::string& error)
{
    out.clear();

    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        error = "malformed search response";
        return false;
    }

    std::string api_error = api_error_message(parsed);
    if (!api_error.empty())
    {
        error = api_error;
        return false;
    }

    auto items = parsed.find("items");
    if (items == parsed.end() || !items->is_array())
    {
        return true;
    }

    for (const json& item : *items)
    {
        if (!item.is_object())
        {
            continue;
        }

        auto snippet = item.find("snippet");
        auto id = item.find("id");
        if (snippet == item.end() || !snippet->is_object() || id == item.end() || !id->is_object())
        {
            continue;
        }

        auto video_id = id->find("videoId");
        auto title = snippet->find("title");
        if (video_id == id->end() || !video_id->is_string() || title == snippet->end() || !title->is_string())
        {
            continue;
        }

        playlist_entry entry;
        entry.id = video_id->get<std::string>();
        entry.title = html_unescape(title->get<std::string>());
        out.push_back(std::move(entry));
    }
    return true;
}

std::optional<std::chrono::seconds> parse_iso8601_duration(const std::string& text)
{
    if (text.empty() || text[0] != 'P')
    {
        return std::nullopt;
    }

    long long total = 0;
    long long number = 0;
    bool have_digits = false;
    bool in_time = false;
    for (size_t i = 1; i < text.size(); ++i)
    {
        char ch = text[i];
        if (std::isdigit(static_cast<unsigned char>(ch)))
        {
            number = number * 10 + (ch - '0');
            have_digits = true;
            continue;
        }

        if (ch == 'T')
        {
            if (have_digits)
            {
                return std::nullopt;
            }
            in_time = true;
            continue;
        }

        if (!have_digits)
        {
            return std::nullopt;
        }

        if (ch == 'D' && !in_time)
        {
            total += number * 86400;
        }
        else if (ch == 'H' && in_time)
        {
            total += number * 3600;
        }
        else if (ch == 'M' && in_time)
        {
            total += number * 60;
        }
        else if (ch == 'S' && in_time)
        {
            total += number;
        }
        else
        {
            return std::nullopt;
        }
        number = 0;
        have_digits = false;
    }

    if (have_digits)
    {
        return std::nullopt;
    }
    return std::chrono::seconds(total);
}

std::optional<std::chrono::seconds> parse_duration_response(const std::string& body)
{
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object())
    {
        return std::nullopt;
    }

    auto items = parsed.find("items");
    if (items == parsed.end() || !items->is_array() || items->empty())
    {
        return std::nullopt;
    }

    const json& first = items->front();
    if (!first.is_object() || !first.contains("contentDetails"))
    {
        return std::nullopt;
    }

    const json& details = first["contentDetails"];
    if (!details.is_object() || !details.contains("duration") || !details["duration"].is_string())
    {
        return std::nullopt;
    }

    return parse_iso8601_duration(details["duration"].get<std::string>());
}

YoutubeClient::YoutubeClient(std::string api_key, int max_results, long timeout_s)
    : _api_key(std::move(api_key)),
      _max_results(max_results),
      _timeout_s(timeout_s)
{
}

bool YoutubeClient::search(const std::string& keyword, std::vector<playlist_entry>& out, std::string& error) const
{
    if (_api_key.empty())
    {
        error = "no API key (set YOUTUBE_API_KEY)";
        return false;
    }

    http_response response;
    if (!http_get(build_search_url(_api_key, keyword, _max_results), _timeout_s, response))
    {
        json parsed = json::parse(response.body, nullptr, false);
        std::string api_error = parsed.is_discarded() ? std::string() : api_error_message(parsed);
        error = api_error.empty() ? response.error : api_error;
        return false;
    }

    return parse_search_response(response.body, out, error);
}

std::chrono::seconds YoutubeClient::lookup_duration(const std::string& video_id) const
{
    if (_api_key.empty())
    {
        return std::chrono::seconds(0);
    }

    http_response response;
    if (!http_get(build_duration_url(_api_key, video_id), _timeout_s, response))
    {
        spdlog::warn("youtube: duration lookup for {} failed: {}", video_id, response.error);
        return std::chrono::seconds(0);
    }

    std::optional<std::chrono::seconds> duration = parse_duration_response(response.body);
    if (!duration)
    {
        spdlog::warn("youtube: no usable duration for {}", video_id);
        return std::chrono::seconds(0);
    }
    return *duration;
}

std::optional<std::string> resolve_stream_url(const std::string& resolver_binary, const std::string& video_id, std::string& error)
{
    process_output output;
    if (!run_capture({resolver_binary, "-x", "--get-url", watch_url(video_id)}, output))
    {
        error = "could not run " + resolver_binary;
        return std::nullopt;
    }
    if (output.exit_code != 0)
    {
        error = resolver_binary + " exited with " + std::to_string(output.exit_code);
        return std::nullopt;
    }

    std::istringstream lines(output.stdout_text);
    std::string line;
    while (std::getline(lines, line))
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
        {
            line.pop_back();
        }
        if (!line.empty())
        {
            return line;
        }
    }

    error = resolver_binary + " printed no URL";
    return std::nullopt;
}
