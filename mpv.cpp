#include "mpv.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

std::string encode_command(const std::vector<std::string>& tokens)
{
    json request = {{"command", tokens}};
    return request.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::optional<playback_event> decode_event(const std::string& line)
{
    json parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded())
    {
        return std::nullopt;
    }

    playback_event event;
    event.raw = line;

    if (!parsed.is_object())
    {
        return event;
    }

    auto name = parsed.find("event");
    if (name == parsed.end() || !name->is_string())
    {
        return event;
    }

    const std::string& value = name->get_ref<const std::string&>();
    if (value == "start-file")
    {
        event.kind = playback_event_kind::start_file;
    }
    else if (value == "end-file")
    {
        event.kind = playback_event_kind::end_file;
        auto reason = parsed.find("reason");
        if (reason != parsed.end() && reason->is_string())
        {
            event.reason = reason->get<std::string>();
        }
    }
    return event;
}

bool PlaybackLink::load_file(const std::string& url)
{
    // Replace: only one track is ever resident in the backend.
    return send({"loadfile", url, "replace"});
}

bool PlaybackLink::play()
{
    return send({"playlist-play-index", "0"});
}

bool PlaybackLink::set_pause(bool paused)
{
    return send({"set", "pause", paused ? "yes" : "no"});
}

bool PlaybackLink::quit()
{
    return send({"quit"});
}

MpvConnection::MpvConnection(int fd, std::size_t max_line_bytes)
    : _fd(fd),
      _max_line_bytes(max_line_bytes)
{
}

MpvConnection::~MpvConnection()
{
    close();
}

bool MpvConnection::connect(const std::string& socket_path, int attempts, int retry_ms)
{
    close();

    sockaddr_un addr = {};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path))
    {
        spdlog::error("mpv: socket path '{}' is too long", socket_path);
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0)
        {
            spdlog::error("mpv: socket() failed: {}", std::strerror(errno));
            return false;
        }

        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0)
        {
            _fd = fd;
            spdlog::info("mpv: connected to '{}' after {} attempt(s)", socket_path, attempt);
            return true;
        }

        spdlog::debug("mpv: connect attempt {} to '{}' failed: {}", attempt, socket_path, std::strerror(errno));
        ::close(fd);
        std::this_thread::sleep_for(std::chrono::milliseconds(retry_ms));
    }

    spdlog::error("mpv: could not connect to '{}'", socket_path);
    return false;
}

void MpvConnection::close()
{
    if (_fd >= 0)
    {
        ::close(_fd);
        _fd = -1;
    }
    _buffer.clear();
}

bool MpvConnection::is_open() const
{
    return _fd >= 0;
}

bool MpvConnection::send(const std::vector<std::string>& tokens)
{
    if (_fd < 0)
    {
        return false;
    }

    std::string line = encode_command(tokens);
    size_t written = 0;
    while (written < line.size())
    {
        ssize_t result = ::send(_fd, line.data() + written, line.size() - written, MSG_NOSIGNAL);
        if (result < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::error("mpv: write failed: {}", std::strerror(errno));
            return false;
        }
        written += static_cast<size_t>(result);
    }

    spdlog::debug("mpv: -> {}", line.substr(0, line.size() - 1));
    return true;
}

bool MpvConnection::next_buffered_event(playback_event& out)
{
    for (;;)
    {
        size_t newline = _buffer.find('\n');
        if (newline == std::string::npos)
        {
            return false;
        }

        std::string line = _buffer.substr(0, newline);
        _buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            continue;
        }

        std::optional<playback_event> event = decode_event(line);
        if (!event)
        {
            spdlog::warn("mpv: dropping malformed line '{}'", line);
            continue;
        }

        out = std::move(*event);
        return true;
    }
}

read_status MpvConnection::poll_event(int timeout_ms, playback_event& out)
{
    if (next_buffered_event(out))
    {
        return read_status::event;
    }

    if (_fd < 0)
    {
        return read_status::closed;
    }

    pollfd pfd = {};
    pfd.fd = _fd;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0)
    {
        if (errno == EINTR)
        {
            return read_status::idle;
        }
        spdlog::error("mpv: poll failed: {}", std::strerror(errno));
        return read_status::closed;
    }
    if (ready == 0)
    {
        return read_status::idle;
    }

    char chunk[4096];
    ssize_t received = ::recv(_fd, chunk, sizeof(chunk), 0);
    if (received == 0)
    {
        spdlog::error("mpv: connection closed by peer");
        return read_status::closed;
    }
    if (received < 0)
    {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return read_status::idle;
        }
        spdlog::error("mpv: read failed: {}", std::strerror(errno));
        return read_status::closed;
    }

    _buffer.append(chunk, static_cast<size_t>(received));
    if (next_buffered_event(out))
    {
        return read_status::event;
    }
    if (_buffer.size() > _max_line_bytes)
    {
        spdlog::warn("mpv: dropping {} bytes without a line break", _buffer.size());
        _buffer.clear();
    }
    return read_status::idle;
}
