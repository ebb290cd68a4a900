#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class playback_event_kind
{
    start_file,
    end_file,
    unknown
};

struct playback_event
{
    playback_event_kind kind = playback_event_kind::unknown;
    std::string reason;
    std::string raw;
};

enum class read_status
{
    event,
    idle,
    closed
};

// {"command":[...]} followed by a newline.
std::string encode_command(const std::vector<std::string>& tokens);

// nullopt when the line is not JSON.
std::optional<playback_event> decode_event(const std::string& line);

// Control side of the playback backend.
class PlaybackLink
{
public:
    virtual ~PlaybackLink() = default;

    virtual bool send(const std::vector<std::string>& tokens) = 0;

    // Waits up to timeout_ms for one decoded event.
    virtual read_status poll_event(int timeout_ms, playback_event& out) = 0;

    bool load_file(const std::string& url);
    bool play();
    bool set_pause(bool paused);
    bool quit();
};

// Longest unterminated line kept while waiting for its newline.
constexpr std::size_t mpv_max_line_bytes = 1024 * 1024;

// JSON IPC over mpv's --input-ipc-server unix socket.
class MpvConnection : public PlaybackLink
{
public:
    MpvConnection() = default;
    explicit MpvConnection(int fd, std::size_t max_line_bytes = mpv_max_line_bytes);
    ~MpvConnection() override;

    MpvConnection(const MpvConnection&) = delete;
    MpvConnection& operator=(const MpvConnection&) = delete;

    bool connect(const std::string& socket_path, int attempts, int retry_ms);
    void close();
    bool is_open() const;

    bool send(const std::vector<std::string>& tokens) override;
    read_status poll_event(int timeout_ms, playback_event& out) override;

private:
    bool next_buffered_event(playback_event& out);

    int _fd = -1;
    std::size_t _max_line_bytes = mpv_max_line_bytes;
    std::string _buffer;
};
