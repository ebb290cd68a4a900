#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "channel.h"
#include "messages.h"
#include "mpv.h"
#include "playlist.h"

// The blocking collaborators the coordinator calls on behalf of the UI.
struct backend_services
{
    std::function<bool(const std::string& keyword, std::vector<playlist_entry>& out, std::string& error)> search;
    std::function<std::chrono::seconds(const std::string& id)> lookup_duration;
    std::function<std::optional<std::string>(const std::string& id, std::string& error)> resolve;
    std::function<bool(const std::vector<playlist_entry>& entries)> save_playlist;
};

// Background task that owns the playback link. It alternates between the command
// mailbox and the link's event stream so neither source can starve the other, and
// reports back to the UI through the message mailbox.
class Coordinator
{
public:
    Coordinator(
        std::unique_ptr<PlaybackLink> link,
        backend_services services,
        Channel<Command>& commands,
        Channel<Message>& messages,
        std::chrono::milliseconds slice = std::chrono::milliseconds(25));
    ~Coordinator();

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    void start();
    void stop();
    bool is_running() const;

    // One multiplexer pass: at most one command, then at most one event.
    void run_once();

    // Only safe once the task has stopped.
    PlaybackLink& link();

private:
    void run();
    void handle_command(const Command& command);
    void handle_event(const playback_event& event);
    void mark_link_lost(const std::string& reason);
    void emit(Message message);

    std::unique_ptr<PlaybackLink> _link;
    backend_services _services;
    Channel<Command>& _commands;
    Channel<Message>& _messages;
    std::chrono::milliseconds _slice;
    bool _link_lost = false;
    std::atomic<bool> _running{false};
    std::thread _thread;
};
