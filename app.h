#pragma once

#include <memory>
#include <string>

#include "app_state.h"
#include "channel.h"
#include "config.h"
#include "coordinator.h"
#include "draw.h"
#include "messages.h"
#include "process.h"
#include "terminal.h"
#include "youtube.h"

class XAudioApp
{
public:
    static XAudioApp& instance();

    // Throws std::runtime_error when the playback backend cannot be brought up.
    void init(const std::string& config_path);
    void run();
    void shutdown();

    XAudioApp(const XAudioApp&) = delete;
    XAudioApp& operator=(const XAudioApp&) = delete;
    XAudioApp(XAudioApp&&) = delete;
    XAudioApp& operator=(XAudioApp&&) = delete;

private:
    XAudioApp() = default;

    std::unique_ptr<MpvConnection> start_player();
    backend_services make_services();
    void dispatch(const update_result& result);
    bool drain_messages();
    void retry_pending_save();

private:
    app_config _config;
    Terminal _terminal;
    std::unique_ptr<TerminalSession> _session;
    std::unique_ptr<Renderer> _renderer;
    ChildProcess _player_process;
    std::unique_ptr<YoutubeClient> _youtube;
    Channel<Command> _commands{1};
    Channel<Message> _messages{1};
    std::unique_ptr<Coordinator> _coordinator;
    app_state _state;
    bool _http_ready = false;
};
