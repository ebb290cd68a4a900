#include "app.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>

#include <signal.h>

#include <spdlog/spdlog.h>

#include "http.h"
#include "input.h"
#include "logging.h"
#include "playlist.h"
#include "view.h"

namespace
{
std::atomic<bool> g_quit_requested{false};

void handle_quit_signal(int)
{
    g_quit_requested.store(true);
}

void install_signal_handlers()
{
    struct sigaction action{};
    action.sa_handler = handle_quit_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}
}

XAudioApp& XAudioApp::instance()
{
    static XAudioApp app;
    return app;
}

void XAudioApp::init(const std::string& config_path)
{
    int dotenv_count = load_dotenv(".env");
    _config = load_config(config_path);

    init_logging(parse_log_level(_config.log_level, spdlog::level::info), _config.log_path);
    spdlog::info("xaudio starting (config '{}', {} variables from .env)", config_path, dotenv_count);
    for (const std::string& warning : _config.warnings)
    {
        spdlog::warn("config: {}", warning);
    }

    if (_config.api_key.empty())
    {
        spdlog::warn("no YouTube API key configured; searches will fail");
    }

    _http_ready = http_init();
    if (!_http_ready)
    {
        spdlog::error("libcurl failed to initialise; searches will fail");
    }

    std::unique_ptr<MpvConnection> connection = start_player();

    _youtube = std::make_unique<YoutubeClient>(_config.api_key, _config.search_max_results, _config.http_timeout_s);

    std::vector<playlist_entry> playlist = load_playlist(_config.playlist_path);
    _state = make_initial_state(std::move(playlist), _config.dedup_playlist);

    _coordinator = std::make_unique<Coordinator>(std::move(connection), make_services(), _commands, _messages);
    _coordinator->start();

    install_signal_handlers();

    _session = std::make_unique<TerminalSession>(_terminal);
    _renderer = std::make_unique<Renderer>(_terminal);
    set_page_size(_state, page_size_for_height(_terminal.get_size().y));
}

std::unique_ptr<MpvConnection> XAudioApp::start_player()
{
    std::vector<std::string> args = {
        _config.mpv_binary,
        "--input-ipc-server=" + _config.mpv_socket_path,
        "--no-terminal",
        "--no-video",
        "--idle",
    };

    if (!_player_process.start(args))
    {
        throw std::runtime_error("could not start '" + _config.mpv_binary + "'");
    }
    spdlog::info("started {} (pid {})", _config.mpv_binary, _player_process.pid());

    auto connection = std::make_unique<MpvConnection>();
    if (!connection->connect(_config.mpv_socket_path, _config.connect_attempts, _config.connect_retry_ms))
    {
        if (!_player_process.is_running())
        {
            throw std::runtime_error("'" + _config.mpv_binary + "' exited before opening " + _config.mpv_socket_path);
        }
        throw std::runtime_error("could not connect to mpv at " + _config.mpv_socket_path);
    }
    return connection;
}

backend_services XAudioApp::make_services()
{
    backend_services services;
    const YoutubeClient* youtube = _youtube.get();
    std::string resolver = _config.resolver_binary;
    std::string playlist_path = _config.playlist_path;

    services.search = [youtube](const std::string& keyword, std::vector<playlist_entry>& out, std::string& error)
    {
        return youtube->search(keyword, out, error);
    };
    services.lookup_duration = [youtube](const std::string& id)
    {
        return youtube->lookup_duration(id);
    };
    services.resolve = [resolver](const std::string& id, std::string& error)
    {
        return resolve_stream_url(resolver, id, error);
    };
    services.save_playlist = [playlist_path](const std::vector<playlist_entry>& entries)
    {
        return save_playlist(playlist_path, entries);
    };
    return services;
}

void XAudioApp::dispatch(const update_result& result)
{
    for (const Command& command : result.commands)
    {
        if (!_commands.try_send(command))
        {
            spdlog::warn("command mailbox full, dropped {}", describe(command));
            on_command_dropped(_state, command);
        }
    }
}

bool XAudioApp::drain_messages()
{
    bool quit = false;
    while (std::optional<Message> message = _messages.try_recv())
    {
        spdlog::debug("message: {}", describe(*message));
        update_result result = apply_message(_state, *message);
        dispatch(result);
        quit = quit || result.quit;
    }
    return quit;
}

void XAudioApp::retry_pending_save()
{
    if (!_state.save_pending)
    {
        return;
    }
    if (_commands.try_send(save_playlist_command{_state.playlist}))
    {
        _state.save_pending = false;
    }
}

void XAudioApp::run()
{
    bool quit = false;
    while (!quit && !g_quit_requested.load())
    {
        if (_terminal.on_terminal_resize())
        {
            set_page_size(_state, page_size_for_height(_terminal.get_size().y));
        }

        render_view(*_renderer, _state, std::chrono::steady_clock::now(), _config.quit_key);
        _renderer->present();

        int key = input_poll_key(_config.poll_interval_ms);
        key_action action = map_key(_state.mode, key, _config.quit_key);
        if (action.action != Action::none)
        {
            update_result result = apply_action(_state, action);
            dispatch(result);
            quit = result.quit;
        }

        retry_pending_save();
        if (drain_messages())
        {
            quit = true;
        }
    }

    spdlog::info("leaving main loop");
}

void XAudioApp::shutdown()
{
    if (_coordinator)
    {
        _coordinator->stop();
        if (!_state.backend_lost && !_coordinator->link().quit())
        {
            spdlog::warn("could not ask mpv to quit");
        }
        _coordinator.reset();
    }

    if (_state.save_pending && !save_playlist(_config.playlist_path, _state.playlist))
    {
        spdlog::error("final playlist save to {} failed", _config.playlist_path);
    }

    _player_process.stop(1000);

    _renderer.reset();
    _session.reset();

    if (_http_ready)
    {
        http_cleanup();
        _http_ready = false;
    }

    spdlog::info("xaudio stopped");
    shutdown_logging();
}
