#include "coordinator.h"

#include <type_traits>

#include <spdlog/spdlog.h>

template <typename T>
inline constexpr bool always_false_command = false;

Coordinator::Coordinator(
    std::unique_ptr<PlaybackLink> link,
    backend_services services,
    Channel<Command>& commands,
    Channel<Message>& messages,
    std::chrono::milliseconds slice)
    : _link(std::move(link)),
      _services(std::move(services)),
      _commands(commands),
      _messages(messages),
      _slice(slice)
{
}

Coordinator::~Coordinator()
{
    stop();
}

void Coordinator::start()
{
    if (_running.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    _thread = std::thread([this]()
    {
        run();
    });
    spdlog::info("coordinator: started");
}

void Coordinator::stop()
{
    bool was_running = _running.exchange(false, std::memory_order_acq_rel);

    // Wake a pending recv_for or a send blocked on a UI that is no longer draining.
    _commands.close();
    _messages.close();

    if (_thread.joinable())
    {
        _thread.join();
    }
    if (was_running)
    {
        spdlog::info("coordinator: stopped");
    }
}

bool Coordinator::is_running() const
{
    return _running.load(std::memory_order_acquire);
}

PlaybackLink& Coordinator::link()
{
    return *_link;
}

void Coordinator::run()
{
    while (_running.load(std::memory_order_acquire))
    {
        run_once();
    }
}

void Coordinator::run_once()
{
    std::optional<Command> command = _commands.recv_for(_slice);
    if (command)
    {
        spdlog::debug("coordinator: command {}", describe(*command));
        handle_command(*command);
    }

    if (_link_lost)
    {
        return;
    }

    playback_event event;
    read_status status = _link->poll_event(static_cast<int>(_slice.count()), event);
    if (status == read_status::event)
    {
        handle_event(event);
    }
    else if (status == read_status::closed)
    {
        mark_link_lost("connection closed");
    }
}

void Coordinator::handle_command(const Command& command)
{
    std::visit([this](const auto& value)
    {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, search_command>)
        {
            std::vector<playlist_entry> results;
            std::string error;
            if (_services.search && _services.search(value.keyword, results, error))
            {
                spdlog::info("coordinator: search '{}' returned {} results", value.keyword, results.size());
                emit(search_results_message{value.generation, std::move(results)});
            }
            else
            {
                if (error.empty())
                {
                    error = "search unavailable";
                }
                spdlog::warn("coordinator: search '{}' failed: {}", value.keyword, error);
                emit(search_failed_message{value.generation, error});
            }
        }
        else if constexpr (std::is_same_v<T, play_command>)
        {
            std::chrono::seconds duration(0);
            if (_services.lookup_duration)
            {
                duration = _services.lookup_duration(value.id);
            }
            emit(song_duration_message{duration});

            if (_link_lost)
            {
                spdlog::warn("coordinator: cannot play {}, playback backend is gone", value.id);
                emit(play_failed_message{value.id, "playback backend disconnected"});
                return;
            }

            std::string error;
            std::optional<std::string> url;
            if (_services.resolve)
            {
                url = _services.resolve(value.id, error);
            }
            if (!url)
            {
                if (error.empty())
                {
                    error = "no stream found";
                }
                spdlog::error("coordinator: could not resolve {}: {}", value.id, error);
                emit(play_failed_message{value.id, error});
                return;
            }

            // mpv keeps the pause property across loadfile.
            if (!_link->load_file(*url) || !_link->play() || !_link->set_pause(false))
            {
                mark_link_lost("write failed");
            }
        }
        else if constexpr (std::is_same_v<T, save_playlist_command>)
        {
            if (!_services.save_playlist || !_services.save_playlist(value.entries))
            {
                spdlog::warn("coordinator: playlist save failed ({} entries)", value.entries.size());
            }
        }
        else if constexpr (std::is_same_v<T, pause_command>)
        {
            if (!_link_lost && !_link->set_pause(value.paused))
            {
                mark_link_lost("write failed");
            }
        }
        else
        {
            static_assert(always_false_command<T>, "unhandled command");
        }
    }, command);
}

void Coordinator::handle_event(const playback_event& event)
{
    switch (event.kind)
    {
    case playback_event_kind::start_file:
        emit(song_started_message{std::chrono::steady_clock::now()});
        break;
    case playback_event_kind::end_file:
        emit(song_stopped_message{event.reason});
        break;
    case playback_event_kind::unknown:
        spdlog::trace("coordinator: ignoring '{}'", event.raw);
        break;
    }
}

void Coordinator::mark_link_lost(const std::string& reason)
{
    if (_link_lost)
    {
        return;
    }
    _link_lost = true;
    spdlog::error("coordinator: playback link lost: {}", reason);
    emit(playback_lost_message{reason});
}

void Coordinator::emit(Message message)
{
    std::string text = describe(message);
    if (!_messages.send(std::move(message)))
    {
        spdlog::debug("coordinator: message channel closed, dropping {}", text);
        return;
    }
    spdlog::debug("coordinator: emitted {}", text);
}
