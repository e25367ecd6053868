//
// Created by Malik T on 13/08/2025.
//

//
// shadowd: authoritative match server over WebSocket++
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Game.hpp"
#include "core/StandardRules.hpp"
#include "core/RandomAi.hpp"
#include "core/Log.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "net/RemoteAgent.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint32_t n_players{5};
        std::uint32_t bots{0};
        std::uint64_t seed{123456789ULL};
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(30)};
        std::optional<std::string> audit_path{};
        bool verbose{false};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--players")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.n_players = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--bots")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.bots = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--timeout_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.turn_timeout = std::chrono::milliseconds(v); }
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
            else if (arg == "--verbose")
            {
                cfg.verbose = true;
            }
            else
            {
                shadow::core::log::Warn("ignoring unknown argument '{}'", arg);
            }
        }

        if (cfg.n_players < shadow::core::constants::MinPlayers || cfg.n_players > shadow::core::constants::MaxPlayers)
        {
            shadow::core::log::Warn("--players {} out of range, using 5", cfg.n_players);
            cfg.n_players = 5;
        }
        if (cfg.bots > cfg.n_players)
        {
            cfg.bots = cfg.n_players;
        }
        return cfg;
    }

    void BroadcastSnapshots(shadow::core::GameImpl const& game,
                            std::vector<std::shared_ptr<shadow::net::SeatChannel>> const& chans,
                            std::uint64_t msg_id)
    {
        for (shadow::core::PlayerId seat = 0; seat < chans.size(); ++seat)
        {
            if (!chans[seat] || !chans[seat]->Connected())
            {
                continue;
            }
            auto const buf = shadow::core::net::BuildSnapshot(game, seat, msg_id);
            std::span<std::byte const> b{
                reinterpret_cast<std::byte const*>(buf.data()), buf.size()
            };
            chans[seat]->SendBinary(b);
        }
    }

    void Broadcast(std::vector<std::shared_ptr<shadow::net::SeatChannel>> const& chans,
                   flatbuffers::DetachedBuffer const& buf)
    {
        std::span<std::byte const> b{
            reinterpret_cast<std::byte const*>(buf.data()), buf.size()
        };
        for (auto const& chan : chans)
        {
            if (chan && chan->Connected())
            {
                chan->SendBinary(b);
            }
        }
    }
}

int main(int argc, char** argv)
{
    using namespace shadow;
    using namespace shadow::core;

    ServerConfig const sc = ParseArgs(argc, argv);
    if (sc.verbose) log::SetLevel(log::Level::Debug);

    std::size_t const remote_seats = sc.n_players - sc.bots;
    std::print("[shadowd] starting on port {} with {} player(s), {} bot(s)\n",
               sc.port, sc.n_players, sc.bots);

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    // Remote seats come first; bots take the remaining ones.
    std::vector<std::shared_ptr<shadow::net::SeatChannel>> chans(remote_seats);
    for (std::size_t i = 0; i < remote_seats; ++i)
    {
        chans[i] = std::make_shared<shadow::net::SeatChannel>(ep);
    }
    std::unordered_map<void*, std::size_t> hdl_to_seat;
    std::mutex seats_mx;
    std::condition_variable seats_cv;
    std::size_t connected_count{0};

    ep->set_open_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::lock_guard<std::mutex> lock(seats_mx);
        std::size_t seat = static_cast<std::size_t>(-1);
        for (std::size_t i = 0; i < chans.size(); ++i)
        {
            if (!chans[i]->Connected())
            {
                seat = i;
                break;
            }
        }
        if (seat == static_cast<std::size_t>(-1))
        {
            ep->close(hdl, websocketpp::close::status::try_again_later, "All seats occupied");
            return;
        }

        hdl_to_seat[key] = seat;
        chans[seat]->Attach(hdl);
        ++connected_count;

        std::print("[shadowd] client connected -> seat {}\n", seat);

        std::string hello = "SeatAssigned " + std::to_string(seat) +
                            " / " + std::to_string(sc.n_players);
        websocketpp::lib::error_code ec;
        ep->send(hdl, hello, websocketpp::frame::opcode::text, ec);
        seats_cv.notify_all();
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::lock_guard<std::mutex> lock(seats_mx);
        auto it = hdl_to_seat.find(key);
        if (it != hdl_to_seat.end())
        {
            std::size_t seat = it->second;
            hdl_to_seat.erase(it);

            if (seat < chans.size())
            {
                chans[seat]->Detach();
                --connected_count;
                std::print("[shadowd] seat {} disconnected\n", seat);
            }
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::size_t seat{};
        {
            std::lock_guard<std::mutex> lock(seats_mx);
            auto it = hdl_to_seat.find(key);
            if (it == hdl_to_seat.end())
            {
                return;
            }
            seat = it->second;
        }

        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        auto const& payload = msg->get_payload();
        std::vector<uint8_t> bytes(payload.begin(), payload.end());

        if (seat < chans.size() && chans[seat])
        {
            chans[seat]->Deliver(std::move(bytes));
        }
    });

    ep->listen(sc.port);
    ep->start_accept();
    std::thread net_thr([ep]
    {
        ep->run();
    });

    {
        std::unique_lock<std::mutex> lk(seats_mx);
        seats_cv.wait(lk, [&] { return connected_count >= remote_seats; });
    }
    std::print("[shadowd] all seats taken, starting match\n");

    Config cfg;
    cfg.n_players    = sc.n_players;
    cfg.seed         = sc.seed;
    cfg.turn_timeout = sc.turn_timeout;
    cfg.bot_seats.assign(sc.n_players, false);

    std::vector<std::unique_ptr<Agent>> agents;
    agents.reserve(sc.n_players);
    for (std::size_t i = 0; i < sc.n_players; ++i)
    {
        if (i < remote_seats)
        {
            agents.emplace_back(std::make_unique<shadow::net::RemoteAgent>(static_cast<PlayerId>(i), chans[i]));
        }
        else
        {
            cfg.bot_seats[i] = true;
            agents.emplace_back(std::make_unique<RandomAI>(sc.seed + static_cast<uint64_t>(i * 1337u)));
        }
    }

    int exit_code = 0;
    try
    {
        GameImpl game(cfg, std::make_unique<StandardRules>(), std::move(agents));

        std::optional<debug::AuditLogger> audit;
        if (sc.audit_path)
        {
            audit.emplace(*sc.audit_path);
            if (!audit->IsOpen())
            {
                log::Warn("cannot open audit log '{}', continuing without it", *sc.audit_path);
                audit.reset();
            }
            else
            {
                audit->start(game, sc.seed);
            }
        }

        std::atomic<std::uint64_t> msg_counter{1};
        EventBus::SubscriptionId const forward = game.Bus().Subscribe([&](GameEvent const& ev)
        {
            if (audit) audit->event(ev);
            Broadcast(chans, shadow::core::net::BuildEvent(ev, msg_counter++));
        });

        BroadcastSnapshots(game, chans, msg_counter++);

        MoveOutcome outcome = MoveOutcome::Applied;
        while (outcome != MoveOutcome::GameEnded && outcome != MoveOutcome::Stalled)
        {
            PlayerId const actor = game.Current();
            outcome = game.Step();
            if (audit) audit->outcome(outcome);

            if (outcome == MoveOutcome::Invalid && game.LastViolation() && actor < chans.size())
            {
                auto const buf = shadow::core::net::BuildViolation(*game.LastViolation(), msg_counter++);
                chans[actor]->SendBinary(std::span<std::byte const>{
                    reinterpret_cast<std::byte const*>(buf.data()), buf.size()});
            }
            BroadcastSnapshots(game, chans, msg_counter++);
        }

        game.Bus().Unsubscribe(forward);
        if (audit) audit->end(game);
        std::print("[shadowd] game over ({})\n", to_string(outcome));
        for (std::size_t seat = 0; seat < chans.size(); ++seat)
        {
            if (chans[seat]->Dropped() > 0)
            {
                log::Info("seat {} had {} frame(s) dropped", seat, chans[seat]->Dropped());
            }
        }
    }
    catch (error::AssertionError const& e)
    {
        std::print(stderr, "[shadowd] {}", e.to_str());
        exit_code = 2;
    }
    catch (error::StateError const& e)
    {
        std::print(stderr, "[shadowd] {}", e.to_str());
        exit_code = 1;
    }

    ep->stop_listening();
    ep->stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return exit_code;
}
