//
// Created by Malik T on 09/10/2025.
//

#ifndef SHADOWHUNT_REMOTEAGENT_HPP
#define SHADOWHUNT_REMOTEAGENT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Agent.hpp"
#include "core/Types.hpp"
#include "core/State.hpp"
#include "core/Actions.hpp"
#include "core/Exception.hpp"

namespace shadow::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // One websocket seat. The server thread attaches/detaches and delivers frames,
    // the game thread sends snapshots and waits for the seat's next decision.
    class SeatChannel
    {
    public:
        // Larger frames cannot be a PlayerActionMsg and are dropped on arrival.
        static constexpr std::size_t MaxFrameBytes = 4096;
        // A client flooding the seat only keeps its newest frames.
        static constexpr std::size_t MaxQueuedFrames = 8;

        explicit SeatChannel(std::weak_ptr<WsServer> ep);

        auto Attach(Hdl hdl) -> void;
        // Wakes a pending Await so a dropped client costs no more than the time already spent.
        auto Detach() -> void;
        auto Connected() const noexcept -> bool { return connected_.load(); }

        auto Deliver(std::vector<uint8_t> bytes) -> void;
        auto Await(std::chrono::steady_clock::time_point deadline) -> std::optional<std::vector<uint8_t>>;
        // Frames left over from an earlier decision are stale once a new one starts.
        auto Drain() -> void;

        auto SendBinary(std::span<const std::byte> bytes) -> bool;

        auto Dropped() const noexcept -> uint64_t { return dropped_.load(); }

    private:
        std::weak_ptr<WsServer>          ep_;
        Hdl                              hdl_;

        mutable std::mutex               mtx_;
        std::condition_variable          cv_;
        std::deque<std::vector<uint8_t>> inbox_;
        std::atomic<bool>                connected_{false};
        std::atomic<uint64_t>            dropped_{0};
    };

    // Sends the seat its snapshot, then blocks until a PlayerActionMsg arrives or the deadline passes.
    // Anything unusable (timeout, bad frame, spoofed actor) becomes EndTurnAction.
    class RemoteAgent final : public shadow::core::Agent
    {
    public:
        RemoteAgent(shadow::core::PlayerId seat, std::shared_ptr<SeatChannel> chan);

        auto Play(std::shared_ptr<const shadow::core::GameSnapshot> snapshot,
                  std::chrono::steady_clock::time_point deadline)
            -> shadow::core::PlayerAction override;

        auto Seat() const noexcept -> shadow::core::PlayerId { return seat_; }

    private:
        shadow::core::PlayerId          seat_{};
        std::shared_ptr<SeatChannel>    chan_;
        uint64_t                        next_msg_id_{1};
    };
}

#endif // SHADOWHUNT_REMOTEAGENT_HPP
