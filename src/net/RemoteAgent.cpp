//
// Created by Malik T on 09/10/2025.
//

#include "net/RemoteAgent.hpp"

#include <utility>

#include "core/Log.hpp"
#include "net/codec.hpp"

namespace shadow::net
{
    namespace log = shadow::core::log;

    SeatChannel::SeatChannel(std::weak_ptr<WsServer> ep):
        ep_{std::move(ep)} {}

    auto SeatChannel::Attach(Hdl hdl) -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            hdl_ = std::move(hdl);
            inbox_.clear();
        }
        connected_.store(true);
    }

    auto SeatChannel::Detach() -> void
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            connected_.store(false);
            inbox_.clear();
        }
        cv_.notify_all();
    }

    auto SeatChannel::Deliver(std::vector<uint8_t> bytes) -> void
    {
        if (bytes.empty() || bytes.size() > MaxFrameBytes)
        {
            dropped_.fetch_add(1);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (inbox_.size() == MaxQueuedFrames)
            {
                inbox_.pop_front();
                dropped_.fetch_add(1);
            }
            inbox_.emplace_back(std::move(bytes));
        }
        cv_.notify_all();
    }

    auto SeatChannel::Await(std::chrono::steady_clock::time_point deadline) -> std::optional<std::vector<uint8_t>>
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_until(lk, deadline, [&] { return !inbox_.empty() || !connected_.load(); });
        if (inbox_.empty())
        {
            return std::nullopt;
        }
        std::vector<uint8_t> out = std::move(inbox_.front());
        inbox_.pop_front();
        return out;
    }

    auto SeatChannel::Drain() -> void
    {
        std::lock_guard<std::mutex> lock(mtx_);
        inbox_.clear();
    }

    auto SeatChannel::SendBinary(std::span<const std::byte> bytes) -> bool
    {
        std::shared_ptr<WsServer> const ep = ep_.lock();
        if (!ep || !connected_.load())
        {
            return false;
        }

        Hdl hdl;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            hdl = hdl_;
        }
        websocketpp::lib::error_code ec;
        ep->send(hdl, bytes.data(), bytes.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            log::Debug("send failed: {}", ec.message());
        }
        return !ec;
    }

    RemoteAgent::RemoteAgent(shadow::core::PlayerId seat, std::shared_ptr<SeatChannel> chan):
        seat_{seat},
        chan_{std::move(chan)} {}

    auto RemoteAgent::Play(std::shared_ptr<const shadow::core::GameSnapshot> snapshot,
                           std::chrono::steady_clock::time_point deadline)
        -> shadow::core::PlayerAction
    {
        SHD_ASSERT(snapshot != nullptr, "RemoteAgent asked to play without a snapshot");

        chan_->Drain();
        flatbuffers::DetachedBuffer const buf = shadow::core::net::BuildSnapshot(*snapshot, next_msg_id_++);
        std::span<const std::byte> const out{reinterpret_cast<const std::byte*>(buf.data()), buf.size()};
        if (!chan_->SendBinary(out))
        {
            log::Warn("seat {} is not connected, ending its turn", static_cast<int>(seat_));
            return shadow::core::EndTurnAction{};
        }

        std::optional<std::vector<uint8_t>> const frame = chan_->Await(deadline);
        if (!frame)
        {
            log::Warn("seat {} sent nothing before the deadline", static_cast<int>(seat_));
            return shadow::core::EndTurnAction{};
        }

        std::span<const std::byte> const bytes{
            reinterpret_cast<const std::byte*>(frame->data()), frame->size()
        };

        auto const parsed = shadow::core::net::DecodePlayerAction(bytes);
        if (!parsed.has_value())
        {
            log::Warn("seat {} parse error: {}", static_cast<int>(seat_), parsed.error().message);
            return shadow::core::EndTurnAction{};
        }

        if (parsed->actor != seat_)
        {
            log::Warn("seat {} spoofed actor P{}", static_cast<int>(seat_), static_cast<int>(parsed->actor));
            return shadow::core::EndTurnAction{};
        }

        return parsed->action;
    }
}
