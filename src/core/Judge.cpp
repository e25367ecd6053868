//
// Created by Malik T on 26/09/2025.
//
#include "Judge.hpp"
#include <format>
#include <future>
#include <thread>
#include <utility>
#include "Agent.hpp"
#include "Exception.hpp"
#include "Game.hpp"
#include "Log.hpp"

namespace shadow::core
{
    auto Judge::GetAction(GameImpl& game, PlayerId actor) const -> TimedDecision
    {
        Agent* agent = game.AgentAt(actor);
        if (agent == nullptr)
            SHD_THROW(shadow::core::error::Code::State, std::format("No agent seated at P{}", static_cast<int>(actor)));

        std::shared_ptr<const GameSnapshot> snap = game.SnapshotFor(actor);
        auto const deadline = std::chrono::steady_clock::now() + game.Cfg().turn_timeout;

        std::packaged_task<PlayerAction()> task(
            [p = agent,
             snp = std::move(snap),
             deadline]() mutable
            {
                return p->Play(std::move(snp), deadline);
            }
        );

        std::future<PlayerAction> fut = task.get_future();

        std::thread worker(std::move(task));
        worker.detach();

        if (fut.wait_until(deadline) == std::future_status::ready)
        {
            return {fut.get(), DecisionResult::OK};
        }

        //Timeout
        log::Warn("P{} missed the decision deadline, ending the turn", static_cast<int>(actor));
        return {EndTurnAction{}, DecisionResult::Timeout};
    }

}
